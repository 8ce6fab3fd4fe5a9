#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

enum class Phase { Download, Upload };

const char* to_string(Phase phase);

struct ProgressSnapshot {
  Phase phase = Phase::Download;
  int percent = 0;                      // 0..100
  uint64_t bytes_done = 0;
  uint64_t bytes_total = 0;
  double rate_bytes_per_sec = 0.0;
  std::optional<uint64_t> eta_seconds;
};

// Parses one retriever progress frame such as
//   "[download]  42.0% of ~100.0MiB at 5.0MiB/s ETA 00:10"
// Anything that does not match the grammar yields no snapshot.
std::optional<ProgressSnapshot> parse_download_line(const std::string& line);

// rate = (bytes_done - previous_bytes_done) / elapsed_seconds, zero when elapsed <= 0.
// percent = floor(bytes_done * 100 / bytes_total).
ProgressSnapshot parse_upload_status(uint64_t bytes_done,
                                     uint64_t bytes_total,
                                     uint64_t previous_bytes_done,
                                     double elapsed_seconds);

// "123.4MB", "5.0MiB", "5.0MiB/s", "870B". Units are 1024 based.
std::optional<double> parse_human_size(const std::string& text);
// "H:MM:SS" or "MM:SS".
std::optional<uint64_t> parse_eta(const std::string& text);

// Splits the retriever's combined output into frames. The retriever rewrites its
// progress line in place with '\r', so both '\r' and '\n' terminate a frame.
class ProgressFrameBuffer {
public:
  std::vector<std::string> push(const char* data, std::size_t size);
  std::string take_remainder();
  std::size_t pending_size() const { return pending_.size(); }

private:
  static constexpr std::size_t kMaxPending = 64 * 1024;
  std::string pending_;
};
