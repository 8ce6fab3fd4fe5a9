#include "progress_parser.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <regex>

namespace {

const std::regex& download_pattern() {
  static const std::regex pattern(
    R"(\[download\]\s+([0-9.]+)%\s+of\s+~?\s*([\d.]+\w+)\s+at\s+([\d.]+\w+/s)\s+ETA\s+([\d:]+))");
  return pattern;
}

const std::regex& size_pattern() {
  static const std::regex pattern(R"(^\s*([0-9]*\.?[0-9]+)\s*([KMGTP]?)i?B(/s)?\s*$)",
                                  std::regex::icase);
  return pattern;
}

std::optional<double> to_double(const std::string& text) {
  if(text.empty()) return std::nullopt;
  errno = 0;
  char* end = nullptr;
  const double value = std::strtod(text.c_str(), &end);
  if(errno != 0 || end != text.c_str() + text.size()) return std::nullopt;
  if(!std::isfinite(value)) return std::nullopt;
  return value;
}

int clamp_percent(double value) {
  if(!(value > 0.0)) return 0;
  if(value >= 100.0) return 100;
  return static_cast<int>(std::floor(value));
}

} // namespace

const char* to_string(Phase phase) {
  switch(phase) {
    case Phase::Download: return "download";
    case Phase::Upload: return "upload";
  }
  return "unknown";
}

std::optional<double> parse_human_size(const std::string& text) {
  std::smatch match;
  if(!std::regex_match(text, match, size_pattern())) return std::nullopt;
  auto number = to_double(match[1].str());
  if(!number) return std::nullopt;

  static constexpr const char* kPrefixes = "KMGTP";
  double multiplier = 1.0;
  const std::string prefix = match[2].str();
  if(!prefix.empty()) {
    const char upper = static_cast<char>(std::toupper(static_cast<unsigned char>(prefix[0])));
    for(const char* p = kPrefixes; *p; ++p) {
      multiplier *= 1024.0;
      if(*p == upper) break;
    }
  }
  return *number * multiplier;
}

std::optional<uint64_t> parse_eta(const std::string& text) {
  std::vector<uint64_t> parts;
  std::string current;
  for(char c : text) {
    if(c == ':') {
      if(current.empty()) return std::nullopt;
      parts.push_back(std::stoull(current));
      current.clear();
    } else if(std::isdigit(static_cast<unsigned char>(c))) {
      current.push_back(c);
      if(current.size() > 9) return std::nullopt;
    } else {
      return std::nullopt;
    }
  }
  if(current.empty()) return std::nullopt;
  parts.push_back(std::stoull(current));
  if(parts.size() == 2) {
    return parts[0] * 60 + parts[1];
  }
  if(parts.size() == 3) {
    return parts[0] * 3600 + parts[1] * 60 + parts[2];
  }
  return std::nullopt;
}

std::optional<ProgressSnapshot> parse_download_line(const std::string& line) {
  std::smatch match;
  if(!std::regex_search(line, match, download_pattern())) return std::nullopt;

  auto percent = to_double(match[1].str());
  if(!percent) return std::nullopt;

  ProgressSnapshot snapshot;
  snapshot.phase = Phase::Download;
  snapshot.percent = clamp_percent(*percent);

  if(auto total = parse_human_size(match[2].str())) {
    snapshot.bytes_total = static_cast<uint64_t>(*total);
    const double fraction = std::min(100.0, std::max(0.0, *percent)) / 100.0;
    snapshot.bytes_done = static_cast<uint64_t>(*total * fraction);
  }
  if(auto rate = parse_human_size(match[3].str())) {
    snapshot.rate_bytes_per_sec = *rate;
  }
  snapshot.eta_seconds = parse_eta(match[4].str());
  return snapshot;
}

ProgressSnapshot parse_upload_status(uint64_t bytes_done,
                                     uint64_t bytes_total,
                                     uint64_t previous_bytes_done,
                                     double elapsed_seconds) {
  ProgressSnapshot snapshot;
  snapshot.phase = Phase::Upload;
  snapshot.bytes_done = bytes_done;
  snapshot.bytes_total = bytes_total;

  if(elapsed_seconds > 0.0 && bytes_done > previous_bytes_done) {
    snapshot.rate_bytes_per_sec =
      static_cast<double>(bytes_done - previous_bytes_done) / elapsed_seconds;
  }
  if(bytes_total > 0) {
    const uint64_t done = std::min(bytes_done, bytes_total);
    snapshot.percent = static_cast<int>(done * 100 / bytes_total);
    if(snapshot.rate_bytes_per_sec > 0.0) {
      snapshot.eta_seconds = static_cast<uint64_t>(
        std::ceil(static_cast<double>(bytes_total - done) / snapshot.rate_bytes_per_sec));
    }
  }
  return snapshot;
}

std::vector<std::string> ProgressFrameBuffer::push(const char* data, std::size_t size) {
  std::vector<std::string> frames;
  for(std::size_t i = 0; i < size; ++i) {
    const char c = data[i];
    if(c == '\r' || c == '\n') {
      if(!pending_.empty()) {
        frames.push_back(std::move(pending_));
        pending_.clear();
      }
      continue;
    }
    pending_.push_back(c);
  }
  // unterminated frames keep only their newest kMaxPending bytes
  if(pending_.size() > kMaxPending) {
    pending_.erase(0, pending_.size() - kMaxPending);
  }
  return frames;
}

std::string ProgressFrameBuffer::take_remainder() {
  std::string out;
  out.swap(pending_);
  return out;
}
