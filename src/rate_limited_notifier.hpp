#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "log.hpp"
#include "notification_sink.hpp"
#include "progress_parser.hpp"

// Collapses bursts of progress snapshots into at most one edit per interval and
// per target. Delivery failures are logged and never reach the caller's task.
class RateLimitedNotifier {
public:
  using Clock = std::chrono::steady_clock;

  struct Options {
    std::chrono::milliseconds interval{1000};
    std::size_t bar_width = 20;
    std::function<Clock::time_point()> now;
  };

  RateLimitedNotifier(std::shared_ptr<NotificationSink> sink,
                      Options options,
                      std::shared_ptr<Logger> logger = nullptr);

  // force bypasses the interval; drivers use it for the last snapshot of a phase.
  bool notify(const MessageTarget& target,
              const std::string& title,
              const ProgressSnapshot& snapshot,
              const std::vector<MessageAction>& actions,
              bool force = false);

  bool post(const MessageTarget& target,
            const std::string& text,
            const std::vector<MessageAction>& actions = {});

  // Delivers the terminal text and closes the target; later renders are dropped.
  // A target that was already forgotten gets the text without being tracked again.
  bool post_final(const MessageTarget& target,
                  const std::string& text,
                  const std::vector<MessageAction>& actions = {});

  void open(const MessageTarget& target);
  void close(const MessageTarget& target);
  bool is_open(const MessageTarget& target) const;
  // Drops all state for the target. Called once its task is finalized.
  void forget(const MessageTarget& target);
  std::size_t tracked_targets() const;

  std::string render_progress(const std::string& title, const ProgressSnapshot& snapshot) const;
  static std::string progress_bar(int percent, std::size_t width);
  static std::string format_eta(const std::optional<uint64_t>& eta_seconds);

private:
  struct TargetState {
    std::mutex mutex;
    bool closed = false;
    bool has_rendered = false;
    Clock::time_point last_render{};
    std::string last_text;
  };

  std::shared_ptr<TargetState> state_for(const MessageTarget& target);
  std::shared_ptr<TargetState> find_state(const MessageTarget& target) const;
  bool deliver(TargetState& state,
               const MessageTarget& target,
               const std::string& text,
               const std::vector<MessageAction>& actions);
  Clock::time_point now() const;

  std::shared_ptr<NotificationSink> sink_;
  Options options_;
  std::shared_ptr<Logger> logger_;
  mutable std::mutex states_mutex_;
  std::unordered_map<std::string, std::shared_ptr<TargetState>> states_;
};
