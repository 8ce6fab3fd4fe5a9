#pragma once

#include <atomic>
#include <cstdint>
#include <iosfwd>
#include <mutex>
#include <string>
#include <vector>

#include "notification_sink.hpp"

// Prints every rendered message to a stream, tagged with its target. Command
// actions are shown as the console command that triggers them.
class ConsoleSink : public NotificationSink {
public:
  explicit ConsoleSink(std::ostream& out, std::string chat_id = "console");

  bool render(const MessageTarget& target,
              const std::string& text,
              const std::vector<MessageAction>& actions,
              std::string& error) override;

  // A fresh message for a new job.
  MessageTarget next_target();

  // "cancel_<id>" -> "cancel <id>", "quality_<tier>_<job>" -> "quality <job> <tier>".
  static std::string command_for_token(const std::string& token);

private:
  std::ostream& out_;
  std::string chat_id_;
  std::mutex mutex_;
  std::atomic<uint64_t> next_message_{1};
};
