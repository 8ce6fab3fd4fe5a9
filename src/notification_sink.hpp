#pragma once

#include <string>
#include <vector>

// The single message an operator watches for one job.
struct MessageTarget {
  std::string chat_id;
  std::string message_id;

  std::string key() const { return chat_id + "/" + message_id; }
};

// A clickable label. Command actions carry an opaque callback token
// (the console maps it to the command to type); link actions carry a url.
struct MessageAction {
  std::string label;
  std::string token;
  std::string url;
};

class NotificationSink {
public:
  virtual ~NotificationSink() = default;

  // Replaces the visible text of target. Returns false with error filled when
  // the edit could not be delivered (e.g. the message was deleted).
  virtual bool render(const MessageTarget& target,
                      const std::string& text,
                      const std::vector<MessageAction>& actions,
                      std::string& error) = 0;
};
