#include "console_sink.hpp"

#include <ostream>

ConsoleSink::ConsoleSink(std::ostream& out, std::string chat_id)
  : out_(out), chat_id_(std::move(chat_id)) {}

MessageTarget ConsoleSink::next_target() {
  return MessageTarget{chat_id_, std::to_string(next_message_.fetch_add(1))};
}

std::string ConsoleSink::command_for_token(const std::string& token) {
  static const std::string kCancel = "cancel_";
  static const std::string kQuality = "quality_";
  if(token.compare(0, kCancel.size(), kCancel) == 0) {
    return "cancel " + token.substr(kCancel.size());
  }
  if(token.compare(0, kQuality.size(), kQuality) == 0) {
    auto rest = token.substr(kQuality.size());
    auto sep = rest.find('_');
    if(sep != std::string::npos) {
      return "quality " + rest.substr(sep + 1) + " " + rest.substr(0, sep);
    }
  }
  return token;
}

bool ConsoleSink::render(const MessageTarget& target,
                         const std::string& text,
                         const std::vector<MessageAction>& actions,
                         std::string& error) {
  std::lock_guard<std::mutex> lock(mutex_);
  out_ << "\n[message " << target.message_id << "]\n" << text << "\n";
  for(const auto& action : actions) {
    if(!action.url.empty()) {
      out_ << "  [" << action.label << "] " << action.url << "\n";
    } else {
      out_ << "  [" << action.label << "] " << command_for_token(action.token) << "\n";
    }
  }
  out_.flush();
  if(!out_) {
    error = "console stream is not writable";
    return false;
  }
  return true;
}
