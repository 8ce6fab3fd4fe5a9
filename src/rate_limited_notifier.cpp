#include "rate_limited_notifier.hpp"

#include <algorithm>

#include "utils.hpp"

RateLimitedNotifier::RateLimitedNotifier(std::shared_ptr<NotificationSink> sink,
                                         Options options,
                                         std::shared_ptr<Logger> logger)
  : sink_(std::move(sink)),
    options_(std::move(options)),
    logger_(std::move(logger)) {
  if(options_.bar_width == 0) options_.bar_width = 20;
  if(options_.interval.count() < 0) options_.interval = std::chrono::milliseconds(0);
}

RateLimitedNotifier::Clock::time_point RateLimitedNotifier::now() const {
  return options_.now ? options_.now() : Clock::now();
}

std::shared_ptr<RateLimitedNotifier::TargetState> RateLimitedNotifier::state_for(const MessageTarget& target) {
  std::lock_guard<std::mutex> lock(states_mutex_);
  auto& slot = states_[target.key()];
  if(!slot) slot = std::make_shared<TargetState>();
  return slot;
}

std::shared_ptr<RateLimitedNotifier::TargetState> RateLimitedNotifier::find_state(const MessageTarget& target) const {
  std::lock_guard<std::mutex> lock(states_mutex_);
  auto it = states_.find(target.key());
  return it == states_.end() ? nullptr : it->second;
}

void RateLimitedNotifier::forget(const MessageTarget& target) {
  std::lock_guard<std::mutex> lock(states_mutex_);
  states_.erase(target.key());
}

std::size_t RateLimitedNotifier::tracked_targets() const {
  std::lock_guard<std::mutex> lock(states_mutex_);
  return states_.size();
}

void RateLimitedNotifier::open(const MessageTarget& target) {
  auto state = state_for(target);
  std::lock_guard<std::mutex> lock(state->mutex);
  state->closed = false;
  state->has_rendered = false;
  state->last_text.clear();
}

void RateLimitedNotifier::close(const MessageTarget& target) {
  auto state = state_for(target);
  std::lock_guard<std::mutex> lock(state->mutex);
  state->closed = true;
}

bool RateLimitedNotifier::is_open(const MessageTarget& target) const {
  auto state = find_state(target);
  if(!state) return true;
  std::lock_guard<std::mutex> lock(state->mutex);
  return !state->closed;
}

bool RateLimitedNotifier::deliver(TargetState& state,
                                  const MessageTarget& target,
                                  const std::string& text,
                                  const std::vector<MessageAction>& actions) {
  state.last_render = now();
  state.has_rendered = true;
  if(!sink_) return false;

  std::string error;
  bool delivered = false;
  try {
    delivered = sink_->render(target, text, actions, error);
  } catch(const std::exception& e) {
    log_error(logger_.get(), "Notification sink threw for {}: {}", target.key(), e.what());
    return false;
  }
  if(!delivered) {
    log_warn(logger_.get(), "Could not update message {} (it may have been deleted): {}",
             target.key(), error.empty() ? "unknown error" : error);
    return false;
  }
  state.last_text = text;
  return true;
}

bool RateLimitedNotifier::notify(const MessageTarget& target,
                                 const std::string& title,
                                 const ProgressSnapshot& snapshot,
                                 const std::vector<MessageAction>& actions,
                                 bool force) {
  auto state = state_for(target);
  std::lock_guard<std::mutex> lock(state->mutex);
  if(state->closed) return false;

  if(!force && state->has_rendered && now() - state->last_render < options_.interval) {
    return false;
  }
  auto text = render_progress(title, snapshot);
  if(text == state->last_text) return false;
  return deliver(*state, target, text, actions);
}

bool RateLimitedNotifier::post(const MessageTarget& target,
                               const std::string& text,
                               const std::vector<MessageAction>& actions) {
  auto state = state_for(target);
  std::lock_guard<std::mutex> lock(state->mutex);
  if(state->closed) return false;
  return deliver(*state, target, text, actions);
}

bool RateLimitedNotifier::post_final(const MessageTarget& target,
                                     const std::string& text,
                                     const std::vector<MessageAction>& actions) {
  auto state = find_state(target);
  if(!state) {
    log_debug(logger_.get(), "Final message for untracked target {}", target.key());
    TargetState untracked;
    return deliver(untracked, target, text, actions);
  }
  std::lock_guard<std::mutex> lock(state->mutex);
  if(state->closed) return false;
  state->closed = true;
  return deliver(*state, target, text, actions);
}

std::string RateLimitedNotifier::progress_bar(int percent, std::size_t width) {
  const int clamped = std::max(0, std::min(100, percent));
  const std::size_t filled = static_cast<std::size_t>(clamped) * width / 100;
  std::string bar;
  bar.reserve(width * 3);
  for(std::size_t i = 0; i < width; ++i) {
    bar += (i < filled) ? u8"█" : u8"░";
  }
  return bar;
}

std::string RateLimitedNotifier::format_eta(const std::optional<uint64_t>& eta_seconds) {
  if(!eta_seconds) return "unknown";
  const uint64_t hours = *eta_seconds / 3600;
  const uint64_t minutes = (*eta_seconds % 3600) / 60;
  const uint64_t seconds = *eta_seconds % 60;
  if(hours > 0) {
    return fmt::format("{}:{:02}:{:02}", hours, minutes, seconds);
  }
  return fmt::format("{:02}:{:02}", minutes, seconds);
}

std::string RateLimitedNotifier::render_progress(const std::string& title,
                                                 const ProgressSnapshot& snapshot) const {
  const std::string bar = progress_bar(snapshot.percent, options_.bar_width);
  if(snapshot.phase == Phase::Download) {
    return fmt::format("Downloading: {}\n\n{} {}%\n\nSize: {} | Speed: {}/s\nETA: {}",
                       title,
                       bar,
                       snapshot.percent,
                       human_readable_size(static_cast<double>(snapshot.bytes_total)),
                       human_readable_size(snapshot.rate_bytes_per_sec),
                       format_eta(snapshot.eta_seconds));
  }
  return fmt::format("Uploading: {}\n\n{} {}%\n\nUploaded: {} / {}\nSpeed: {}/s",
                     title,
                     bar,
                     snapshot.percent,
                     human_readable_size(static_cast<double>(snapshot.bytes_done)),
                     human_readable_size(static_cast<double>(snapshot.bytes_total)),
                     human_readable_size(snapshot.rate_bytes_per_sec));
}
