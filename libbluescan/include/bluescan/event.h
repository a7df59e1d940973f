/**
 * @file event.h
 * @brief Multicast event with token-based handler registration
 */

#ifndef BLUESCAN_EVENT_H
#define BLUESCAN_EVENT_H

#include <cstdint>
#include <functional>
#include <list>
#include <mutex>
#include <utility>

namespace bluescan {

/**
 * @brief Event handler list that platform objects raise notifications on
 *
 * Handlers are added with add() (or +=) and removed with the returned
 * token. emit() holds the event lock while handlers run, so once
 * remove() returns the removed handler is neither running nor will it
 * run again. Handlers must not add or remove handlers on the same event.
 *
 * @tparam Args Argument types passed to each handler
 */
template <typename... Args> class Event {
public:
  using Handler = std::function<void(Args...)>;
  using Token = uint64_t;

  Event() = default;

  Event(const Event &) = delete;
  Event &operator=(const Event &) = delete;

  /// Register a handler, returns the token needed to remove it
  Token add(Handler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    Token token = ++last_token_;
    handlers_.emplace_back(token, std::move(handler));
    return token;
  }

  Token operator+=(Handler handler) { return add(std::move(handler)); }

  /// Remove a handler; false if the token is unknown
  bool remove(Token token) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = handlers_.begin(); it != handlers_.end(); ++it) {
      if (it->first == token) {
        handlers_.erase(it);
        return true;
      }
    }
    return false;
  }

  void clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_.clear();
  }

  bool empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handlers_.empty();
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handlers_.size();
  }

  /// Invoke every registered handler in registration order
  void emit(Args... args) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &entry : handlers_) {
      entry.second(args...);
    }
  }

private:
  mutable std::mutex mutex_;
  std::list<std::pair<Token, Handler>> handlers_;
  Token last_token_ = 0;
};

} // namespace bluescan

#endif // BLUESCAN_EVENT_H
