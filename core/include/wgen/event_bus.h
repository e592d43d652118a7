#pragma once

#include <any>
#include <functional>
#include <mutex>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace wgen {

// Typed publish/subscribe. Handlers run synchronously on the emitting thread;
// subscribing and emitting may happen from different threads.
class EventBus {
 public:
  template <typename T>
  void subscribe(std::function<void(const T&)> handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& bucket = handlers_[std::type_index(typeid(T))];
    bucket.push_back([handler](const std::any& ev) {
      handler(std::any_cast<const T&>(ev));
    });
  }

  template <typename T>
  void emit(const T& event) const {
    std::vector<std::function<void(const std::any&)>> bucket;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = handlers_.find(std::type_index(typeid(T)));
      if (it == handlers_.end()) {
        return;
      }
      bucket = it->second;
    }
    const std::any wrapped(event);
    for (auto& fn : bucket) {
      fn(wrapped);
    }
  }

  template <typename T>
  size_t subscriber_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = handlers_.find(std::type_index(typeid(T)));
    return it == handlers_.end() ? 0 : it->second.size();
  }

  void clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_.clear();
  }

 private:
  mutable std::mutex mutex_;
  std::unordered_map<std::type_index, std::vector<std::function<void(const std::any&)>>> handlers_;
};

} // namespace wgen
