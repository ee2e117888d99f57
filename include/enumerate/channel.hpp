#pragma once

#include <mutex>
#include <queue>
#include <vector>
#include <boost/log/trivial.hpp>

namespace slicer {
namespace enumerate {

// Thread-safe FIFO shared by enumeration workers and the draining consumer
template <typename T>
class Channel {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR
  Channel() = default;
  ~Channel() = default;


  // ---- CHANNEL CONTROL METHODS ----
  // Adds an item to the back of the queue
  void produce(T item) {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.push(std::move(item));
    BOOST_LOG_TRIVIAL(trace) << "Channel: Added item. Channel size: " << queue_.size();
  }

  // Retrieves and removes the next item, returns false when the channel is empty
  bool consume(T& item) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty()) {
      return false;
    }
    item = std::move(queue_.front());
    queue_.pop();
    return true;
  }

  // Removes every queued item in FIFO order
  std::vector<T> drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<T> items;
    items.reserve(queue_.size());
    while (!queue_.empty()) {
      items.push_back(std::move(queue_.front()));
      queue_.pop();
    }
    return items;
  }


  // ---- QUERY METHODS ----
  bool empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.empty();
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
  }

private:
  // ---- PARAMETERS ----
  mutable std::mutex mutex_;
  std::queue<T> queue_;
};

} // namespace enumerate
} // namespace slicer
