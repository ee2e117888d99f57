#include "build/build_dispatcher.hpp"
#include <stdexcept>
#include <boost/asio/post.hpp>
#include <boost/log/trivial.hpp>

namespace slicer::build {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

BuildDispatcher::BuildDispatcher(const SliceBuilder& builder, std::size_t parallel,
                                 const partition::CancellationToken* cancel)
  : builder_(builder)
  , parallel_(parallel)
  , cancel_(cancel)
  , pool_(parallel == 0 ? 1 : parallel) {
  if (parallel_ == 0) {
    throw std::invalid_argument("parallel has to be greater than 0");
  }
  BOOST_LOG_TRIVIAL(debug) << "Dispatcher: Building with " << parallel_ << " worker(s)";
}

BuildDispatcher::~BuildDispatcher() {
  pool_.join();
}


//==============================================
// DISPATCH
//==============================================

void BuildDispatcher::accept(partition::SlicePlan plan) {
  std::unique_lock<std::mutex> lock(mutex_);
  done_.wait(lock, [this] { return in_flight_ < parallel_ || error_; });

  if (error_) {
    std::rethrow_exception(error_);
  }
  if (cancel_ && cancel_->cancelled()) {
    throw partition::PartitionCancelled("slice " + std::to_string(plan.slice_index + 1) + " not dispatched");
  }
  in_flight_++;
  lock.unlock();

  BOOST_LOG_TRIVIAL(debug) << "Dispatcher: Dispatching slice " << plan.slice_index + 1;
  boost::asio::post(pool_, [this, plan = std::move(plan)]() { run(plan); });
}

void BuildDispatcher::wait() {
  std::unique_lock<std::mutex> lock(mutex_);
  done_.wait(lock, [this] { return in_flight_ == 0; });
  if (error_) {
    std::rethrow_exception(error_);
  }
  BOOST_LOG_TRIVIAL(info) << "Dispatcher: " << completed_ << " slice(s) built";
}

std::size_t BuildDispatcher::completed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return completed_;
}

void BuildDispatcher::run(const partition::SlicePlan& plan) {
  std::exception_ptr failure;
  try {
    builder_.build(plan);
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Dispatcher: Slice " << plan.slice_index + 1 << " failed: " << e.what();
    failure = std::current_exception();
  }

  std::lock_guard<std::mutex> lock(mutex_);
  in_flight_--;
  if (failure) {
    // Later failures are usually consequences of the first one
    if (!error_) {
      error_ = failure;
    }
  } else {
    completed_++;
  }
  done_.notify_all();
}

} // namespace slicer::build
