#ifndef SLICER_BUILD_BUILD_DISPATCHER_HPP
#define SLICER_BUILD_BUILD_DISPATCHER_HPP

#include <condition_variable>
#include <cstddef>
#include <exception>
#include <mutex>
#include <boost/asio/thread_pool.hpp>
#include "build/slice_builder.hpp"
#include "partition/slice_partitioner.hpp"

namespace slicer::build {

// Builds slices on a worker pool while the partitioner keeps producing them.
// At most `parallel` slices are in flight; accept() blocks beyond that.
class BuildDispatcher : public partition::SliceSink {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  BuildDispatcher(const SliceBuilder& builder, std::size_t parallel,
                  const partition::CancellationToken* cancel = nullptr);
  ~BuildDispatcher() override;
  BuildDispatcher(const BuildDispatcher&) = delete;
  BuildDispatcher& operator=(const BuildDispatcher&) = delete;


  // ---- DISPATCH ----
  // Rethrows an earlier build failure; throws PartitionCancelled once cancellation is requested
  void accept(partition::SlicePlan plan) override;
  // Blocks until every accepted slice has finished, then rethrows the first failure
  void wait();

  std::size_t completed() const;

private:
  // ---- PARAMETERS ----
  const SliceBuilder& builder_;
  std::size_t parallel_;
  const partition::CancellationToken* cancel_;

  mutable std::mutex mutex_;
  std::condition_variable done_;
  std::size_t in_flight_ = 0;
  std::size_t completed_ = 0;
  std::exception_ptr error_;

  boost::asio::thread_pool pool_;

  void run(const partition::SlicePlan& plan);
};

} // namespace slicer::build

#endif // SLICER_BUILD_BUILD_DISPATCHER_HPP
