#ifndef SLICER_FEEDER_HPP
#define SLICER_FEEDER_HPP

#include <vector>
#include "partition/types.hpp"

namespace slicer::feeder {

using partition::FeederBudget;
using partition::FileDescriptor;

// Supplies supplementary descriptors for the slice currently being emitted
class Feeder {
public:
  virtual ~Feeder() = default;

  // Returns the descriptors to inject into the current slice; may be empty
  virtual std::vector<FileDescriptor> next_batch() = 0;

  virtual FeederBudget budget() const = 0;
};

// Feeder used when no supplementary content is configured
class NullFeeder : public Feeder {
public:
  std::vector<FileDescriptor> next_batch() override { return {}; }
  FeederBudget budget() const override { return FeederBudget{}; }
};

} // namespace slicer::feeder

#endif // SLICER_FEEDER_HPP
