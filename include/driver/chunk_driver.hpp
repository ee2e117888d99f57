#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include "config/config.hpp"
#include "feeder/feeder.hpp"
#include "feeder/segment_tool.hpp"
#include "partition/types.hpp"
#include "store/manifest_repository.hpp"
#include "build/build_callback.hpp"

namespace slicer {
namespace driver {

struct RunReport {
  std::size_t files = 0;
  std::size_t skipped = 0;
  std::size_t slices = 0;
  std::int64_t input_bytes = 0;
  bool cancelled = false;
};

// Wires enumeration, feeder, partitioner and builders together for one input tree
class ChunkDriver {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Loads the capacity config when options.config_path is set
  ChunkDriver(config::ChunkOptions options, feeder::SegmentTool& segment_tool);
  ~ChunkDriver();


  // ---- RUNNING ----
  // Bumps the persisted capacity, then runs once or, in loop mode, until cancelled.
  // Returns the report of the last run.
  RunReport run(partition::CancellationToken& cancel);
  // One full enumerate, partition and build pass. Throws ConfigError before any
  // I/O when the options are invalid and BuildError when a slice fails.
  RunReport run_once(const partition::CancellationToken& cancel);
  // Adds capacity_step to the capacity and persists it; returns the new capacity
  std::int64_t bump_capacity();


  // ---- GETTERS ----
  const config::ChunkOptions& options() const { return options_; }
  build::CallbackKind callback_kind() const;

private:
  // ---- PARAMETERS ----
  config::ChunkOptions options_;
  feeder::SegmentTool& segment_tool_;
  std::optional<config::CapacityConfig> capacity_;

  // Feeders and repository live across loop iterations so cursors and counters keep advancing
  std::unique_ptr<feeder::Feeder> feeder_;
  std::unique_ptr<store::ManifestRepository> repository_;

  feeder::Feeder& active_feeder();
};

} // namespace driver
} // namespace slicer
