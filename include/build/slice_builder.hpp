#ifndef SLICER_BUILD_SLICE_BUILDER_HPP
#define SLICER_BUILD_SLICE_BUILDER_HPP

#include <cstddef>
#include <string>
#include "build/archive_writer.hpp"
#include "build/build_callback.hpp"
#include "partition/types.hpp"

namespace slicer::build {

// Turns a slice plan into an archive and reports it to the callback
class SliceBuilder {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // skip_filename leaves entry names out of the recorded detail
  SliceBuilder(ArchiveWriter writer, BuildCallback& callback, std::string graph_name, bool skip_filename = false);


  // ---- BUILDING ----
  // Calls exactly one of on_success or on_error. Errors raised by the
  // callback itself propagate to the caller.
  void build(const partition::SlicePlan& plan) const;

  // "<graph>-total-<total>-part-<index + 1>"
  static std::string slice_name(const std::string& graph_name, std::size_t slice_index, std::size_t slice_total);

  // JSON summary of the archive: content id, size and one link per entry
  std::string detail(const SliceArchive& archive) const;

private:
  // ---- PARAMETERS ----
  ArchiveWriter writer_;
  BuildCallback& callback_;
  std::string graph_name_;
  bool skip_filename_;
};

} // namespace slicer::build

#endif // SLICER_BUILD_SLICE_BUILDER_HPP
