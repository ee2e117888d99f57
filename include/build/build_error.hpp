#ifndef SLICER_BUILD_BUILD_ERROR_HPP
#define SLICER_BUILD_BUILD_ERROR_HPP

#include <stdexcept>
#include <string>

namespace slicer::build {

// Failure to materialize or record a slice; aborts the run
class BuildError : public std::runtime_error {
public:
  explicit BuildError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace slicer::build

#endif // SLICER_BUILD_BUILD_ERROR_HPP
