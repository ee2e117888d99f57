#ifndef SLICER_BUILD_BUILD_CALLBACK_HPP
#define SLICER_BUILD_BUILD_CALLBACK_HPP

#include <exception>
#include <filesystem>
#include <memory>
#include <string>
#include "build/archive_writer.hpp"
#include "store/manifest_repository.hpp"
#include "store/store.hpp"

namespace slicer::build {

// Receives the outcome of every slice build. Exactly one of the two methods
// is called per slice. Implementations may be called from several build
// threads at once.
class BuildCallback {
public:
  virtual ~BuildCallback() = default;

  // Records a finished slice; failures are reported as BuildError
  virtual void on_success(const SliceArchive& archive, const std::string& slice_name,
                          const std::string& content_id, const std::string& detail) = 0;

  // Always throws BuildError wrapping the cause
  virtual void on_error(const std::exception& error) = 0;
};

enum class CallbackKind {
  // Piece commitment, archive named after it, full manifest row
  CommitmentRecording,
  // Archive named after the content id, short manifest row
  ManifestOnly,
  // Nothing persisted
  Discard
};

struct CallbackOptions {
  std::filesystem::path car_dir;
  // Drop the ".car" suffix from archives named by commitment
  bool rename = false;
  // Zero-fill archives up to the piece payload capacity
  bool add_padding = false;
  // Optional; receives a completed record per slice
  store::ManifestRepository* repository = nullptr;
};

constexpr const char* MANIFEST_FILE_NAME = "manifest.csv";

std::unique_ptr<BuildCallback> make_build_callback(CallbackKind kind, const CallbackOptions& options);

class CommitmentRecordingCallback : public BuildCallback {
public:
  explicit CommitmentRecordingCallback(const CallbackOptions& options);

  void on_success(const SliceArchive& archive, const std::string& slice_name,
                  const std::string& content_id, const std::string& detail) override;
  void on_error(const std::exception& error) override;

private:
  CallbackOptions options_;
  store::ArchiveStore archives_;
  store::ManifestWriter manifest_;
};

class ManifestOnlyCallback : public BuildCallback {
public:
  explicit ManifestOnlyCallback(const CallbackOptions& options);

  void on_success(const SliceArchive& archive, const std::string& slice_name,
                  const std::string& content_id, const std::string& detail) override;
  void on_error(const std::exception& error) override;

private:
  store::ArchiveStore archives_;
  store::ManifestWriter manifest_;
};

class DiscardCallback : public BuildCallback {
public:
  void on_success(const SliceArchive&, const std::string&, const std::string&, const std::string&) override {}
  void on_error(const std::exception& error) override;
};

} // namespace slicer::build

#endif // SLICER_BUILD_BUILD_CALLBACK_HPP
