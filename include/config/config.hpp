#ifndef SLICER_CONFIG_HPP
#define SLICER_CONFIG_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>

namespace slicer::config {

class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string& message) : std::runtime_error("Config error: " + message) {}
};

// Persisted capacity settings, stored as a JSON object with the keys
// "SliceSize", "ExtraFilePath" and "ExtraFileSizeInOnePiece"
struct CapacityConfig {
  // 18 GiB
  std::int64_t slice_size = 19327352832LL;
  std::string extra_file_path;
  // Human readable size such as "500MiB"; empty when no extra content is used
  std::string extra_file_size_in_one_piece;

  // Throws ConfigError when the file is missing or malformed
  static CapacityConfig load(const std::filesystem::path& path);
  // Rewrites the whole file
  void save(const std::filesystem::path& path) const;
};

// Parses sizes like "1024", "500MiB", "1.5g" or "20 KB". Units are binary
// (k = 1024), the trailing "i" and "b" are optional and case is ignored.
std::int64_t parse_size(const std::string& text);

// Everything one chunking run needs
struct ChunkOptions {
  // ---- INPUT AND OUTPUT ----
  std::filesystem::path input_path;
  // Archive entry names are relative to this path; defaults to input_path
  std::filesystem::path parent_path;
  std::filesystem::path car_dir;
  std::string graph_name;

  // ---- CAPACITY ----
  std::int64_t slice_size = 0;
  std::filesystem::path config_path;
  // Added to the persisted capacity before the first run and after every loop iteration
  std::int64_t capacity_step = 1;

  // ---- BUILD ----
  std::size_t parallel = 2;
  bool calc_commp = true;
  bool save_manifest = true;
  bool rename = false;
  bool add_padding = false;
  bool skip_filename = true;
  // JSON manifest repository file, unused when empty
  std::filesystem::path manifest_db;

  // ---- INPUT SELECTION ----
  bool random_rename_source_file = false;
  bool random_select_file = true;
  std::optional<std::uint64_t> shuffle_seed;

  // ---- EXTRA FILES ----
  std::filesystem::path extra_file_path;
  std::int64_t extra_file_size = 0;

  // ---- VIDEO ----
  std::filesystem::path video_path;
  // Segment directory; defaults to input_path
  std::filesystem::path video_output_path;
  std::string base_rename;
  std::int64_t base_limit = 0;
  std::int64_t video_step_ms = 1;
  std::int64_t video_reserve = 0;

  // ---- LOOP ----
  bool loop = false;
  std::int64_t loop_delay_seconds = 60;
};

// Copies capacity and extra file settings from the persisted config
void apply(const CapacityConfig& capacity, ChunkOptions& options);

// Rejects options that can not produce a valid run. Throws ConfigError naming the offending value.
void validate(const ChunkOptions& options);

} // namespace slicer::config

#endif // SLICER_CONFIG_HPP
