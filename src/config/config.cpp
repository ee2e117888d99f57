#include "config/config.hpp"
#include <cctype>
#include <cmath>
#include <fstream>
#include <limits>
#include <regex>
#include <boost/algorithm/string/trim.hpp>
#include <boost/log/trivial.hpp>
#include <nlohmann/json.hpp>
#include "partition/types.hpp"

namespace slicer::config {

using json = nlohmann::json;

//==============================================
// CAPACITY CONFIG
//==============================================

CapacityConfig CapacityConfig::load(const std::filesystem::path& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    BOOST_LOG_TRIVIAL(error) << "Config: Unable to open configuration file: " << path.string();
    throw ConfigError("could not open config file: " + path.string());
  }

  CapacityConfig config;
  try {
    json j;
    file >> j;
    config.slice_size = j.at("SliceSize").get<std::int64_t>();
    config.extra_file_path = j.value("ExtraFilePath", "");
    config.extra_file_size_in_one_piece = j.value("ExtraFileSizeInOnePiece", "");
  } catch (const json::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Config: JSON error in file " << path.string() << ": " << e.what();
    throw ConfigError("malformed config file " + path.string() + ": " + e.what());
  }

  BOOST_LOG_TRIVIAL(info) << "Config: Loaded " << path.string() << ", slice size " << config.slice_size;
  return config;
}

void CapacityConfig::save(const std::filesystem::path& path) const {
  json j = {
    {"SliceSize", slice_size},
    {"ExtraFilePath", extra_file_path},
    {"ExtraFileSizeInOnePiece", extra_file_size_in_one_piece},
  };

  std::ofstream file(path, std::ios::trunc);
  if (!file.is_open()) {
    BOOST_LOG_TRIVIAL(error) << "Config: Unable to open configuration file for writing: " << path.string();
    throw ConfigError("could not open config file for writing: " + path.string());
  }
  file << j.dump(4);
  if (!file) {
    throw ConfigError("failed to write config file: " + path.string());
  }
  BOOST_LOG_TRIVIAL(info) << "Config: Saved " << path.string() << ", slice size " << slice_size;
}


//==============================================
// SIZE PARSING
//==============================================

std::int64_t parse_size(const std::string& text) {
  static const std::regex pattern(R"(^(\d+(?:\.\d+)?) ?([kmgtp])?i?b?$)", std::regex::icase);

  std::string trimmed = boost::algorithm::trim_copy(text);
  std::smatch match;
  if (!std::regex_match(trimmed, match, pattern)) {
    throw ConfigError("invalid size: '" + text + "'");
  }

  double value = std::stod(match[1].str());
  int exponent = 0;
  if (match[2].matched) {
    switch (std::tolower(static_cast<unsigned char>(match[2].str()[0]))) {
      case 'k': exponent = 1; break;
      case 'm': exponent = 2; break;
      case 'g': exponent = 3; break;
      case 't': exponent = 4; break;
      case 'p': exponent = 5; break;
    }
  }

  double bytes = value * std::pow(1024.0, exponent);
  if (bytes >= static_cast<double>(std::numeric_limits<std::int64_t>::max())) {
    throw ConfigError("size out of range: '" + text + "'");
  }
  return static_cast<std::int64_t>(bytes);
}


//==============================================
// RUN OPTIONS
//==============================================

void apply(const CapacityConfig& capacity, ChunkOptions& options) {
  options.slice_size = capacity.slice_size;
  options.extra_file_path = capacity.extra_file_path;
  options.extra_file_size = 0;

  if (!capacity.extra_file_path.empty()) {
    if (capacity.extra_file_size_in_one_piece.empty()) {
      throw ConfigError("extra file size in one piece is required when extra file path is set");
    }
    options.extra_file_size = parse_size(capacity.extra_file_size_in_one_piece);
  }
}

void validate(const ChunkOptions& options) {
  if (options.slice_size <= 0) {
    throw ConfigError("slice size has been set as " + std::to_string(options.slice_size));
  }
  if (options.parallel == 0) {
    throw ConfigError("parallel has to be greater than 0");
  }
  if (options.graph_name.empty()) {
    throw ConfigError("graph name is required");
  }
  if (options.input_path.empty()) {
    throw ConfigError("input path is required");
  }
  if (options.car_dir.empty() || !std::filesystem::is_directory(options.car_dir)) {
    throw ConfigError("the path of car-dir does not exist: " + options.car_dir.string());
  }
  if (options.capacity_step < 0) {
    throw ConfigError("capacity step must not be negative, got " + std::to_string(options.capacity_step));
  }

  // Extra file budget
  if (options.extra_file_size < 0) {
    throw ConfigError("extra file size must not be negative, got " + std::to_string(options.extra_file_size));
  }
  if (options.extra_file_size > 0 && options.extra_file_path.empty()) {
    throw ConfigError("extra file size " + std::to_string(options.extra_file_size) +
                      " is set without an extra file path");
  }
  if (!options.extra_file_path.empty()) {
    if (options.extra_file_size == 0) {
      throw ConfigError("extra file path " + options.extra_file_path.string() + " is set without a size");
    }
    if (!std::filesystem::is_directory(options.extra_file_path)) {
      throw ConfigError("extra file path is not a directory: " + options.extra_file_path.string());
    }
  }
  if (options.slice_size + options.extra_file_size > partition::MAX_PIECE_BYTES) {
    throw ConfigError("slice size " + std::to_string(options.slice_size) + " + extra file slice size " +
                      std::to_string(options.extra_file_size) + " exceeds 32 GiB");
  }

  // Video segments
  if (!options.video_path.empty()) {
    if (!std::filesystem::exists(options.video_path)) {
      throw ConfigError("video file does not exist: " + options.video_path.string());
    }
    if (options.base_limit < 0) {
      throw ConfigError("base limit must not be negative, got " + std::to_string(options.base_limit));
    }
    if (options.video_step_ms <= 0) {
      throw ConfigError("video step must be positive, got " + std::to_string(options.video_step_ms));
    }
    if (options.video_reserve < 0) {
      throw ConfigError("video reserve must not be negative, got " + std::to_string(options.video_reserve));
    }
  }

  const std::int64_t reserved = !options.video_path.empty() ? options.video_reserve : options.extra_file_size;
  if (options.slice_size - reserved <= 0) {
    throw ConfigError("slice size " + std::to_string(options.slice_size) +
                      " leaves no room after reserving " + std::to_string(reserved) + " bytes");
  }
}

} // namespace slicer::config
