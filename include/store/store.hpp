#pragma once

#include <string>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <mutex>
#include <vector>

namespace slicer {
namespace store {

// Slice archives on disk, one file per key directly under the base directory
class ArchiveStore {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit ArchiveStore(const std::filesystem::path& base_path);


  // ---- CORE STORAGE OPERATIONS ----
  // Stores the stream under the given key; an existing archive is never appended to
  void store(const std::string& key, std::istream& data);
  // Streams the archive stored under the key into output
  void get(const std::string& key, std::ostream& output) const;
  // Renames an archive, used to drop the format suffix
  void rename(const std::string& from_key, const std::string& to_key);
  // Grows the archive with zero bytes up to size
  void pad(const std::string& key, std::uintmax_t size);
  // Removes data associated with given key
  void remove(const std::string& key);
  // Removes all stored data and reset store
  void clear();


  // ---- QUERY OPERATIONS ----
  // Checks if data exists using given key
  bool has(const std::string& key) const;
  // Returns the size of the stored file in bytes
  std::uintmax_t get_file_size(const std::string& key) const;
  // Resolves a key to its path without checking existence
  std::filesystem::path path_for(const std::string& key) const;

  const std::filesystem::path& base_path() const { return base_path_; }

private:
  // ---- PARAMETERS ----
  // Root path for all stored files
  std::filesystem::path base_path_;


  // ---- QUERY OPERATIONS ----
  // Ensures directory exists, create if needed
  void check_directory_exists(const std::filesystem::path& path) const;
  // Keys name files directly, so separators and dot segments are rejected
  void validate_key(const std::string& key) const;
  // Verifies if a file exists at the given path, throws StoreError if not found
  void verify_file_exists(const std::filesystem::path& file_path) const;
};

// Appends rows to a CSV manifest, writing the header when the file is created
class ManifestWriter {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  ManifestWriter(const std::filesystem::path& path, std::vector<std::string> header);


  // ---- WRITING ----
  // Thread-safe; rows end with CRLF
  void append(const std::vector<std::string>& row);

  const std::filesystem::path& path() const { return path_; }

private:
  // ---- PARAMETERS ----
  std::filesystem::path path_;
  std::vector<std::string> header_;
  std::mutex mutex_;

  static void write_row(std::ostream& out, const std::vector<std::string>& row);
};

// Quotes a field when it contains a comma, quote or line break
std::string csv_escape(const std::string& field);

class StoreError : public std::runtime_error {
public:
  explicit StoreError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace store
} // namespace slicer
