#include "store/store.hpp"
#include <system_error>
#include <boost/log/trivial.hpp>

namespace slicer {
namespace store {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

// Initialize store with base directory path and ensure it exists
ArchiveStore::ArchiveStore(const std::filesystem::path& base_path) : base_path_(base_path) {
  BOOST_LOG_TRIVIAL(info) << "Store: Initializing archive store with base path: " << base_path.string();
  check_directory_exists(base_path_);
  BOOST_LOG_TRIVIAL(debug) << "Store: Store directory created/verified at: " << base_path.string();
}


//==============================================
// CORE STORAGE OPERATIONS
//==============================================

void ArchiveStore::store(const std::string& key, std::istream& data) {
  BOOST_LOG_TRIVIAL(info) << "Store: Storing archive with key: " << key;

  if (!data.good()) {
    BOOST_LOG_TRIVIAL(error) << "Store: Invalid input stream provided for key: " << key;
    throw StoreError("Store: Invalid input stream");
  }

  std::filesystem::path file_path = path_for(key);
  std::filesystem::path partial_path = file_path;
  partial_path += ".partial";

  // Write beside the target first so a reader never sees a half written archive
  {
    std::ofstream file(partial_path, std::ios::binary | std::ios::trunc);
    if (!file) {
      throw StoreError("Store: Failed to create file: " + partial_path.string());
    }

    std::uintmax_t bytes_written = 0;
    char buffer[64 * 1024];

    // Read input stream in chunks and write to file
    while (data.read(buffer, sizeof(buffer)) || data.gcount() > 0) {
      file.write(buffer, data.gcount());
      bytes_written += static_cast<std::uintmax_t>(data.gcount());
    }

    if (data.bad() || !file) {
      file.close();
      std::error_code ec;
      std::filesystem::remove(partial_path, ec);
      throw StoreError("Store: Failed to copy archive data for key: " + key);
    }
    BOOST_LOG_TRIVIAL(debug) << "Store: Wrote " << bytes_written << " bytes for key: " << key;
  }

  std::error_code ec;
  std::filesystem::rename(partial_path, file_path, ec);
  if (ec) {
    throw StoreError("Store: Failed to publish " + file_path.string() + ": " + ec.message());
  }
  BOOST_LOG_TRIVIAL(info) << "Store: Successfully stored archive with key: " << key;
}

void ArchiveStore::get(const std::string& key, std::ostream& output) const {
  BOOST_LOG_TRIVIAL(debug) << "Store: Retrieving archive for key: " << key;

  std::filesystem::path file_path = path_for(key);
  verify_file_exists(file_path);

  std::ifstream file(file_path, std::ios::binary);
  if (!file) {
    throw StoreError("Store: Failed to open file: " + file_path.string());
  }

  char buffer[64 * 1024];
  while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
    output.write(buffer, file.gcount());
  }

  if (!output.good()) {
    throw StoreError("Store: Failed to write to output stream");
  }
}

void ArchiveStore::rename(const std::string& from_key, const std::string& to_key) {
  BOOST_LOG_TRIVIAL(info) << "Store: Renaming " << from_key << " to " << to_key;

  std::filesystem::path from_path = path_for(from_key);
  std::filesystem::path to_path = path_for(to_key);
  verify_file_exists(from_path);

  std::error_code ec;
  std::filesystem::rename(from_path, to_path, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Store: Failed to rename " << from_key << ": " << ec.message();
    throw StoreError("Store: Failed to rename archive file: " + ec.message());
  }
}

void ArchiveStore::pad(const std::string& key, std::uintmax_t size) {
  std::filesystem::path file_path = path_for(key);
  verify_file_exists(file_path);

  std::uintmax_t current = std::filesystem::file_size(file_path);
  if (current > size) {
    throw StoreError("Store: Archive " + key + " is larger than the padded size " + std::to_string(size));
  }

  std::error_code ec;
  std::filesystem::resize_file(file_path, size, ec);
  if (ec) {
    throw StoreError("Store: Failed to pad archive " + key + ": " + ec.message());
  }
  BOOST_LOG_TRIVIAL(debug) << "Store: Padded " << key << " from " << current << " to " << size << " bytes";
}

void ArchiveStore::remove(const std::string& key) {
  BOOST_LOG_TRIVIAL(info) << "Store: Removing archive with key: " << key;

  std::filesystem::path file_path = path_for(key);

  // std::filesystem::remove returns true if a file was removed
  if (std::filesystem::remove(file_path)) {
    BOOST_LOG_TRIVIAL(info) << "Store: Successfully removed archive with key: " << key;
  } else {
    BOOST_LOG_TRIVIAL(error) << "Store: Failed to remove archive with key: " << key;
    throw StoreError("Store: Failed to remove file");
  }
}

void ArchiveStore::clear() {
  BOOST_LOG_TRIVIAL(info) << "Store: Clearing entire store at: " << base_path_.string();
  std::filesystem::remove_all(base_path_);
  check_directory_exists(base_path_);
  BOOST_LOG_TRIVIAL(info) << "Store: Store cleared successfully";
}


//==============================================
// QUERY OPERATIONS
//==============================================

bool ArchiveStore::has(const std::string& key) const {
  std::filesystem::path file_path = path_for(key);
  bool exists = std::filesystem::exists(file_path);

  BOOST_LOG_TRIVIAL(debug) << "Store: Key " << key << (exists ? " exists" : " not found")
                           << " at path: " << file_path.string();
  return exists;
}

std::uintmax_t ArchiveStore::get_file_size(const std::string& key) const {
  std::filesystem::path file_path = path_for(key);
  verify_file_exists(file_path);
  return std::filesystem::file_size(file_path);
}

std::filesystem::path ArchiveStore::path_for(const std::string& key) const {
  validate_key(key);
  return base_path_ / key;
}


//==============================================
// UTILITY METHODS
//==============================================

void ArchiveStore::check_directory_exists(const std::filesystem::path& path) const {
  if (!std::filesystem::exists(path)) {
    std::filesystem::create_directories(path);
  }
}

void ArchiveStore::validate_key(const std::string& key) const {
  if (key.empty() || key == "." || key == ".." ||
      key.find('/') != std::string::npos || key.find('\\') != std::string::npos) {
    throw StoreError("Store: Invalid archive key: '" + key + "'");
  }
}

void ArchiveStore::verify_file_exists(const std::filesystem::path& file_path) const {
  if (!std::filesystem::exists(file_path)) {
    BOOST_LOG_TRIVIAL(error) << "Store: File not found: " << file_path.string();
    throw StoreError("Store: File not found: " + file_path.string());
  }
}


//==============================================
// CSV MANIFEST
//==============================================

ManifestWriter::ManifestWriter(const std::filesystem::path& path, std::vector<std::string> header)
  : path_(path)
  , header_(std::move(header)) {}

void ManifestWriter::append(const std::vector<std::string>& row) {
  std::lock_guard<std::mutex> lock(mutex_);

  std::error_code ec;
  bool exists = std::filesystem::exists(path_, ec);
  if (ec) {
    throw StoreError("Store: Cannot stat manifest " + path_.string() + ": " + ec.message());
  }

  std::ofstream file(path_, std::ios::binary | std::ios::app);
  if (!file) {
    throw StoreError("Store: Failed to open manifest: " + path_.string());
  }

  if (!exists && !header_.empty()) {
    write_row(file, header_);
  }
  write_row(file, row);

  file.flush();
  if (!file) {
    throw StoreError("Store: Failed to write manifest: " + path_.string());
  }
  BOOST_LOG_TRIVIAL(debug) << "Store: Appended manifest row for " << (row.empty() ? "" : row.front());
}

void ManifestWriter::write_row(std::ostream& out, const std::vector<std::string>& row) {
  for (std::size_t i = 0; i < row.size(); ++i) {
    if (i > 0) {
      out << ',';
    }
    out << csv_escape(row[i]);
  }
  out << "\r\n";
}

std::string csv_escape(const std::string& field) {
  if (field.find_first_of(",\"\r\n") == std::string::npos &&
      (field.empty() || (field.front() != ' ' && field.front() != '\t'))) {
    return field;
  }
  std::string escaped = "\"";
  for (char c : field) {
    if (c == '"') {
      escaped += '"';
    }
    escaped += c;
  }
  escaped += '"';
  return escaped;
}

} // namespace store
} // namespace slicer
