#include "enumerate/file_enumerator.hpp"
#include <algorithm>
#include <random>
#include <stdexcept>
#include <system_error>
#include <boost/asio/post.hpp>
#include <boost/log/trivial.hpp>

namespace slicer {
namespace enumerate {

namespace fs = std::filesystem;

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

FileEnumerator::FileEnumerator(std::size_t workers) : workers_(workers) {
  if (workers_ == 0) {
    throw std::invalid_argument("File enumerator: worker count must be > 0");
  }
}


//==============================================
// ENUMERATION
//==============================================

EnumerationResult FileEnumerator::enumerate(const std::vector<fs::path>& roots) const {
  BOOST_LOG_TRIVIAL(info) << "File enumerator: Scanning " << roots.size() << " root(s) with "
                          << workers_ << " worker(s)";

  ScanState state;
  boost::asio::thread_pool pool(workers_);

  for (const auto& root : roots) {
    std::error_code ec;
    auto status = fs::status(root, ec);
    if (ec || !fs::exists(status)) {
      BOOST_LOG_TRIVIAL(warning) << "File enumerator: Root not accessible: " << root.string()
                                 << (ec ? " (" + ec.message() + ")" : "");
      state.skipped++;
      continue;
    }

    if (fs::is_regular_file(status)) {
      publish_file(root, state);
    } else if (fs::is_directory(status)) {
      boost::asio::post(pool, [this, root, &state, &pool]() {
        scan_directory(root, state, pool);
      });
    } else {
      BOOST_LOG_TRIVIAL(warning) << "File enumerator: Root is neither file nor directory: " << root.string();
      state.skipped++;
    }
  }

  // Work posted from inside the workers counts as outstanding, join waits for all of it
  pool.join();

  EnumerationResult result;
  result.files = state.channel.drain();
  result.skipped = state.skipped.load();
  std::sort(result.files.begin(), result.files.end(),
            [](const FileDescriptor& lhs, const FileDescriptor& rhs) { return lhs.path < rhs.path; });

  BOOST_LOG_TRIVIAL(info) << "File enumerator: Found " << result.files.size() << " file(s), skipped "
                          << result.skipped;
  return result;
}

void FileEnumerator::scan_directory(const fs::path& directory, ScanState& state,
                                    boost::asio::thread_pool& pool) const {
  BOOST_LOG_TRIVIAL(trace) << "File enumerator: Scanning directory " << directory.string();

  std::error_code ec;
  fs::directory_iterator it(directory, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(warning) << "File enumerator: Cannot open directory " << directory.string()
                               << ": " << ec.message();
    state.skipped++;
    return;
  }

  for (fs::directory_iterator end; it != end;) {
    const fs::directory_entry& entry = *it;
    std::error_code entry_ec;

    // Linked directories are not followed so cycles cannot occur
    if (entry.is_symlink(entry_ec) && entry.is_directory(entry_ec)) {
      BOOST_LOG_TRIVIAL(debug) << "File enumerator: Not following directory link " << entry.path().string();
    } else if (entry.is_directory(entry_ec)) {
      fs::path sub_directory = entry.path();
      boost::asio::post(pool, [this, sub_directory, &state, &pool]() {
        scan_directory(sub_directory, state, pool);
      });
    } else if (entry.is_regular_file(entry_ec)) {
      publish_file(entry.path(), state);
    } else if (entry.is_symlink(entry_ec)) {
      BOOST_LOG_TRIVIAL(warning) << "File enumerator: Broken link skipped: " << entry.path().string();
      state.skipped++;
    } else if (entry_ec) {
      BOOST_LOG_TRIVIAL(warning) << "File enumerator: Cannot stat " << entry.path().string()
                                 << ": " << entry_ec.message();
      state.skipped++;
    }

    it.increment(ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(warning) << "File enumerator: Error while listing " << directory.string()
                                 << ": " << ec.message();
      state.skipped++;
      return;
    }
  }
}

void FileEnumerator::publish_file(const fs::path& file, ScanState& state) const {
  std::error_code ec;
  auto size = fs::file_size(file, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(warning) << "File enumerator: Cannot read size of " << file.string()
                               << ": " << ec.message();
    state.skipped++;
    return;
  }
  state.channel.produce(FileDescriptor::whole(file, static_cast<std::int64_t>(size)));
}


//==============================================
// HELPERS
//==============================================

void shuffle_descriptors(std::vector<FileDescriptor>& files, std::optional<std::uint64_t> seed) {
  std::mt19937_64 generator(seed ? *seed : std::random_device{}());
  std::shuffle(files.begin(), files.end(), generator);
}

std::int64_t total_size(const std::vector<FileDescriptor>& files) {
  std::int64_t total = 0;
  for (const auto& file : files) {
    total += file.size_in_slice();
  }
  return total;
}

std::size_t slice_total(std::int64_t total, std::int64_t capacity) {
  if (capacity <= 0) {
    throw std::invalid_argument("slice capacity must be > 0");
  }
  if (total <= 0) {
    return 0;
  }
  return static_cast<std::size_t>((total + capacity - 1) / capacity);
}

} // namespace enumerate
} // namespace slicer
