#include "build/archive_writer.hpp"
#include <algorithm>
#include <limits>
#include <system_error>
#include <boost/log/trivial.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include "build/build_error.hpp"
#include "crypto/byte_order.hpp"
#include "crypto/digest.hpp"

namespace slicer::build {

using crypto::ByteOrder;
using crypto::Sha256;
using partition::FileDescriptor;

namespace {

// Writes to the archive file and the running digest in one step
class HashingWriter {
public:
  HashingWriter(std::ofstream& out, Sha256& sha) : out_(out), sha_(sha) {}

  void write(const void* data, std::size_t length) {
    out_.write(static_cast<const char*>(data), static_cast<std::streamsize>(length));
    sha_.update(data, length);
    written_ += static_cast<std::int64_t>(length);
  }

  template<typename T>
  void write_integer(T value) {
    uint8_t buf[sizeof(T)];
    ByteOrder::putBigEndian(buf, value);
    write(buf, sizeof(T));
  }

  std::int64_t written() const { return written_; }

private:
  std::ofstream& out_;
  Sha256& sha_;
  std::int64_t written_ = 0;
};

// Removes a partially written archive unless dismissed
class TempFileGuard {
public:
  explicit TempFileGuard(std::filesystem::path path) : path_(std::move(path)) {}
  ~TempFileGuard() {
    if (armed_) {
      std::error_code ec;
      std::filesystem::remove(path_, ec);
    }
  }
  void dismiss() { armed_ = false; }

private:
  std::filesystem::path path_;
  bool armed_ = true;
};

bool is_beneath(const std::filesystem::path& path, const std::filesystem::path& parent) {
  auto relative = path.lexically_relative(parent);
  return !relative.empty() && *relative.begin() != "..";
}

} // namespace

//==============================================
// SLICE ARCHIVE
//==============================================

SliceArchive::SliceArchive(std::filesystem::path path, std::string content_id, std::int64_t size,
                           std::vector<ArchiveEntry> entries)
  : path_(std::move(path))
  , content_id_(std::move(content_id))
  , size_(size)
  , entries_(std::move(entries)) {}

SliceArchive::~SliceArchive() {
  std::error_code ec;
  std::filesystem::remove(path_, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(warning) << "Archive: Failed to remove temporary archive " << path_.string()
                               << ": " << ec.message();
  }
}

std::ifstream SliceArchive::open() const {
  std::ifstream in(path_, std::ios::binary);
  if (!in) {
    throw BuildError("Archive: Failed to open " + path_.string());
  }
  return in;
}


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

ArchiveWriter::ArchiveWriter(std::filesystem::path work_dir, std::filesystem::path parent_path)
  : work_dir_(std::move(work_dir))
  , parent_path_(std::move(parent_path)) {
  if (!parent_path_.empty()) {
    parent_path_ = parent_path_.lexically_normal();
  }
}


//==============================================
// WRITING
//==============================================

std::unique_ptr<SliceArchive> ArchiveWriter::write(const std::vector<FileDescriptor>& descriptors) const {
  if (descriptors.size() > std::numeric_limits<uint32_t>::max()) {
    throw BuildError("Archive: Too many entries: " + std::to_string(descriptors.size()));
  }

  std::filesystem::path path = temp_path();
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw BuildError("Archive: Failed to create " + path.string());
  }
  TempFileGuard guard(path);

  Sha256 archive_sha;
  HashingWriter writer(out, archive_sha);
  writer.write(ARCHIVE_MAGIC, sizeof(ARCHIVE_MAGIC));
  writer.write_integer(static_cast<uint32_t>(descriptors.size()));

  std::vector<ArchiveEntry> entries;
  entries.reserve(descriptors.size());
  std::vector<char> buffer(64 * 1024);

  for (const auto& descriptor : descriptors) {
    ArchiveEntry entry;
    entry.name = entry_name(descriptor);
    entry.size = descriptor.size_in_slice();
    if (entry.name.size() > std::numeric_limits<uint16_t>::max()) {
      throw BuildError("Archive: Entry name too long: " + entry.name);
    }

    writer.write_integer(static_cast<uint16_t>(entry.name.size()));
    writer.write(entry.name.data(), entry.name.size());
    writer.write_integer(static_cast<uint64_t>(entry.size));

    Sha256 entry_sha;
    std::int64_t remaining = entry.size;
    if (remaining > 0) {
      std::ifstream in(descriptor.path, std::ios::binary);
      if (!in) {
        throw BuildError("Archive: Failed to open source " + descriptor.path.string());
      }
      in.seekg(descriptor.byte_start);
      while (remaining > 0 && in) {
        auto chunk = static_cast<std::streamsize>(
          std::min<std::int64_t>(remaining, static_cast<std::int64_t>(buffer.size())));
        in.read(buffer.data(), chunk);
        auto got = static_cast<std::size_t>(in.gcount());
        writer.write(buffer.data(), got);
        entry_sha.update(buffer.data(), got);
        remaining -= static_cast<std::int64_t>(got);
      }
    }
    if (remaining != 0) {
      throw BuildError("Archive: Source " + descriptor.path.string() + " ended " +
                       std::to_string(remaining) + " bytes short of range [" +
                       std::to_string(descriptor.byte_start) + ", " + std::to_string(descriptor.byte_end) + "]");
    }

    entry.digest = Sha256::to_hex(entry_sha.finish());
    entries.push_back(std::move(entry));
  }

  out.close();
  if (!out) {
    throw BuildError("Archive: Failed to write " + path.string());
  }

  std::string content_id = "payload-" + Sha256::to_hex(archive_sha.finish());
  std::int64_t size = writer.written();

  BOOST_LOG_TRIVIAL(debug) << "Archive: Wrote " << entries.size() << " entries, " << size
                           << " bytes, content id " << content_id;

  auto archive = std::make_unique<SliceArchive>(path, std::move(content_id), size, std::move(entries));
  guard.dismiss();
  return archive;
}

std::string ArchiveWriter::entry_name(const FileDescriptor& descriptor) const {
  if (parent_path_.empty()) {
    return descriptor.display_name;
  }
  auto source = descriptor.path.lexically_normal();
  if (!is_beneath(source, parent_path_)) {
    return descriptor.display_name;
  }
  auto directory = source.lexically_relative(parent_path_).parent_path();
  if (directory.empty()) {
    return descriptor.display_name;
  }
  return (directory / descriptor.display_name).generic_string();
}

std::filesystem::path ArchiveWriter::temp_path() const {
  static thread_local boost::uuids::random_generator generator;
  return work_dir_ / (".slice-" + boost::uuids::to_string(generator()) + ".tmp");
}

} // namespace slicer::build
