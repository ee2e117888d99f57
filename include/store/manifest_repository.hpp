#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace slicer {
namespace store {

enum class ManifestStatus { Pending, Processing, Completed, Failed };

std::string to_string(ManifestStatus status);
// Returns nullopt for an unknown status name
std::optional<ManifestStatus> parse_status(const std::string& name);

// One recorded slice: content id to slice name to piece commitment
struct ManifestRecord {
  std::uint64_t id = 0;
  std::string payload_cid;
  std::string filename;
  std::string piece_cid;
  std::int64_t payload_size = 0;
  std::int64_t piece_size = 0;
  std::string detail;
  ManifestStatus status = ManifestStatus::Pending;
  // Milliseconds since the epoch
  std::int64_t created_at = 0;
  std::int64_t updated_at = 0;
};

struct ManifestPage {
  std::vector<ManifestRecord> records;
  // Matching records before paging
  std::size_t total = 0;
};

// Slice metadata keyed by unique payload_cid with a secondary piece_cid lookup.
// Thread-safe. When constructed with a path, the repository loads the JSON
// document found there and rewrites it after every change.
class ManifestRepository {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  ManifestRepository() = default;
  explicit ManifestRepository(std::filesystem::path path);


  // ---- WRITES ----
  // Validates and inserts the record, returning it with id and timestamps assigned.
  // Throws StoreError on missing fields, non-positive sizes or a duplicate payload_cid.
  ManifestRecord create(ManifestRecord record);
  // Inserts all records or none
  std::vector<ManifestRecord> batch_create(std::vector<ManifestRecord> records);
  // Allowed: pending to processing, completed or failed; processing to completed or failed
  ManifestRecord update_status(const std::string& payload_cid, ManifestStatus status);
  void remove(const std::string& payload_cid);


  // ---- QUERIES ----
  std::optional<ManifestRecord> get_by_payload_cid(const std::string& payload_cid) const;
  std::vector<ManifestRecord> get_by_piece_cid(const std::string& piece_cid) const;
  // Newest first
  ManifestPage list(std::size_t offset, std::size_t limit,
                    std::optional<ManifestStatus> status = std::nullopt) const;
  std::map<ManifestStatus, std::size_t> stats_by_status() const;
  std::size_t size() const;

private:
  // ---- PARAMETERS ----
  std::filesystem::path path_;
  mutable std::mutex mutex_;
  std::uint64_t next_id_ = 1;
  std::map<std::uint64_t, ManifestRecord> records_;
  std::unordered_map<std::string, std::uint64_t> by_payload_cid_;

  static void validate(const ManifestRecord& record);
  static bool transition_allowed(ManifestStatus from, ManifestStatus to);
  ManifestRecord insert_locked(ManifestRecord record);
  void load();
  void persist_locked() const;
};

} // namespace store
} // namespace slicer
