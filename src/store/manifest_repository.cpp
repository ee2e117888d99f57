#include "store/manifest_repository.hpp"
#include <algorithm>
#include <chrono>
#include <fstream>
#include <system_error>
#include <unordered_set>
#include <boost/log/trivial.hpp>
#include <nlohmann/json.hpp>
#include "store/store.hpp"

namespace slicer {
namespace store {

using json = nlohmann::json;

namespace {

std::int64_t now_ms() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
    std::chrono::system_clock::now().time_since_epoch()).count();
}

json to_json(const ManifestRecord& record) {
  return json{
    {"id", record.id},
    {"payload_cid", record.payload_cid},
    {"filename", record.filename},
    {"piece_cid", record.piece_cid},
    {"payload_size", record.payload_size},
    {"piece_size", record.piece_size},
    {"detail", record.detail},
    {"status", to_string(record.status)},
    {"created_at", record.created_at},
    {"updated_at", record.updated_at},
  };
}

ManifestRecord from_json(const json& j) {
  ManifestRecord record;
  record.id = j.at("id").get<std::uint64_t>();
  record.payload_cid = j.at("payload_cid").get<std::string>();
  record.filename = j.at("filename").get<std::string>();
  record.piece_cid = j.at("piece_cid").get<std::string>();
  record.payload_size = j.at("payload_size").get<std::int64_t>();
  record.piece_size = j.at("piece_size").get<std::int64_t>();
  record.detail = j.value("detail", "");
  auto status = parse_status(j.at("status").get<std::string>());
  if (!status) {
    throw StoreError("Manifest repository: unknown status in record " + record.payload_cid);
  }
  record.status = *status;
  record.created_at = j.value("created_at", std::int64_t{0});
  record.updated_at = j.value("updated_at", record.created_at);
  return record;
}

} // namespace

std::string to_string(ManifestStatus status) {
  switch (status) {
    case ManifestStatus::Pending: return "pending";
    case ManifestStatus::Processing: return "processing";
    case ManifestStatus::Completed: return "completed";
    case ManifestStatus::Failed: return "failed";
  }
  return "unknown";
}

std::optional<ManifestStatus> parse_status(const std::string& name) {
  if (name == "pending") return ManifestStatus::Pending;
  if (name == "processing") return ManifestStatus::Processing;
  if (name == "completed") return ManifestStatus::Completed;
  if (name == "failed") return ManifestStatus::Failed;
  return std::nullopt;
}


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

ManifestRepository::ManifestRepository(std::filesystem::path path) : path_(std::move(path)) {
  BOOST_LOG_TRIVIAL(info) << "Manifest repository: Using " << path_.string();
  load();
}


//==============================================
// WRITES
//==============================================

ManifestRecord ManifestRepository::create(ManifestRecord record) {
  validate(record);
  std::lock_guard<std::mutex> lock(mutex_);
  if (by_payload_cid_.count(record.payload_cid)) {
    throw StoreError("Manifest repository: duplicate payload_cid: " + record.payload_cid);
  }
  ManifestRecord inserted = insert_locked(std::move(record));
  persist_locked();
  BOOST_LOG_TRIVIAL(debug) << "Manifest repository: Created record " << inserted.id << " for "
                           << inserted.payload_cid;
  return inserted;
}

std::vector<ManifestRecord> ManifestRepository::batch_create(std::vector<ManifestRecord> records) {
  std::unordered_set<std::string> seen;
  for (const auto& record : records) {
    validate(record);
    if (!seen.insert(record.payload_cid).second) {
      throw StoreError("Manifest repository: duplicate payload_cid in batch: " + record.payload_cid);
    }
  }

  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& record : records) {
    if (by_payload_cid_.count(record.payload_cid)) {
      throw StoreError("Manifest repository: duplicate payload_cid: " + record.payload_cid);
    }
  }

  std::vector<ManifestRecord> inserted;
  inserted.reserve(records.size());
  for (auto& record : records) {
    inserted.push_back(insert_locked(std::move(record)));
  }
  persist_locked();
  BOOST_LOG_TRIVIAL(info) << "Manifest repository: Created " << inserted.size() << " records";
  return inserted;
}

ManifestRecord ManifestRepository::update_status(const std::string& payload_cid, ManifestStatus status) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = by_payload_cid_.find(payload_cid);
  if (it == by_payload_cid_.end()) {
    throw StoreError("Manifest repository: no record for payload_cid: " + payload_cid);
  }
  ManifestRecord& record = records_.at(it->second);
  if (!transition_allowed(record.status, status)) {
    throw StoreError("Manifest repository: invalid status transition " + to_string(record.status) +
                     " -> " + to_string(status) + " for " + payload_cid);
  }
  record.status = status;
  record.updated_at = now_ms();
  persist_locked();
  return record;
}

void ManifestRepository::remove(const std::string& payload_cid) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = by_payload_cid_.find(payload_cid);
  if (it == by_payload_cid_.end()) {
    throw StoreError("Manifest repository: no record for payload_cid: " + payload_cid);
  }
  records_.erase(it->second);
  by_payload_cid_.erase(it);
  persist_locked();
}


//==============================================
// QUERIES
//==============================================

std::optional<ManifestRecord> ManifestRepository::get_by_payload_cid(const std::string& payload_cid) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = by_payload_cid_.find(payload_cid);
  if (it == by_payload_cid_.end()) {
    return std::nullopt;
  }
  return records_.at(it->second);
}

std::vector<ManifestRecord> ManifestRepository::get_by_piece_cid(const std::string& piece_cid) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<ManifestRecord> matches;
  for (const auto& entry : records_) {
    if (entry.second.piece_cid == piece_cid) {
      matches.push_back(entry.second);
    }
  }
  return matches;
}

ManifestPage ManifestRepository::list(std::size_t offset, std::size_t limit,
                                      std::optional<ManifestStatus> status) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<const ManifestRecord*> matches;
  for (const auto& entry : records_) {
    if (!status || entry.second.status == *status) {
      matches.push_back(&entry.second);
    }
  }
  std::sort(matches.begin(), matches.end(), [](const ManifestRecord* a, const ManifestRecord* b) {
    if (a->created_at != b->created_at) {
      return a->created_at > b->created_at;
    }
    return a->id > b->id;
  });

  ManifestPage page;
  page.total = matches.size();
  for (std::size_t i = offset; i < matches.size() && page.records.size() < limit; ++i) {
    page.records.push_back(*matches[i]);
  }
  return page;
}

std::map<ManifestStatus, std::size_t> ManifestRepository::stats_by_status() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::map<ManifestStatus, std::size_t> stats;
  for (const auto& entry : records_) {
    stats[entry.second.status]++;
  }
  return stats;
}

std::size_t ManifestRepository::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return records_.size();
}


//==============================================
// UTILITY METHODS
//==============================================

void ManifestRepository::validate(const ManifestRecord& record) {
  if (record.payload_cid.empty() || record.filename.empty() || record.piece_cid.empty()) {
    throw StoreError("Manifest repository: validation failed: required fields missing");
  }
  if (record.filename.size() > 1024) {
    throw StoreError("Manifest repository: validation failed: filename longer than 1024 characters");
  }
  if (record.payload_size <= 0 || record.piece_size <= 0) {
    throw StoreError("Manifest repository: validation failed: sizes must be positive");
  }
}

bool ManifestRepository::transition_allowed(ManifestStatus from, ManifestStatus to) {
  switch (from) {
    case ManifestStatus::Pending:
      return to == ManifestStatus::Processing || to == ManifestStatus::Completed || to == ManifestStatus::Failed;
    case ManifestStatus::Processing:
      return to == ManifestStatus::Completed || to == ManifestStatus::Failed;
    default:
      return false;
  }
}

ManifestRecord ManifestRepository::insert_locked(ManifestRecord record) {
  record.id = next_id_++;
  record.created_at = now_ms();
  record.updated_at = record.created_at;
  by_payload_cid_[record.payload_cid] = record.id;
  return records_.emplace(record.id, record).first->second;
}

void ManifestRepository::load() {
  if (!std::filesystem::exists(path_)) {
    return;
  }
  std::ifstream file(path_);
  if (!file) {
    throw StoreError("Manifest repository: cannot open " + path_.string());
  }

  try {
    json document = json::parse(file);
    next_id_ = document.value("next_id", std::uint64_t{1});
    for (const auto& item : document.at("records")) {
      ManifestRecord record = from_json(item);
      by_payload_cid_[record.payload_cid] = record.id;
      next_id_ = std::max(next_id_, record.id + 1);
      records_.emplace(record.id, std::move(record));
    }
  } catch (const json::exception& e) {
    throw StoreError("Manifest repository: malformed " + path_.string() + ": " + e.what());
  }
  BOOST_LOG_TRIVIAL(info) << "Manifest repository: Loaded " << records_.size() << " records";
}

void ManifestRepository::persist_locked() const {
  if (path_.empty()) {
    return;
  }

  json records = json::array();
  for (const auto& entry : records_) {
    records.push_back(to_json(entry.second));
  }
  json document{{"next_id", next_id_}, {"records", records}};

  std::filesystem::path partial = path_;
  partial += ".partial";
  {
    std::ofstream file(partial, std::ios::trunc);
    if (!file) {
      throw StoreError("Manifest repository: cannot write " + partial.string());
    }
    file << document.dump(2);
    if (!file) {
      throw StoreError("Manifest repository: failed writing " + partial.string());
    }
  }

  std::error_code ec;
  std::filesystem::rename(partial, path_, ec);
  if (ec) {
    throw StoreError("Manifest repository: cannot replace " + path_.string() + ": " + ec.message());
  }
}

} // namespace store
} // namespace slicer
