#include "store/reading_store.h"

#include "store/sqlite_reading_store.h"
#include "common/errors.h"

#include <algorithm>
#include <cctype>
#include <map>
#include <memory>
#include <utility>

namespace store {
namespace {

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

// Container-backed store with the same referential rules as the sqlite schema.
// Used by tests and dry runs; nothing is persisted.
class MemoryReadingStore final : public IReadingStore {
public:
  std::vector<Antenna> ListAntennas() const override {
    std::vector<Antenna> out;
    out.reserve(antennas_.size());
    for (const auto& kv : antennas_) out.push_back(kv.second);
    return out;
  }

  std::vector<Tag> ListTags(std::optional<TagRole> role) const override {
    std::vector<Tag> out;
    for (const auto& kv : tags_) {
      if (!role || kv.second.role == *role) out.push_back(kv.second);
    }
    return out;
  }

  std::optional<Tag> GetTag(const rfpos::TagId& tag_id) const override {
    auto it = tags_.find(tag_id);
    if (it == tags_.end()) return std::nullopt;
    return it->second;
  }

  std::vector<Reading> ListReadings() const override { return readings_; }

  std::vector<Reading> ListReadingsByTag(const rfpos::TagId& tag_id) const override {
    std::vector<Reading> out;
    for (const Reading& r : readings_) {
      if (r.tag_id == tag_id) out.push_back(r);
    }
    return out;
  }

  std::vector<Reading> ListReadingsByAntenna(const rfpos::AntennaId& antenna_id) const override {
    std::vector<Reading> out;
    for (const Reading& r : readings_) {
      if (r.antenna_id == antenna_id) out.push_back(r);
    }
    return out;
  }

  void UpsertAntenna(const Antenna& antenna) override {
    if (antenna.antenna_id.empty()) {
      throw rfpos::DataError("Antenna id must not be empty");
    }
    antennas_[antenna.antenna_id] = antenna;
  }

  void UpsertTag(const Tag& tag) override {
    ValidateTag(tag);
    tags_[tag.tag_id] = tag;
  }

  void InsertReadings(const std::vector<Reading>& readings) override {
    // Validate everything first so a failure leaves the store untouched.
    for (const Reading& r : readings) {
      if (tags_.find(r.tag_id) == tags_.end()) {
        throw rfpos::StoreError("Reading references unknown tag '" + r.tag_id + "'");
      }
      if (antennas_.find(r.antenna_id) == antennas_.end()) {
        throw rfpos::StoreError("Reading references unknown antenna '" + r.antenna_id + "'");
      }
      if (r.read_count < 0) {
        throw rfpos::DataError("Negative read count for tag '" + r.tag_id + "'");
      }
    }
    for (Reading r : readings) {
      r.record_id = ++last_record_id_;
      readings_.push_back(r);
    }
  }

  void SetPredictedPosition(const rfpos::TagId& tag_id, double x, double y) override {
    auto it = tags_.find(tag_id);
    if (it == tags_.end()) {
      throw rfpos::StoreError("SetPredictedPosition: unknown tag '" + tag_id + "'");
    }
    if (it->second.role == TagRole::REFERENCE) {
      throw rfpos::DataError("Reference tag '" + tag_id + "' must not carry predicted coordinates");
    }
    it->second.pred_x = x;
    it->second.pred_y = y;
  }

  void MarkObserved(const rfpos::TagId& tag_id) override {
    auto it = tags_.find(tag_id);
    if (it == tags_.end()) {
      throw rfpos::StoreError("MarkObserved: unknown tag '" + tag_id + "'");
    }
    it->second.is_read = true;
  }

  std::size_t ReadingCount() const override { return readings_.size(); }

  void BeginWrite() override {
    if (snapshot_) {
      throw rfpos::StoreError("BeginWrite: a write batch is already open");
    }
    snapshot_ = std::make_unique<Snapshot>(Snapshot{antennas_, tags_, readings_, last_record_id_});
  }

  void CommitWrite() override {
    if (!snapshot_) {
      throw rfpos::StoreError("CommitWrite: no write batch is open");
    }
    snapshot_.reset();
  }

  void RollbackWrite() override {
    if (!snapshot_) return;
    antennas_ = std::move(snapshot_->antennas);
    tags_ = std::move(snapshot_->tags);
    readings_ = std::move(snapshot_->readings);
    last_record_id_ = snapshot_->last_record_id;
    snapshot_.reset();
  }

private:
  struct Snapshot {
    std::map<rfpos::AntennaId, Antenna> antennas;
    std::map<rfpos::TagId, Tag> tags;
    std::vector<Reading> readings;
    std::int64_t last_record_id = 0;
  };

  std::map<rfpos::AntennaId, Antenna> antennas_;
  std::map<rfpos::TagId, Tag> tags_;
  std::vector<Reading> readings_;
  std::int64_t last_record_id_ = 0;
  std::unique_ptr<Snapshot> snapshot_;  // state at BeginWrite(); null outside a batch
};

} // namespace

std::unique_ptr<IReadingStore> CreateReadingStore(const ReadingStoreConfig& cfg) {
  const std::string backend = to_lower(cfg.backend);
  if (backend == "sqlite") {
    return std::make_unique<SqliteReadingStore>(cfg);
  }
  if (backend == "memory") {
    return std::make_unique<MemoryReadingStore>();
  }
  throw rfpos::ConfigurationError("CreateReadingStore: unknown backend '" + cfg.backend + "'");
}

} // namespace store
