#pragma once
/**
 * @file reading_store.h
 * @brief Store boundary consumed (and written back to) by the positioning run.
 */

#include "store/records.h"
#include "rfpos_types.h"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace store {

struct ReadingStoreConfig {
  std::string backend = "sqlite";  // "sqlite" or "memory"
  std::string sqlite_db_uri;       // empty or ":memory:" => in-memory database
  std::string journal_mode;        // optional PRAGMA override
  std::string synchronous;         // optional PRAGMA override
};

class IReadingStore {
public:
  virtual ~IReadingStore() = default;

  virtual std::vector<Antenna> ListAntennas() const = 0;

  // All tags when role is empty, otherwise only tags of that role.
  virtual std::vector<Tag> ListTags(std::optional<TagRole> role = std::nullopt) const = 0;
  virtual std::optional<Tag> GetTag(const rfpos::TagId& tag_id) const = 0;

  // Readings in no particular order.
  virtual std::vector<Reading> ListReadings() const = 0;
  virtual std::vector<Reading> ListReadingsByTag(const rfpos::TagId& tag_id) const = 0;
  virtual std::vector<Reading> ListReadingsByAntenna(const rfpos::AntennaId& antenna_id) const = 0;

  virtual void UpsertAntenna(const Antenna& antenna) = 0;
  virtual void UpsertTag(const Tag& tag) = 0;

  // All-or-nothing insert. Readings must reference known tags and antennas.
  virtual void InsertReadings(const std::vector<Reading>& readings) = 0;

  // Write the predicted position of a target tag. Rejects unknown and reference tags.
  virtual void SetPredictedPosition(const rfpos::TagId& tag_id, double x, double y) = 0;
  virtual void MarkObserved(const rfpos::TagId& tag_id) = 0;

  virtual std::size_t ReadingCount() const = 0;

  // Writes between BeginWrite() and CommitWrite() apply together or not at all.
  // Batches do not nest. RollbackWrite() is a no-op without an open batch and never throws.
  virtual void BeginWrite() = 0;
  virtual void CommitWrite() = 0;
  virtual void RollbackWrite() = 0;
};

// Scoped write batch: rolls back on destruction unless Commit() was reached.
class WriteBatch {
public:
  explicit WriteBatch(IReadingStore& store) : store_(store) { store_.BeginWrite(); }
  ~WriteBatch() {
    if (!committed_) store_.RollbackWrite();
  }

  WriteBatch(const WriteBatch&) = delete;
  WriteBatch& operator=(const WriteBatch&) = delete;

  void Commit() {
    store_.CommitWrite();
    committed_ = true;
  }

private:
  IReadingStore& store_;
  bool committed_ = false;
};

std::unique_ptr<IReadingStore> CreateReadingStore(const ReadingStoreConfig& cfg);

} // namespace store
