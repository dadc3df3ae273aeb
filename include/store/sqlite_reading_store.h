#pragma once

#include "store/reading_store.h"

#include <string>

namespace store {

// SQLite-backed reading store. Schema: antenna, tag, record (see sqlite_reading_store.cpp).
// File databases use WAL journaling unless overridden; ":memory:" uses in-memory pragmas.
class SqliteReadingStore final : public IReadingStore {
public:
  explicit SqliteReadingStore(const ReadingStoreConfig& cfg);
  ~SqliteReadingStore() override;

  SqliteReadingStore(const SqliteReadingStore&) = delete;
  SqliteReadingStore& operator=(const SqliteReadingStore&) = delete;

  std::vector<Antenna> ListAntennas() const override;
  std::vector<Tag> ListTags(std::optional<TagRole> role = std::nullopt) const override;
  std::optional<Tag> GetTag(const rfpos::TagId& tag_id) const override;

  std::vector<Reading> ListReadings() const override;
  std::vector<Reading> ListReadingsByTag(const rfpos::TagId& tag_id) const override;
  std::vector<Reading> ListReadingsByAntenna(const rfpos::AntennaId& antenna_id) const override;

  void UpsertAntenna(const Antenna& antenna) override;
  void UpsertTag(const Tag& tag) override;
  void InsertReadings(const std::vector<Reading>& readings) override;

  void SetPredictedPosition(const rfpos::TagId& tag_id, double x, double y) override;
  void MarkObserved(const rfpos::TagId& tag_id) override;

  std::size_t ReadingCount() const override;

  void BeginWrite() override;
  void CommitWrite() override;
  void RollbackWrite() override;

private:
  void Begin();     // BEGIN IMMEDIATE
  void Commit();    // COMMIT
  void Rollback();  // ROLLBACK (safe to call after errors)

  struct Impl;
  Impl* p_;
};

} // namespace store
