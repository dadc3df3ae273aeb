#include "test_support.h"

#include "common/time_utils.h"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace rfpos_test {

rfpos::Timestamp At(int seconds) {
  // 2024-01-01 00:00:00 UTC
  const rfpos::Timestamp base = 1704067200LL * rfpos::kMicrosPerSecond;
  return base + static_cast<rfpos::Timestamp>(seconds) * rfpos::kMicrosPerSecond;
}

store::Reading MakeReading(const rfpos::TagId& tag,
                           const rfpos::AntennaId& antenna,
                           double rssi,
                           int read_count,
                           int seconds) {
  store::Reading r;
  r.tag_id = tag;
  r.antenna_id = antenna;
  r.rssi = rssi;
  r.read_count = read_count;
  r.timestamp = At(seconds);
  return r;
}

store::Tag MakeReference(const rfpos::TagId& id, double x, double y) {
  store::Tag t;
  t.tag_id = id;
  t.role = store::TagRole::REFERENCE;
  t.true_x = x;
  t.true_y = y;
  return t;
}

store::Tag MakeTarget(const rfpos::TagId& id) {
  store::Tag t;
  t.tag_id = id;
  t.role = store::TagRole::TARGET;
  return t;
}

store::Tag MakeTarget(const rfpos::TagId& id, double true_x, double true_y) {
  store::Tag t = MakeTarget(id);
  t.true_x = true_x;
  t.true_y = true_y;
  return t;
}

void SeedTwoTagScenario(store::IReadingStore& s) {
  s.UpsertAntenna(store::Antenna{"A1", 0.0, 0.0});
  s.UpsertAntenna(store::Antenna{"A2", 4.0, 0.0});
  s.UpsertTag(MakeReference("T1", 0.0, 0.0));
  s.UpsertTag(MakeTarget("T2", 2.0, 2.0));

  std::vector<store::Reading> readings;
  for (int t = 1; t <= 3; ++t) {
    readings.push_back(MakeReading("T1", "A1", -50.0, 1, t));
    readings.push_back(MakeReading("T1", "A2", -60.0, 1, t));
    readings.push_back(MakeReading("T2", "A1", -55.0, 1, t));
    readings.push_back(MakeReading("T2", "A2", -65.0, 1, t));
  }
  s.InsertReadings(readings);
}

std::vector<fp::FingerprintRow> MakeTagRows(const rfpos::TagId& tag,
                                            std::size_t n,
                                            std::size_t k,
                                            double (*value)(std::size_t row, std::size_t col)) {
  std::vector<fp::FingerprintRow> rows(n);
  for (std::size_t i = 0; i < n; ++i) {
    fp::FingerprintRow& r = rows[i];
    r.tag_id = tag;
    r.timestamp = At(static_cast<int>(i));
    r.rssi.resize(k);
    r.rc.resize(k);
    for (std::size_t j = 0; j < k; ++j) {
      r.rssi[j] = value(i, j);
      r.rc[j] = value(i, k + j);
    }
  }
  return rows;
}

std::string MakeTempDir(const std::string& name) {
  const fs::path dir = fs::path(::testing::TempDir()) / ("rfpos_" + name);
  std::error_code ec;
  fs::remove_all(dir, ec);
  fs::create_directories(dir);
  return dir.string();
}

void WriteFile(const std::string& path, const std::string& content) {
  std::ofstream out(path, std::ios::trunc);
  if (!out) throw std::runtime_error("cannot write " + path);
  out << content;
}

} // namespace rfpos_test
