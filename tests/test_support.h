#pragma once

#include "fingerprint/fingerprint_row.h"
#include "store/reading_store.h"

#include <string>
#include <vector>

namespace rfpos_test {

// Timestamp for a whole number of seconds after 2024-01-01 00:00:00 UTC.
rfpos::Timestamp At(int seconds);

store::Reading MakeReading(const rfpos::TagId& tag,
                           const rfpos::AntennaId& antenna,
                           double rssi,
                           int read_count,
                           int seconds);

store::Tag MakeReference(const rfpos::TagId& id, double x, double y);
store::Tag MakeTarget(const rfpos::TagId& id);
store::Tag MakeTarget(const rfpos::TagId& id, double true_x, double true_y);

/**
 * Two antennas (A1, A2); reference T1 at (0,0) read three times at -50/-60 dBm,
 * target T2 with truth (2,2) read three times at -55/-65 dBm, read count 1 each.
 */
void SeedTwoTagScenario(store::IReadingStore& s);

// Fingerprint rows for one tag on a k-antenna axis with values from (row, column).
std::vector<fp::FingerprintRow> MakeTagRows(const rfpos::TagId& tag,
                                            std::size_t n,
                                            std::size_t k,
                                            double (*value)(std::size_t row, std::size_t col));

// Fresh empty directory under the gtest temp dir.
std::string MakeTempDir(const std::string& name);

void WriteFile(const std::string& path, const std::string& content);

} // namespace rfpos_test
