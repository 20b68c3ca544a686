#ifndef RECPOOL_COMMON_RECORD_H_
#define RECPOOL_COMMON_RECORD_H_

#include <cstdint>
#include <ostream>
#include <string>
#include <utility>

namespace Recpool {

/**
 * Immutable sample carried through the pools.
 * Equality is by field value, never by storage slot.
 * Default-constructible so that arenas can hold unassigned slots.
 */
struct Record {
    uint64_t id = 0;
    double value = 0.0;
    std::string timestamp;   // ISO-8601, opaque to the pools

    Record() = default;
    Record(uint64_t id_, double value_, std::string timestamp_)
        : id(id_), value(value_), timestamp(std::move(timestamp_)) {}
};

inline bool operator==(const Record& a, const Record& b) {
    return a.id == b.id && a.value == b.value && a.timestamp == b.timestamp;
}

inline bool operator!=(const Record& a, const Record& b) {
    return !(a == b);
}

std::ostream& operator<<(std::ostream& os, const Record& record);

/**
 * Add two unsigned integers.
 * @throws InvalidValue if the sum does not fit in 64 bits
 */
uint64_t Add(uint64_t left, uint64_t right);

/**
 * Generate a record with id in [1, 1000), value in [0, 100) and the current
 * UTC time as an RFC 3339 timestamp.
 */
Record GenerateRandomRecord();

// Shortest decimal text that parses back to exactly `value`, e.g. 0.1, 50.5, 1
std::string FormatValue(double value);

// Current UTC time formatted as RFC 3339 with nanoseconds, e.g.
// 2025-10-26T12:00:00.123456789+00:00
std::string CurrentTimestamp();

} // namespace Recpool

#endif // RECPOOL_COMMON_RECORD_H_
