#include "record.h"
#include "errors.h"

#include <charconv>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <limits>
#include <random>
#include <system_error>

namespace Recpool {

std::ostream& operator<<(std::ostream& os, const Record& record) {
    return os << "Record{id=" << record.id << ", value=" << record.value
              << ", timestamp=" << record.timestamp << "}";
}

uint64_t Add(uint64_t left, uint64_t right) {
    if (left > std::numeric_limits<uint64_t>::max() - right) {
        throw InvalidValue(std::to_string(left) + " + " + std::to_string(right) +
                           " overflows 64 bits");
    }
    return left + right;
}

std::string FormatValue(double value) {
    char buf[32];
    auto result = std::to_chars(buf, buf + sizeof(buf), value);
    if (result.ec != std::errc()) {
        throw InvalidValue("cannot format " + std::to_string(value));
    }
    return std::string(buf, result.ptr);
}

std::string CurrentTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto secs = std::chrono::time_point_cast<std::chrono::seconds>(now);
    auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(now - secs).count();

    std::time_t t = std::chrono::system_clock::to_time_t(secs);
    std::tm tm_utc;
    gmtime_r(&t, &tm_utc);

    char date[32];
    std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &tm_utc);
    char out[64];
    std::snprintf(out, sizeof(out), "%s.%09lld+00:00", date, static_cast<long long>(nanos));
    return std::string(out);
}

Record GenerateRandomRecord() {
    static thread_local std::mt19937_64 gen(std::random_device{}());
    std::uniform_int_distribution<uint64_t> id_dis(1, 999);
    std::uniform_real_distribution<double> value_dis(0.0, 100.0);

    return Record(id_dis(gen), value_dis(gen), CurrentTimestamp());
}

} // namespace Recpool
