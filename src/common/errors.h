#ifndef RECPOOL_COMMON_ERRORS_H_
#define RECPOOL_COMMON_ERRORS_H_

#include <cstddef>
#include <stdexcept>
#include <string>

namespace Recpool {

/**
 * Thrown when an arena cannot serve a range request, either from its
 * free-range list or from the space left above its watermark.
 * Non-fatal: callers may retry with a larger arena.
 */
class CapacityExceeded : public std::runtime_error {
public:
    CapacityExceeded(size_t requested, size_t available)
        : std::runtime_error("Capacity exceeded: requested " + std::to_string(requested) +
                             " slots, " + std::to_string(available) + " available"),
          requested_(requested),
          available_(available) {}

    size_t Requested() const { return requested_; }
    size_t Available() const { return available_; }

private:
    size_t requested_;
    size_t available_;
};

// Value rejected before encoding or arithmetic (non-finite, overflow).
class InvalidValue : public std::runtime_error {
public:
    explicit InvalidValue(const std::string& detail)
        : std::runtime_error("Invalid value: " + detail) {}
};

// Malformed, incomplete or wrongly typed record encoding.
class SerializationError : public std::runtime_error {
public:
    explicit SerializationError(const std::string& detail)
        : std::runtime_error("Serialization error: " + detail) {}
};

} // namespace Recpool

#endif // RECPOOL_COMMON_ERRORS_H_
