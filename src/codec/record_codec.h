#ifndef RECPOOL_CODEC_RECORD_CODEC_H_
#define RECPOOL_CODEC_RECORD_CODEC_H_

#include <string>
#include "common/record.h"

namespace Recpool {

/**
 * Encode a record as compact JSON with fields in declaration order:
 *   {"id":42,"value":3.14,"timestamp":"2025-10-26T12:00:00Z"}
 * value is written in shortest round-trip form (1.0 for integral values).
 * @throws InvalidValue if value is NaN or infinite
 */
std::string ToJson(const Record& record);

/**
 * Decode a strict JSON object produced by ToJson (or any equivalent object).
 * All three fields are required; id must be an unsigned integer, value a
 * number and timestamp a string. Unknown fields are ignored.
 * @throws SerializationError on malformed input, missing or mistyped fields
 */
Record FromJson(const std::string& json);

} // namespace Recpool

#endif // RECPOOL_CODEC_RECORD_CODEC_H_
