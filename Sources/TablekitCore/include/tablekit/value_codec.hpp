#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include <optional>
#include <string>

namespace tablekit::codec {

/// Current time, truncated to seconds.
timestamp_t now();

/// "YYYY-MM-DD HH:MM:SS" (UTC).
std::string format_timestamp(timestamp_t ts);

/// Accepts "YYYY-MM-DD", "YYYY-MM-DD HH:MM[:SS]" and the same with a 'T'
/// separator, optional fractional seconds and an optional trailing 'Z'.
std::optional<timestamp_t> parse_timestamp(const std::string& text);

/// Converts a caller-supplied value into the column's semantic type.
/// Throws validation_error naming the column when the value does not fit.
field_value_t coerce(const field_value_t& value, const column_descriptor& column);

/// Logical value -> driver value (bool as 0/1, timestamps as text).
column_value_t to_physical(const field_value_t& value);

/// Driver value -> logical value for a column of the given type. Values the
/// type cannot interpret are returned as read rather than dropped.
field_value_t from_physical(const column_value_t& value, semantic_type type);

/// Text form used for messages and text coercion.
std::string to_display_string(const field_value_t& value);

} // namespace tablekit::codec

#endif // __cplusplus
