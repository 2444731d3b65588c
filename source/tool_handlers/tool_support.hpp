#ifndef INKWELL_TOOL_SUPPORT_HPP
#define INKWELL_TOOL_SUPPORT_HPP

// Argument extraction and result helpers shared by the tool handlers.
// Arguments come straight from the client, so every accessor tolerates a
// missing key, a null value or an unexpected type.

#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "storage/storage_types.hpp"

namespace tool_support {

using json = nlohmann::json;

// Value of key in object, or a null value when absent.
const json &field(const json &object, const char *key);

// Present and not null.
bool has(const json &arguments, const char *key);

// Present and not null, empty, false or zero.
bool truthy(const json &arguments, const char *key);

// The argument rendered as text ("" when absent). Numbers are rendered, not rejected.
std::string text(const json &arguments, const char *key);

// A number, or a string holding one. std::nullopt otherwise.
std::optional<double> number(const json &arguments, const char *key);

// number() as a bindable value: integral numbers stay integers.
std::optional<json> numeric_value(const json &arguments, const char *key);

// Page size: default_value when absent, otherwise clamped to [1, maximum].
int64_t limit(const json &arguments, const char *key, int64_t default_value, int64_t maximum);

// Non-negative offset, 0 when absent.
int64_t offset(const json &arguments, const char *key);

// An array argument with every element rendered as text. Anything else yields {}.
std::vector<std::string> string_list(const json &arguments, const char *key);

// Trimmed copy of text.
std::string trim(const std::string &text);

// One formatted line per row joined by newlines, then a blank line and the watermark.
std::string markdown_list(const std::vector<storage::Row> &rows,
                          std::string (*format_row)(const json &row),
                          const std::string &watermark_text);

// row with message added under "message".
json with_message(const json &row, const std::string &message);

} // namespace tool_support

#endif // INKWELL_TOOL_SUPPORT_HPP
