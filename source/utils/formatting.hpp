#ifndef INKWELL_FORMATTING_HPP
#define INKWELL_FORMATTING_HPP

// Markdown rendering and value helpers shared by the tool handlers.

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace formatting {

using json = nlohmann::json;

// "---\n_<watermark>_", appended to every markdown block.
std::string get_watermark(const std::string &watermark_text);

// Renders a column value for display: strings as-is, numbers via dump(),
// null or missing as empty.
std::string text_of(const json &value);

// True when a column value is present and not null, empty, false or zero.
bool is_truthy(const json &value);

// Decodes a tag column stored as JSON array text. Anything else yields {}.
std::vector<std::string> parse_json_array(const json &value);

// Rounds half away from zero to one decimal place.
double round_one_decimal(double value);

// Current UTC time as ISO 8601 with milliseconds, e.g. 2026-02-01T10:00:00.000Z.
std::string iso_timestamp_now();

std::string format_article_md(const json &article);
std::string format_note_md(const json &note);
std::string format_source_md(const json &source);

} // namespace formatting

#endif // INKWELL_FORMATTING_HPP
