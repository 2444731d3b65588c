#ifndef INKWELL_UTF8_SANITIZE_HPP
#define INKWELL_UTF8_SANITIZE_HPP

// Text read back from SQLite is whatever bytes were stored. nlohmann::json
// refuses to dump invalid UTF-8, so column text passes through here first.

#include <string>

namespace utf8_sanitize {

// Returns true if text is well-formed UTF-8 (no overlongs, no surrogates).
bool is_valid(const std::string &text);

// Replaces each invalid byte with U+FFFD, in place.
void sanitize(std::string &text);

} // namespace utf8_sanitize

#endif // INKWELL_UTF8_SANITIZE_HPP
