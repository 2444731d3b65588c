#include "utils/utf8_sanitize.hpp"

#include <cstddef>
#include <utility>

namespace utf8_sanitize {

namespace {

const unsigned char kReplacementUtf8[] = { 0xEF, 0xBF, 0xBD }; // U+FFFD
constexpr size_t kReplacementLength = sizeof(kReplacementUtf8);

// Length of the well-formed sequence starting at pointer, or 0 if the bytes
// there do not form one. Follows the table in Unicode 15, section 3.9.
size_t sequence_length(const unsigned char *pointer, const unsigned char *end) {
    const unsigned char lead = pointer[0];
    if (lead < 0x80u) {
        return 1;
    }

    size_t length = 0;
    unsigned char second_min = 0x80u;
    unsigned char second_max = 0xBFu;

    if (lead >= 0xC2u && lead <= 0xDFu) {
        length = 2;
    } else if (lead >= 0xE0u && lead <= 0xEFu) {
        length = 3;
        if (lead == 0xE0u) {
            second_min = 0xA0u;
        } else if (lead == 0xEDu) {
            second_max = 0x9Fu;
        }
    } else if (lead >= 0xF0u && lead <= 0xF4u) {
        length = 4;
        if (lead == 0xF0u) {
            second_min = 0x90u;
        } else if (lead == 0xF4u) {
            second_max = 0x8Fu;
        }
    } else {
        return 0;
    }

    if (static_cast<size_t>(end - pointer) < length) {
        return 0;
    }
    if (pointer[1] < second_min || pointer[1] > second_max) {
        return 0;
    }
    for (size_t index = 2; index < length; ++index) {
        if ((pointer[index] & 0xC0u) != 0x80u) {
            return 0;
        }
    }
    return length;
}

} // namespace

bool is_valid(const std::string &text) {
    const unsigned char *pointer = reinterpret_cast<const unsigned char *>(text.data());
    const unsigned char *end = pointer + text.size();

    while (pointer < end) {
        size_t length = sequence_length(pointer, end);
        if (length == 0) {
            return false;
        }
        pointer += length;
    }
    return true;
}

void sanitize(std::string &text) {
    if (is_valid(text)) {
        return;
    }

    std::string result;
    result.reserve(text.size() + kReplacementLength);

    const unsigned char *pointer = reinterpret_cast<const unsigned char *>(text.data());
    const unsigned char *end = pointer + text.size();

    while (pointer < end) {
        size_t length = sequence_length(pointer, end);
        if (length == 0) {
            result.append(reinterpret_cast<const char *>(kReplacementUtf8), kReplacementLength);
            ++pointer;
            continue;
        }
        result.append(reinterpret_cast<const char *>(pointer), length);
        pointer += length;
    }

    text = std::move(result);
}

} // namespace utf8_sanitize
