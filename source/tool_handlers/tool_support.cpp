#include "tool_handlers/tool_support.hpp"
#include "utils/formatting.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>

namespace tool_support {

const json &field(const json &object, const char *key) {
    static const json null_value;
    if (!object.is_object()) {
        return null_value;
    }
    auto iterator = object.find(key);
    return iterator == object.end() ? null_value : *iterator;
}

bool has(const json &arguments, const char *key) {
    return !field(arguments, key).is_null();
}

bool truthy(const json &arguments, const char *key) {
    return formatting::is_truthy(field(arguments, key));
}

std::string text(const json &arguments, const char *key) {
    return formatting::text_of(field(arguments, key));
}

std::optional<double> number(const json &arguments, const char *key) {
    const json &value = field(arguments, key);
    if (value.is_number()) {
        return value.get<double>();
    }
    if (value.is_string()) {
        std::string digits = trim(value.get<std::string>());
        if (digits.empty()) {
            return std::nullopt;
        }
        char *end = nullptr;
        double parsed = std::strtod(digits.c_str(), &end);
        if (end != digits.c_str() + digits.size() || !std::isfinite(parsed)) {
            return std::nullopt;
        }
        return parsed;
    }
    return std::nullopt;
}

std::optional<json> numeric_value(const json &arguments, const char *key) {
    std::optional<double> parsed = number(arguments, key);
    if (!parsed) {
        return std::nullopt;
    }
    if (std::floor(*parsed) == *parsed && std::fabs(*parsed) < 9.0e15) {
        return json(static_cast<int64_t>(*parsed));
    }
    return json(*parsed);
}

int64_t limit(const json &arguments, const char *key, int64_t default_value, int64_t maximum) {
    std::optional<double> requested = number(arguments, key);
    if (!requested) {
        return default_value;
    }
    double clamped = std::min(std::max(std::floor(*requested), 1.0), static_cast<double>(maximum));
    return static_cast<int64_t>(clamped);
}

int64_t offset(const json &arguments, const char *key) {
    std::optional<double> requested = number(arguments, key);
    if (!requested || *requested < 0) {
        return 0;
    }
    return static_cast<int64_t>(std::floor(*requested));
}

std::vector<std::string> string_list(const json &arguments, const char *key) {
    std::vector<std::string> items;
    const json &value = field(arguments, key);
    if (!value.is_array()) {
        return items;
    }
    for (const auto &item : value) {
        items.push_back(formatting::text_of(item));
    }
    return items;
}

std::string trim(const std::string &text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }
    return text.substr(begin, end - begin);
}

std::string markdown_list(const std::vector<storage::Row> &rows,
                          std::string (*format_row)(const json &row),
                          const std::string &watermark_text) {
    std::string markdown;
    for (size_t index = 0; index < rows.size(); ++index) {
        if (index > 0) {
            markdown += "\n";
        }
        markdown += format_row(rows[index]);
    }
    return markdown + "\n\n" + formatting::get_watermark(watermark_text);
}

json with_message(const json &row, const std::string &message) {
    json result = row;
    result["message"] = message;
    return result;
}

} // namespace tool_support
