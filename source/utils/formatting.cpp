#include "utils/formatting.hpp"

#include <cctype>
#include <chrono>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace formatting {

std::string get_watermark(const std::string &watermark_text) {
    return "---\n_" + watermark_text + "_";
}

std::string text_of(const json &value) {
    if (value.is_null()) {
        return "";
    }
    if (value.is_string()) {
        return value.get<std::string>();
    }
    return value.dump();
}

bool is_truthy(const json &value) {
    if (value.is_null()) {
        return false;
    }
    if (value.is_boolean()) {
        return value.get<bool>();
    }
    if (value.is_number_integer()) {
        return value.get<long long>() != 0;
    }
    if (value.is_number()) {
        return value.get<double>() != 0.0;
    }
    if (value.is_string()) {
        return !value.get<std::string>().empty();
    }
    return true;
}

std::vector<std::string> parse_json_array(const json &value) {
    std::vector<std::string> items;
    json array_value;

    if (value.is_array()) {
        array_value = value;
    } else if (value.is_string()) {
        const std::string &text = value.get_ref<const std::string &>();
        if (text.empty() || text[0] != '[') {
            return items;
        }
        array_value = json::parse(text, nullptr, false);
        if (array_value.is_discarded() || !array_value.is_array()) {
            return items;
        }
    } else {
        return items;
    }

    for (const auto &item : array_value) {
        items.push_back(text_of(item));
    }
    return items;
}

double round_one_decimal(double value) {
    // std::round rounds halfway cases away from zero on every platform.
    return std::round(value * 10.0) / 10.0;
}

std::string iso_timestamp_now() {
    auto now = std::chrono::system_clock::now();
    auto milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;
    std::time_t seconds = std::chrono::system_clock::to_time_t(now);

    std::tm utc_time{};
    gmtime_r(&seconds, &utc_time);

    std::ostringstream stream;
    stream << std::put_time(&utc_time, "%Y-%m-%dT%H:%M:%S")
           << '.' << std::setw(3) << std::setfill('0') << milliseconds << 'Z';
    return stream.str();
}

static std::string field(const json &row, const char *name) {
    return row.contains(name) ? text_of(row[name]) : std::string();
}

static bool has_value(const json &row, const char *name) {
    return row.contains(name) && is_truthy(row[name]);
}

std::string format_article_md(const json &article) {
    std::string number = (article.contains("number") && !article["number"].is_null())
        ? "#" + text_of(article["number"]) : "";
    std::string title = has_value(article, "title") ? field(article, "title") : "Untitled";
    std::string type = has_value(article, "type") ? " [" + field(article, "type") + "]" : "";
    std::string date = has_value(article, "published_at")
        ? " (" + field(article, "published_at").substr(0, 10) + ")" : "";
    std::string url = has_value(article, "substack_url")
        ? " - [Read](" + field(article, "substack_url") + ")" : "";
    std::string angle = has_value(article, "editorial_angle")
        ? "\n  _" + field(article, "editorial_angle") + "_" : "";

    std::vector<std::string> stats;
    if (has_value(article, "views")) {
        stats.push_back(field(article, "views") + " views");
    }
    if (has_value(article, "open_rate")) {
        stats.push_back(field(article, "open_rate") + "% open");
    }
    std::string stats_text;
    for (size_t index = 0; index < stats.size(); ++index) {
        stats_text += (index == 0 ? " | " : ", ") + stats[index];
    }

    return "- **" + number + " " + title + "**" + type + date + stats_text + url + angle;
}

std::string format_note_md(const json &note) {
    std::string article = has_value(note, "target_article")
        ? "Article " + field(note, "target_article") : "Backlog";

    std::vector<std::string> tags = parse_json_array(note.contains("tags") ? note["tags"] : json());
    std::string tags_text;
    if (!tags.empty()) {
        tags_text = " [";
        for (size_t index = 0; index < tags.size(); ++index) {
            if (index > 0) {
                tags_text += ", ";
            }
            tags_text += tags[index];
        }
        tags_text += "]";
    }

    std::string priority = field(note, "priority");
    std::string priority_text = (priority != "3") ? " P" + priority : "";

    std::string type = field(note, "type");
    for (auto &character : type) {
        character = static_cast<char>(std::toupper(static_cast<unsigned char>(character)));
    }

    return "- **[" + type + "]** " + field(note, "content") + "\n  _" + article + priority_text +
           " | " + field(note, "status") + tags_text + " | " + field(note, "id") + "_";
}

std::string format_source_md(const json &source) {
    std::string date = has_value(source, "published_date") ? field(source, "published_date") : "?";

    std::string prefix;
    if (field(source, "status") == "inactive") {
        prefix = "[INACTIVE]";
    } else if (has_value(source, "used_in_article")) {
        prefix = "[USED in " + field(source, "used_in_article") + "]";
    } else {
        prefix = "[UNUSED]";
    }

    std::string type = has_value(source, "type") ? field(source, "type") : "other";
    return "- " + prefix + " " + field(source, "title") + " (" + date + ")\n  " +
           field(source, "url") + "\n  _" + type + " | " + field(source, "id") + "_";
}

} // namespace formatting
