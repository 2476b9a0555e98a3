#include "item.hpp"

#include <cstdint>
#include <cstdio>
#include <ctime>

namespace itemvault {
namespace model {

namespace {

// Days since 1970-01-01 for a proleptic Gregorian date
int64_t days_from_civil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2 ? 1 : 0;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

bool is_leap(int y) { return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0; }

int days_in_month(int y, int m) {
    static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m == 2 && is_leap(y)) {
        return 29;
    }
    return kDays[m - 1];
}

bool read_digits(const std::string &text, size_t pos, size_t count, int &out) {
    out = 0;
    for (size_t i = pos; i < pos + count; ++i) {
        char c = text[i];
        if (c < '0' || c > '9') {
            return false;
        }
        out = out * 10 + (c - '0');
    }
    return true;
}

}  // namespace

Item make_item(const std::string &id, const ItemFields &fields, Timestamp now) {
    Item item;
    item.id = id;
    item.name = fields.name;
    item.description = fields.description;
    item.created_at = truncate_to_millis(now);
    item.updated_at = item.created_at;
    return item;
}

Item apply_update(const Item &current, const ItemFields &fields, Timestamp now) {
    Item updated = current;
    updated.name = fields.name;
    updated.description = fields.description;

    Timestamp refreshed = truncate_to_millis(now);
    updated.updated_at = refreshed < current.updated_at ? current.updated_at : refreshed;
    return updated;
}

bool check_invariants(const Item &item, std::string &error) {
    if (item.id.empty()) {
        error = "item id must not be empty";
        return false;
    }
    if (item.name.empty()) {
        error = "item '" + item.id + "' has an empty name";
        return false;
    }
    if (item.updated_at < item.created_at) {
        error = "item '" + item.id + "' has updatedAt before createdAt";
        return false;
    }
    return true;
}

Timestamp truncate_to_millis(Timestamp ts) {
    return std::chrono::time_point_cast<std::chrono::milliseconds>(ts);
}

std::string format_timestamp(Timestamp ts) {
    auto ms_since_epoch = std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
    int64_t secs = ms_since_epoch / 1000;
    int64_t millis = ms_since_epoch % 1000;
    if (millis < 0) {
        millis += 1000;
        secs -= 1;
    }

    std::time_t time = static_cast<std::time_t>(secs);
    std::tm tm_buf;
#ifdef _WIN32
    gmtime_s(&tm_buf, &time);
#else
    gmtime_r(&time, &tm_buf);
#endif

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ", tm_buf.tm_year + 1900, tm_buf.tm_mon + 1,
                  tm_buf.tm_mday, tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, static_cast<int>(millis));
    return buf;
}

std::optional<Timestamp> parse_timestamp(const std::string &text) {
    // YYYY-MM-DDTHH:MM:SS.mmmZ
    if (text.size() != 24 || text[4] != '-' || text[7] != '-' || text[10] != 'T' || text[13] != ':' ||
        text[16] != ':' || text[19] != '.' || text[23] != 'Z') {
        return std::nullopt;
    }

    int year, month, day, hour, minute, second, millis;
    if (!read_digits(text, 0, 4, year) || !read_digits(text, 5, 2, month) || !read_digits(text, 8, 2, day) ||
        !read_digits(text, 11, 2, hour) || !read_digits(text, 14, 2, minute) || !read_digits(text, 17, 2, second) ||
        !read_digits(text, 20, 3, millis)) {
        return std::nullopt;
    }

    if (month < 1 || month > 12 || day < 1 || day > days_in_month(year, month) || hour > 23 || minute > 59 ||
        second > 59) {
        return std::nullopt;
    }

    int64_t days = days_from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    int64_t total_ms = ((days * 86400) + hour * 3600 + minute * 60 + second) * 1000 + millis;
    return Timestamp(std::chrono::milliseconds(total_ms));
}

}  // namespace model
}  // namespace itemvault
