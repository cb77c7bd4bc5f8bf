#include "backup/cron_expression.hpp"
#include "common/backup_errors.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <sstream>
#include <vector>

namespace {

const char* const kMonthNames[] = {"JAN", "FEB", "MAR", "APR", "MAY", "JUN",
                                   "JUL", "AUG", "SEP", "OCT", "NOV", "DEC"};
const char* const kDayNames[] = {"SUN", "MON", "TUE", "WED", "THU", "FRI", "SAT"};

// Upper bound on the search; leap-day schedules fire at least every 8 years.
constexpr int kMaxSearchYears = 9;

struct FieldSpec {
    const char* name;
    int min;
    int max;
    const char* const* names;  // optional symbolic values, index 0 maps to nameBase
    int nameCount;
    int nameBase;
};

const FieldSpec kMinute = {"minute", 0, 59, nullptr, 0, 0};
const FieldSpec kHour = {"hour", 0, 23, nullptr, 0, 0};
const FieldSpec kDayOfMonth = {"day-of-month", 1, 31, nullptr, 0, 0};
const FieldSpec kMonth = {"month", 1, 12, kMonthNames, 12, 1};
const FieldSpec kDayOfWeek = {"day-of-week", 0, 7, kDayNames, 7, 0};

std::string upper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}

std::vector<std::string> split(const std::string& text, char separator) {
    std::vector<std::string> parts;
    std::string current;
    std::istringstream stream(text);
    while (std::getline(stream, current, separator)) {
        parts.push_back(current);
    }
    if (!text.empty() && text.back() == separator) {
        parts.emplace_back();
    }
    return parts;
}

[[noreturn]] void fail(const FieldSpec& spec, const std::string& field, const std::string& why) {
    throw ConfigurationError(std::string("Invalid cron ") + spec.name + " field '" + field + "': " + why);
}

int parseValue(const FieldSpec& spec, const std::string& field, const std::string& token) {
    if (token.empty()) {
        fail(spec, field, "empty value");
    }
    if (std::all_of(token.begin(), token.end(), [](unsigned char c) { return std::isdigit(c); })) {
        if (token.size() > 3) {
            fail(spec, field, "value out of range");
        }
        int value = std::stoi(token);
        if (value < spec.min || value > spec.max) {
            fail(spec, field, "value " + token + " out of range " + std::to_string(spec.min) +
                              "-" + std::to_string(spec.max));
        }
        return value;
    }
    std::string name = upper(token);
    for (int i = 0; i < spec.nameCount; ++i) {
        if (name == spec.names[i]) {
            return spec.nameBase + i;
        }
    }
    fail(spec, field, "unknown value '" + token + "'");
}

// Returns true when the field starts with '*', which is what makes a day field
// count as unrestricted.
template <size_t N>
bool parseField(const FieldSpec& spec, const std::string& field, std::bitset<N>& bits) {
    if (field.empty()) {
        fail(spec, field, "empty field");
    }
    for (const auto& item : split(field, ',')) {
        std::string range = item;
        int step = 1;
        auto slash = item.find('/');
        if (slash != std::string::npos) {
            range = item.substr(0, slash);
            std::string stepText = item.substr(slash + 1);
            if (stepText.empty() || stepText.size() > 3 ||
                !std::all_of(stepText.begin(), stepText.end(),
                             [](unsigned char c) { return std::isdigit(c); })) {
                fail(spec, field, "invalid step '" + stepText + "'");
            }
            step = std::stoi(stepText);
            if (step <= 0) {
                fail(spec, field, "step must be positive");
            }
        }

        int low = 0;
        int high = 0;
        if (range == "*") {
            low = spec.min;
            high = spec.max;
        } else {
            auto dash = range.find('-');
            if (dash != std::string::npos) {
                low = parseValue(spec, field, range.substr(0, dash));
                high = parseValue(spec, field, range.substr(dash + 1));
                if (low > high) {
                    fail(spec, field, "range " + range + " is reversed");
                }
            } else {
                low = parseValue(spec, field, range);
                // "5/15" runs from 5 to the end of the field
                high = slash != std::string::npos ? spec.max : low;
            }
        }

        for (int value = low; value <= high; value += step) {
            bits.set(static_cast<size_t>(value));
        }
    }
    return field[0] == '*';
}

std::string expandShorthand(const std::string& expression) {
    std::string name = upper(expression);
    if (name == "@YEARLY" || name == "@ANNUALLY") return "0 0 1 1 *";
    if (name == "@MONTHLY") return "0 0 1 * *";
    if (name == "@WEEKLY") return "0 0 * * 0";
    if (name == "@DAILY" || name == "@MIDNIGHT") return "0 0 * * *";
    if (name == "@HOURLY") return "0 * * * *";
    throw ConfigurationError("Unknown cron shorthand '" + expression + "'");
}

std::tm toUtc(utils::TimePoint time) {
    std::time_t tt = std::chrono::system_clock::to_time_t(time);
    std::tm tm{};
    gmtime_r(&tt, &tm);
    return tm;
}

// Re-normalizes an adjusted tm (overflowing fields carry into the next one).
void normalize(std::tm& tm) {
    std::time_t tt = timegm(&tm);
    gmtime_r(&tt, &tm);
}

} // namespace

CronExpression CronExpression::parse(const std::string& expression) {
    std::string text = utils::trim(expression);
    if (text.empty()) {
        throw ConfigurationError("Empty cron expression");
    }
    std::string fields = text[0] == '@' ? expandShorthand(text) : text;

    std::istringstream stream(fields);
    std::vector<std::string> parts;
    std::string part;
    while (stream >> part) {
        parts.push_back(part);
    }
    if (parts.size() != 5) {
        throw ConfigurationError("Cron expression '" + text + "' must have 5 fields, found " +
                                 std::to_string(parts.size()));
    }

    CronExpression cron;
    cron.text_ = text;
    parseField(kMinute, parts[0], cron.minutes_);
    parseField(kHour, parts[1], cron.hours_);
    cron.dayOfMonthRestricted_ = !parseField(kDayOfMonth, parts[2], cron.daysOfMonth_);
    parseField(kMonth, parts[3], cron.months_);

    std::bitset<8> weekDays;
    cron.dayOfWeekRestricted_ = !parseField(kDayOfWeek, parts[4], weekDays);
    for (size_t day = 0; day < 7; ++day) {
        cron.daysOfWeek_[day] = weekDays[day];
    }
    if (weekDays[7]) {
        cron.daysOfWeek_.set(0);
    }
    return cron;
}

bool CronExpression::dayMatches(int dayOfMonth, int month, int dayOfWeek) const {
    if (!months_[static_cast<size_t>(month)]) {
        return false;
    }
    bool domMatch = daysOfMonth_[static_cast<size_t>(dayOfMonth)];
    bool dowMatch = daysOfWeek_[static_cast<size_t>(dayOfWeek)];
    if (dayOfMonthRestricted_ && dayOfWeekRestricted_) {
        return domMatch || dowMatch;
    }
    return domMatch && dowMatch;
}

bool CronExpression::matches(utils::TimePoint time) const {
    std::tm tm = toUtc(time);
    return minutes_[static_cast<size_t>(tm.tm_min)] && hours_[static_cast<size_t>(tm.tm_hour)] &&
           dayMatches(tm.tm_mday, tm.tm_mon + 1, tm.tm_wday);
}

std::optional<utils::TimePoint> CronExpression::next(utils::TimePoint after) const {
    std::tm tm = toUtc(after);
    tm.tm_sec = 0;
    tm.tm_min += 1;
    normalize(tm);
    const int lastYear = tm.tm_year + kMaxSearchYears;

    while (tm.tm_year <= lastYear) {
        if (!months_[static_cast<size_t>(tm.tm_mon + 1)]) {
            tm.tm_mon += 1;
            tm.tm_mday = 1;
            tm.tm_hour = 0;
            tm.tm_min = 0;
            normalize(tm);
            continue;
        }
        if (!dayMatches(tm.tm_mday, tm.tm_mon + 1, tm.tm_wday)) {
            tm.tm_mday += 1;
            tm.tm_hour = 0;
            tm.tm_min = 0;
            normalize(tm);
            continue;
        }
        if (!hours_[static_cast<size_t>(tm.tm_hour)]) {
            tm.tm_hour += 1;
            tm.tm_min = 0;
            normalize(tm);
            continue;
        }
        if (!minutes_[static_cast<size_t>(tm.tm_min)]) {
            tm.tm_min += 1;
            normalize(tm);
            continue;
        }
        return std::chrono::system_clock::from_time_t(timegm(&tm));
    }
    return std::nullopt;
}
