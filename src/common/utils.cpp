#include "common/utils.hpp"
#include <curl/curl.h>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <random>
#include <sstream>
#include <system_error>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace utils {

std::string urlEncode(const std::string& str) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return str;
    }

    char* encoded = curl_easy_escape(curl, str.c_str(), static_cast<int>(str.length()));
    if (!encoded) {
        curl_easy_cleanup(curl);
        return str;
    }
    std::string result(encoded);
    curl_free(encoded);
    curl_easy_cleanup(curl);
    return result;
}

std::string generateId() {
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch());

    thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<> dis(0, 15);
    const char* hex = "0123456789abcdef";

    std::stringstream ss;
    ss << std::hex << std::setw(12) << std::setfill('0') << now_ms.count();
    for (int i = 0; i < 12; ++i) {
        ss << hex[dis(gen)];
    }
    return ss.str();
}

std::string shellQuote(const std::string& arg) {
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

std::string formatIso8601(TimePoint time) {
    auto secs = std::chrono::time_point_cast<std::chrono::seconds>(time);
    if (secs > time) {
        secs -= std::chrono::seconds(1);
    }
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(time - secs).count();
    std::time_t tt = std::chrono::system_clock::to_time_t(secs);
    std::tm tm{};
    gmtime_r(&tt, &tm);

    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.'
       << std::setw(3) << std::setfill('0') << millis << 'Z';
    return ss.str();
}

std::optional<TimePoint> parseIso8601(const std::string& text) {
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    int consumed = 0;
    if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                    &year, &month, &day, &hour, &minute, &second, &consumed) != 6) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60) {
        return std::nullopt;
    }

    std::size_t pos = static_cast<std::size_t>(consumed);
    std::chrono::nanoseconds fraction{0};
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        long long scale = 100000000;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            fraction += std::chrono::nanoseconds((text[pos] - '0') * scale);
            scale /= 10;
            ++pos;
        }
    }

    std::chrono::minutes offset{0};
    if (pos < text.size()) {
        char sign = text[pos];
        if (sign == 'Z' || sign == 'z') {
            ++pos;
        } else if (sign == '+' || sign == '-') {
            int offHour = 0, offMinute = 0;
            if (std::sscanf(text.c_str() + pos + 1, "%2d:%2d", &offHour, &offMinute) != 2) {
                return std::nullopt;
            }
            offset = std::chrono::minutes(offHour * 60 + offMinute);
            if (sign == '-') {
                offset = -offset;
            }
            pos += 6;
        } else {
            return std::nullopt;
        }
    }
    if (pos != text.size()) {
        return std::nullopt;
    }

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    std::time_t tt = timegm(&tm);

    auto result = std::chrono::system_clock::from_time_t(tt) - offset;
    return result + std::chrono::duration_cast<std::chrono::system_clock::duration>(fraction);
}

std::string formatShortUtc(TimePoint time) {
    std::time_t tt = std::chrono::system_clock::to_time_t(time);
    std::tm tm{};
    gmtime_r(&tt, &tm);
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y/%m/%d %H:%M");
    return ss.str();
}

std::string trim(const std::string& str) {
    auto begin = str.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = str.find_last_not_of(" \t\r\n");
    return str.substr(begin, end - begin + 1);
}

bool writeFileAtomically(const std::string& path, const std::string& content, std::string& error) {
    std::string tempPath = path + ".tmp";
    {
        std::ofstream file(tempPath, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            error = "Cannot open " + tempPath + " for writing";
            return false;
        }
        file << content;
        file.flush();
        if (!file) {
            error = "Failed writing " + tempPath;
            return false;
        }
    }
    std::error_code ec;
    std::filesystem::rename(tempPath, path, ec);
    if (ec) {
        error = "Cannot replace " + path + ": " + ec.message();
        std::filesystem::remove(tempPath, ec);
        return false;
    }
    return true;
}

FileLock::FileLock(const std::string& lockPath, bool exclusive)
    : fd_(::open(lockPath.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644)) {
    if (fd_ < 0) {
        throw std::system_error(errno, std::generic_category(), "Cannot open lock file " + lockPath);
    }
    int rc;
    do {
        rc = ::flock(fd_, exclusive ? LOCK_EX : LOCK_SH);
    } while (rc != 0 && errno == EINTR);
    if (rc != 0) {
        int error = errno;
        ::close(fd_);
        throw std::system_error(error, std::generic_category(), "Cannot lock " + lockPath);
    }
}

FileLock::~FileLock() {
    ::flock(fd_, LOCK_UN);
    ::close(fd_);
}

TimePoint addMonthsUtc(TimePoint time, int months) {
    static const int kDaysInMonth[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};

    auto secs = std::chrono::time_point_cast<std::chrono::seconds>(time);
    if (secs > time) {
        secs -= std::chrono::seconds(1);
    }
    auto remainder = time - secs;
    std::time_t tt = std::chrono::system_clock::to_time_t(secs);
    std::tm tm{};
    gmtime_r(&tt, &tm);

    int total = tm.tm_year * 12 + tm.tm_mon + months;
    int year = total / 12;
    int month = total % 12;
    if (month < 0) {
        month += 12;
        --year;
    }
    int fullYear = year + 1900;
    bool leap = (fullYear % 4 == 0 && fullYear % 100 != 0) || fullYear % 400 == 0;
    int maxDay = kDaysInMonth[month] + (month == 1 && leap ? 1 : 0);

    tm.tm_year = year;
    tm.tm_mon = month;
    if (tm.tm_mday > maxDay) {
        tm.tm_mday = maxDay;
    }
    return std::chrono::system_clock::from_time_t(timegm(&tm)) + remainder;
}

TimePoint startOfDayUtc(TimePoint time) {
    std::time_t tt = std::chrono::system_clock::to_time_t(time);
    std::tm tm{};
    gmtime_r(&tt, &tm);
    tm.tm_hour = 0;
    tm.tm_min = 0;
    tm.tm_sec = 0;
    return std::chrono::system_clock::from_time_t(timegm(&tm));
}

} // namespace utils
