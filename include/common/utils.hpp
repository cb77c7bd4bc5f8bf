#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace utils {

using TimePoint = std::chrono::system_clock::time_point;

std::string urlEncode(const std::string& str);

// Hex millisecond timestamp followed by random hex digits; sortable by creation time.
std::string generateId();

// Quotes a single argument for /bin/sh.
std::string shellQuote(const std::string& arg);

// ISO 8601 in UTC with millisecond precision, e.g. 2025-11-10T00:57:05.120Z
std::string formatIso8601(TimePoint time);

// Accepts "YYYY-MM-DDTHH:MM:SS" with optional fraction and optional "Z" or
// "+HH:MM"/"-HH:MM" offset. A missing offset is read as UTC.
std::optional<TimePoint> parseIso8601(const std::string& text);

// "YYYY/MM/DD HH:MM" in UTC, used for execution names.
std::string formatShortUtc(TimePoint time);

std::string trim(const std::string& str);

// Writes to "<path>.tmp" and renames over path. On failure returns false and
// fills error; path is then left untouched.
bool writeFileAtomically(const std::string& path, const std::string& content, std::string& error);

// Advisory flock(2) on lockPath, held until destruction. Processes sharing a
// store take it around every read-modify-write cycle. Throws std::system_error
// when the lock file cannot be opened or locked.
class FileLock {
public:
    FileLock(const std::string& lockPath, bool exclusive);
    ~FileLock();

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

private:
    int fd_;
};

// Calendar arithmetic in UTC. Days past the end of the target month are clamped.
TimePoint addMonthsUtc(TimePoint time, int months);
TimePoint startOfDayUtc(TimePoint time);

} // namespace utils
