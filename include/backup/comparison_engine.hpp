#pragma once

#include "backup/file_entry.hpp"
#include <string>
#include <vector>

struct ComparisonResult {
    FileEntryList newEntries;       // in source only
    FileEntryList changedEntries;   // in both, file sizes differ (source entry)
    FileEntryList obsoleteEntries;  // in destination only

    bool empty() const {
        return newEntries.empty() && changedEntries.empty() && obsoleteEntries.empty();
    }
};

// Path/size change detection between a source and a destination listing.
// Stateless apart from the case policy; every call is a pure function of its inputs.
class ComparisonEngine {
public:
    explicit ComparisonEngine(bool caseInsensitive = false);

    ComparisonResult compare(const FileEntryList& sourceEntries,
                             const FileEntryList& destEntries,
                             const std::string& sourceRoot,
                             const std::string& destRoot) const;

    // Source entries whose key and size match a destination entry.
    FileEntryList unchanged(const FileEntryList& sourceEntries,
                            const FileEntryList& destEntries,
                            const std::string& sourceRoot,
                            const std::string& destRoot) const;

    bool sameRoot(const std::string& sourceRoot, const std::string& destRoot) const;

    // Forward slashes, no trailing separator ("/" stays "/").
    static std::string normalizePath(const std::string& path);

    // Full path minus root, without leading or trailing separators. Falls back to
    // the entry name when the path does not live under the root.
    std::string relativePath(const FileEntry& entry, const std::string& root) const;

    // relativePath folded to the case policy; the equality key of an entry.
    std::string relativeKey(const FileEntry& entry, const std::string& root) const;

private:
    std::string foldCase(const std::string& value) const;

    bool caseInsensitive_;
};
