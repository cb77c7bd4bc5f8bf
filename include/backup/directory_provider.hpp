#pragma once

#include "backup/file_entry.hpp"
#include <string>

// Read side of a backup source. Implementations are used by one run at a time.
class DirectoryProvider {
public:
    virtual ~DirectoryProvider() = default;

    // Recursive listing of everything below root. Throws TransportError or
    // AuthenticationError; any failure aborts the run.
    virtual FileEntryList listEntries(const std::string& root) = 0;

    // Writes the content of a listed file to targetPath, replacing it.
    // Throws TransportError; the caller treats it as a per-file failure.
    virtual void fetchFile(const FileEntry& entry, const std::string& targetPath) = 0;

    virtual std::string describe() const = 0;
};
