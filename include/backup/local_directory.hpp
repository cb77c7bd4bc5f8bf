#pragma once

#include "backup/file_entry.hpp"
#include <string>
#include <vector>

// Walks the local destination tree.
class LocalDirectory {
public:
    // Directories before files, alphabetical within each level; every directory is
    // followed by its own subtree. A missing root is created, or listed as empty
    // when createIfMissing is false. Throws DestinationError when root contains
    // ".." or cannot be created or read. Unreadable subdirectories are logged and
    // skipped. Symbolic links are not followed or listed; their paths go to
    // skippedLinks when given. In-flight staging files are never listed.
    static FileEntryList listEntries(const std::string& root, bool computeChecksums = false,
                                     bool createIfMissing = true,
                                     std::vector<std::string>* skippedLinks = nullptr);

    // Hidden sibling of targetPath that a transfer writes before renaming it
    // into place, e.g. "dir/.a.txt.syncwarden-<id>.tmp".
    static std::string stagingPathFor(const std::string& targetPath);
    static bool isStagingName(const std::string& fileName);

    // Lowercase hex MD5 of a file, or empty on failure.
    static std::string md5OfFile(const std::string& path);

    static std::string permissionsOf(const std::string& path);
};
