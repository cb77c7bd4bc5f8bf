#include "backup/comparison_engine.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace {

using KeyIndex = std::unordered_map<std::string, const FileEntry*>;

} // namespace

ComparisonEngine::ComparisonEngine(bool caseInsensitive)
    : caseInsensitive_(caseInsensitive) {
}

std::string ComparisonEngine::normalizePath(const std::string& path) {
    std::string normalized = path;
    std::replace(normalized.begin(), normalized.end(), '\\', '/');
    while (normalized.size() > 1 && normalized.back() == '/') {
        normalized.pop_back();
    }
    return normalized;
}

std::string ComparisonEngine::foldCase(const std::string& value) const {
    if (!caseInsensitive_) {
        return value;
    }
    std::string folded = value;
    std::transform(folded.begin(), folded.end(), folded.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return folded;
}

bool ComparisonEngine::sameRoot(const std::string& sourceRoot, const std::string& destRoot) const {
    return foldCase(normalizePath(sourceRoot)) == foldCase(normalizePath(destRoot));
}

std::string ComparisonEngine::relativePath(const FileEntry& entry, const std::string& root) const {
    std::string full = normalizePath(entry.path);
    std::string base = normalizePath(root);

    std::string relative;
    bool underRoot = false;
    if (base.empty() || base == "/") {
        relative = full;
        underRoot = true;
    } else if (foldCase(full.substr(0, base.size())) == foldCase(base) &&
               (full.size() == base.size() || full[base.size()] == '/')) {
        relative = full.substr(base.size());
        underRoot = true;
    }

    if (!underRoot) {
        relative = entry.name;
    }

    auto first = relative.find_first_not_of('/');
    if (first == std::string::npos) {
        return "";
    }
    relative = relative.substr(first);
    while (!relative.empty() && relative.back() == '/') {
        relative.pop_back();
    }
    return relative;
}

std::string ComparisonEngine::relativeKey(const FileEntry& entry, const std::string& root) const {
    return foldCase(relativePath(entry, root));
}

ComparisonResult ComparisonEngine::compare(const FileEntryList& sourceEntries,
                                           const FileEntryList& destEntries,
                                           const std::string& sourceRoot,
                                           const std::string& destRoot) const {
    ComparisonResult result;

    if (sameRoot(sourceRoot, destRoot)) {
        Logger::warning("Source and destination paths are the same: " + normalizePath(sourceRoot) +
                        ". Skipping comparison.");
        return result;
    }

    KeyIndex sourceIndex;
    for (const auto& entry : sourceEntries) {
        sourceIndex.emplace(relativeKey(entry, sourceRoot), &entry);
    }
    KeyIndex destIndex;
    for (const auto& entry : destEntries) {
        destIndex.emplace(relativeKey(entry, destRoot), &entry);
    }

    for (const auto& entry : sourceEntries) {
        auto it = destIndex.find(relativeKey(entry, sourceRoot));
        if (it == destIndex.end() || it->second->type != entry.type) {
            // A type flip (file <-> directory) is a delete followed by a fresh copy.
            result.newEntries.push_back(entry);
        } else if (entry.isFile() && it->second->size != entry.size) {
            result.changedEntries.push_back(entry);
        }
    }

    for (const auto& entry : destEntries) {
        auto it = sourceIndex.find(relativeKey(entry, destRoot));
        if (it == sourceIndex.end() || it->second->type != entry.type) {
            result.obsoleteEntries.push_back(entry);
        }
    }

    return result;
}

FileEntryList ComparisonEngine::unchanged(const FileEntryList& sourceEntries,
                                          const FileEntryList& destEntries,
                                          const std::string& sourceRoot,
                                          const std::string& destRoot) const {
    FileEntryList result;
    if (sameRoot(sourceRoot, destRoot)) {
        return result;
    }

    KeyIndex destIndex;
    for (const auto& entry : destEntries) {
        destIndex.emplace(relativeKey(entry, destRoot), &entry);
    }

    for (const auto& entry : sourceEntries) {
        auto it = destIndex.find(relativeKey(entry, sourceRoot));
        if (it != destIndex.end() && it->second->type == entry.type &&
            (entry.isDirectory() || it->second->size == entry.size)) {
            result.push_back(entry);
        }
    }
    return result;
}
