// DIRGATE - Tree Search Engine Implementation
// Copyright (c) 2024 DIRGATE Developers
// MIT License

#include "dirgate/search/tree_search.h"

#include "dirgate/util/fs.h"
#include "dirgate/util/logging.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <sstream>
#include <utility>

namespace dirgate {
namespace search {

namespace {

std::string ToLower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

struct Hit {
    FileEntry entry;
    size_t depth;
    std::string sortKey;   // Lowercase display name
};

struct PendingDirectory {
    util::fs::Path path;
    size_t depth;
};

/// Walk state shared across directories
class Walker {
public:
    Walker(const SearchRequest& request, SearchResult& result)
        : request_(request),
          result_(result),
          lowerTerm_(ToLower(request.term)),
          rootPath_(request.root.ToPath()),
          deadline_(request.timeBudget),
          limit_(request.maxResults + 1) {}

    std::vector<Hit> Run() {
        std::vector<PendingDirectory> stack;
        stack.push_back({rootPath_, 0});

        while (!stack.empty()) {
            if (hits_.size() >= limit_) {
                break;
            }
            if (deadline_.IsExpired()) {
                result_.timedOut = true;
                break;
            }

            PendingDirectory current = std::move(stack.back());
            stack.pop_back();

            std::vector<PendingDirectory> children;
            ScanDirectory(current, children);
            if (result_.timedOut) {
                break;
            }

            // Reverse so the first subdirectory read is visited next
            for (auto it = children.rbegin(); it != children.rend(); ++it) {
                stack.push_back(std::move(*it));
            }
        }

        return std::move(hits_);
    }

private:
    void ScanDirectory(const PendingDirectory& dir, std::vector<PendingDirectory>& children) {
        bool descend = request_.includeSubdirectories && dir.depth < request_.maxDepth;
        size_t examined = 0;

        int error = util::fs::ForEachEntry(dir.path, [&](const util::fs::DirectoryEntry& entry) {
            if (++examined % DEADLINE_CHECK_INTERVAL == 0 && deadline_.IsExpired()) {
                result_.timedOut = true;
                return false;
            }

            bool isDirectory = entry.type == util::fs::FileType::Directory;

            if (TreeSearchEngine::NameMatches(entry.name, lowerTerm_)) {
                AddHit(entry, isDirectory, dir.depth);
                if (hits_.size() >= limit_) {
                    return false;
                }
            }

            if (descend && isDirectory && !entry.isSymlink) {
                children.push_back({entry.path, dir.depth + 1});
            }
            return true;
        });

        ++result_.directoriesScanned;

        if (error == 0) {
            return;
        }
        if (error == ENOENT || error == ENOTDIR) {
            ++result_.vanishedDirectories;
            LOG_DEBUG(util::LogCategory::SEARCH) << "Directory vanished during search: " << dir.path.String();
        } else {
            ++result_.skippedDirectories;
            LOG_DEBUG(util::LogCategory::SEARCH) << "Skipping " << dir.path.String() << ": "
                                           << std::strerror(error);
        }
    }

    void AddHit(const util::fs::DirectoryEntry& entry, bool isDirectory, size_t depth) {
        Hit hit;
        hit.entry.name = entry.path.RelativeTo(rootPath_).String();
        hit.entry.absolutePath = entry.path.String();
        hit.entry.sizeBytes = isDirectory ? 0 : entry.size;
        hit.entry.lastModified = entry.modifiedTime;
        hit.entry.isDirectory = isDirectory;
        hit.depth = depth;
        hit.sortKey = ToLower(hit.entry.name);
        hits_.push_back(std::move(hit));
    }

    const SearchRequest& request_;
    SearchResult& result_;
    std::string lowerTerm_;
    util::fs::Path rootPath_;
    util::DeadlineTimer deadline_;
    size_t limit_;
    std::vector<Hit> hits_;
};

std::string Diagnostics(const SearchResult& result, util::Milliseconds budget) {
    std::ostringstream oss;
    if (result.timedOut) {
        oss << "Search timed out after "
            << std::chrono::duration_cast<util::Seconds>(budget).count()
            << " seconds, skipped " << result.skippedDirectories << " directories";
    } else if (result.skippedDirectories > 0) {
        oss << "Skipped " << result.skippedDirectories << " directories due to permissions";
    }
    return oss.str();
}

} // namespace

bool TreeSearchEngine::NameMatches(const std::string& name, const std::string& lowerTerm) {
    return ToLower(name).find(lowerTerm) != std::string::npos;
}

SearchResult TreeSearchEngine::Search(const SearchRequest& request) const {
    util::ScopedLogTimer timer(util::LogCategory::SEARCH, "search for '" + request.term + "' in " +
                                                        request.root.String());

    SearchResult result;
    std::vector<Hit> hits = Walker(request, result).Run();

    if (hits.size() > request.maxResults) {
        // Keep discovery order when cutting, then rank
        hits.resize(request.maxResults);
        result.truncated = true;
    }

    // Tiers by depth; within a depth, directories before files
    std::stable_sort(hits.begin(), hits.end(), [](const Hit& a, const Hit& b) {
        if (a.depth != b.depth) {
            return a.depth < b.depth;
        }
        if (a.entry.isDirectory != b.entry.isDirectory) {
            return a.entry.isDirectory;
        }
        if (a.sortKey != b.sortKey) {
            return a.sortKey < b.sortKey;
        }
        return a.entry.name < b.entry.name;
    });

    result.entries.reserve(hits.size());
    for (auto& hit : hits) {
        result.entries.push_back(std::move(hit.entry));
    }

    std::string diagnostics = Diagnostics(result, request.timeBudget);
    std::ostringstream message;
    if (result.truncated) {
        message << "Search returned " << request.maxResults
                << "+ results. Try a more specific search term.";
    } else {
        if (result.entries.empty()) {
            message << "No results found for '" << request.term << "' in '"
                    << request.root.String() << "' (limit: " << request.maxResults << ")";
        } else {
            message << "Found " << result.entries.size() << " results (limit: "
                    << request.maxResults << ")";
        }
        if (!diagnostics.empty()) {
            message << " - " << diagnostics;
        }
    }
    result.message = message.str();

    LOG_DEBUG(util::LogCategory::SEARCH) << "Search scanned " << result.directoriesScanned
                                   << " directories, " << result.entries.size() << " results"
                                   << (result.truncated ? " (truncated)" : "")
                                   << (result.timedOut ? " (timed out)" : "");
    return result;
}

} // namespace search
} // namespace dirgate
