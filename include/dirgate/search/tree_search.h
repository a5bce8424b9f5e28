// DIRGATE - Tree Search Engine
// Copyright (c) 2024 DIRGATE Developers
// MIT License
//
// Bounded depth-first name search below a validated root. The walk stops
// on a result cap or a time budget, and skips directories it cannot read
// instead of failing.

#ifndef DIRGATE_SEARCH_TREE_SEARCH_H
#define DIRGATE_SEARCH_TREE_SEARCH_H

#include "dirgate/core/types.h"
#include "dirgate/security/path_guard.h"
#include "dirgate/util/time.h"

#include <cstddef>
#include <string>
#include <vector>

namespace dirgate {
namespace search {

constexpr size_t DEFAULT_MAX_RESULTS = 10000;
constexpr size_t DEFAULT_MAX_DEPTH = 20;
constexpr util::Milliseconds DEFAULT_TIME_BUDGET{30000};

/// Entries examined inside one directory between deadline checks
constexpr size_t DEADLINE_CHECK_INTERVAL = 256;

struct SearchRequest {
    SearchRequest(security::ResolvedPath searchRoot, std::string searchTerm)
        : root(std::move(searchRoot)), term(std::move(searchTerm)) {}

    security::ResolvedPath root;
    std::string term;                 // Already validated by TermGuard
    bool includeSubdirectories{true};
    size_t maxResults{DEFAULT_MAX_RESULTS};
    size_t maxDepth{DEFAULT_MAX_DEPTH};
    util::Milliseconds timeBudget{DEFAULT_TIME_BUDGET};
};

/**
 * Search outcome. Entry names are paths relative to the search root.
 * Diagnostics are reported in the counters and message, never as entries.
 */
struct SearchResult {
    std::vector<FileEntry> entries;
    bool truncated{false};
    bool timedOut{false};
    size_t skippedDirectories{0};     // Permission or I/O failures
    size_t vanishedDirectories{0};    // Removed during the walk
    size_t directoriesScanned{0};
    std::string message;
};

class TreeSearchEngine {
public:
    TreeSearchEngine() = default;

    SearchResult Search(const SearchRequest& request) const;

    /// Case-insensitive substring test used for matching
    static bool NameMatches(const std::string& name, const std::string& lowerTerm);
};

} // namespace search
} // namespace dirgate

#endif // DIRGATE_SEARCH_TREE_SEARCH_H
