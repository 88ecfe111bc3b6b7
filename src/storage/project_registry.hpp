#pragma once

#include "common/clock.hpp"
#include "storage/chunk_index.hpp"
#include "storage/segment_store.hpp"

#include <spdlog/spdlog.h>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace segedit {

// Identity of a project directory at the time its entry was built. Two
// resolutions of the same name refer to the same directory only if the
// canonical path and the inode both match, so a directory renamed away and
// replaced by another one under the same name is detected.
struct RootIdentity {
    std::filesystem::path canonical;
    uint64_t device = 0;
    uint64_t inode  = 0;

    bool operator==(const RootIdentity&) const = default;
};

// One live project: its store and chunk index share the project root.
struct Project {
    Project(std::string name, std::filesystem::path root, RootIdentity identity,
            const Clock& clock, std::shared_ptr<spdlog::logger> logger);

    std::string name;
    std::filesystem::path root;
    RootIdentity identity;
    SegmentStore segments;
    ChunkIndex chunks;
};

struct ProjectSummary {
    std::string name;
    double duration = 0.0;
};

// ── ProjectRegistry ──────────────────────────────────────────────────────────
//
// Maps project names under `projects_dir` to live Project entries.
//
//   construct-on-miss   – the first resolve() of a name builds the entry
//   reuse-on-match      – later resolves return the same entry (caches kept)
//   evict-on-change     – if the name now points at a different directory,
//                         the stale entry is dropped and a fresh one built
//
// At most one entry is live per name. Callers hold shared_ptrs, so an evicted
// entry stays valid for requests already using it.
//
// Thread-safety: all methods may be called concurrently.

class ProjectRegistry {
public:
    ProjectRegistry(std::filesystem::path projects_dir,
                    const Clock& clock,
                    spdlog::level::level_enum log_level = spdlog::level::info);

    // Throws Error(Errc::not_found) if the name is not a project directory
    // holding transcriptions/segments.csv.
    [[nodiscard]] std::shared_ptr<Project> resolve(const std::string& name);

    // Projects with a segments file, sorted by name. Duration comes from the
    // chunk metadata and is 0 when that file is missing or unreadable.
    [[nodiscard]] std::vector<ProjectSummary> list_projects() const;

    [[nodiscard]] std::size_t size() const;

    [[nodiscard]] const std::filesystem::path& projects_dir() const noexcept { return projects_dir_; }

private:
    std::filesystem::path projects_dir_;
    const Clock& clock_;
    spdlog::level::level_enum log_level_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Project>> projects_;
};

// Project names are single path components.
[[nodiscard]] bool is_valid_project_name(const std::string& name);

} // namespace segedit
