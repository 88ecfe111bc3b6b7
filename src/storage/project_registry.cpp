#include "storage/project_registry.hpp"

#include "common/errors.hpp"
#include "common/logger.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <optional>

#include <sys/stat.h>

namespace segedit {

namespace {

std::filesystem::path segments_file(const std::filesystem::path& root) {
    return root / "transcriptions" / "segments.csv";
}

std::optional<RootIdentity> identify(const std::filesystem::path& root) {
    std::error_code ec;
    auto canonical = std::filesystem::canonical(root, ec);
    if (ec) {
        return std::nullopt;
    }
    struct ::stat st {};
    if (::stat(canonical.c_str(), &st) != 0) {
        return std::nullopt;
    }
    return RootIdentity{std::move(canonical),
                        static_cast<uint64_t>(st.st_dev),
                        static_cast<uint64_t>(st.st_ino)};
}

} // namespace

bool is_valid_project_name(const std::string& name) {
    return !name.empty() && name != "." && name != ".." &&
           name.find('/') == std::string::npos &&
           name.find('\0') == std::string::npos;
}

Project::Project(std::string name_, std::filesystem::path root_, RootIdentity identity_,
                 const Clock& clock, std::shared_ptr<spdlog::logger> logger)
    : name(std::move(name_)),
      root(std::move(root_)),
      identity(std::move(identity_)),
      segments(root, clock, logger),
      chunks(root, logger) {}

ProjectRegistry::ProjectRegistry(std::filesystem::path projects_dir,
                                 const Clock& clock,
                                 spdlog::level::level_enum log_level)
    : projects_dir_(std::move(projects_dir)), clock_(clock), log_level_(log_level) {}

// ── resolve ──────────────────────────────────────────────────────────────────

std::shared_ptr<Project> ProjectRegistry::resolve(const std::string& name) {
    const auto not_found = [&name] {
        return Error(Errc::not_found, fmt::format("Project '{}' not found", name));
    };

    if (!is_valid_project_name(name)) {
        throw not_found();
    }

    const auto root = projects_dir_ / name;
    std::error_code ec;
    if (!std::filesystem::is_regular_file(segments_file(root), ec)) {
        throw not_found();
    }
    auto identity = identify(root);
    if (!identity) {
        throw not_found();
    }

    std::lock_guard lock(mutex_);

    if (auto it = projects_.find(name); it != projects_.end()) {
        if (it->second->identity == *identity) {
            return it->second;
        }
        spdlog::info("ProjectRegistry: '{}' now resolves to a different directory "
                     "({} inode {}), rebuilding", name,
                     identity->canonical.string(), identity->inode);
        projects_.erase(it);
    }

    auto project = std::make_shared<Project>(
        name, root, std::move(*identity), clock_, make_project_logger(name, log_level_));
    projects_.emplace(name, project);
    spdlog::debug("ProjectRegistry: opened project '{}' at {}", name, root.string());
    return project;
}

// ── list_projects ────────────────────────────────────────────────────────────

std::vector<ProjectSummary> ProjectRegistry::list_projects() const {
    std::vector<ProjectSummary> result;

    std::error_code ec;
    if (!std::filesystem::is_directory(projects_dir_, ec)) {
        return result;
    }

    std::filesystem::directory_iterator it(projects_dir_, ec);
    if (ec) {
        spdlog::warn("ProjectRegistry: cannot list {}: {}", projects_dir_.string(), ec.message());
        return result;
    }

    for (const auto& entry : it) {
        std::error_code entry_ec;
        if (!entry.is_directory(entry_ec) ||
            !std::filesystem::is_regular_file(segments_file(entry.path()), entry_ec)) {
            continue;
        }

        ProjectSummary summary;
        summary.name = entry.path().filename().string();

        CsvDocument doc;
        std::vector<Chunk> chunks;
        const auto meta = entry.path() / "chunks" / "chunks_metadata.csv";
        if (!read_csv_file(meta, doc) && !decode_chunks(doc, chunks)) {
            for (const auto& chunk : chunks) {
                summary.duration = std::max(summary.duration, chunk.end_time);
            }
        }
        result.push_back(std::move(summary));
    }

    std::sort(result.begin(), result.end(),
              [](const ProjectSummary& a, const ProjectSummary& b) { return a.name < b.name; });
    return result;
}

std::size_t ProjectRegistry::size() const {
    std::lock_guard lock(mutex_);
    return projects_.size();
}

} // namespace segedit
