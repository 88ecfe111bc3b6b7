#include "common/clock.hpp"
#include "common/logger.hpp"
#include "common/server_config.hpp"
#include "network/api_router.hpp"
#include "network/range_streamer.hpp"
#include "network/server.hpp"
#include "storage/project_registry.hpp"

#include <boost/system/system_error.hpp>

#include <spdlog/spdlog.h>

#include <cstdio>
#include <filesystem>
#include <stdexcept>

int main(int argc, char* argv[]) {
    // ── Parse CLI arguments ──────────────────────────────────────────────────
    segedit::ServerConfig cfg;
    try {
        cfg = segedit::parse_config(argc, argv);
    } catch (const std::runtime_error& e) {
        fprintf(stderr, "%s\n", e.what());
        return 1;
    }

    // ── Logging ──────────────────────────────────────────────────────────────
    const auto level = segedit::parse_log_level(cfg.log_level);
    segedit::init_default_logger(level);

    spdlog::info("segment-editor starting – http={}:{} projects_dir={} stream_chunk_size={}",
                 cfg.host, cfg.port, cfg.projects_dir, cfg.stream_chunk_size);

    // ── Projects directory ───────────────────────────────────────────────────
    namespace fs = std::filesystem;
    std::error_code fs_ec;
    if (!fs::is_directory(cfg.projects_dir, fs_ec)) {
        spdlog::warn("Projects directory {} does not exist; every project lookup will 404",
                     cfg.projects_dir);
    }

    // ── Components ───────────────────────────────────────────────────────────
    segedit::SystemClock clock;
    segedit::ProjectRegistry registry{cfg.projects_dir, clock, level};
    segedit::network::RangeStreamer streamer{cfg.stream_chunk_size};
    segedit::network::ApiRouter router{registry, streamer};

    for (const auto& project : registry.list_projects()) {
        spdlog::debug("  project {} ({:.1f} s)", project.name, project.duration);
    }

    // ── Serve ────────────────────────────────────────────────────────────────
    try {
        segedit::network::Server server{cfg.host, cfg.port, router, streamer};
        server.run();
    } catch (const boost::system::system_error& e) {
        spdlog::error("Failed to start HTTP server on {}:{}: {}", cfg.host, cfg.port, e.what());
        return 1;
    }

    spdlog::info("segment-editor stopped");
    return 0;
}
