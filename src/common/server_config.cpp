#include "common/server_config.hpp"

#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <string>

#include <boost/program_options.hpp>
#include <fmt/format.h>

namespace po = boost::program_options;

namespace segedit {

namespace {

constexpr std::size_t kMinStreamChunk = 512;
constexpr std::size_t kMaxStreamChunk = 1024 * 1024;

bool is_known_level(const std::string& level) {
    return level == "trace" || level == "debug" || level == "info" ||
           level == "warn"  || level == "error" || level == "critical";
}

// --projects-dir wins over the environment, which wins over the built-in default.
std::string resolve_projects_dir(const po::variables_map& vm) {
    if (vm.count("projects-dir")) {
        return vm["projects-dir"].as<std::string>();
    }
    if (const char* env = std::getenv(kProjectsDirEnv); env != nullptr && *env != '\0') {
        return env;
    }
    return kDefaultProjectsDir;
}

// Validate the fully populated ServerConfig.
void validate(const ServerConfig& cfg) {
    if (cfg.port == 0) {
        throw std::runtime_error("--port must be in [1, 65535], got 0");
    }
    if (cfg.projects_dir.empty()) {
        throw std::runtime_error("--projects-dir must not be empty");
    }
    if (cfg.stream_chunk_size < kMinStreamChunk || cfg.stream_chunk_size > kMaxStreamChunk) {
        throw std::runtime_error(
            fmt::format("--stream-chunk-size must be in [{}, {}], got {}",
                        kMinStreamChunk, kMaxStreamChunk, cfg.stream_chunk_size));
    }
    if (!is_known_level(cfg.log_level)) {
        throw std::runtime_error(
            fmt::format("--log-level must be trace|debug|info|warn|error|critical, got '{}'",
                        cfg.log_level));
    }
}

} // anonymous namespace

// ── add_options ───────────────────────────────────────────────────────────────

void add_options(po::options_description& desc) {
    desc.add_options()
        ("help,h",
            "Show this help message and exit")
        ("host",
            po::value<std::string>()->default_value("0.0.0.0"),
            "Bind address for HTTP connections")
        ("port",
            po::value<uint16_t>()->default_value(8765),
            "HTTP port")
        ("projects-dir",
            po::value<std::string>(),
            "Directory containing one sub-directory per project "
            "(default: $SEGMENT_EDITOR_PROJECTS_DIR or /storage6/dubbing_projects)")
        ("log-level",
            po::value<std::string>()->default_value("info"),
            "Log level: trace|debug|info|warn|error|critical")
        ("stream-chunk-size",
            po::value<std::size_t>()->default_value(8192),
            "Bytes read per step when streaming audio");
}

// ── parse_config ──────────────────────────────────────────────────────────────

ServerConfig parse_config(int argc, char* argv[]) {
    po::options_description desc("segment-editor options");
    add_options(desc);

    po::variables_map vm;
    try {
        po::store(
            po::parse_command_line(argc, argv, desc),
            vm);

        if (vm.count("help")) {
            std::ostringstream oss;
            oss << desc;
            throw std::runtime_error(oss.str());
        }

        po::notify(vm);
    } catch (const po::error& e) {
        throw std::runtime_error(fmt::format("Argument error: {}", e.what()));
    }

    ServerConfig cfg;
    cfg.host              = vm["host"].as<std::string>();
    cfg.port              = vm["port"].as<uint16_t>();
    cfg.projects_dir      = resolve_projects_dir(vm);
    cfg.log_level         = vm["log-level"].as<std::string>();
    cfg.stream_chunk_size = vm["stream-chunk-size"].as<std::size_t>();

    validate(cfg);
    return cfg;
}

} // namespace segedit
