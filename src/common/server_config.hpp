#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

#include <boost/program_options.hpp>

namespace segedit {

// ── ServerConfig ──────────────────────────────────────────────────────────────
// Full configuration for one segment-editor server process.
// Populated by parse_config() from CLI arguments (and the environment).

struct ServerConfig {
    std::string host;               // Bind address for HTTP connections
    uint16_t    port;               // HTTP port
    std::string projects_dir;       // Directory holding one sub-directory per project
    std::string log_level;          // spdlog level string
    std::size_t stream_chunk_size;  // Bytes per read when streaming audio
};

// Environment variable consulted when --projects-dir is not given.
inline constexpr const char* kProjectsDirEnv = "SEGMENT_EDITOR_PROJECTS_DIR";

// Used when neither --projects-dir nor the environment variable is set.
inline constexpr const char* kDefaultProjectsDir = "/storage6/dubbing_projects";

// ── parse_config ──────────────────────────────────────────────────────────────
// Parse CLI arguments into a ServerConfig.
//
// On success: returns a fully validated ServerConfig.
// On error  : throws std::runtime_error with a human-readable message.
//
// Validates:
//   - port in [1, 65535]
//   - projects_dir not empty
//   - stream_chunk_size in [512, 1 MiB]
//   - log_level is one of trace|debug|info|warn|error|critical

[[nodiscard]] ServerConfig parse_config(int argc, char* argv[]);

// ── add_options ───────────────────────────────────────────────────────────────
// Populate a boost::program_options::options_description with server options.
// Exposed for testing and help-text generation.

void add_options(boost::program_options::options_description& desc);

} // namespace segedit
