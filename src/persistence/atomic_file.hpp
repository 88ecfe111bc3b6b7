#pragma once

#include <filesystem>
#include <string_view>
#include <system_error>

namespace segedit::persistence {

// ── AtomicFile ───────────────────────────────────────────────────────────────
//
// Whole-file replace with no torn states visible to readers:
//
//   1. write `content` to `<path>.tmp` (sibling, same filesystem)
//   2. fsync the temp file
//   3. rename(2) the temp file onto `path`
//
// A reader opening `path` concurrently sees either the previous complete
// file or the new complete file. On any failure the temp file is removed and
// `path` is left untouched.
//
// Thread-safety: static methods, no mutable state. Two writers targeting the
// same path must be serialised by the caller (they share the temp name).

class AtomicFile {
public:
    [[nodiscard]] static std::error_code replace(const std::filesystem::path& path,
                                                 std::string_view content);

    // The sibling path used as the write target before the rename.
    [[nodiscard]] static std::filesystem::path temp_path_for(const std::filesystem::path& path);
};

} // namespace segedit::persistence
