// src/io/AtomicFile.h
//
// Whole-file writes that never leave a half-written destination behind.
//
// write_atomic writes to a sibling "<final>.tmp", flushes and closes it, then
// renames it over the destination (rename within one directory replaces the
// target atomically on POSIX filesystems). Parent directories are created.

#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace maze::io {

namespace fs = std::filesystem;

/// @param err  Optional: receives a human-readable error on failure.
/// @return true on success.
[[nodiscard]] bool write_atomic(const fs::path& final_path,
                                std::string_view bytes,
                                std::string* err = nullptr);

/// Read the entire file at `path` into `out` (replaced on success).
[[nodiscard]] bool read_all(const fs::path& path,
                            std::string& out,
                            std::string* err = nullptr);

} // namespace maze::io
