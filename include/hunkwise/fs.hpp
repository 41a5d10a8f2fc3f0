#pragma once
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace hunkwise::fs {

bool exists(const std::filesystem::path& p);
void ensure_parent_dir(const std::filesystem::path& p);

std::vector<std::uint8_t> read_file(const std::filesystem::path& p);
std::string read_text(const std::filesystem::path& p);

// Write via a sibling temp file and rename. An existing file keeps its
// permission bits.
void write_file_atomic(const std::filesystem::path& p, std::span<const std::uint8_t> data);
void write_text_atomic(const std::filesystem::path& p, std::string_view text);

// `arg` as typed relative to `base`; absolute paths pass through unchanged.
std::string resolve_from(const std::filesystem::path& base, std::string_view arg);

// Remove a regular file; throws if it cannot be removed.
void remove_file(const std::filesystem::path& p);

} // namespace hunkwise::fs
