#pragma once
// FileUtils.hpp - Filesystem helpers and XDG directory lookup

#include <filesystem>
#include <string>
#include <vector>
#include "Result.hpp"
#include "Types.hpp"

namespace babel::file {

namespace fs = std::filesystem;

inline const std::vector<std::string> audioExtensions = {
        ".mp3", ".flac", ".ogg", ".opus", ".wav", ".m4a", ".aac"};
inline const std::vector<std::string> lyricsExtensions = {".json"};
inline const std::vector<std::string> ttmlExtensions = {".ttml", ".xml"};

fs::path configDir();
fs::path cacheDir();

bool ensureDir(const fs::path& dir);

// Case-insensitive extension match, extensions include the leading dot
bool hasExtension(const fs::path& path, const std::vector<std::string>& exts);

Result<std::vector<u8>> readBytes(const fs::path& path);
Result<std::string> readText(const fs::path& path);

// Writes to <path>.tmp and renames over the target
Result<void> writeAtomic(const fs::path& path, std::string_view contents);

} // namespace babel::file
