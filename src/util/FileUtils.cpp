#include "FileUtils.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iterator>

namespace babel::file {

namespace {
constexpr const char* kAppDir = "babel-player";

fs::path xdgDir(const char* envVar, const char* fallbackRelative) {
    if (const char* xdg = std::getenv(envVar); xdg && *xdg)
        return fs::path(xdg) / kAppDir;
    if (const char* home = std::getenv("HOME"); home && *home)
        return fs::path(home) / fallbackRelative / kAppDir;
    return fs::temp_directory_path() / kAppDir;
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}
} // namespace

fs::path configDir() {
    return xdgDir("XDG_CONFIG_HOME", ".config");
}

fs::path cacheDir() {
    return xdgDir("XDG_CACHE_HOME", ".cache");
}

bool ensureDir(const fs::path& dir) {
    std::error_code ec;
    if (fs::is_directory(dir, ec))
        return true;
    fs::create_directories(dir, ec);
    return !ec;
}

bool hasExtension(const fs::path& path, const std::vector<std::string>& exts) {
    auto ext = lower(path.extension().string());
    return std::find(exts.begin(), exts.end(), ext) != exts.end();
}

Result<std::vector<u8>> readBytes(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in)
        return Result<std::vector<u8>>::err("Failed to open file: " +
                                            path.string());

    std::vector<u8> data((std::istreambuf_iterator<char>(in)),
                         std::istreambuf_iterator<char>());
    if (in.bad())
        return Result<std::vector<u8>>::err("Failed to read file: " +
                                            path.string());
    return Result<std::vector<u8>>::ok(std::move(data));
}

Result<std::string> readText(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in)
        return Result<std::string>::err("Failed to open file: " +
                                        path.string());

    std::string text((std::istreambuf_iterator<char>(in)),
                     std::istreambuf_iterator<char>());
    if (in.bad())
        return Result<std::string>::err("Failed to read file: " +
                                        path.string());
    return Result<std::string>::ok(std::move(text));
}

Result<void> writeAtomic(const fs::path& path, std::string_view contents) {
    fs::path tempPath = path;
    tempPath += ".tmp";

    auto fail = [&tempPath](std::string message) {
        std::error_code ignored;
        fs::remove(tempPath, ignored);
        return Result<void>::err(std::move(message));
    };

    std::ofstream out(tempPath, std::ios::binary | std::ios::trunc);
    if (!out)
        return fail("Failed to open for writing: " + tempPath.string());
    out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    out.close();
    if (!out)
        return fail("Failed to write: " + tempPath.string());

    std::error_code ec;
    fs::rename(tempPath, path, ec);
    if (ec)
        return fail("Failed to replace " + path.string() + ": " + ec.message());
    return Result<void>::ok();
}

} // namespace babel::file
