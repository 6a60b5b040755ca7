#pragma once
// TtmlImporter.hpp - AMLL TTML to Babel lyrics conversion
//
// Every <p> becomes a line and every timed <span> inside it a segment.
// Whitespace between spans becomes a " " segment. Background vocal spans
// (ttm:role="x-bg") become a separate line after their parent.
// Translation and romanization spans are not imported.

#include <QByteArray>
#include <filesystem>
#include <optional>
#include <string_view>
#include "LyricsData.hpp"
#include "util/Result.hpp"

namespace babel::lyrics {

class TtmlImporter {
public:
    static Result<BabelLyrics> parse(const QByteArray& xml);
    static Result<BabelLyrics> loadFile(const std::filesystem::path& path);

    // [[hh:]mm:]ss[.fff] or <seconds>s
    static std::optional<Duration> parseTime(std::string_view text);
};

} // namespace babel::lyrics
