#pragma once
// LyricsJson.hpp - Babel lyrics JSON reader/writer
//
// Layout (times in integer milliseconds, pairs as two-element arrays):
//   { "metadata": { "agents": [{"id"}], "translations": [{"language","id"}] },
//     "lyrics": { "lines": [ { "begin","end","agent_id","uuid",
//         "original": [ {"begin","end","text","translations":[[id,[idx]]]} ],
//         "translations": [[id,["word"]]] } ] } }

#include <QByteArray>
#include <filesystem>
#include "LyricsData.hpp"
#include "util/Result.hpp"

namespace babel::lyrics {

class LyricsJson {
public:
    // Strict: every field is required, errors name the offending path
    static Result<BabelLyrics> parse(const QByteArray& json);
    static QByteArray serialize(const BabelLyrics& lyrics, bool indented = false);

    static Result<BabelLyrics> loadFile(const std::filesystem::path& path);
    static Result<void> saveFile(const std::filesystem::path& path,
                                 const BabelLyrics& lyrics);
};

} // namespace babel::lyrics
