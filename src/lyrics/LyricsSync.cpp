#include "LyricsSync.hpp"
#include <algorithm>

namespace babel::lyrics {

std::vector<const LineState*> LyricsFrame::activeLines() const {
    std::vector<const LineState*> result;
    for (const auto& state : lines) {
        if (state.active)
            result.push_back(&state);
    }
    return result;
}

bool LyricsFrame::anyActive() const {
    return std::any_of(lines.begin(), lines.end(), [](const auto& l) {
        return l.active;
    });
}

LineState LyricsSync::lineAt(const LyricsLine& line, size_t index, Duration t) {
    LineState state;
    state.index = index;
    state.line = &line;
    state.active = isActive(line.begin, line.end, t);

    std::vector<const SegmentTranslation*> activeLinks;
    state.segments.reserve(line.original.size());
    for (const auto& seg : line.original) {
        bool segActive = state.active && isActive(seg.begin, seg.end, t);
        state.segments.push_back({&seg, segActive});
        if (segActive) {
            for (const auto& link : seg.translations)
                activeLinks.push_back(&link);
        }
    }

    if (!state.active)
        return state;

    for (const auto& [language, words] : line.translations) {
        if (words.empty())
            continue;

        TranslationRow row;
        row.language = language;
        row.words = &words;
        row.highlighted.assign(words.size(), false);
        for (const auto* link : activeLinks) {
            if (link->first != language)
                continue;
            for (size_t i : link->second) {
                if (i < row.highlighted.size())
                    row.highlighted[i] = true;
            }
        }
        state.translations.push_back(std::move(row));
    }
    return state;
}

LyricsFrame LyricsSync::frameAt(const BabelLyrics& lyrics, Duration t) {
    LyricsFrame frame;
    frame.timestamp = t;
    const auto& lines = lyrics.lyrics.lines;
    frame.lines.reserve(lines.size());
    for (size_t i = 0; i < lines.size(); ++i)
        frame.lines.push_back(lineAt(lines[i], i, t));
    return frame;
}

std::vector<size_t> LyricsSync::activeLineIndices(const BabelLyrics& lyrics,
                                                  Duration t) {
    std::vector<size_t> result;
    const auto& lines = lyrics.lyrics.lines;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (isActive(lines[i].begin, lines[i].end, t))
            result.push_back(i);
    }
    return result;
}

} // namespace babel::lyrics
