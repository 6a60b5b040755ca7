#pragma once
// LyricsSync.hpp - What the lyric views show at a playback timestamp
//
// A line or segment is active strictly inside (begin, end). A translation
// word is highlighted when an active segment of its line links to it.

#include <vector>
#include "LyricsData.hpp"

namespace babel::lyrics {

struct SegmentState {
    const LyricsSegment* segment{nullptr};
    bool active{false};
};

struct TranslationRow {
    Uuid language;
    const std::vector<std::string>* words{nullptr};
    std::vector<bool> highlighted; // parallel to *words
};

struct LineState {
    size_t index{0};
    const LyricsLine* line{nullptr};
    bool active{false};
    std::vector<SegmentState> segments;
    std::vector<TranslationRow> translations; // active lines only, non-empty rows
};

struct LyricsFrame {
    Duration timestamp{0};
    std::vector<LineState> lines; // every line, in document order

    // Active lines only, as shown in the captions window
    std::vector<const LineState*> activeLines() const;
    bool anyActive() const;
};

class LyricsSync {
public:
    static bool isActive(Duration begin, Duration end, Duration t) {
        return begin < t && t < end;
    }

    // The frame holds pointers into `lyrics`, which must outlive it
    static LyricsFrame frameAt(const BabelLyrics& lyrics, Duration t);
    static LineState lineAt(const LyricsLine& line, size_t index, Duration t);

    // Indices of all lines active at t
    static std::vector<size_t> activeLineIndices(const BabelLyrics& lyrics,
                                                 Duration t);
};

} // namespace babel::lyrics
