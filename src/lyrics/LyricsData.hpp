#pragma once
// LyricsData.hpp - Babel lyrics document model
// Word-timed original text with per-language translations linked by index

#include <string>
#include <utility>
#include <vector>
#include "util/Types.hpp"

namespace babel::lyrics {

// Canonical lower-case uuid text without braces
using Uuid = std::string;

// Language id -> indices into the line's translation words
using SegmentTranslation = std::pair<Uuid, std::vector<size_t>>;
// Language id -> translated words of the whole line
using LineTranslation = std::pair<Uuid, std::vector<std::string>>;

struct TranslationEntry {
    std::string language;
    Uuid id;

    bool operator==(const TranslationEntry&) const = default;
};

struct Agent {
    std::string id;

    bool operator==(const Agent&) const = default;
};

struct LyricsMetadata {
    std::vector<Agent> agents;
    std::vector<TranslationEntry> translations;

    bool operator==(const LyricsMetadata&) const = default;
};

struct LyricsSegment {
    Duration begin{0};
    Duration end{0};
    std::string text;
    std::vector<SegmentTranslation> translations;

    bool operator==(const LyricsSegment&) const = default;
};

struct LyricsLine {
    Duration begin{0};
    Duration end{0};
    std::string agentId;
    std::vector<LyricsSegment> original;
    Uuid uuid;
    std::vector<LineTranslation> translations;

    bool operator==(const LyricsLine&) const = default;
};

struct Lyrics {
    std::vector<LyricsLine> lines;

    bool operator==(const Lyrics&) const = default;
};

struct BabelLyrics {
    LyricsMetadata metadata;
    Lyrics lyrics;

    bool operator==(const BabelLyrics&) const = default;
};

Uuid newUuid();

// Concatenated segment texts, used as the line's title
std::string lineText(const LyricsLine& line);

// Name of a translation language, empty when the id is unknown
std::string languageName(const LyricsMetadata& meta, const Uuid& id);

} // namespace babel::lyrics
