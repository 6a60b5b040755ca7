#pragma once
// LyricsDocument.hpp - Editing operations on a Babel lyrics document
//
// Keeps the per-language translation entries of every line and segment in
// step with the metadata language list. Operations with an invalid index or
// unknown language return an error and leave the document untouched.

#include <optional>
#include "LyricsData.hpp"
#include "util/Result.hpp"

namespace babel::lyrics {

class LyricsDocument {
public:
    LyricsDocument() = default;
    explicit LyricsDocument(BabelLyrics lyrics) : lyrics_(std::move(lyrics)) {}

    const BabelLyrics& lyrics() const {
        return lyrics_;
    }
    void setLyrics(BabelLyrics lyrics) {
        lyrics_ = std::move(lyrics);
    }

    size_t lineCount() const {
        return lyrics_.lyrics.lines.size();
    }
    const LyricsLine* line(size_t index) const;

    // Translation languages
    Uuid addLanguage(const std::string& name);
    Result<void> removeLanguage(const Uuid& id);
    Result<void> renameLanguage(const Uuid& id, const std::string& name);
    bool hasLanguage(const Uuid& id) const;

    // Lines
    size_t addLine();
    Result<void> removeLine(size_t line);
    Result<void> setAgent(size_t line, const std::string& agentId);
    Result<void> setLineTimes(size_t line, Duration begin, Duration end);

    // Segments of a line's original text
    Result<void> insertSegment(size_t line, size_t index);
    Result<void> removeSegment(size_t line, size_t index);
    Result<void> moveSegment(size_t line, size_t from, size_t to);
    Result<void> setSegmentTimes(size_t line,
                                 size_t segment,
                                 Duration begin,
                                 Duration end);
    Result<void> setSegmentText(size_t line, size_t segment, std::string text);

    // Translation words of a line
    Result<size_t> addTranslationWord(size_t line, const Uuid& language);
    Result<void> setTranslationWord(size_t line,
                                    const Uuid& language,
                                    size_t index,
                                    std::string text);
    Result<void> removeTranslationWord(size_t line,
                                       const Uuid& language,
                                       size_t index);
    const std::vector<std::string>* translationWords(size_t line,
                                                     const Uuid& language) const;

    // Segment -> translation word links
    Result<void> setLink(size_t line,
                         size_t segment,
                         const Uuid& language,
                         size_t wordIndex,
                         bool linked);
    bool isLinked(size_t line,
                  size_t segment,
                  const Uuid& language,
                  size_t wordIndex) const;

private:
    std::vector<SegmentTranslation> emptySegmentTranslations() const;
    std::vector<LineTranslation> emptyLineTranslations() const;

    LyricsLine* mutableLine(size_t index);
    static std::vector<std::string>* wordsFor(LyricsLine& line, const Uuid& language);
    static std::vector<size_t>* indicesFor(LyricsSegment& seg, const Uuid& language);

    BabelLyrics lyrics_;
};

} // namespace babel::lyrics
