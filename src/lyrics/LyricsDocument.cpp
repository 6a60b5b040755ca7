#include "LyricsDocument.hpp"
#include <algorithm>
#include "core/Logger.hpp"

namespace babel::lyrics {

namespace {
Result<void> badLine(size_t line) {
    return Result<void>::err("No line at index " + std::to_string(line));
}
Result<void> badSegment(size_t segment) {
    return Result<void>::err("No segment at index " + std::to_string(segment));
}
Result<void> badLanguage(const Uuid& id) {
    return Result<void>::err("Unknown translation language " + id);
}
} // namespace

const LyricsLine* LyricsDocument::line(size_t index) const {
    if (index >= lyrics_.lyrics.lines.size())
        return nullptr;
    return &lyrics_.lyrics.lines[index];
}

LyricsLine* LyricsDocument::mutableLine(size_t index) {
    if (index >= lyrics_.lyrics.lines.size())
        return nullptr;
    return &lyrics_.lyrics.lines[index];
}

std::vector<std::string>* LyricsDocument::wordsFor(LyricsLine& line,
                                                   const Uuid& language) {
    for (auto& [id, words] : line.translations) {
        if (id == language)
            return &words;
    }
    return nullptr;
}

std::vector<size_t>* LyricsDocument::indicesFor(LyricsSegment& seg,
                                                const Uuid& language) {
    for (auto& [id, indices] : seg.translations) {
        if (id == language)
            return &indices;
    }
    return nullptr;
}

std::vector<SegmentTranslation> LyricsDocument::emptySegmentTranslations() const {
    std::vector<SegmentTranslation> result;
    for (const auto& entry : lyrics_.metadata.translations)
        result.emplace_back(entry.id, std::vector<size_t>{});
    return result;
}

std::vector<LineTranslation> LyricsDocument::emptyLineTranslations() const {
    std::vector<LineTranslation> result;
    for (const auto& entry : lyrics_.metadata.translations)
        result.emplace_back(entry.id, std::vector<std::string>{});
    return result;
}

bool LyricsDocument::hasLanguage(const Uuid& id) const {
    const auto& list = lyrics_.metadata.translations;
    return std::any_of(list.begin(), list.end(), [&id](const auto& e) {
        return e.id == id;
    });
}

Uuid LyricsDocument::addLanguage(const std::string& name) {
    Uuid id = newUuid();
    lyrics_.metadata.translations.push_back(TranslationEntry{name, id});
    for (auto& line : lyrics_.lyrics.lines) {
        line.translations.emplace_back(id, std::vector<std::string>{});
        for (auto& seg : line.original)
            seg.translations.emplace_back(id, std::vector<size_t>{});
    }
    LOG_DEBUG("Added translation language {} ({})", name, id);
    return id;
}

Result<void> LyricsDocument::removeLanguage(const Uuid& id) {
    if (!hasLanguage(id))
        return badLanguage(id);

    std::erase_if(lyrics_.metadata.translations,
                  [&id](const auto& e) { return e.id == id; });
    for (auto& line : lyrics_.lyrics.lines) {
        std::erase_if(line.translations,
                      [&id](const auto& t) { return t.first == id; });
        for (auto& seg : line.original) {
            std::erase_if(seg.translations,
                          [&id](const auto& t) { return t.first == id; });
        }
    }
    LOG_DEBUG("Removed translation language {}", id);
    return Result<void>::ok();
}

Result<void> LyricsDocument::renameLanguage(const Uuid& id,
                                            const std::string& name) {
    for (auto& entry : lyrics_.metadata.translations) {
        if (entry.id == id) {
            entry.language = name;
            return Result<void>::ok();
        }
    }
    return badLanguage(id);
}

size_t LyricsDocument::addLine() {
    LyricsLine line;
    line.uuid = newUuid();
    line.translations = emptyLineTranslations();
    lyrics_.lyrics.lines.push_back(std::move(line));
    return lyrics_.lyrics.lines.size() - 1;
}

Result<void> LyricsDocument::removeLine(size_t line) {
    auto& lines = lyrics_.lyrics.lines;
    if (line >= lines.size())
        return badLine(line);
    lines.erase(lines.begin() + static_cast<std::ptrdiff_t>(line));
    return Result<void>::ok();
}

Result<void> LyricsDocument::setAgent(size_t line, const std::string& agentId) {
    auto* l = mutableLine(line);
    if (!l)
        return badLine(line);
    l->agentId = agentId;
    return Result<void>::ok();
}

Result<void> LyricsDocument::setLineTimes(size_t line,
                                          Duration begin,
                                          Duration end) {
    auto* l = mutableLine(line);
    if (!l)
        return badLine(line);
    l->begin = begin;
    l->end = end;
    return Result<void>::ok();
}

Result<void> LyricsDocument::insertSegment(size_t line, size_t index) {
    auto* l = mutableLine(line);
    if (!l)
        return badLine(line);
    if (index > l->original.size())
        return badSegment(index);

    LyricsSegment seg;
    seg.translations = emptySegmentTranslations();
    l->original.insert(l->original.begin() + static_cast<std::ptrdiff_t>(index),
                       std::move(seg));
    return Result<void>::ok();
}

Result<void> LyricsDocument::removeSegment(size_t line, size_t index) {
    auto* l = mutableLine(line);
    if (!l)
        return badLine(line);
    if (index >= l->original.size())
        return badSegment(index);
    l->original.erase(l->original.begin() + static_cast<std::ptrdiff_t>(index));
    return Result<void>::ok();
}

Result<void> LyricsDocument::moveSegment(size_t line, size_t from, size_t to) {
    auto* l = mutableLine(line);
    if (!l)
        return badLine(line);
    if (from >= l->original.size())
        return badSegment(from);
    if (to >= l->original.size())
        return badSegment(to);
    std::swap(l->original[from], l->original[to]);
    return Result<void>::ok();
}

Result<void> LyricsDocument::setSegmentTimes(size_t line,
                                             size_t segment,
                                             Duration begin,
                                             Duration end) {
    auto* l = mutableLine(line);
    if (!l)
        return badLine(line);
    if (segment >= l->original.size())
        return badSegment(segment);
    l->original[segment].begin = begin;
    l->original[segment].end = end;
    return Result<void>::ok();
}

Result<void> LyricsDocument::setSegmentText(size_t line,
                                            size_t segment,
                                            std::string text) {
    auto* l = mutableLine(line);
    if (!l)
        return badLine(line);
    if (segment >= l->original.size())
        return badSegment(segment);
    l->original[segment].text = std::move(text);
    return Result<void>::ok();
}

Result<size_t> LyricsDocument::addTranslationWord(size_t line,
                                                  const Uuid& language) {
    auto* l = mutableLine(line);
    if (!l)
        return Result<size_t>::err(badLine(line).error().message);
    auto* words = wordsFor(*l, language);
    if (!words)
        return Result<size_t>::err(badLanguage(language).error().message);
    words->emplace_back();
    return Result<size_t>::ok(words->size() - 1);
}

Result<void> LyricsDocument::setTranslationWord(size_t line,
                                                const Uuid& language,
                                                size_t index,
                                                std::string text) {
    auto* l = mutableLine(line);
    if (!l)
        return badLine(line);
    auto* words = wordsFor(*l, language);
    if (!words)
        return badLanguage(language);
    if (index >= words->size())
        return Result<void>::err("No translation word at index " +
                                 std::to_string(index));
    (*words)[index] = std::move(text);
    return Result<void>::ok();
}

Result<void> LyricsDocument::removeTranslationWord(size_t line,
                                                   const Uuid& language,
                                                   size_t index) {
    auto* l = mutableLine(line);
    if (!l)
        return badLine(line);
    auto* words = wordsFor(*l, language);
    if (!words)
        return badLanguage(language);
    if (index >= words->size())
        return Result<void>::err("No translation word at index " +
                                 std::to_string(index));

    words->erase(words->begin() + static_cast<std::ptrdiff_t>(index));

    // Links past the removed word shift down by one
    for (auto& seg : l->original) {
        auto* indices = indicesFor(seg, language);
        if (!indices)
            continue;
        std::erase(*indices, index);
        for (auto& i : *indices) {
            if (i > index)
                --i;
        }
    }
    return Result<void>::ok();
}

const std::vector<std::string>* LyricsDocument::translationWords(
        size_t line,
        const Uuid& language) const {
    const auto* l = this->line(line);
    if (!l)
        return nullptr;
    for (const auto& [id, words] : l->translations) {
        if (id == language)
            return &words;
    }
    return nullptr;
}

Result<void> LyricsDocument::setLink(size_t line,
                                     size_t segment,
                                     const Uuid& language,
                                     size_t wordIndex,
                                     bool linked) {
    auto* l = mutableLine(line);
    if (!l)
        return badLine(line);
    if (segment >= l->original.size())
        return badSegment(segment);
    auto* words = wordsFor(*l, language);
    auto* indices = indicesFor(l->original[segment], language);
    if (!words || !indices)
        return badLanguage(language);
    if (wordIndex >= words->size())
        return Result<void>::err("No translation word at index " +
                                 std::to_string(wordIndex));

    bool present = std::find(indices->begin(), indices->end(), wordIndex) !=
                   indices->end();
    if (linked && !present)
        indices->push_back(wordIndex);
    else if (!linked && present)
        std::erase(*indices, wordIndex);
    return Result<void>::ok();
}

bool LyricsDocument::isLinked(size_t line,
                              size_t segment,
                              const Uuid& language,
                              size_t wordIndex) const {
    const auto* l = this->line(line);
    if (!l || segment >= l->original.size())
        return false;
    for (const auto& [id, indices] : l->original[segment].translations) {
        if (id == language)
            return std::find(indices.begin(), indices.end(), wordIndex) !=
                   indices.end();
    }
    return false;
}

} // namespace babel::lyrics
