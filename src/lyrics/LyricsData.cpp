#include "LyricsData.hpp"
#include <QUuid>

namespace babel::lyrics {

Uuid newUuid() {
    return QUuid::createUuid().toString(QUuid::WithoutBraces).toStdString();
}

std::string lineText(const LyricsLine& line) {
    std::string text;
    for (const auto& seg : line.original)
        text += seg.text;
    return text;
}

std::string languageName(const LyricsMetadata& meta, const Uuid& id) {
    for (const auto& entry : meta.translations) {
        if (entry.id == id)
            return entry.language;
    }
    return {};
}

} // namespace babel::lyrics
