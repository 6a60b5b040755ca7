#include "LyricsJson.hpp"
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QUuid>
#include <cmath>
#include <limits>
#include "core/Logger.hpp"
#include "util/FileUtils.hpp"

namespace babel::lyrics {

namespace {

struct Reader {
    std::string error;

    bool fail(const std::string& path, const std::string& what) {
        error = path + ": " + what;
        return false;
    }

    bool field(const QJsonObject& obj,
               const std::string& path,
               const char* key,
               QJsonValue& out) {
        auto it = obj.constFind(QLatin1String(key));
        if (it == obj.constEnd())
            return fail(path, std::string("missing field '") + key + "'");
        out = it.value();
        return true;
    }

    bool object(const QJsonValue& v, const std::string& path, QJsonObject& out) {
        if (!v.isObject())
            return fail(path, "expected an object");
        out = v.toObject();
        return true;
    }

    bool array(const QJsonValue& v, const std::string& path, QJsonArray& out) {
        if (!v.isArray())
            return fail(path, "expected an array");
        out = v.toArray();
        return true;
    }

    bool string(const QJsonValue& v, const std::string& path, std::string& out) {
        if (!v.isString())
            return fail(path, "expected a string");
        out = v.toString().toStdString();
        return true;
    }

    bool integer(const QJsonValue& v, const std::string& path, i64& out) {
        if (!v.isDouble())
            return fail(path, "expected an integer");
        double d = v.toDouble();
        if (std::floor(d) != d || std::abs(d) > 9.0e15)
            return fail(path, "expected an integer");
        out = static_cast<i64>(d);
        return true;
    }

    bool index(const QJsonValue& v, const std::string& path, size_t& out) {
        i64 n = 0;
        if (!integer(v, path, n))
            return false;
        if (n < 0)
            return fail(path, "expected a non-negative index");
        out = static_cast<size_t>(n);
        return true;
    }

    bool duration(const QJsonObject& obj,
                  const std::string& path,
                  const char* key,
                  Duration& out) {
        QJsonValue v;
        i64 ms = 0;
        if (!field(obj, path, key, v) || !integer(v, path + "." + key, ms))
            return false;
        out = Duration(ms);
        return true;
    }

    bool uuid(const QJsonValue& v, const std::string& path, Uuid& out) {
        if (!v.isString())
            return fail(path, "expected a uuid string");
        QUuid parsed = QUuid::fromString(v.toString());
        if (parsed.isNull() && v.toString() != QUuid().toString(QUuid::WithoutBraces))
            return fail(path, "invalid uuid '" + v.toString().toStdString() + "'");
        out = parsed.toString(QUuid::WithoutBraces).toStdString();
        return true;
    }

    template <typename Second, typename ReadItem>
    bool pairs(const QJsonValue& v,
               const std::string& path,
               std::vector<std::pair<Uuid, std::vector<Second>>>& out,
               ReadItem readItem) {
        QJsonArray arr;
        if (!array(v, path, arr))
            return false;
        for (qsizetype i = 0; i < arr.size(); ++i) {
            auto itemPath = path + "[" + std::to_string(i) + "]";
            QJsonArray pair;
            if (!array(arr[i], itemPath, pair))
                return false;
            if (pair.size() != 2)
                return fail(itemPath, "expected a [id, list] pair");

            std::pair<Uuid, std::vector<Second>> entry;
            if (!uuid(pair[0], itemPath + "[0]", entry.first))
                return false;

            QJsonArray items;
            if (!array(pair[1], itemPath + "[1]", items))
                return false;
            for (qsizetype j = 0; j < items.size(); ++j) {
                Second item{};
                if (!readItem(items[j],
                              itemPath + "[1][" + std::to_string(j) + "]",
                              item))
                    return false;
                entry.second.push_back(std::move(item));
            }
            out.push_back(std::move(entry));
        }
        return true;
    }

    bool segment(const QJsonValue& v, const std::string& path, LyricsSegment& seg) {
        QJsonObject obj;
        QJsonValue text, translations;
        if (!object(v, path, obj) || !duration(obj, path, "begin", seg.begin) ||
            !duration(obj, path, "end", seg.end) ||
            !field(obj, path, "text", text) ||
            !string(text, path + ".text", seg.text) ||
            !field(obj, path, "translations", translations))
            return false;

        return pairs<size_t>(translations,
                             path + ".translations",
                             seg.translations,
                             [this](const QJsonValue& item,
                                    const std::string& p,
                                    size_t& out) { return index(item, p, out); });
    }

    bool line(const QJsonValue& v, const std::string& path, LyricsLine& line) {
        QJsonObject obj;
        QJsonValue agent, original, uuidVal, translations;
        if (!object(v, path, obj) || !duration(obj, path, "begin", line.begin) ||
            !duration(obj, path, "end", line.end) ||
            !field(obj, path, "agent_id", agent) ||
            !string(agent, path + ".agent_id", line.agentId) ||
            !field(obj, path, "uuid", uuidVal) ||
            !uuid(uuidVal, path + ".uuid", line.uuid) ||
            !field(obj, path, "original", original))
            return false;

        QJsonArray segments;
        if (!array(original, path + ".original", segments))
            return false;
        for (qsizetype i = 0; i < segments.size(); ++i) {
            LyricsSegment seg;
            if (!segment(segments[i],
                         path + ".original[" + std::to_string(i) + "]",
                         seg))
                return false;
            line.original.push_back(std::move(seg));
        }

        if (!field(obj, path, "translations", translations))
            return false;
        return pairs<std::string>(
                translations,
                path + ".translations",
                line.translations,
                [this](const QJsonValue& item,
                       const std::string& p,
                       std::string& out) { return string(item, p, out); });
    }

    bool metadata(const QJsonValue& v, const std::string& path, LyricsMetadata& meta) {
        QJsonObject obj;
        QJsonValue agentsVal, translationsVal;
        QJsonArray agents, translations;
        if (!object(v, path, obj) || !field(obj, path, "agents", agentsVal) ||
            !array(agentsVal, path + ".agents", agents) ||
            !field(obj, path, "translations", translationsVal) ||
            !array(translationsVal, path + ".translations", translations))
            return false;

        for (qsizetype i = 0; i < agents.size(); ++i) {
            auto p = path + ".agents[" + std::to_string(i) + "]";
            QJsonObject agentObj;
            QJsonValue id;
            Agent agent;
            if (!object(agents[i], p, agentObj) || !field(agentObj, p, "id", id) ||
                !string(id, p + ".id", agent.id))
                return false;
            meta.agents.push_back(std::move(agent));
        }

        for (qsizetype i = 0; i < translations.size(); ++i) {
            auto p = path + ".translations[" + std::to_string(i) + "]";
            QJsonObject entryObj;
            QJsonValue language, id;
            TranslationEntry entry;
            if (!object(translations[i], p, entryObj) ||
                !field(entryObj, p, "language", language) ||
                !string(language, p + ".language", entry.language) ||
                !field(entryObj, p, "id", id) || !uuid(id, p + ".id", entry.id))
                return false;
            meta.translations.push_back(std::move(entry));
        }
        return true;
    }

    bool document(const QJsonDocument& doc, BabelLyrics& out) {
        if (!doc.isObject())
            return fail("$", "expected an object");
        QJsonObject root = doc.object();

        QJsonValue meta, lyricsVal, linesVal;
        QJsonObject lyricsObj;
        QJsonArray lines;
        if (!field(root, "$", "metadata", meta) ||
            !metadata(meta, "metadata", out.metadata) ||
            !field(root, "$", "lyrics", lyricsVal) ||
            !object(lyricsVal, "lyrics", lyricsObj) ||
            !field(lyricsObj, "lyrics", "lines", linesVal) ||
            !array(linesVal, "lyrics.lines", lines))
            return false;

        for (qsizetype i = 0; i < lines.size(); ++i) {
            LyricsLine l;
            if (!line(lines[i], "lyrics.lines[" + std::to_string(i) + "]", l))
                return false;
            out.lyrics.lines.push_back(std::move(l));
        }
        return true;
    }
};

QString qs(const std::string& s) {
    return QString::fromStdString(s);
}

QJsonArray segmentTranslationsJson(const std::vector<SegmentTranslation>& list) {
    QJsonArray arr;
    for (const auto& [id, indices] : list) {
        QJsonArray idx;
        for (size_t i : indices)
            idx.append(static_cast<qint64>(i));
        arr.append(QJsonArray{qs(id), idx});
    }
    return arr;
}

QJsonArray lineTranslationsJson(const std::vector<LineTranslation>& list) {
    QJsonArray arr;
    for (const auto& [id, words] : list) {
        QJsonArray w;
        for (const auto& word : words)
            w.append(qs(word));
        arr.append(QJsonArray{qs(id), w});
    }
    return arr;
}

} // namespace

Result<BabelLyrics> LyricsJson::parse(const QByteArray& json) {
    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(json, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        return Result<BabelLyrics>::err(
                "Invalid JSON at offset " + std::to_string(parseError.offset) +
                ": " + parseError.errorString().toStdString());
    }

    Reader reader;
    BabelLyrics lyrics;
    if (!reader.document(doc, lyrics))
        return Result<BabelLyrics>::err("Invalid lyrics file: " + reader.error);

    return Result<BabelLyrics>::ok(std::move(lyrics));
}

QByteArray LyricsJson::serialize(const BabelLyrics& lyrics, bool indented) {
    QJsonArray agents;
    for (const auto& agent : lyrics.metadata.agents)
        agents.append(QJsonObject{{"id", qs(agent.id)}});

    QJsonArray translations;
    for (const auto& entry : lyrics.metadata.translations)
        translations.append(
                QJsonObject{{"language", qs(entry.language)}, {"id", qs(entry.id)}});

    QJsonArray lines;
    for (const auto& line : lyrics.lyrics.lines) {
        QJsonArray original;
        for (const auto& seg : line.original) {
            original.append(QJsonObject{
                    {"begin", static_cast<qint64>(seg.begin.count())},
                    {"end", static_cast<qint64>(seg.end.count())},
                    {"text", qs(seg.text)},
                    {"translations", segmentTranslationsJson(seg.translations)}});
        }
        lines.append(QJsonObject{
                {"begin", static_cast<qint64>(line.begin.count())},
                {"end", static_cast<qint64>(line.end.count())},
                {"agent_id", qs(line.agentId)},
                {"original", original},
                {"uuid", qs(line.uuid)},
                {"translations", lineTranslationsJson(line.translations)}});
    }

    QJsonObject root{
            {"metadata",
             QJsonObject{{"agents", agents}, {"translations", translations}}},
            {"lyrics", QJsonObject{{"lines", lines}}}};

    return QJsonDocument(root).toJson(indented ? QJsonDocument::Indented
                                               : QJsonDocument::Compact);
}

Result<BabelLyrics> LyricsJson::loadFile(const std::filesystem::path& path) {
    auto text = file::readText(path);
    if (!text) {
        LOG_ERROR("{}", text.error().message);
        return Result<BabelLyrics>::err(text.error().message);
    }

    auto parsed = parse(QByteArray::fromStdString(*text));
    if (!parsed) {
        LOG_ERROR("Failed to parse lyrics {}: {}",
                  path.string(),
                  parsed.error().message);
        return parsed;
    }

    LOG_INFO("Loaded lyrics {} ({} lines, {} translations)",
             path.filename().string(),
             parsed->lyrics.lines.size(),
             parsed->metadata.translations.size());
    return parsed;
}

Result<void> LyricsJson::saveFile(const std::filesystem::path& path,
                                  const BabelLyrics& lyrics) {
    QByteArray json = serialize(lyrics);
    auto res = file::writeAtomic(path,
                                 std::string_view(json.constData(),
                                                  static_cast<size_t>(json.size())));
    if (!res) {
        LOG_ERROR("Failed to export lyrics: {}", res.error().message);
        return res;
    }
    LOG_INFO("Exported lyrics to {}", path.string());
    return Result<void>::ok();
}

} // namespace babel::lyrics
