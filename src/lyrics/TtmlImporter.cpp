#include "TtmlImporter.hpp"
#include <QXmlStreamReader>
#include <algorithm>
#include <charconv>
#include <cmath>
#include "core/Logger.hpp"
#include "util/FileUtils.hpp"
#include "util/TimeFormat.hpp"

namespace babel::lyrics {

namespace {

std::optional<QString> attr(const QXmlStreamReader& xml, QStringView localName) {
    for (const auto& a : xml.attributes()) {
        if (a.name() == localName)
            return a.value().toString();
    }
    return std::nullopt;
}

bool isWhitespace(const QString& s) {
    return std::all_of(s.begin(), s.end(), [](QChar c) { return c.isSpace(); });
}

class TtmlParser {
public:
    explicit TtmlParser(const QByteArray& data) : xml_(data) {}

    Result<BabelLyrics> run() {
        bool sawRoot = false;
        while (!xml_.atEnd() && error_.empty()) {
            if (!xml_.readNextStartElement())
                continue;

            if (!sawRoot) {
                if (xml_.name() != QLatin1String("tt")) {
                    return Result<BabelLyrics>::err(
                            "Not a TTML document: root element is <" +
                            xml_.name().toString().toStdString() + ">");
                }
                sawRoot = true;
                continue;
            }

            if (xml_.name() == QLatin1String("agent")) {
                if (auto id = attr(xml_, u"id"))
                    result_.metadata.agents.push_back(Agent{id->toStdString()});
                xml_.skipCurrentElement();
            } else if (xml_.name() == QLatin1String("p")) {
                readParagraph();
            }
            // head, metadata, body and div are descended into
        }

        if (xml_.hasError()) {
            return Result<BabelLyrics>::err(
                    "TTML parse error at line " +
                    std::to_string(xml_.lineNumber()) + ", column " +
                    std::to_string(xml_.columnNumber()) + ": " +
                    xml_.errorString().toStdString());
        }
        if (!error_.empty())
            return Result<BabelLyrics>::err(error_);
        if (!sawRoot)
            return Result<BabelLyrics>::err("Not a TTML document: empty input");

        return Result<BabelLyrics>::ok(std::move(result_));
    }

private:
    bool timeAttr(std::u16string_view name, Duration& out, bool required) {
        auto value = attr(xml_, QStringView(name.data(), name.size()));
        if (!value) {
            if (required) {
                error_ = "Missing '" +
                         QString::fromUtf16(name.data(), name.size()).toStdString() +
                         "' at line " + std::to_string(xml_.lineNumber());
            }
            return false;
        }
        auto text = value->toStdString();
        auto t = TtmlImporter::parseTime(text);
        if (!t) {
            error_ = "Invalid time expression '" + text + "' at line " +
                     std::to_string(xml_.lineNumber());
            return false;
        }
        out = *t;
        return true;
    }

    static void appendText(LyricsLine& line, const QString& text, Duration at) {
        LyricsSegment seg;
        seg.begin = at;
        seg.end = at;
        seg.text = text.toStdString();
        line.original.push_back(std::move(seg));
    }

    // Whitespace runs collapse to one " " segment, dropped at the line edges
    static void appendSpace(LyricsLine& line, bool& pendingSpace) {
        if (pendingSpace && !line.original.empty() &&
            line.original.back().text != " ") {
            Duration at = line.original.back().end;
            appendText(line, QStringLiteral(" "), at);
        }
        pendingSpace = false;
    }

    // Reads the children of a <p> or x-bg <span> into `line`
    void readContent(LyricsLine& line, std::vector<LyricsLine>* bgLines) {
        bool pendingSpace = false;
        while (error_.empty() && !xml_.hasError()) {
            auto token = xml_.readNext();
            if (token == QXmlStreamReader::EndElement ||
                token == QXmlStreamReader::EndDocument ||
                token == QXmlStreamReader::Invalid)
                return;

            // Stray text outside a timed span is not a segment
            if (token == QXmlStreamReader::Characters) {
                if (isWhitespace(xml_.text().toString()))
                    pendingSpace = true;
                continue;
            }

            if (token != QXmlStreamReader::StartElement)
                continue;

            if (xml_.name() != QLatin1String("span")) {
                xml_.skipCurrentElement();
                continue;
            }

            auto role = attr(xml_, u"role").value_or(QString());
            if (role == QLatin1String("x-translation") ||
                role == QLatin1String("x-roman")) {
                xml_.skipCurrentElement();
                continue;
            }

            if (role == QLatin1String("x-bg")) {
                if (bgLines)
                    readBackground(line, *bgLines);
                else
                    xml_.skipCurrentElement();
                continue;
            }

            Duration begin{0}, end{0};
            bool timed = timeAttr(u"begin", begin, false) &&
                         timeAttr(u"end", end, false);
            if (!error_.empty())
                return;

            QString text = xml_.readElementText(
                    QXmlStreamReader::IncludeChildElements);
            if (!timed || text.isEmpty())
                continue;

            appendSpace(line, pendingSpace);
            LyricsSegment seg;
            seg.begin = begin;
            seg.end = end;
            seg.text = text.toStdString();
            line.original.push_back(std::move(seg));
        }
    }

    void readBackground(const LyricsLine& parent, std::vector<LyricsLine>& out) {
        LyricsLine bg;
        bg.agentId = parent.agentId;
        bg.uuid = newUuid();

        Duration begin{0}, end{0};
        bool timed = timeAttr(u"begin", begin, false) &&
                     timeAttr(u"end", end, false);
        if (!error_.empty())
            return;

        readContent(bg, nullptr);
        if (!error_.empty() || bg.original.empty())
            return;

        if (timed) {
            bg.begin = begin;
            bg.end = end;
        } else {
            bg.begin = bg.original.front().begin;
            bg.end = bg.original.front().end;
            for (const auto& seg : bg.original) {
                bg.begin = std::min(bg.begin, seg.begin);
                bg.end = std::max(bg.end, seg.end);
            }
        }
        out.push_back(std::move(bg));
    }

    void readParagraph() {
        LyricsLine line;
        line.uuid = newUuid();
        line.agentId = attr(xml_, u"agent").value_or(QString()).toStdString();

        if (!timeAttr(u"begin", line.begin, true) ||
            !timeAttr(u"end", line.end, true))
            return;

        std::vector<LyricsLine> bgLines;
        readContent(line, &bgLines);
        if (!error_.empty())
            return;

        while (!line.original.empty() && line.original.back().text == " ")
            line.original.pop_back();

        result_.lyrics.lines.push_back(std::move(line));
        for (auto& bg : bgLines)
            result_.lyrics.lines.push_back(std::move(bg));
    }

    QXmlStreamReader xml_;
    BabelLyrics result_;
    std::string error_;
};

} // namespace

std::optional<Duration> TtmlImporter::parseTime(std::string_view text) {
    while (!text.empty() && text.front() == ' ')
        text.remove_prefix(1);
    while (!text.empty() && text.back() == ' ')
        text.remove_suffix(1);

    if (!text.empty() && text.back() == 's' &&
        text.find(':') == std::string_view::npos) {
        text.remove_suffix(1);
        double seconds = 0.0;
        auto [ptr, ec] =
                std::from_chars(text.data(), text.data() + text.size(), seconds);
        if (text.empty() || ec != std::errc() || ptr != text.data() + text.size() ||
            seconds < 0.0)
            return std::nullopt;
        return Duration(static_cast<i64>(std::llround(seconds * 1000.0)));
    }

    return timefmt::parseTimestamp(text);
}

Result<BabelLyrics> TtmlImporter::parse(const QByteArray& xml) {
    TtmlParser parser(xml);
    return parser.run();
}

Result<BabelLyrics> TtmlImporter::loadFile(const std::filesystem::path& path) {
    auto text = file::readText(path);
    if (!text) {
        LOG_ERROR("{}", text.error().message);
        return Result<BabelLyrics>::err(text.error().message);
    }

    auto parsed = parse(QByteArray::fromStdString(*text));
    if (!parsed) {
        LOG_ERROR("Failed to import TTML {}: {}",
                  path.string(),
                  parsed.error().message);
        return parsed;
    }

    LOG_INFO("Imported TTML {} ({} lines, {} agents)",
             path.filename().string(),
             parsed->lyrics.lines.size(),
             parsed->metadata.agents.size());
    return parsed;
}

} // namespace babel::lyrics
