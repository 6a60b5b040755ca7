#include <QtTest>
#include "lyrics/LyricsSync.hpp"

using namespace babel;
using namespace babel::lyrics;

namespace {
const Uuid kEnglish = "0b7e2f7c-4f7e-4a52-9f0b-0e4bb1d1c001";
const Uuid kGerman = "0b7e2f7c-4f7e-4a52-9f0b-0e4bb1d1c002";

LyricsSegment segment(i64 begin, i64 end, std::string text,
                      std::vector<size_t> englishLinks) {
    LyricsSegment seg;
    seg.begin = Duration(begin);
    seg.end = Duration(end);
    seg.text = std::move(text);
    seg.translations = {{kEnglish, std::move(englishLinks)}, {kGerman, {}}};
    return seg;
}

// Line 0 "Hello world" 1000-3000, line 1 "Again" 2500-5000 (overlaps line 0)
BabelLyrics sample() {
    BabelLyrics doc;
    doc.metadata.translations = {{"English", kEnglish}, {"Deutsch", kGerman}};

    LyricsLine first;
    first.begin = Duration(1000);
    first.end = Duration(3000);
    first.original = {segment(1000, 1800, "Hello", {1}),
                      segment(1800, 2000, " ", {}),
                      segment(2000, 3000, "world", {0})};
    first.translations = {{kEnglish, {"world", "hello"}}, {kGerman, {}}};

    LyricsLine second;
    second.begin = Duration(2500);
    second.end = Duration(5000);
    second.original = {segment(2500, 5000, "Again", {0})};
    second.translations = {{kEnglish, {"again"}}, {kGerman, {"wieder"}}};

    doc.lyrics.lines = {first, second};
    return doc;
}
} // namespace

class TestLyricsSync : public QObject {
    Q_OBJECT

private slots:
    void testBoundariesAreExclusive() {
        QVERIFY(!LyricsSync::isActive(Duration(1000), Duration(3000), Duration(1000)));
        QVERIFY(LyricsSync::isActive(Duration(1000), Duration(3000), Duration(1001)));
        QVERIFY(LyricsSync::isActive(Duration(1000), Duration(3000), Duration(2999)));
        QVERIFY(!LyricsSync::isActive(Duration(1000), Duration(3000), Duration(3000)));
        QVERIFY(!LyricsSync::isActive(Duration(1000), Duration(1000), Duration(1000)));
    }

    void testFrameBeforeFirstLine() {
        auto doc = sample();
        auto frame = LyricsSync::frameAt(doc, Duration(500));
        QCOMPARE(frame.lines.size(), size_t{2});
        QVERIFY(!frame.anyActive());
        QVERIFY(frame.activeLines().empty());
        for (const auto& line : frame.lines) {
            QVERIFY(line.translations.empty());
            for (const auto& seg : line.segments)
                QVERIFY(!seg.active);
        }
    }

    void testActiveSegmentHighlightsLinkedWords() {
        auto doc = sample();
        auto frame = LyricsSync::frameAt(doc, Duration(1500));

        const auto& line = frame.lines[0];
        QVERIFY(line.active);
        QVERIFY(line.segments[0].active);
        QVERIFY(!line.segments[1].active);
        QVERIFY(!line.segments[2].active);

        // German row of line 0 is empty and is left out
        QCOMPARE(line.translations.size(), size_t{1});
        const auto& row = line.translations[0];
        QCOMPARE(row.language, kEnglish);
        QCOMPARE(row.words->size(), size_t{2});
        QCOMPARE(row.highlighted, (std::vector<bool>{false, true}));

        QVERIFY(!frame.lines[1].active);
        QVERIFY(frame.lines[1].translations.empty());
    }

    void testSegmentBoundaryHighlightsNothing() {
        auto doc = sample();
        auto frame = LyricsSync::frameAt(doc, Duration(1800));
        const auto& line = frame.lines[0];
        QVERIFY(line.active);
        for (const auto& seg : line.segments)
            QVERIFY(!seg.active);
        QCOMPARE(line.translations[0].highlighted, (std::vector<bool>{false, false}));
    }

    void testOverlappingLinesAreBothActive() {
        auto doc = sample();
        auto frame = LyricsSync::frameAt(doc, Duration(2600));

        auto active = frame.activeLines();
        QCOMPARE(active.size(), size_t{2});
        QCOMPARE(active[0]->index, size_t{0});
        QCOMPARE(active[1]->index, size_t{1});

        QCOMPARE(frame.lines[0].translations[0].highlighted,
                 (std::vector<bool>{true, false}));
        QCOMPARE(frame.lines[1].translations.size(), size_t{2});
        QCOMPARE(frame.lines[1].translations[1].highlighted,
                 (std::vector<bool>{false}));

        QCOMPARE(LyricsSync::activeLineIndices(doc, Duration(2600)),
                 (std::vector<size_t>{0, 1}));
        QCOMPARE(LyricsSync::activeLineIndices(doc, Duration(3000)),
                 (std::vector<size_t>{1}));
        QVERIFY(LyricsSync::activeLineIndices(doc, Duration(5000)).empty());
    }

    void testSegmentOutsideLineIsInactive() {
        auto doc = sample();
        // Segment runs past the end of its line
        doc.lyrics.lines[0].original[2].end = Duration(4000);
        auto frame = LyricsSync::frameAt(doc, Duration(3500));
        QVERIFY(!frame.lines[0].active);
        QVERIFY(!frame.lines[0].segments[2].active);
    }

    void testOutOfRangeLinkIsIgnored() {
        auto doc = sample();
        doc.lyrics.lines[1].original[0].translations[0].second = {0, 7};
        auto frame = LyricsSync::frameAt(doc, Duration(4000));
        QCOMPARE(frame.lines[1].translations[0].highlighted,
                 (std::vector<bool>{true}));
    }
};

int runTestLyricsSync(int argc, char** argv) {
    TestLyricsSync tc;
    return QTest::qExec(&tc, argc, argv);
}

#include "test_LyricsSync.moc"
