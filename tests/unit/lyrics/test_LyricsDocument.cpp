#include <QtTest>
#include "lyrics/LyricsDocument.hpp"

using namespace babel;
using namespace babel::lyrics;

namespace {
// One line "ab" with segments "a" and "b"
LyricsDocument twoSegmentDocument() {
    LyricsDocument doc;
    size_t line = doc.addLine();
    doc.insertSegment(line, 0);
    doc.insertSegment(line, 1);
    doc.setSegmentText(line, 0, "a");
    doc.setSegmentText(line, 1, "b");
    return doc;
}
} // namespace

class TestLyricsDocument : public QObject {
    Q_OBJECT

private slots:
    void testAddLanguageReachesEveryLineAndSegment() {
        auto doc = twoSegmentDocument();
        Uuid id = doc.addLanguage("English");

        QVERIFY(doc.hasLanguage(id));
        QCOMPARE(doc.lyrics().metadata.translations.size(), size_t{1});
        QCOMPARE(languageName(doc.lyrics().metadata, id), std::string("English"));

        const auto* line = doc.line(0);
        QCOMPARE(line->translations.size(), size_t{1});
        QCOMPARE(line->translations[0].first, id);
        QVERIFY(line->translations[0].second.empty());
        for (const auto& seg : line->original) {
            QCOMPARE(seg.translations.size(), size_t{1});
            QCOMPARE(seg.translations[0].first, id);
        }
    }

    void testNewLinesAndSegmentsCarryLanguages() {
        LyricsDocument doc;
        Uuid en = doc.addLanguage("English");
        Uuid de = doc.addLanguage("Deutsch");

        size_t line = doc.addLine();
        QCOMPARE(line, size_t{0});
        QCOMPARE(doc.line(0)->begin.count(), i64{0});
        QVERIFY(!doc.line(0)->uuid.empty());
        QCOMPARE(doc.line(0)->translations.size(), size_t{2});

        QVERIFY(doc.insertSegment(0, 0).isOk());
        const auto& seg = doc.line(0)->original[0];
        QCOMPARE(seg.translations.size(), size_t{2});
        QCOMPARE(seg.translations[0].first, en);
        QCOMPARE(seg.translations[1].first, de);
        QVERIFY(seg.text.empty());
    }

    void testRemoveLanguage() {
        auto doc = twoSegmentDocument();
        Uuid en = doc.addLanguage("English");
        Uuid de = doc.addLanguage("Deutsch");

        QVERIFY(doc.removeLanguage(en).isOk());
        QVERIFY(!doc.hasLanguage(en));
        QVERIFY(doc.hasLanguage(de));
        QCOMPARE(doc.line(0)->translations.size(), size_t{1});
        QCOMPARE(doc.line(0)->original[1].translations[0].first, de);

        QVERIFY(doc.removeLanguage(en).isErr());
    }

    void testRenameLanguage() {
        LyricsDocument doc;
        Uuid id = doc.addLanguage("");
        QVERIFY(doc.renameLanguage(id, "Français").isOk());
        QCOMPARE(doc.lyrics().metadata.translations[0].language,
                 std::string("Français"));
        QVERIFY(doc.renameLanguage("missing", "x").isErr());
    }

    void testSegmentOperations() {
        auto doc = twoSegmentDocument();

        QVERIFY(doc.moveSegment(0, 0, 1).isOk());
        QCOMPARE(lineText(*doc.line(0)), std::string("ba"));

        QVERIFY(doc.insertSegment(0, 1).isOk());
        QVERIFY(doc.setSegmentText(0, 1, " ").isOk());
        QCOMPARE(lineText(*doc.line(0)), std::string("b a"));

        QVERIFY(doc.setSegmentTimes(0, 2, Duration(100), Duration(200)).isOk());
        QCOMPARE(doc.line(0)->original[2].end.count(), i64{200});

        QVERIFY(doc.removeSegment(0, 0).isOk());
        QCOMPARE(lineText(*doc.line(0)), std::string(" a"));
    }

    void testInvalidIndicesAreRejected() {
        auto doc = twoSegmentDocument();
        auto before = doc.lyrics();

        QVERIFY(doc.insertSegment(0, 3).isErr());
        QVERIFY(doc.insertSegment(5, 0).isErr());
        QVERIFY(doc.removeSegment(0, 2).isErr());
        QVERIFY(doc.moveSegment(0, 1, 2).isErr());
        QVERIFY(doc.setSegmentText(1, 0, "x").isErr());
        QVERIFY(doc.setAgent(9, "v1").isErr());
        QVERIFY(doc.removeLine(1).isErr());
        QVERIFY(doc.addTranslationWord(0, "unknown").isErr());
        QVERIFY(doc.setLink(0, 0, "unknown", 0, true).isErr());

        QVERIFY(doc.lyrics() == before);
    }

    void testLineOperations() {
        auto doc = twoSegmentDocument();
        doc.addLine();

        QVERIFY(doc.setAgent(0, "v2").isOk());
        QVERIFY(doc.setLineTimes(0, Duration(1500), Duration(3000)).isOk());
        QCOMPARE(doc.line(0)->agentId, std::string("v2"));
        QCOMPARE(doc.line(0)->end.count(), i64{3000});

        QVERIFY(doc.removeLine(0).isOk());
        QCOMPARE(doc.lineCount(), size_t{1});
        QVERIFY(doc.line(0)->original.empty());
        QVERIFY(doc.line(1) == nullptr);
    }

    void testTranslationWords() {
        auto doc = twoSegmentDocument();
        Uuid en = doc.addLanguage("English");

        auto first = doc.addTranslationWord(0, en);
        auto second = doc.addTranslationWord(0, en);
        QVERIFY(first.isOk() && second.isOk());
        QCOMPARE(*first, size_t{0});
        QCOMPARE(*second, size_t{1});

        QVERIFY(doc.setTranslationWord(0, en, 0, "hello").isOk());
        QVERIFY(doc.setTranslationWord(0, en, 2, "oops").isErr());

        const auto* words = doc.translationWords(0, en);
        QVERIFY(words != nullptr);
        QCOMPARE(*words, (std::vector<std::string>{"hello", ""}));
    }

    void testLinksAreIdempotent() {
        auto doc = twoSegmentDocument();
        Uuid en = doc.addLanguage("English");
        doc.addTranslationWord(0, en);

        QVERIFY(doc.setLink(0, 1, en, 0, true).isOk());
        QVERIFY(doc.setLink(0, 1, en, 0, true).isOk());
        QVERIFY(doc.isLinked(0, 1, en, 0));
        QCOMPARE(doc.line(0)->original[1].translations[0].second.size(), size_t{1});

        QVERIFY(doc.setLink(0, 1, en, 0, false).isOk());
        QVERIFY(doc.setLink(0, 1, en, 0, false).isOk());
        QVERIFY(!doc.isLinked(0, 1, en, 0));

        QVERIFY(doc.setLink(0, 1, en, 1, true).isErr());
    }

    void testRemoveWordReindexesLinks() {
        auto doc = twoSegmentDocument();
        Uuid en = doc.addLanguage("English");
        for (int i = 0; i < 3; ++i)
            doc.addTranslationWord(0, en);

        doc.setLink(0, 0, en, 0, true);
        doc.setLink(0, 0, en, 2, true);
        doc.setLink(0, 1, en, 1, true);
        doc.setLink(0, 1, en, 2, true);

        QVERIFY(doc.removeTranslationWord(0, en, 1).isOk());
        QCOMPARE(doc.translationWords(0, en)->size(), size_t{2});

        const auto& segs = doc.line(0)->original;
        QCOMPARE(segs[0].translations[0].second, (std::vector<size_t>{0, 1}));
        QCOMPARE(segs[1].translations[0].second, (std::vector<size_t>{1}));
    }
};

int runTestLyricsDocument(int argc, char** argv) {
    TestLyricsDocument tc;
    return QTest::qExec(&tc, argc, argv);
}

#include "test_LyricsDocument.moc"
