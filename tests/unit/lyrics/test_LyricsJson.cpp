#include <QTemporaryDir>
#include <QtTest>
#include "lyrics/LyricsJson.hpp"

using namespace babel;
using namespace babel::lyrics;

namespace {
const char* kLanguage = "0b6f6a0e-3c8b-4c47-9a43-2e4c1c7f1a10";
const char* kLine = "6f1d8c43-8a55-4b8e-b2a7-5f0e2d1c9b77";

QByteArray sampleJson() {
    return QByteArray(R"({
        "metadata": {
            "agents": [{"id": "v1"}],
            "translations": [{"language": "English", "id": "0b6f6a0e-3c8b-4c47-9a43-2e4c1c7f1a10"}]
        },
        "lyrics": {
            "lines": [{
                "begin": 1000,
                "end": 4000,
                "agent_id": "v1",
                "original": [
                    {"begin": 1000, "end": 2000, "text": "君の",
                     "translations": [["0b6f6a0e-3c8b-4c47-9a43-2e4c1c7f1a10", [0]]]},
                    {"begin": 2000, "end": 4000, "text": "名は",
                     "translations": [["0b6f6a0e-3c8b-4c47-9a43-2e4c1c7f1a10", [1, 2]]]}
                ],
                "uuid": "6F1D8C43-8A55-4B8E-B2A7-5F0E2D1C9B77",
                "translations": [["0b6f6a0e-3c8b-4c47-9a43-2e4c1c7f1a10", ["your", " ", "name"]]]
            }]
        }
    })");
}
} // namespace

class TestLyricsJson : public QObject {
    Q_OBJECT

private slots:
    void testParse() {
        auto res = LyricsJson::parse(sampleJson());
        QVERIFY2(res.isOk(), res.isOk() ? "" : res.error().message.c_str());

        const auto& lyrics = *res;
        QCOMPARE(lyrics.metadata.agents.size(), size_t{1});
        QCOMPARE(lyrics.metadata.agents[0].id, std::string("v1"));
        QCOMPARE(lyrics.metadata.translations.size(), size_t{1});
        QCOMPARE(lyrics.metadata.translations[0].language, std::string("English"));
        QCOMPARE(lyrics.metadata.translations[0].id, std::string(kLanguage));

        QCOMPARE(lyrics.lyrics.lines.size(), size_t{1});
        const auto& line = lyrics.lyrics.lines[0];
        QCOMPARE(line.begin.count(), i64{1000});
        QCOMPARE(line.end.count(), i64{4000});
        QCOMPARE(line.agentId, std::string("v1"));
        QCOMPARE(line.original.size(), size_t{2});
        QCOMPARE(line.original[1].text, std::string("名は"));
        QCOMPARE(line.original[1].translations[0].second,
                 (std::vector<size_t>{1, 2}));
        QCOMPARE(line.translations[0].second.size(), size_t{3});
        QCOMPARE(lineText(line), std::string("君の名は"));
    }

    void testUuidIsCanonicalized() {
        auto res = LyricsJson::parse(sampleJson());
        QVERIFY(res.isOk());
        QCOMPARE(res->lyrics.lines[0].uuid, std::string(kLine));
    }

    void testSerializeParsesBack() {
        auto res = LyricsJson::parse(sampleJson());
        QVERIFY(res.isOk());

        auto compact = LyricsJson::serialize(*res);
        QVERIFY(!compact.contains('\n'));
        auto again = LyricsJson::parse(compact);
        QVERIFY(again.isOk());
        QVERIFY(*again == *res);

        auto indented = LyricsJson::serialize(*res, true);
        QVERIFY(indented.contains('\n'));
    }

    void testMissingFieldNamesPath() {
        QByteArray json = sampleJson();
        json.replace("\"begin\": 2000, ", "");
        auto res = LyricsJson::parse(json);
        QVERIFY(res.isErr());
        QCOMPARE(res.error().message,
                 std::string("Invalid lyrics file: lyrics.lines[0].original[1]: "
                             "missing field 'begin'"));
    }

    void testWrongTypeIsRejected() {
        QByteArray json = sampleJson();
        json.replace("\"end\": 4000,\n", "\"end\": \"4000\",\n");
        auto res = LyricsJson::parse(json);
        QVERIFY(res.isErr());
        QVERIFY(res.error().message.find("lyrics.lines[0].end") != std::string::npos);
    }

    void testInvalidUuidIsRejected() {
        QByteArray json = sampleJson();
        json.replace("6F1D8C43-8A55-4B8E-B2A7-5F0E2D1C9B77", "not-a-uuid");
        auto res = LyricsJson::parse(json);
        QVERIFY(res.isErr());
        QVERIFY(res.error().message.find("invalid uuid 'not-a-uuid'") !=
                std::string::npos);
    }

    void testMalformedJson() {
        auto res = LyricsJson::parse("{\"metadata\": ");
        QVERIFY(res.isErr());
        QVERIFY(res.error().message.rfind("Invalid JSON at offset", 0) == 0);
    }

    void testEmptyDocument() {
        auto res = LyricsJson::parse(
                R"({"metadata":{"agents":[],"translations":[]},"lyrics":{"lines":[]}})");
        QVERIFY(res.isOk());
        QVERIFY(res->lyrics.lines.empty());
    }

    void testSaveAndLoadFile() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        std::filesystem::path path = dir.filePath("song.json").toStdString();

        auto res = LyricsJson::parse(sampleJson());
        QVERIFY(res.isOk());
        QVERIFY(LyricsJson::saveFile(path, *res).isOk());

        auto loaded = LyricsJson::loadFile(path);
        QVERIFY(loaded.isOk());
        QVERIFY(*loaded == *res);
    }

    void testLoadMissingFile() {
        auto loaded = LyricsJson::loadFile("/nonexistent/babel/lyrics.json");
        QVERIFY(loaded.isErr());
    }
};

int runTestLyricsJson(int argc, char** argv) {
    TestLyricsJson tc;
    return QTest::qExec(&tc, argc, argv);
}

#include "test_LyricsJson.moc"
