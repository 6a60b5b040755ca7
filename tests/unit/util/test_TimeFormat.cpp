#include <QTemporaryDir>
#include <QtTest>
#include "util/FileUtils.hpp"
#include "util/TimeFormat.hpp"

using namespace babel;
using namespace std::chrono_literals;

class TestTimeFormat : public QObject {
    Q_OBJECT

private slots:
    void testFormatTimestamp() {
        QCOMPARE(timefmt::formatTimestamp(0ms), std::string("0:00:00.000"));
        QCOMPARE(timefmt::formatTimestamp(187'250ms), std::string("0:03:07.250"));
        QCOMPARE(timefmt::formatTimestamp(3'723'004ms), std::string("1:02:03.004"));
        QCOMPARE(timefmt::formatTimestamp(-5ms), std::string("0:00:00.000"));
    }

    void testFormatTotal() {
        QCOMPARE(timefmt::formatTotal(std::nullopt), std::string("???"));
        QCOMPARE(timefmt::formatTotal(Duration(61'000)), std::string("0:01:01.000"));
    }

    void testParseTimestamp() {
        QCOMPARE(timefmt::parseTimestamp("0:03:07.250")->count(), i64{187'250});
        QCOMPARE(timefmt::parseTimestamp("03:07.250")->count(), i64{187'250});
        QCOMPARE(timefmt::parseTimestamp("7.25")->count(), i64{7'250});
        QCOMPARE(timefmt::parseTimestamp("7.5")->count(), i64{7'500});
        QCOMPARE(timefmt::parseTimestamp(" 12 ")->count(), i64{12'000});
        QCOMPARE(timefmt::parseTimestamp("1:00:00")->count(), i64{3'600'000});
    }

    void testParseTimestampRejectsGarbage() {
        QVERIFY(!timefmt::parseTimestamp(""));
        QVERIFY(!timefmt::parseTimestamp("abc"));
        QVERIFY(!timefmt::parseTimestamp("1:2:3:4"));
        QVERIFY(!timefmt::parseTimestamp("1.2345"));
        QVERIFY(!timefmt::parseTimestamp("1."));
        QVERIFY(!timefmt::parseTimestamp("-1"));
    }

    void testFormatThenParse() {
        Duration t(5'025'678);
        QCOMPARE(timefmt::parseTimestamp(timefmt::formatTimestamp(t))->count(),
                 t.count());
    }

    void testSplitJoin() {
        auto parts = timefmt::split(Duration(125'042));
        QCOMPARE(parts.minutes, i64{2});
        QCOMPARE(parts.seconds, i64{5});
        QCOMPARE(parts.millis, i64{42});
        QCOMPARE(timefmt::join(parts).count(), i64{125'042});
    }

    void testFormatMiB() {
        QCOMPARE(timefmt::formatMiB(0), std::string("0.00 MiB"));
        QCOMPARE(timefmt::formatMiB(5 * 1024 * 1024 + 512 * 1024),
                 std::string("5.50 MiB"));
    }

    void testColorFromHex() {
        QCOMPARE(Color::fromHex("#F97316"), (Color{0xF9, 0x73, 0x16, 0xFF}));
        QCOMPARE(Color::fromHex("abc"), (Color{0xAA, 0xBB, 0xCC, 0xFF}));
        QCOMPARE(Color::fromHex("#00000080"), (Color{0, 0, 0, 0x80}));
        QCOMPARE(Color::fromHex("#zzzzzz"), Color::white());
        QCOMPARE(Color::fromHex("#12345"), Color::white());
    }

    void testColorToHex() {
        QCOMPARE((Color{0xF9, 0x73, 0x16, 0xFF}).toHex(), std::string("#F97316"));
        QCOMPARE((Color{1, 2, 3, 4}).toHex(), std::string("#01020304"));
    }

    void testHasExtension() {
        QVERIFY(file::hasExtension("/music/Song.FLAC", file::audioExtensions));
        QVERIFY(file::hasExtension("lyrics.json", file::lyricsExtensions));
        QVERIFY(file::hasExtension("lyrics.ttml", file::ttmlExtensions));
        QVERIFY(!file::hasExtension("notes.txt", file::audioExtensions));
        QVERIFY(!file::hasExtension("noext", file::lyricsExtensions));
    }

    void testWriteAtomicAndRead() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        std::filesystem::path path = dir.filePath("out.txt").toStdString();

        QVERIFY(file::writeAtomic(path, "first").isOk());
        QVERIFY(file::writeAtomic(path, "second").isOk());
        auto text = file::readText(path);
        QVERIFY(text.isOk());
        QCOMPARE(*text, std::string("second"));

        auto bytes = file::readBytes(path);
        QVERIFY(bytes.isOk());
        QCOMPARE(bytes->size(), size_t{6});
    }

    void testWriteAtomicFailureRemovesTempFile() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        // A non-empty directory in the way makes the final rename fail
        std::filesystem::path target = dir.filePath("taken").toStdString();
        std::filesystem::create_directories(target / "child");

        auto res = file::writeAtomic(target, "data");
        QVERIFY(res.isErr());
        QVERIFY(res.error().message.find("Failed to replace") != std::string::npos);
        QVERIFY(res.error().message.find(": ") != std::string::npos);
        QVERIFY(!std::filesystem::exists(target.string() + ".tmp"));
        QVERIFY(std::filesystem::is_directory(target));
    }

    void testWriteAtomicIntoMissingDir() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        std::filesystem::path path =
                dir.filePath("missing/out.txt").toStdString();

        auto res = file::writeAtomic(path, "data");
        QVERIFY(res.isErr());
        QVERIFY(!std::filesystem::exists(path.string() + ".tmp"));
    }

    void testReadMissingFile() {
        auto res = file::readBytes("/nonexistent/babel/file.mp3");
        QVERIFY(res.isErr());
        QVERIFY(!res.error().message.empty());
    }
};

int runTestTimeFormat(int argc, char** argv) {
    TestTimeFormat tc;
    return QTest::qExec(&tc, argc, argv);
}

#include "test_TimeFormat.moc"
