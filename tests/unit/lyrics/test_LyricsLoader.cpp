#include <QTemporaryDir>
#include <QtTest>
#include <fstream>
#include <future>
#include <memory>
#include <string>
#include <vector>
#include "lyrics/LyricsJson.hpp"
#include "lyrics/LyricsLoader.hpp"

using namespace babel;
using namespace babel::lyrics;
using namespace std::chrono_literals;

namespace {
BabelLyrics sampleLyrics() {
    LyricsLine line;
    line.begin = 1000ms;
    line.end = 2000ms;
    line.uuid = newUuid();
    line.original.push_back(LyricsSegment{1000ms, 2000ms, "Hello", {}});

    BabelLyrics doc;
    doc.lyrics.lines.push_back(line);
    return doc;
}
} // namespace

class TestLyricsLoader : public QObject {
    Q_OBJECT

private:
    std::unique_ptr<LyricsLoader> loader_;
    std::vector<std::string> events_;
    std::shared_ptr<BabelLyrics> result_;

private slots:
    void init() {
        loader_ = std::make_unique<LyricsLoader>();
        events_.clear();
        result_.reset();
        loader_->fileSelected.connect(
                [this](const std::filesystem::path&, const std::string& name) {
                    events_.push_back("selected:" + name);
                });
        loader_->loaded.connect([this](std::shared_ptr<BabelLyrics> lyrics) {
            events_.push_back("loaded");
            result_ = std::move(lyrics);
        });
        loader_->failed.connect([this](const std::string& message) {
            events_.push_back("failed:" + message);
        });
    }

    void cleanup() {
        loader_.reset();
    }

    void testLoadsJsonInOrder() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        std::filesystem::path path = dir.filePath("song.json").toStdString();
        auto doc = sampleLyrics();
        QVERIFY(LyricsJson::saveFile(path, doc).isOk());

        QVERIFY(loader_->loadAsync(path, LyricsFormat::BabelJson));
        loader_->wait();

        QVERIFY(!loader_->isLoading());
        QCOMPARE(events_.size(), size_t{2});
        QCOMPARE(events_[0], std::string("selected:song.json"));
        QCOMPARE(events_[1], std::string("loaded"));
        QVERIFY(result_);
        QCOMPARE(result_->lyrics.lines.size(), size_t{1});
        QCOMPARE(lineText(result_->lyrics.lines[0]), std::string("Hello"));
        QCOMPARE(result_->lyrics.lines[0].uuid, doc.lyrics.lines[0].uuid);
    }

    void testImportsTtml() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        std::filesystem::path path = dir.filePath("song.ttml").toStdString();
        {
            std::ofstream out(path);
            out << "<tt><body><div><p begin=\"1\" end=\"2\">"
                   "<span begin=\"1\" end=\"2\">Hi</span></p></div></body></tt>";
        }

        QVERIFY(loader_->loadAsync(path, LyricsFormat::AmllTtml));
        loader_->wait();

        QCOMPARE(events_.size(), size_t{2});
        QCOMPARE(events_[1], std::string("loaded"));
        QVERIFY(result_);
        QCOMPARE(lineText(result_->lyrics.lines.at(0)), std::string("Hi"));
    }

    void testMissingFileFails() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        std::filesystem::path path = dir.filePath("absent.json").toStdString();

        QVERIFY(loader_->loadAsync(path, LyricsFormat::BabelJson));
        loader_->wait();

        QVERIFY(!loader_->isLoading());
        QCOMPARE(events_.size(), size_t{1});
        QCOMPARE(events_[0], "failed:Failed to open file: " + path.string());
        QVERIFY(!result_);
    }

    void testParseErrorAfterSelection() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        std::filesystem::path path = dir.filePath("broken.json").toStdString();
        {
            std::ofstream out(path);
            out << "{ not json";
        }

        QVERIFY(loader_->loadAsync(path, LyricsFormat::BabelJson));
        loader_->wait();

        QVERIFY(!loader_->isLoading());
        QCOMPARE(events_.size(), size_t{2});
        QCOMPARE(events_[0], std::string("selected:broken.json"));
        QVERIFY(events_[1].rfind("failed:", 0) == 0);
        QVERIFY(events_[1].size() > std::string("failed:").size());
        QVERIFY(!result_);
    }

    void testRejectsSecondLoadWhileBusy() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        std::filesystem::path path = dir.filePath("song.json").toStdString();
        QVERIFY(LyricsJson::saveFile(path, sampleLyrics()).isOk());

        std::promise<void> entered;
        std::promise<void> release;
        auto releaseFuture = release.get_future().share();
        loader_->fileSelected.connect(
                [&entered, releaseFuture](const std::filesystem::path&,
                                          const std::string&) {
                    entered.set_value();
                    releaseFuture.wait();
                });

        QVERIFY(loader_->loadAsync(path, LyricsFormat::BabelJson));
        entered.get_future().wait();
        QVERIFY(loader_->isLoading());
        QVERIFY(!loader_->loadAsync(path, LyricsFormat::BabelJson));

        release.set_value();
        loader_->wait();
        QVERIFY(!loader_->isLoading());
        QCOMPARE(events_.back(), std::string("loaded"));
    }
};

int runTestLyricsLoader(int argc, char** argv) {
    TestLyricsLoader tc;
    return QTest::qExec(&tc, argc, argv);
}

#include "test_LyricsLoader.moc"
