#include <QtTest>
#include <memory>
#include <vector>
#include "audio/PlayerController.hpp"

using namespace babel;
using namespace std::chrono_literals;

namespace {
std::shared_ptr<AudioDetails> track(std::optional<Duration> duration) {
    auto details = std::make_shared<AudioDetails>();
    details->fileName = "song.mp3";
    details->duration = duration;
    return details;
}
} // namespace

class TestPlayerController : public QObject {
    Q_OBJECT

private:
    std::shared_ptr<PlaybackClock::Clock::time_point> now_;
    std::unique_ptr<PlayerController> player_;
    std::vector<PlayerState> states_;
    std::vector<i64> positions_;

    void advance(Duration d) {
        *now_ += d;
    }

private slots:
    void init() {
        now_ = std::make_shared<PlaybackClock::Clock::time_point>();
        auto now = now_;
        // No audio sink: playback runs on the clock alone
        player_ = std::make_unique<PlayerController>(nullptr, [now] { return *now; });
        states_.clear();
        positions_.clear();
        player_->stateChanged.connect([this](PlayerState s) { states_.push_back(s); });
        player_->positionChanged.connect(
                [this](Duration d) { positions_.push_back(d.count()); });
    }

    void cleanup() {
        player_.reset();
    }

    void testSetTrack() {
        QVERIFY(!player_->audioAvailable());
        QVERIFY(player_->setTrack(nullptr).isErr());

        QVERIFY(player_->setTrack(track(Duration(10000))).isOk());
        QCOMPARE(player_->track()->fileName, std::string("song.mp3"));
        QCOMPARE(player_->duration()->count(), i64{10000});
        QCOMPARE(player_->position().count(), i64{0});
        QCOMPARE(player_->state(), PlayerState::Stopped);
        QCOMPARE(positions_, (std::vector<i64>{0}));
        QVERIFY(states_.empty());
    }

    void testPlayPauseResumeReset() {
        player_->setTrack(track(Duration(10000)));

        player_->pause();
        player_->resume();
        QVERIFY(states_.empty());

        player_->play();
        advance(2s);
        player_->tick();
        QCOMPARE(player_->position().count(), i64{2000});

        player_->pause();
        advance(5s);
        player_->tick();
        QCOMPARE(player_->position().count(), i64{2000});

        player_->resume();
        advance(1s);
        player_->tick();
        QCOMPARE(player_->position().count(), i64{3000});

        player_->reset();
        QCOMPARE(player_->position().count(), i64{0});
        QCOMPARE(states_, (std::vector<PlayerState>{PlayerState::Playing,
                                                    PlayerState::Paused,
                                                    PlayerState::Playing,
                                                    PlayerState::Stopped}));
    }

    void testTogglePlayPause() {
        player_->togglePlayPause();
        QCOMPARE(player_->state(), PlayerState::Playing);
        player_->togglePlayPause();
        QCOMPARE(player_->state(), PlayerState::Paused);
        player_->togglePlayPause();
        QCOMPARE(player_->state(), PlayerState::Playing);
    }

    void testSeekClamps() {
        player_->setTrack(track(Duration(10000)));
        positions_.clear();

        player_->seek(Duration(4000));
        QCOMPARE(player_->position().count(), i64{4000});
        player_->seek(Duration(60000));
        QCOMPARE(player_->position().count(), i64{10000});
        player_->seek(Duration(-1));
        QCOMPARE(player_->position().count(), i64{0});

        // Same position again emits nothing
        player_->seek(Duration(0));
        QCOMPARE(positions_, (std::vector<i64>{4000, 10000, 0}));
    }

    void testSeekWhilePlaying() {
        player_->setTrack(track(Duration(10000)));
        player_->play();
        advance(1s);
        player_->tick();

        player_->seek(Duration(6000));
        advance(500ms);
        player_->tick();
        QCOMPARE(player_->position().count(), i64{6500});
        QCOMPARE(player_->state(), PlayerState::Playing);
    }

    void testPausesAtEndOfTrack() {
        player_->setTrack(track(Duration(3000)));
        player_->play();
        advance(3500ms);
        player_->tick();

        QCOMPARE(player_->state(), PlayerState::Paused);
        QCOMPARE(player_->position().count(), i64{3000});
        QCOMPARE(positions_.back(), i64{3000});

        // Resuming at the end pauses again on the next tick
        player_->resume();
        advance(100ms);
        player_->tick();
        QCOMPARE(player_->state(), PlayerState::Paused);
    }

    void testUnknownDurationKeepsPlaying() {
        player_->setTrack(track(std::nullopt));
        QVERIFY(!player_->duration().has_value());
        player_->play();
        advance(1h);
        player_->tick();
        QCOMPARE(player_->state(), PlayerState::Playing);
        QCOMPARE(player_->position().count(), i64{3600000});
    }

    void testNewTrackStopsPlayback() {
        player_->setTrack(track(Duration(10000)));
        player_->play();
        advance(2s);
        player_->tick();

        player_->setTrack(track(Duration(5000)));
        QCOMPARE(player_->state(), PlayerState::Stopped);
        QCOMPARE(player_->position().count(), i64{0});
        QCOMPARE(player_->duration()->count(), i64{5000});
        QCOMPARE(states_.back(), PlayerState::Stopped);
    }
};

int runTestPlayerController(int argc, char** argv) {
    TestPlayerController tc;
    return QTest::qExec(&tc, argc, argv);
}

#include "test_PlayerController.moc"
