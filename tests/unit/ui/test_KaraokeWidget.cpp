#include <QWheelEvent>
#include <QtTest>
#include <memory>
#include <string>
#include "ui/KaraokeWidget.hpp"

using namespace babel;
using namespace babel::lyrics;
using namespace std::chrono_literals;

namespace {
// Twenty one-second lines, each active for its first 900 ms
std::shared_ptr<const BabelLyrics> manyLines() {
    auto doc = std::make_shared<BabelLyrics>();
    for (int i = 0; i < 20; ++i) {
        LyricsLine line;
        line.begin = Duration(i * 1000);
        line.end = Duration(i * 1000 + 900);
        line.uuid = newUuid();
        line.original.push_back(LyricsSegment{
                line.begin, line.end, "Line " + std::to_string(i), {}});
        doc->lyrics.lines.push_back(std::move(line));
    }
    return doc;
}

void scroll(QWidget& widget, int angle) {
    QWheelEvent event(QPointF(10, 10),
                      QPointF(10, 10),
                      QPoint(),
                      QPoint(0, angle),
                      Qt::NoButton,
                      Qt::NoModifier,
                      Qt::NoScrollPhase,
                      false);
    QCoreApplication::sendEvent(&widget, &event);
}
} // namespace

class TestKaraokeWidget : public QObject {
    Q_OBJECT

private slots:
    void testWheelScrollsFullLyrics() {
        KaraokeWidget view(KaraokeWidget::Mode::FullLyrics);
        view.resize(400, 200);
        view.show();
        view.setLyrics(manyLines());
        view.updateTime(500ms);
        QCOMPARE(view.scrollOffset(), 0);

        scroll(view, -240);
        QCOMPARE(view.scrollOffset(), -120);
        scroll(view, 120);
        QCOMPARE(view.scrollOffset(), -60);
        QVERIFY(!view.grab().isNull());
    }

    void testScrollKeptWithinSameLine() {
        KaraokeWidget view(KaraokeWidget::Mode::FullLyrics);
        view.resize(400, 200);
        view.show();
        view.setLyrics(manyLines());
        view.updateTime(100ms);

        scroll(view, -240);
        view.updateTime(600ms);
        QCOMPARE(view.scrollOffset(), -120);
    }

    void testNextLineResetsScroll() {
        KaraokeWidget view(KaraokeWidget::Mode::FullLyrics);
        view.resize(400, 200);
        view.show();
        view.setLyrics(manyLines());
        view.updateTime(100ms);

        scroll(view, -240);
        view.updateTime(5500ms);
        QCOMPARE(view.scrollOffset(), 0);
    }

    void testScrollIsBounded() {
        KaraokeWidget view(KaraokeWidget::Mode::FullLyrics);
        view.resize(400, 200);
        view.show();
        view.setLyrics(manyLines());

        for (int i = 0; i < 1000; ++i)
            scroll(view, -1200);
        int bottom = view.scrollOffset();
        QVERIFY(bottom < 0);
        scroll(view, -1200);
        QCOMPARE(view.scrollOffset(), bottom);
    }

    void testCaptionsIgnoreWheel() {
        KaraokeWidget view(KaraokeWidget::Mode::Captions);
        view.resize(400, 200);
        view.show();
        view.setLyrics(manyLines());
        view.updateTime(500ms);

        scroll(view, -240);
        QCOMPARE(view.scrollOffset(), 0);
    }

    void testNewLyricsResetScroll() {
        KaraokeWidget view(KaraokeWidget::Mode::FullLyrics);
        view.resize(400, 200);
        view.show();
        view.setLyrics(manyLines());
        scroll(view, -240);
        QVERIFY(view.scrollOffset() != 0);

        view.setLyrics(manyLines());
        QCOMPARE(view.scrollOffset(), 0);
    }
};

int runTestKaraokeWidget(int argc, char** argv) {
    TestKaraokeWidget tc;
    return QTest::qExec(&tc, argc, argv);
}

#include "test_KaraokeWidget.moc"
