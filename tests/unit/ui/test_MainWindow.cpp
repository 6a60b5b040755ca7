#include <QApplication>
#include <QLabel>
#include <QtTest>
#include "audio/PlayerController.hpp"
#include "ui/LyricsEditorWindow.hpp"
#include "ui/MainWindow.hpp"

using namespace babel;
using namespace babel::lyrics;
using namespace std::chrono_literals;

namespace {
LyricsEditorWindow* findEditor() {
    for (auto* w : QApplication::topLevelWidgets()) {
        if (auto* editor = qobject_cast<LyricsEditorWindow*>(w))
            return editor;
    }
    return nullptr;
}
} // namespace

class TestMainWindow : public QObject {
    Q_OBJECT

private slots:
    void testLoadFromEditorNamesSource() {
        PlayerController player(nullptr);
        MainWindow window(&player);

        auto* editor = findEditor();
        QVERIFY(editor);

        LyricsLine line;
        line.begin = 0ms;
        line.end = 1000ms;
        line.uuid = newUuid();
        line.original.push_back(LyricsSegment{0ms, 1000ms, "Hi", {}});
        BabelLyrics doc;
        doc.lyrics.lines.push_back(line);
        editor->setLyrics(doc, "song.json");

        QVERIFY(QMetaObject::invokeMethod(&window, "onLoadFromEditor"));

        auto* path = window.findChild<QLabel*>("LyricsPath");
        auto* name = window.findChild<QLabel*>("LyricsFileName");
        QVERIFY(path);
        QVERIFY(name);
        QCOMPARE(path->text(), QString("From editor"));
        QCOMPARE(name->text(), QString("From editor"));
    }

    void testLoadFromEmptyEditorKeepsPanel() {
        PlayerController player(nullptr);
        MainWindow window(&player);

        QVERIFY(QMetaObject::invokeMethod(&window, "onLoadFromEditor"));

        auto* path = window.findChild<QLabel*>("LyricsPath");
        QVERIFY(path);
        QVERIFY(path->text().isEmpty());
    }
};

int runTestMainWindow(int argc, char** argv) {
    TestMainWindow tc;
    return QTest::qExec(&tc, argc, argv);
}

#include "test_MainWindow.moc"
