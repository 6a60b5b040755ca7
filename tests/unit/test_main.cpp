/**
 * @file test_main.cpp
 * @brief Test suite entry point using Qt Test.
 */
#include <QApplication>
#include <QtTest>

// Each suite lives in its own translation unit
int runTestLogger(int argc, char** argv);
int runTestConfigParsers(int argc, char** argv);
int runTestConfig(int argc, char** argv);
int runTestTimeFormat(int argc, char** argv);
int runTestLyricsJson(int argc, char** argv);
int runTestTtmlImporter(int argc, char** argv);
int runTestLyricsDocument(int argc, char** argv);
int runTestLyricsSync(int argc, char** argv);
int runTestLyricsLoader(int argc, char** argv);
int runTestPlaybackClock(int argc, char** argv);
int runTestPlayerController(int argc, char** argv);
int runTestAudioLoader(int argc, char** argv);
int runTestKaraokeWidget(int argc, char** argv);
int runTestMainWindow(int argc, char** argv);

int main(int argc, char* argv[]) {
    // Widget suites render without a display
    if (qEnvironmentVariableIsEmpty("QT_QPA_PLATFORM"))
        qputenv("QT_QPA_PLATFORM", "offscreen");
    QApplication app(argc, argv);

    int status = 0;

    status |= runTestLogger(argc, argv);
    status |= runTestConfigParsers(argc, argv);
    status |= runTestConfig(argc, argv);
    status |= runTestTimeFormat(argc, argv);
    status |= runTestLyricsJson(argc, argv);
    status |= runTestTtmlImporter(argc, argv);
    status |= runTestLyricsDocument(argc, argv);
    status |= runTestLyricsSync(argc, argv);
    status |= runTestLyricsLoader(argc, argv);
    status |= runTestPlaybackClock(argc, argv);
    status |= runTestPlayerController(argc, argv);
    status |= runTestAudioLoader(argc, argv);
    status |= runTestKaraokeWidget(argc, argv);
    status |= runTestMainWindow(argc, argv);

    return status;
}
