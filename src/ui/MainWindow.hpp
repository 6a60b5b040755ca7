#pragma once
// MainWindow.hpp - Player window: panel, lyrics dock, captions and editor

#include <QMainWindow>
#include <QTimer>
#include <filesystem>
#include <memory>
#include "audio/AudioLoader.hpp"
#include "lyrics/LyricsLoader.hpp"

class QDockWidget;

namespace babel {

class CaptionsWindow;
class KaraokeWidget;
class LyricsEditorWindow;
class PlayerController;
class PlayerPanel;

class MainWindow : public QMainWindow {
    Q_OBJECT

public:
    explicit MainWindow(PlayerController* player, QWidget* parent = nullptr);
    ~MainWindow() override;

    void openAudio(const std::filesystem::path& path);
    void openLyrics(const std::filesystem::path& path);
    void importTtml(const std::filesystem::path& path);

    // Shows `lyrics` in the lyrics dock and the captions window
    void setLyrics(std::shared_ptr<const lyrics::BabelLyrics> lyrics,
                   const QString& fileName);

protected:
    void closeEvent(QCloseEvent* event) override;
    void dragEnterEvent(QDragEnterEvent* event) override;
    void dropEvent(QDropEvent* event) override;

private slots:
    void onSelectAudio();
    void onSelectLyrics();
    void onLoadFromEditor();
    void onShowSettings();
    void onShowAbout();
    void onUpdateLoop();

private:
    void setupUI();
    void setupMenuBar();
    void setupConnections();
    void setupUpdateTimer();
    void updateWindowTitle();
    void setLyricsWindowVisible(bool visible);
    void setCaptionsVisible(bool visible);
    void openPath(const std::filesystem::path& path);

    PlayerController* player_;

    PlayerPanel* panel_{nullptr};
    KaraokeWidget* lyricsView_{nullptr};
    QDockWidget* lyricsDock_{nullptr};
    CaptionsWindow* captions_{nullptr};
    LyricsEditorWindow* editor_{nullptr};

    AudioLoader audioLoader_;
    lyrics::LyricsLoader lyricsLoader_;
    QString pendingLyricsName_;
    std::shared_ptr<const lyrics::BabelLyrics> lyrics_;

    QTimer updateTimer_;

    unsigned long positionSlot_{0};
    unsigned long stateSlot_{0};
    unsigned long errorSlot_{0};
};

} // namespace babel
