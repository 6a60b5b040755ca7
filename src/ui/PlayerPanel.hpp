#pragma once
// PlayerPanel.hpp - File pickers, details and transport controls
// Drives the PlayerController directly; file loading goes through MainWindow

#include <QWidget>
#include <optional>
#include "audio/PlaybackClock.hpp"

class QCheckBox;
class QLabel;
class QProgressBar;
class QPushButton;

namespace babel {

class PlayerController;
class TimestampSpinBox;
struct AudioDetails;

class PlayerPanel : public QWidget {
    Q_OBJECT

public:
    explicit PlayerPanel(PlayerController* player, QWidget* parent = nullptr);

    // Audio file section
    void setAudioLoading(bool loading);
    void setAudioPath(const QString& path);
    void setAudioDetails(const AudioDetails* details);

    // Lyrics file section
    void setLyricsLoading(bool loading);
    void setLyricsPath(const QString& path);
    void setLyricsDetails(const QString& fileName, bool inMemory);
    void setLyricsWindows(bool mainWindow, bool captions);

    void setEditorVisible(bool visible);
    void setEditorHasLyrics(bool hasLyrics);

    // Player state, called on the UI thread
    void refreshState(PlayerState state);
    void refreshPosition(Duration position);
    void refreshDuration(std::optional<Duration> total);

signals:
    void selectAudioRequested();
    void selectLyricsRequested();
    void editorToggled(bool visible);
    void loadFromEditorRequested();
    void lyricsWindowToggled(bool visible);
    void captionsWindowToggled(bool visible);

private:
    void setupUI();
    QWidget* makeSeparator();

    PlayerController* player_;

    QPushButton* selectAudioBtn_{nullptr};
    QLabel* audioPathLabel_{nullptr};
    QProgressBar* audioBusy_{nullptr};
    QLabel* audioNameValue_{nullptr};
    QLabel* audioSizeValue_{nullptr};
    QLabel* audioDurationValue_{nullptr};
    QLabel* audioDataValue_{nullptr};

    QPushButton* editorToggle_{nullptr};
    QPushButton* loadFromEditorBtn_{nullptr};

    QPushButton* selectLyricsBtn_{nullptr};
    QLabel* lyricsPathLabel_{nullptr};
    QProgressBar* lyricsBusy_{nullptr};
    QLabel* lyricsNameValue_{nullptr};
    QLabel* lyricsDataValue_{nullptr};
    QWidget* windowToggles_{nullptr};
    QCheckBox* lyricsWindowCheck_{nullptr};
    QCheckBox* captionsWindowCheck_{nullptr};

    TimestampSpinBox* timestampSpin_{nullptr};
    QLabel* totalLabel_{nullptr};
    QPushButton* playBtn_{nullptr};
    QPushButton* resumeBtn_{nullptr};
    QPushButton* pauseBtn_{nullptr};
    QPushButton* resetBtn_{nullptr};
};

} // namespace babel
