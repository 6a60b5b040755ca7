#pragma once
// LyricsEditorWindow.hpp - Lyrics editor: TTML import, editing, JSON export

#include <QWidget>
#include <filesystem>
#include <memory>
#include "lyrics/LyricsDocument.hpp"
#include "lyrics/LyricsLoader.hpp"

class QLabel;
class QListWidget;
class QProgressBar;
class QPushButton;
class QVBoxLayout;

namespace babel {

class LineEditor;

class LyricsEditorWindow : public QWidget {
    Q_OBJECT

public:
    explicit LyricsEditorWindow(QWidget* parent = nullptr);
    ~LyricsEditorWindow() override;

    bool hasLyrics() const {
        return document_ != nullptr;
    }
    // nullptr when nothing is loaded
    const lyrics::BabelLyrics* lyrics() const;

    void importTtml(const std::filesystem::path& path);
    void openLyrics(const std::filesystem::path& path);
    void setLyrics(lyrics::BabelLyrics lyrics, const QString& fileName);

signals:
    void lyricsAvailabilityChanged(bool available);
    void visibilityChanged(bool visible);
    void statusMessage(const QString& message);

protected:
    void showEvent(QShowEvent* event) override;
    void hideEvent(QHideEvent* event) override;

private:
    void setupUI();
    void connectLoader();
    void load(const std::filesystem::path& path, lyrics::LyricsFormat format);
    void setLoading(bool loading);

    void onImportClicked();
    void onSelectClicked();
    void onExportClicked();

    void refreshDetails();
    void refreshLanguages();
    void refreshLines();
    void refreshLineTitle(size_t line);

    lyrics::LyricsLoader loader_;
    std::unique_ptr<lyrics::LyricsDocument> document_;
    QString fileName_;

    QPushButton* importBtn_{nullptr};
    QPushButton* selectBtn_{nullptr};
    QPushButton* exportBtn_{nullptr};
    QProgressBar* busy_{nullptr};
    QLabel* pathLabel_{nullptr};
    QLabel* fileNameValue_{nullptr};
    QLabel* dataValue_{nullptr};

    QWidget* body_{nullptr};
    QVBoxLayout* languagesLayout_{nullptr};
    QListWidget* lineList_{nullptr};
    LineEditor* lineEditor_{nullptr};
};

} // namespace babel
