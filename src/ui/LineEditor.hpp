#pragma once
// LineEditor.hpp - Editor panel for one lyrics line
//
// Structural edits (segments, words, languages) rebuild the panel through a
// queued call so the clicked button is not destroyed inside its own handler.

#include <QWidget>
#include <optional>
#include <vector>
#include "lyrics/LyricsDocument.hpp"

class QLabel;
class QVBoxLayout;

namespace babel {

class LineEditor : public QWidget {
    Q_OBJECT

public:
    explicit LineEditor(QWidget* parent = nullptr);

    void setDocument(lyrics::LyricsDocument* doc);
    void setLine(std::optional<size_t> line);
    std::optional<size_t> line() const {
        return line_;
    }

    void rebuild();

signals:
    // Segment text changed; the line list title needs refreshing
    void lineTextChanged(size_t line);
    void lineRemoved(size_t line);
    void documentChanged();

private:
    void scheduleRebuild();
    bool apply(Result<void> result);

    QWidget* buildHeader(size_t line);
    QWidget* buildTranslations(size_t line);
    QWidget* buildTranslationGrid(size_t line, const lyrics::Uuid& language);
    QWidget* buildSegments(size_t line);

    lyrics::LyricsDocument* doc_{nullptr};
    std::optional<size_t> line_;
    QVBoxLayout* layout_{nullptr};
    QWidget* content_{nullptr};
    bool rebuildPending_{false};

    // Segment text labels of the translation grids, indexed by segment
    std::vector<std::vector<QLabel*>> segmentLabels_;
};

} // namespace babel
