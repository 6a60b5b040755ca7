#pragma once
// KaraokeWidget.hpp - Synchronized lyrics renderer
// Full mode lists every line around the current one and scrolls with the
// mouse wheel until playback moves to another line; captions mode shows
// only the active lines

#include <QFont>
#include <QWidget>
#include <memory>
#include "lyrics/LyricsSync.hpp"

class QPainter;

namespace babel {

class KaraokeWidget : public QWidget {
    Q_OBJECT

public:
    enum class Mode { FullLyrics, Captions };

    explicit KaraokeWidget(Mode mode, QWidget* parent = nullptr);
    ~KaraokeWidget() override;

    void setLyrics(std::shared_ptr<const lyrics::BabelLyrics> lyrics);
    void clear();
    void updateTime(Duration time);
    void updateStyle();

    bool hasLyrics() const {
        return lyrics_ != nullptr;
    }
    const lyrics::LyricsFrame& frame() const {
        return frame_;
    }
    int scrollOffset() const {
        return scrollOffset_;
    }

    QSize sizeHint() const override;

protected:
    void paintEvent(QPaintEvent* event) override;
    void wheelEvent(QWheelEvent* event) override;

private:
    struct Piece {
        QString text;
        QColor color;
    };

    void rebuildFrame();
    size_t anchorLine() const;
    int contentHeight() const;
    int blockHeight(const lyrics::LineState& line) const;
    int drawBlock(QPainter& painter, const lyrics::LineState& line, int y);
    void drawRow(QPainter& painter,
                 const std::vector<Piece>& pieces,
                 const QFont& font,
                 int baseline);
    void drawFullLyrics(QPainter& painter);
    void drawCaptions(QPainter& painter);

    struct Style {
        QFont font;
        QFont translationFont;
        QColor highlight;
        QColor translation;
        QColor dim;
        QColor text;
        QColor background;
    };

    Mode mode_;
    Style style_;
    std::shared_ptr<const lyrics::BabelLyrics> lyrics_;
    lyrics::LyricsFrame frame_;
    Duration currentTime_{0};
    size_t anchor_{0};
    int scrollOffset_{0};
};

} // namespace babel
