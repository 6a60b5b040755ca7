#include "KaraokeWidget.hpp"
#include "Colors.hpp"
#include "core/Config.hpp"

#include <QFontMetrics>
#include <QPainter>
#include <QWheelEvent>
#include <algorithm>
#include <utility>

namespace babel {

namespace {
constexpr double kLineSpacing = 1.4;
constexpr double kTranslationSpacing = 1.25;
constexpr int kBlockGap = 12;
} // namespace

KaraokeWidget::KaraokeWidget(Mode mode, QWidget* parent)
    : QWidget(parent), mode_(mode) {
    setAutoFillBackground(true);
    updateStyle();
}

KaraokeWidget::~KaraokeWidget() = default;

void KaraokeWidget::setLyrics(std::shared_ptr<const lyrics::BabelLyrics> lyrics) {
    lyrics_ = std::move(lyrics);
    rebuildFrame();
    anchor_ = anchorLine();
    scrollOffset_ = 0;
    update();
}

void KaraokeWidget::clear() {
    lyrics_.reset();
    frame_ = lyrics::LyricsFrame();
    anchor_ = 0;
    scrollOffset_ = 0;
    update();
}

void KaraokeWidget::updateTime(Duration time) {
    if (time == currentTime_)
        return;
    currentTime_ = time;
    rebuildFrame();

    // Moving on to another line hands the view back to playback
    size_t anchor = anchorLine();
    if (anchor != anchor_) {
        anchor_ = anchor;
        scrollOffset_ = 0;
    }
    update();
}

void KaraokeWidget::rebuildFrame() {
    if (lyrics_)
        frame_ = lyrics::LyricsSync::frameAt(*lyrics_, currentTime_);
    else
        frame_ = lyrics::LyricsFrame();
}

void KaraokeWidget::updateStyle() {
    const auto& cfg = std::as_const(CONFIG).captions();
    style_.font = QFont(QString::fromStdString(cfg.fontFamily));
    style_.font.setPixelSize(static_cast<int>(cfg.fontSize));
    style_.font.setBold(cfg.bold);

    style_.translationFont = style_.font;
    style_.translationFont.setPixelSize(
            std::max(8, static_cast<int>(cfg.fontSize) * 3 / 4));
    style_.translationFont.setBold(false);

    style_.highlight = colors::toQColor(cfg.highlightColor);
    style_.translation = colors::toQColor(cfg.translationColor);
    style_.dim = colors::toQColor(cfg.dimColor);
    style_.text = colors::toQColor(cfg.textColor);
    style_.background = colors::toQColor(cfg.backgroundColor);

    QPalette pal = palette();
    pal.setColor(QPalette::Window, style_.background);
    setPalette(pal);
    update();
}

QSize KaraokeWidget::sizeHint() const {
    if (mode_ == Mode::Captions)
        return {800, 160};
    return {480, 600};
}

int KaraokeWidget::blockHeight(const lyrics::LineState& line) const {
    QFontMetrics fm(style_.font);
    QFontMetrics tfm(style_.translationFont);
    int h = static_cast<int>(fm.height() * kLineSpacing);
    h += static_cast<int>(line.translations.size() *
                          tfm.height() * kTranslationSpacing);
    return h + kBlockGap;
}

void KaraokeWidget::drawRow(QPainter& painter,
                            const std::vector<Piece>& pieces,
                            const QFont& font,
                            int baseline) {
    painter.setFont(font);
    QFontMetrics fm(font);

    int total = 0;
    for (const auto& p : pieces)
        total += fm.horizontalAdvance(p.text);

    int x = (width() - total) / 2;
    for (const auto& p : pieces) {
        if (mode_ == Mode::Captions) {
            painter.setPen(QColor(0, 0, 0, 160));
            painter.drawText(x + 2, baseline + 2, p.text);
        }
        painter.setPen(p.color);
        painter.drawText(x, baseline, p.text);
        x += fm.horizontalAdvance(p.text);
    }
}

int KaraokeWidget::drawBlock(QPainter& painter,
                             const lyrics::LineState& line,
                             int y) {
    QFontMetrics fm(style_.font);
    QFontMetrics tfm(style_.translationFont);

    std::vector<Piece> pieces;
    pieces.reserve(line.segments.size());
    for (const auto& seg : line.segments) {
        QColor color = style_.dim;
        if (line.active)
            color = seg.active ? style_.highlight : style_.text;
        pieces.push_back({QString::fromStdString(seg.segment->text), color});
    }

    int lineH = static_cast<int>(fm.height() * kLineSpacing);
    drawRow(painter, pieces, style_.font, y + fm.ascent());
    y += lineH;

    int rowH = static_cast<int>(tfm.height() * kTranslationSpacing);
    for (const auto& row : line.translations) {
        std::vector<Piece> words;
        words.reserve(row.words->size());
        for (size_t i = 0; i < row.words->size(); ++i) {
            words.push_back({QString::fromStdString((*row.words)[i]),
                             row.highlighted[i] ? style_.highlight
                                                : style_.translation});
        }
        drawRow(painter, words, style_.translationFont, y + tfm.ascent());
        y += rowH;
    }
    return y + kBlockGap;
}

void KaraokeWidget::paintEvent(QPaintEvent*) {
    QPainter painter(this);
    painter.setRenderHint(QPainter::Antialiasing);
    painter.setRenderHint(QPainter::TextAntialiasing);

    if (!lyrics_) {
        if (mode_ == Mode::FullLyrics) {
            painter.setPen(style_.dim);
            painter.drawText(rect(), Qt::AlignCenter, "No lyrics loaded");
        }
        return;
    }

    if (mode_ == Mode::Captions)
        drawCaptions(painter);
    else
        drawFullLyrics(painter);
}

// First active line, else the next upcoming one, else the last
size_t KaraokeWidget::anchorLine() const {
    const auto& lines = frame_.lines;
    if (lines.empty())
        return 0;

    auto active = std::find_if(lines.begin(), lines.end(),
                               [](const auto& l) { return l.active; });
    if (active != lines.end())
        return static_cast<size_t>(active - lines.begin());

    for (size_t i = 0; i < lines.size(); ++i) {
        if (lines[i].line->begin >= frame_.timestamp)
            return i;
    }
    return lines.size() - 1;
}

int KaraokeWidget::contentHeight() const {
    int total = 0;
    for (const auto& line : frame_.lines)
        total += blockHeight(line);
    return total;
}

void KaraokeWidget::wheelEvent(QWheelEvent* event) {
    if (mode_ != Mode::FullLyrics || frame_.lines.empty()) {
        QWidget::wheelEvent(event);
        return;
    }

    int delta = event->pixelDelta().y();
    if (delta == 0)
        delta = event->angleDelta().y() / 2;

    int limit = contentHeight();
    scrollOffset_ = std::clamp(scrollOffset_ + delta, -limit, limit);
    event->accept();
    update();
}

void KaraokeWidget::drawFullLyrics(QPainter& painter) {
    const auto& lines = frame_.lines;
    if (lines.empty())
        return;

    size_t anchor = std::min(anchor_, lines.size() - 1);
    int offset = 0;
    for (size_t i = 0; i < anchor; ++i)
        offset += blockHeight(lines[i]);

    int y = height() / 2 - offset - blockHeight(lines[anchor]) / 2 +
            scrollOffset_;
    for (const auto& line : lines) {
        int h = blockHeight(line);
        if (y + h >= 0 && y <= height())
            drawBlock(painter, line, y);
        y += h;
        if (y > height())
            break;
    }
}

void KaraokeWidget::drawCaptions(QPainter& painter) {
    auto active = frame_.activeLines();
    if (active.empty())
        return;

    int total = 0;
    for (const auto* line : active)
        total += blockHeight(*line);

    int y = std::max(0, (height() - total) / 2);
    for (const auto* line : active)
        y = drawBlock(painter, *line, y);
}

} // namespace babel
