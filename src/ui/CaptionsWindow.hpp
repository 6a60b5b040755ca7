#pragma once
// CaptionsWindow.hpp - Frameless window showing only the active lines

#include <QPoint>
#include <QWidget>

namespace babel {

class KaraokeWidget;

class CaptionsWindow : public QWidget {
    Q_OBJECT

public:
    explicit CaptionsWindow(QWidget* parent = nullptr);

    KaraokeWidget* view() {
        return view_;
    }

    void applySettings();

signals:
    void closed();

protected:
    void mousePressEvent(QMouseEvent* event) override;
    void mouseMoveEvent(QMouseEvent* event) override;
    void mouseReleaseEvent(QMouseEvent* event) override;
    void mouseDoubleClickEvent(QMouseEvent* event) override;
    void closeEvent(QCloseEvent* event) override;

private:
    KaraokeWidget* view_{nullptr};
    QPoint dragOffset_;
    bool dragging_{false};
};

} // namespace babel
