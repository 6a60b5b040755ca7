#include "CaptionsWindow.hpp"
#include "KaraokeWidget.hpp"
#include "core/Config.hpp"

#include <QCloseEvent>
#include <QMouseEvent>
#include <QVBoxLayout>
#include <utility>

namespace babel {

CaptionsWindow::CaptionsWindow(QWidget* parent) : QWidget(parent, Qt::Window) {
    setWindowTitle("Captions");
    setMinimumSize(320, 80);
    resize(900, 160);

    auto* layout = new QVBoxLayout(this);
    layout->setContentsMargins(0, 0, 0, 0);
    view_ = new KaraokeWidget(KaraokeWidget::Mode::Captions, this);
    layout->addWidget(view_);

    applySettings();
}

void CaptionsWindow::applySettings() {
    bool wasVisible = isVisible();
    Qt::WindowFlags flags = Qt::Window | Qt::FramelessWindowHint;
    if (std::as_const(CONFIG).ui().captionsAlwaysOnTop)
        flags |= Qt::WindowStaysOnTopHint;
    // setWindowFlags hides the window
    setWindowFlags(flags);
    view_->updateStyle();
    if (wasVisible)
        show();
}

void CaptionsWindow::mousePressEvent(QMouseEvent* event) {
    if (event->button() == Qt::LeftButton) {
        dragging_ = true;
        dragOffset_ = event->globalPosition().toPoint() - frameGeometry().topLeft();
        event->accept();
        return;
    }
    QWidget::mousePressEvent(event);
}

void CaptionsWindow::mouseMoveEvent(QMouseEvent* event) {
    if (dragging_ && (event->buttons() & Qt::LeftButton)) {
        move(event->globalPosition().toPoint() - dragOffset_);
        event->accept();
        return;
    }
    QWidget::mouseMoveEvent(event);
}

void CaptionsWindow::mouseReleaseEvent(QMouseEvent* event) {
    dragging_ = false;
    QWidget::mouseReleaseEvent(event);
}

// No title bar, so a double click hides the window
void CaptionsWindow::mouseDoubleClickEvent(QMouseEvent* event) {
    if (event->button() == Qt::LeftButton) {
        close();
        return;
    }
    QWidget::mouseDoubleClickEvent(event);
}

void CaptionsWindow::closeEvent(QCloseEvent* event) {
    emit closed();
    event->accept();
}

} // namespace babel
