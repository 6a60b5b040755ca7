#pragma once
// TimeEdit.hpp - Minutes / seconds / milliseconds editor for segment times

#include <QWidget>
#include "util/Types.hpp"

class QSpinBox;

namespace babel {

class TimeEdit : public QWidget {
    Q_OBJECT

public:
    explicit TimeEdit(QWidget* parent = nullptr);

    Duration time() const;
    void setTime(Duration t);

signals:
    void timeChanged(Duration t);

private:
    QSpinBox* minutes_{nullptr};
    QSpinBox* seconds_{nullptr};
    QSpinBox* millis_{nullptr};
};

} // namespace babel
