#include "TimeEdit.hpp"
#include "util/TimeFormat.hpp"

#include <QHBoxLayout>
#include <QSignalBlocker>
#include <QSpinBox>
#include <algorithm>

namespace babel {

TimeEdit::TimeEdit(QWidget* parent) : QWidget(parent) {
    auto* layout = new QHBoxLayout(this);
    layout->setContentsMargins(0, 0, 0, 0);
    layout->setSpacing(2);

    auto makeSpin = [this, layout](int max, const QString& suffix) {
        auto* spin = new QSpinBox(this);
        spin->setRange(0, max);
        spin->setSuffix(suffix);
        spin->setButtonSymbols(QAbstractSpinBox::NoButtons);
        spin->setAlignment(Qt::AlignRight);
        layout->addWidget(spin);
        connect(spin, qOverload<int>(&QSpinBox::valueChanged), this, [this] {
            emit timeChanged(time());
        });
        return spin;
    };

    minutes_ = makeSpin(59, "m");
    seconds_ = makeSpin(59, "s");
    millis_ = makeSpin(999, QString());
}

Duration TimeEdit::time() const {
    return timefmt::join({minutes_->value(), seconds_->value(), millis_->value()});
}

void TimeEdit::setTime(Duration t) {
    auto parts = timefmt::split(t);
    QSignalBlocker b1(minutes_);
    QSignalBlocker b2(seconds_);
    QSignalBlocker b3(millis_);
    minutes_->setValue(static_cast<int>(std::min<i64>(parts.minutes, 59)));
    seconds_->setValue(static_cast<int>(parts.seconds));
    millis_->setValue(static_cast<int>(parts.millis));
}

} // namespace babel
