#include "TimestampSpinBox.hpp"
#include "core/Config.hpp"
#include "util/TimeFormat.hpp"

#include <QSignalBlocker>
#include <algorithm>
#include <limits>
#include <utility>

namespace babel {

TimestampSpinBox::TimestampSpinBox(QWidget* parent) : QSpinBox(parent) {
    setRange(0, std::numeric_limits<int>::max());
    setSingleStep(static_cast<int>(std::as_const(CONFIG).player().seekStepMs));
    setAccelerated(true);
    setKeyboardTracking(false);
    setAlignment(Qt::AlignRight);
    setMinimumWidth(fontMetrics().horizontalAdvance("00:00:00.000") + 40);
}

void TimestampSpinBox::setTimestamp(Duration t) {
    // Programmatic updates must not look like user seeks
    QSignalBlocker blocker(this);
    auto clamped = std::clamp<i64>(t.count(), minimum(), maximum());
    setValue(static_cast<int>(clamped));
}

void TimestampSpinBox::setDuration(std::optional<Duration> total) {
    int max = std::numeric_limits<int>::max();
    if (total)
        max = static_cast<int>(std::clamp<i64>(total->count(), 0, max));
    QSignalBlocker blocker(this);
    setMaximum(max);
}

QString TimestampSpinBox::textFromValue(int value) const {
    return QString::fromStdString(timefmt::formatTimestamp(Duration(value)));
}

int TimestampSpinBox::valueFromText(const QString& text) const {
    auto parsed = timefmt::parseTimestamp(text.trimmed().toStdString());
    if (!parsed)
        return value();
    return static_cast<int>(std::clamp<i64>(parsed->count(), minimum(), maximum()));
}

QValidator::State TimestampSpinBox::validate(QString& input, int&) const {
    QString trimmed = input.trimmed();
    if (trimmed.isEmpty())
        return QValidator::Intermediate;

    for (QChar c : trimmed) {
        if (!c.isDigit() && c != ':' && c != '.')
            return QValidator::Invalid;
    }

    auto parsed = timefmt::parseTimestamp(trimmed.toStdString());
    if (!parsed)
        return QValidator::Intermediate;
    if (parsed->count() > maximum())
        return QValidator::Intermediate;
    return QValidator::Acceptable;
}

} // namespace babel
