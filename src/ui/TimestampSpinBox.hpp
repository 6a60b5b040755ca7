#pragma once
// TimestampSpinBox.hpp - Millisecond spin box shown as H:MM:SS.mmm

#include <QSpinBox>
#include <optional>
#include "util/Types.hpp"

namespace babel {

class TimestampSpinBox : public QSpinBox {
    Q_OBJECT

public:
    explicit TimestampSpinBox(QWidget* parent = nullptr);

    Duration timestamp() const {
        return Duration(value());
    }
    void setTimestamp(Duration t);

    // Upper bound; unknown durations leave the range open
    void setDuration(std::optional<Duration> total);

protected:
    QString textFromValue(int value) const override;
    int valueFromText(const QString& text) const override;
    QValidator::State validate(QString& input, int& pos) const override;
};

} // namespace babel
