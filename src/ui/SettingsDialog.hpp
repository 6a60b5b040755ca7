#pragma once
// SettingsDialog.hpp - Application settings

#include "util/Types.hpp"

#include <QCheckBox>
#include <QColor>
#include <QComboBox>
#include <QDialog>
#include <QDoubleSpinBox>
#include <QFontComboBox>
#include <QLineEdit>
#include <QPushButton>
#include <QSpinBox>
#include <QTabWidget>

namespace babel {

class SettingsDialog : public QDialog {
    Q_OBJECT

public:
    explicit SettingsDialog(QWidget* parent = nullptr);

public slots:
    void accept() override;

private:
    void setupUI();
    QWidget* createGeneralTab();
    QWidget* createAudioTab();
    QWidget* createCaptionsTab();
    void loadSettings();
    void saveSettings();

    QPushButton* addColorButton(QColor& target);
    static void paintColorButton(QPushButton* btn, const QColor& color);

    QTabWidget* tabWidget_{nullptr};

    // General
    QCheckBox* debugCheck_{nullptr};
    QComboBox* themeCombo_{nullptr};
    QCheckBox* showLyricsCheck_{nullptr};
    QCheckBox* showCaptionsCheck_{nullptr};
    QCheckBox* captionsOnTopCheck_{nullptr};

    // Audio
    QLineEdit* audioDeviceEdit_{nullptr};
    QSpinBox* bufferSizeSpin_{nullptr};
    QSpinBox* sampleRateSpin_{nullptr};
    QDoubleSpinBox* volumeSpin_{nullptr};
    QSpinBox* seekStepSpin_{nullptr};
    QSpinBox* tickIntervalSpin_{nullptr};

    // Captions
    QFontComboBox* fontCombo_{nullptr};
    QSpinBox* fontSizeSpin_{nullptr};
    QCheckBox* boldCheck_{nullptr};
    QPushButton* highlightBtn_{nullptr};
    QPushButton* translationBtn_{nullptr};
    QPushButton* dimBtn_{nullptr};
    QPushButton* textBtn_{nullptr};
    QPushButton* backgroundBtn_{nullptr};

    QColor highlightColor_;
    QColor translationColor_;
    QColor dimColor_;
    QColor textColor_;
    QColor backgroundColor_;
};

} // namespace babel
