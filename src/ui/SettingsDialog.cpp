#include "SettingsDialog.hpp"
#include "Colors.hpp"
#include "core/Config.hpp"
#include "core/Logger.hpp"

#include <QColorDialog>
#include <QDialogButtonBox>
#include <QFormLayout>
#include <QLabel>
#include <QMessageBox>
#include <QVBoxLayout>

namespace babel {

SettingsDialog::SettingsDialog(QWidget* parent) : QDialog(parent) {
    setWindowTitle("Settings");
    setMinimumWidth(460);
    setupUI();
    loadSettings();
}

void SettingsDialog::setupUI() {
    auto* layout = new QVBoxLayout(this);

    tabWidget_ = new QTabWidget(this);
    tabWidget_->addTab(createGeneralTab(), "General");
    tabWidget_->addTab(createAudioTab(), "Audio");
    tabWidget_->addTab(createCaptionsTab(), "Captions");
    layout->addWidget(tabWidget_);

    auto* buttons = new QDialogButtonBox(
            QDialogButtonBox::Ok | QDialogButtonBox::Cancel, this);
    connect(buttons, &QDialogButtonBox::accepted, this, &SettingsDialog::accept);
    connect(buttons, &QDialogButtonBox::rejected, this, &SettingsDialog::reject);
    layout->addWidget(buttons);
}

QWidget* SettingsDialog::createGeneralTab() {
    auto* tab = new QWidget();
    auto* form = new QFormLayout(tab);

    debugCheck_ = new QCheckBox("Debug logging", tab);
    form->addRow(debugCheck_);

    themeCombo_ = new QComboBox(tab);
    themeCombo_->addItems({"dark", "light"});
    form->addRow("Theme:", themeCombo_);

    showLyricsCheck_ = new QCheckBox("Show main lyrics window", tab);
    showCaptionsCheck_ = new QCheckBox("Show captions window", tab);
    captionsOnTopCheck_ = new QCheckBox("Keep captions above other windows", tab);
    form->addRow(showLyricsCheck_);
    form->addRow(showCaptionsCheck_);
    form->addRow(captionsOnTopCheck_);

    auto* note = new QLabel("Theme changes apply after a restart.", tab);
    note->setStyleSheet(QString("color: %1;").arg(colors::GRAY_500.name()));
    form->addRow(note);
    return tab;
}

QWidget* SettingsDialog::createAudioTab() {
    auto* tab = new QWidget();
    auto* form = new QFormLayout(tab);

    audioDeviceEdit_ = new QLineEdit(tab);
    audioDeviceEdit_->setPlaceholderText("default");
    form->addRow("Output device:", audioDeviceEdit_);

    bufferSizeSpin_ = new QSpinBox(tab);
    bufferSizeSpin_->setRange(256, 16384);
    bufferSizeSpin_->setSuffix(" samples");
    form->addRow("Buffer size:", bufferSizeSpin_);

    sampleRateSpin_ = new QSpinBox(tab);
    sampleRateSpin_->setRange(8000, 192000);
    sampleRateSpin_->setSuffix(" Hz");
    form->addRow("Sample rate:", sampleRateSpin_);

    volumeSpin_ = new QDoubleSpinBox(tab);
    volumeSpin_->setRange(0.0, 1.0);
    volumeSpin_->setSingleStep(0.05);
    form->addRow("Volume:", volumeSpin_);

    seekStepSpin_ = new QSpinBox(tab);
    seekStepSpin_->setRange(10, 10000);
    seekStepSpin_->setSuffix(" ms");
    form->addRow("Position step:", seekStepSpin_);

    tickIntervalSpin_ = new QSpinBox(tab);
    tickIntervalSpin_->setRange(5, 100);
    tickIntervalSpin_->setSuffix(" ms");
    form->addRow("Refresh interval:", tickIntervalSpin_);

    auto* note = new QLabel("Device, buffer and rate changes apply after a restart.", tab);
    note->setStyleSheet(QString("color: %1;").arg(colors::GRAY_500.name()));
    form->addRow(note);
    return tab;
}

QWidget* SettingsDialog::createCaptionsTab() {
    auto* tab = new QWidget();
    auto* form = new QFormLayout(tab);

    fontCombo_ = new QFontComboBox(tab);
    form->addRow("Font:", fontCombo_);

    fontSizeSpin_ = new QSpinBox(tab);
    fontSizeSpin_->setRange(8, 144);
    fontSizeSpin_->setSuffix(" px");
    form->addRow("Font size:", fontSizeSpin_);

    boldCheck_ = new QCheckBox("Bold", tab);
    form->addRow(boldCheck_);

    highlightBtn_ = addColorButton(highlightColor_);
    translationBtn_ = addColorButton(translationColor_);
    dimBtn_ = addColorButton(dimColor_);
    textBtn_ = addColorButton(textColor_);
    backgroundBtn_ = addColorButton(backgroundColor_);
    form->addRow("Highlight:", highlightBtn_);
    form->addRow("Translation:", translationBtn_);
    form->addRow("Inactive lines:", dimBtn_);
    form->addRow("Text:", textBtn_);
    form->addRow("Background:", backgroundBtn_);
    return tab;
}

QPushButton* SettingsDialog::addColorButton(QColor& target) {
    auto* btn = new QPushButton();
    btn->setFixedWidth(90);
    connect(btn, &QPushButton::clicked, this, [this, btn, &target] {
        QColor picked = QColorDialog::getColor(
                target, this, "Select Color", QColorDialog::ShowAlphaChannel);
        if (picked.isValid()) {
            target = picked;
            paintColorButton(btn, target);
        }
    });
    return btn;
}

void SettingsDialog::paintColorButton(QPushButton* btn, const QColor& color) {
    btn->setText(color.name(QColor::HexRgb).toUpper());
    QColor fg = color.lightness() > 128 ? Qt::black : Qt::white;
    btn->setStyleSheet(QString("background-color: %1; color: %2;")
                               .arg(color.name(QColor::HexArgb), fg.name()));
}

void SettingsDialog::loadSettings() {
    const auto& cfg = Config::instance();

    debugCheck_->setChecked(cfg.debug());
    themeCombo_->setCurrentText(QString::fromStdString(cfg.ui().theme));
    showLyricsCheck_->setChecked(cfg.ui().showLyricsWindow);
    showCaptionsCheck_->setChecked(cfg.ui().showCaptionsWindow);
    captionsOnTopCheck_->setChecked(cfg.ui().captionsAlwaysOnTop);

    audioDeviceEdit_->setText(QString::fromStdString(cfg.audio().device));
    bufferSizeSpin_->setValue(static_cast<int>(cfg.audio().bufferSize));
    sampleRateSpin_->setValue(static_cast<int>(cfg.audio().sampleRate));
    volumeSpin_->setValue(cfg.audio().volume);
    seekStepSpin_->setValue(static_cast<int>(cfg.player().seekStepMs));
    tickIntervalSpin_->setValue(static_cast<int>(cfg.player().tickIntervalMs));

    const auto& cap = cfg.captions();
    fontCombo_->setCurrentFont(QFont(QString::fromStdString(cap.fontFamily)));
    fontSizeSpin_->setValue(static_cast<int>(cap.fontSize));
    boldCheck_->setChecked(cap.bold);

    highlightColor_ = colors::toQColor(cap.highlightColor);
    translationColor_ = colors::toQColor(cap.translationColor);
    dimColor_ = colors::toQColor(cap.dimColor);
    textColor_ = colors::toQColor(cap.textColor);
    backgroundColor_ = colors::toQColor(cap.backgroundColor);
    paintColorButton(highlightBtn_, highlightColor_);
    paintColorButton(translationBtn_, translationColor_);
    paintColorButton(dimBtn_, dimColor_);
    paintColorButton(textBtn_, textColor_);
    paintColorButton(backgroundBtn_, backgroundColor_);
}

void SettingsDialog::saveSettings() {
    auto& cfg = Config::instance();

    cfg.setDebug(debugCheck_->isChecked());
    Logger::setDebug(debugCheck_->isChecked());

    auto& ui = cfg.ui();
    ui.theme = themeCombo_->currentText().toStdString();
    ui.showLyricsWindow = showLyricsCheck_->isChecked();
    ui.showCaptionsWindow = showCaptionsCheck_->isChecked();
    ui.captionsAlwaysOnTop = captionsOnTopCheck_->isChecked();

    auto& audio = cfg.audio();
    audio.device = audioDeviceEdit_->text().trimmed().toStdString();
    if (audio.device.empty())
        audio.device = "default";
    audio.bufferSize = static_cast<u32>(bufferSizeSpin_->value());
    audio.sampleRate = static_cast<u32>(sampleRateSpin_->value());
    audio.volume = static_cast<f32>(volumeSpin_->value());

    auto& player = cfg.player();
    player.seekStepMs = static_cast<u32>(seekStepSpin_->value());
    player.tickIntervalMs = static_cast<u32>(tickIntervalSpin_->value());

    auto& cap = cfg.captions();
    cap.fontFamily = fontCombo_->currentFont().family().toStdString();
    cap.fontSize = static_cast<u32>(fontSizeSpin_->value());
    cap.bold = boldCheck_->isChecked();
    cap.highlightColor = colors::fromQColor(highlightColor_);
    cap.translationColor = colors::fromQColor(translationColor_);
    cap.dimColor = colors::fromQColor(dimColor_);
    cap.textColor = colors::fromQColor(textColor_);
    cap.backgroundColor = colors::fromQColor(backgroundColor_);
}

void SettingsDialog::accept() {
    saveSettings();
    if (auto res = CONFIG.save(CONFIG.configPath()); !res) {
        LOG_ERROR("Failed to save settings: {}", res.error().message);
        QMessageBox::warning(this,
                             "Settings",
                             QString::fromStdString(res.error().message));
    }
    QDialog::accept();
}

} // namespace babel
