#include "PlayerPanel.hpp"
#include "Colors.hpp"
#include "TimestampSpinBox.hpp"
#include "audio/PlayerController.hpp"
#include "util/TimeFormat.hpp"

#include <QCheckBox>
#include <QFrame>
#include <QGridLayout>
#include <QHBoxLayout>
#include <QLabel>
#include <QProgressBar>
#include <QPushButton>
#include <QSignalBlocker>
#include <QVBoxLayout>

namespace babel {

namespace {
const QString kNone = QStringLiteral("-");
const QString kInMemory = QStringLiteral("✓ In memory");

QProgressBar* makeBusyIndicator(QWidget* parent) {
    auto* bar = new QProgressBar(parent);
    bar->setRange(0, 0);
    bar->setTextVisible(false);
    bar->setMaximumWidth(80);
    bar->setMaximumHeight(12);
    bar->hide();
    return bar;
}

QLabel* addDetailsRow(QGridLayout* grid, const QString& name) {
    int row = grid->rowCount();
    auto* label = new QLabel(name);
    label->setStyleSheet(QString("color: %1;").arg(colors::GRAY_500.name()));
    auto* value = new QLabel(kNone);
    value->setTextInteractionFlags(Qt::TextSelectableByMouse);
    grid->addWidget(label, row, 0);
    grid->addWidget(value, row, 1);
    return value;
}
} // namespace

PlayerPanel::PlayerPanel(PlayerController* player, QWidget* parent)
    : QWidget(parent), player_(player) {
    setupUI();
    refreshState(player_->state());
    refreshDuration(player_->duration());
    refreshPosition(player_->position());
}

QWidget* PlayerPanel::makeSeparator() {
    auto* line = new QFrame(this);
    line->setFrameShape(QFrame::HLine);
    line->setFrameShadow(QFrame::Sunken);
    return line;
}

void PlayerPanel::setupUI() {
    auto* layout = new QVBoxLayout(this);

    // Audio file
    auto* audioRow = new QHBoxLayout();
    selectAudioBtn_ = new QPushButton("Select Audio File", this);
    audioPathLabel_ = new QLabel(this);
    audioPathLabel_->setTextInteractionFlags(Qt::TextSelectableByMouse);
    audioBusy_ = makeBusyIndicator(this);
    audioRow->addWidget(selectAudioBtn_);
    audioRow->addWidget(audioBusy_);
    audioRow->addWidget(audioPathLabel_, 1);
    layout->addLayout(audioRow);

    auto* audioGrid = new QGridLayout();
    audioGrid->setColumnStretch(1, 1);
    audioNameValue_ = addDetailsRow(audioGrid, "File name");
    audioSizeValue_ = addDetailsRow(audioGrid, "File size");
    audioDurationValue_ = addDetailsRow(audioGrid, "Duration");
    audioDataValue_ = addDetailsRow(audioGrid, "File data");
    layout->addLayout(audioGrid);

    layout->addWidget(makeSeparator());

    // Editor
    auto* editorRow = new QHBoxLayout();
    editorToggle_ = new QPushButton("Lyrics editor", this);
    editorToggle_->setCheckable(true);
    loadFromEditorBtn_ = new QPushButton("Load from editor", this);
    loadFromEditorBtn_->setEnabled(false);
    editorRow->addWidget(editorToggle_);
    editorRow->addWidget(loadFromEditorBtn_);
    editorRow->addStretch();
    layout->addLayout(editorRow);

    // Lyrics file
    auto* lyricsRow = new QHBoxLayout();
    selectLyricsBtn_ = new QPushButton("Select lyrics file", this);
    lyricsPathLabel_ = new QLabel(this);
    lyricsPathLabel_->setObjectName("LyricsPath");
    lyricsPathLabel_->setTextInteractionFlags(Qt::TextSelectableByMouse);
    lyricsBusy_ = makeBusyIndicator(this);
    lyricsRow->addWidget(selectLyricsBtn_);
    lyricsRow->addWidget(lyricsBusy_);
    lyricsRow->addWidget(lyricsPathLabel_, 1);
    layout->addLayout(lyricsRow);

    auto* lyricsGrid = new QGridLayout();
    lyricsGrid->setColumnStretch(1, 1);
    lyricsNameValue_ = addDetailsRow(lyricsGrid, "File name");
    lyricsNameValue_->setObjectName("LyricsFileName");
    lyricsDataValue_ = addDetailsRow(lyricsGrid, "Lyrics data");
    layout->addLayout(lyricsGrid);

    windowToggles_ = new QWidget(this);
    auto* togglesRow = new QHBoxLayout(windowToggles_);
    togglesRow->setContentsMargins(0, 0, 0, 0);
    lyricsWindowCheck_ = new QCheckBox("Main lyrics window", windowToggles_);
    captionsWindowCheck_ = new QCheckBox("Captions window", windowToggles_);
    togglesRow->addWidget(lyricsWindowCheck_);
    togglesRow->addWidget(captionsWindowCheck_);
    togglesRow->addStretch();
    windowToggles_->hide();
    layout->addWidget(windowToggles_);

    layout->addWidget(makeSeparator());

    // Transport
    auto* timeRow = new QHBoxLayout();
    timestampSpin_ = new TimestampSpinBox(this);
    auto* slash = new QLabel("/", this);
    slash->setStyleSheet(QString("color: %1;").arg(colors::GRAY_500.name()));
    totalLabel_ = new QLabel(this);
    timeRow->addWidget(timestampSpin_);
    timeRow->addWidget(slash);
    timeRow->addWidget(totalLabel_);
    timeRow->addStretch();
    layout->addLayout(timeRow);

    auto* buttonRow = new QHBoxLayout();
    playBtn_ = new QPushButton("Play", this);
    resumeBtn_ = new QPushButton("Resume", this);
    pauseBtn_ = new QPushButton("Pause", this);
    resetBtn_ = new QPushButton("Reset", this);
    for (auto* btn : {playBtn_, resumeBtn_, pauseBtn_, resetBtn_})
        buttonRow->addWidget(btn);
    buttonRow->addStretch();
    layout->addLayout(buttonRow);
    layout->addStretch();

    connect(selectAudioBtn_, &QPushButton::clicked, this,
            &PlayerPanel::selectAudioRequested);
    connect(selectLyricsBtn_, &QPushButton::clicked, this,
            &PlayerPanel::selectLyricsRequested);
    connect(editorToggle_, &QPushButton::toggled, this,
            &PlayerPanel::editorToggled);
    connect(loadFromEditorBtn_, &QPushButton::clicked, this,
            &PlayerPanel::loadFromEditorRequested);
    connect(lyricsWindowCheck_, &QCheckBox::toggled, this,
            &PlayerPanel::lyricsWindowToggled);
    connect(captionsWindowCheck_, &QCheckBox::toggled, this,
            &PlayerPanel::captionsWindowToggled);

    connect(playBtn_, &QPushButton::clicked, this, [this] { player_->play(); });
    connect(resumeBtn_, &QPushButton::clicked, this, [this] { player_->resume(); });
    connect(pauseBtn_, &QPushButton::clicked, this, [this] { player_->pause(); });
    connect(resetBtn_, &QPushButton::clicked, this, [this] { player_->reset(); });
    connect(timestampSpin_, qOverload<int>(&QSpinBox::valueChanged), this,
            [this](int ms) { player_->seek(Duration(ms)); });
}

void PlayerPanel::setAudioLoading(bool loading) {
    selectAudioBtn_->setEnabled(!loading);
    audioBusy_->setVisible(loading);
    audioPathLabel_->setVisible(!loading);
}

void PlayerPanel::setAudioPath(const QString& path) {
    audioPathLabel_->setText(path);
}

void PlayerPanel::setAudioDetails(const AudioDetails* details) {
    if (!details) {
        for (auto* label : {audioNameValue_, audioSizeValue_,
                            audioDurationValue_, audioDataValue_})
            label->setText(kNone);
        return;
    }

    audioNameValue_->setText(QString::fromStdString(details->fileName));
    audioSizeValue_->setText(
            QString::fromStdString(timefmt::formatMiB(details->size)));
    audioDurationValue_->setText(
            QString::fromStdString(timefmt::formatTotal(details->duration)));
    audioDataValue_->setText(details->data.empty() ? kNone : kInMemory);
}

void PlayerPanel::setLyricsLoading(bool loading) {
    selectLyricsBtn_->setEnabled(!loading);
    lyricsBusy_->setVisible(loading);
    lyricsPathLabel_->setVisible(!loading);
}

void PlayerPanel::setLyricsPath(const QString& path) {
    lyricsPathLabel_->setText(path);
}

void PlayerPanel::setLyricsDetails(const QString& fileName, bool inMemory) {
    lyricsNameValue_->setText(fileName.isEmpty() ? kNone : fileName);
    lyricsDataValue_->setText(inMemory ? kInMemory : kNone);
    windowToggles_->setVisible(inMemory);
}

void PlayerPanel::setLyricsWindows(bool mainWindow, bool captions) {
    QSignalBlocker b1(lyricsWindowCheck_);
    QSignalBlocker b2(captionsWindowCheck_);
    lyricsWindowCheck_->setChecked(mainWindow);
    captionsWindowCheck_->setChecked(captions);
}

void PlayerPanel::setEditorVisible(bool visible) {
    QSignalBlocker blocker(editorToggle_);
    editorToggle_->setChecked(visible);
}

void PlayerPanel::setEditorHasLyrics(bool hasLyrics) {
    loadFromEditorBtn_->setEnabled(hasLyrics);
}

void PlayerPanel::refreshState(PlayerState state) {
    playBtn_->setVisible(state == PlayerState::Stopped);
    resumeBtn_->setVisible(state == PlayerState::Paused);
    pauseBtn_->setVisible(state == PlayerState::Playing);
    resetBtn_->setVisible(state != PlayerState::Stopped);
}

void PlayerPanel::refreshPosition(Duration position) {
    timestampSpin_->setTimestamp(position);
}

void PlayerPanel::refreshDuration(std::optional<Duration> total) {
    timestampSpin_->setDuration(total);
    totalLabel_->setText(QString::fromStdString(timefmt::formatTotal(total)));
}

} // namespace babel
