#include "MainWindow.hpp"
#include "CaptionsWindow.hpp"
#include "KaraokeWidget.hpp"
#include "LyricsEditorWindow.hpp"
#include "PlayerPanel.hpp"
#include "SettingsDialog.hpp"
#include "audio/PlayerController.hpp"
#include "core/Config.hpp"
#include "core/Logger.hpp"
#include "util/FileUtils.hpp"

#include <QCloseEvent>
#include <QDir>
#include <QDockWidget>
#include <QDragEnterEvent>
#include <QDropEvent>
#include <QFileDialog>
#include <QMenuBar>
#include <QMessageBox>
#include <QMimeData>
#include <QScrollArea>
#include <QStatusBar>
#include <algorithm>
#include <utility>

namespace babel {

namespace {
QString dirOrHome(const fs::path& dir) {
    return dir.empty() ? QDir::homePath() : QString::fromStdString(dir.string());
}
} // namespace

MainWindow::MainWindow(PlayerController* player, QWidget* parent)
    : QMainWindow(parent), player_(player) {
    setWindowTitle("Babel Player");
    setMinimumSize(720, 480);
    resize(1200, 760);
    setAcceptDrops(true);

    setupUI();
    setupMenuBar();
    setupConnections();
    setupUpdateTimer();

    if (!player_->audioAvailable())
        statusBar()->showMessage("Audio output unavailable, playback is silent");
    else
        statusBar()->showMessage("Ready");
}

MainWindow::~MainWindow() {
    updateTimer_.stop();

    player_->positionChanged.disconnect(positionSlot_);
    player_->stateChanged.disconnect(stateSlot_);
    player_->errorOccurred.disconnect(errorSlot_);
    audioLoader_.loaded.disconnectAll();
    audioLoader_.failed.disconnectAll();
    lyricsLoader_.fileSelected.disconnectAll();
    lyricsLoader_.loaded.disconnectAll();
    lyricsLoader_.failed.disconnectAll();

    delete captions_;
    delete editor_;
}

void MainWindow::setupUI() {
    auto* scroll = new QScrollArea(this);
    scroll->setWidgetResizable(true);
    panel_ = new PlayerPanel(player_, scroll);
    scroll->setWidget(panel_);
    setCentralWidget(scroll);

    lyricsView_ = new KaraokeWidget(KaraokeWidget::Mode::FullLyrics, this);
    lyricsDock_ = new QDockWidget("Lyrics", this);
    lyricsDock_->setObjectName("LyricsDock");
    lyricsDock_->setWidget(lyricsView_);
    lyricsDock_->setFeatures(QDockWidget::DockWidgetMovable |
                             QDockWidget::DockWidgetFloatable |
                             QDockWidget::DockWidgetClosable);
    addDockWidget(Qt::RightDockWidgetArea, lyricsDock_);
    resizeDocks({lyricsDock_}, {560}, Qt::Horizontal);
    lyricsDock_->hide();

    // Top-level windows, owned here rather than through Qt parenting
    captions_ = new CaptionsWindow();
    editor_ = new LyricsEditorWindow();
}

void MainWindow::setupMenuBar() {
    auto* fileMenu = menuBar()->addMenu("&File");
    fileMenu->addAction("Open &Audio...", QKeySequence::Open, this,
                        &MainWindow::onSelectAudio);
    fileMenu->addAction("Open &Lyrics...",
                        QKeySequence(Qt::CTRL | Qt::Key_L),
                        this,
                        &MainWindow::onSelectLyrics);
    fileMenu->addSeparator();
    fileMenu->addAction("E&xit", QKeySequence::Quit, this, &QMainWindow::close);

    auto* playbackMenu = menuBar()->addMenu("&Playback");
    playbackMenu->addAction("&Play/Pause", QKeySequence(Qt::Key_Space), this,
                            [this] { player_->togglePlayPause(); });
    playbackMenu->addAction("&Reset", QKeySequence(Qt::Key_Home), this,
                            [this] { player_->reset(); });
    playbackMenu->addSeparator();
    playbackMenu->addAction("Step &Back", QKeySequence(Qt::Key_Left), this, [this] {
        auto step = Duration(std::as_const(CONFIG).player().seekStepMs);
        player_->seek(std::max(Duration(0), player_->position() - step));
    });
    playbackMenu->addAction("Step &Forward", QKeySequence(Qt::Key_Right), this, [this] {
        auto step = Duration(std::as_const(CONFIG).player().seekStepMs);
        player_->seek(player_->position() + step);
    });

    auto* viewMenu = menuBar()->addMenu("&View");
    auto* lyricsAction = lyricsDock_->toggleViewAction();
    lyricsAction->setText("Main &Lyrics Window");
    viewMenu->addAction(lyricsAction);
    viewMenu->addAction("&Captions Window", this, [this] {
        setCaptionsVisible(!captions_->isVisible());
    });
    viewMenu->addAction("Lyrics &Editor", QKeySequence(Qt::CTRL | Qt::Key_E), this, [this] {
        editor_->setVisible(!editor_->isVisible());
    });

    auto* toolsMenu = menuBar()->addMenu("&Tools");
    toolsMenu->addAction("&Settings...", QKeySequence::Preferences, this,
                         &MainWindow::onShowSettings);

    auto* helpMenu = menuBar()->addMenu("&Help");
    helpMenu->addAction("&About Babel Player", this, &MainWindow::onShowAbout);
}

void MainWindow::setupConnections() {
    positionSlot_ = player_->positionChanged.connect([this](Duration pos) {
        QMetaObject::invokeMethod(this, [this, pos] {
            panel_->refreshPosition(pos);
            lyricsView_->updateTime(pos);
            captions_->view()->updateTime(pos);
        });
    });
    stateSlot_ = player_->stateChanged.connect([this](PlayerState state) {
        QMetaObject::invokeMethod(this, [this, state] {
            panel_->refreshState(state);
            updateWindowTitle();
        });
    });
    errorSlot_ = player_->errorOccurred.connect([this](const std::string& msg) {
        QMetaObject::invokeMethod(this, [this, msg] {
            statusBar()->showMessage(QString::fromStdString(msg), 5000);
        });
    });

    audioLoader_.loaded.connect([this](std::shared_ptr<AudioDetails> details) {
        QMetaObject::invokeMethod(this, [this, details] {
            panel_->setAudioLoading(false);
            if (auto res = player_->setTrack(details); !res) {
                LOG_ERROR("{}", res.error().message);
                statusBar()->showMessage(QString::fromStdString(res.error().message), 5000);
            }
            panel_->setAudioDetails(player_->track());
            panel_->refreshDuration(player_->duration());
            panel_->refreshPosition(player_->position());
            updateWindowTitle();
            statusBar()->showMessage(
                    "Loaded " + QString::fromStdString(details->fileName), 3000);
        });
    });
    audioLoader_.failed.connect([this](const std::string& msg) {
        LOG_ERROR("Audio: {}", msg);
        QMetaObject::invokeMethod(this, [this, msg] {
            panel_->setAudioLoading(false);
            statusBar()->showMessage(QString::fromStdString(msg), 5000);
        });
    });

    lyricsLoader_.fileSelected.connect(
            [this](const std::filesystem::path& path, const std::string& name) {
                QMetaObject::invokeMethod(this, [this, path, name] {
                    panel_->setLyricsPath(QString::fromStdString(path.string()));
                    pendingLyricsName_ = QString::fromStdString(name);
                });
            });
    lyricsLoader_.loaded.connect([this](std::shared_ptr<lyrics::BabelLyrics> data) {
        QMetaObject::invokeMethod(this, [this, data] {
            panel_->setLyricsLoading(false);
            setLyrics(data, pendingLyricsName_);
        });
    });
    lyricsLoader_.failed.connect([this](const std::string& msg) {
        LOG_ERROR("Lyrics: {}", msg);
        QMetaObject::invokeMethod(this, [this, msg] {
            panel_->setLyricsLoading(false);
            statusBar()->showMessage(QString::fromStdString(msg), 5000);
        });
    });

    connect(panel_, &PlayerPanel::selectAudioRequested, this, &MainWindow::onSelectAudio);
    connect(panel_, &PlayerPanel::selectLyricsRequested, this, &MainWindow::onSelectLyrics);
    connect(panel_, &PlayerPanel::loadFromEditorRequested, this,
            &MainWindow::onLoadFromEditor);
    connect(panel_, &PlayerPanel::editorToggled, editor_, &QWidget::setVisible);
    connect(panel_, &PlayerPanel::lyricsWindowToggled, this,
            &MainWindow::setLyricsWindowVisible);
    connect(panel_, &PlayerPanel::captionsWindowToggled, this,
            &MainWindow::setCaptionsVisible);

    connect(lyricsDock_, &QDockWidget::visibilityChanged, this, [this] {
        panel_->setLyricsWindows(!lyricsDock_->isHidden(), captions_->isVisible());
    });
    connect(captions_, &CaptionsWindow::closed, this, [this] {
        panel_->setLyricsWindows(!lyricsDock_->isHidden(), false);
    });

    connect(editor_, &LyricsEditorWindow::visibilityChanged, panel_,
            &PlayerPanel::setEditorVisible);
    connect(editor_, &LyricsEditorWindow::lyricsAvailabilityChanged, panel_,
            &PlayerPanel::setEditorHasLyrics);
    connect(editor_, &LyricsEditorWindow::statusMessage, this, [this](const QString& msg) {
        statusBar()->showMessage(msg, 5000);
    });
}

void MainWindow::setupUpdateTimer() {
    connect(&updateTimer_, &QTimer::timeout, this, &MainWindow::onUpdateLoop);
    updateTimer_.start(
            static_cast<int>(std::as_const(CONFIG).player().tickIntervalMs));
}

void MainWindow::onUpdateLoop() {
    player_->tick();
}

void MainWindow::updateWindowTitle() {
    QString title = "Babel Player";
    if (const auto* track = player_->track()) {
        QString name = QString::fromStdString(track->info.title.empty()
                                                      ? track->fileName
                                                      : track->info.title);
        if (!track->info.artist.empty())
            name = QString::fromStdString(track->info.artist) + " - " + name;
        title = name + " | " + title;
    }
    if (player_->state() == PlayerState::Playing)
        title = "▶ " + title;
    setWindowTitle(title);
}

void MainWindow::openAudio(const std::filesystem::path& path) {
    if (!audioLoader_.loadAsync(path)) {
        statusBar()->showMessage("An audio file is already loading", 3000);
        return;
    }
    panel_->setAudioPath(QString::fromStdString(path.string()));
    panel_->setAudioLoading(true);
}

void MainWindow::openLyrics(const std::filesystem::path& path) {
    if (!lyricsLoader_.loadAsync(path, lyrics::LyricsFormat::BabelJson)) {
        statusBar()->showMessage("A lyrics file is already loading", 3000);
        return;
    }
    panel_->setLyricsLoading(true);
}

void MainWindow::importTtml(const std::filesystem::path& path) {
    editor_->show();
    editor_->importTtml(path);
}

void MainWindow::setLyrics(std::shared_ptr<const lyrics::BabelLyrics> lyrics,
                           const QString& fileName) {
    lyrics_ = std::move(lyrics);
    lyricsView_->setLyrics(lyrics_);
    captions_->view()->setLyrics(lyrics_);
    lyricsView_->updateTime(player_->position());
    captions_->view()->updateTime(player_->position());

    panel_->setLyricsDetails(fileName, true);
    setLyricsWindowVisible(std::as_const(CONFIG).ui().showLyricsWindow);
    setCaptionsVisible(std::as_const(CONFIG).ui().showCaptionsWindow);

    LOG_INFO("Lyrics: {} lines, {} translations from {}",
             lyrics_->lyrics.lines.size(),
             lyrics_->metadata.translations.size(),
             fileName.toStdString());
}

void MainWindow::setLyricsWindowVisible(bool visible) {
    lyricsDock_->setVisible(visible);
    panel_->setLyricsWindows(visible, captions_->isVisible());
}

void MainWindow::setCaptionsVisible(bool visible) {
    captions_->setVisible(visible);
    panel_->setLyricsWindows(!lyricsDock_->isHidden(), visible);
}

void MainWindow::openPath(const std::filesystem::path& path) {
    if (file::hasExtension(path, file::audioExtensions))
        openAudio(path);
    else if (file::hasExtension(path, file::lyricsExtensions))
        openLyrics(path);
    else if (file::hasExtension(path, file::ttmlExtensions))
        importTtml(path);
    else
        LOG_WARN("Ignoring dropped file with unknown type: {}", path.string());
}

void MainWindow::onSelectAudio() {
    QFileDialog dialog(this,
                       "Select Audio File",
                       dirOrHome(std::as_const(CONFIG).paths().lastAudioDir));
    dialog.setNameFilters(
            {"Audio Files (*.mp3 *.flac *.ogg *.opus *.wav *.m4a *.aac)",
             "All Files (*)"});
    dialog.setFileMode(QFileDialog::ExistingFile);
    dialog.setOption(QFileDialog::DontUseNativeDialog, true);
    if (!dialog.exec())
        return;

    fs::path path(dialog.selectedFiles().first().toStdString());
    CONFIG.paths().lastAudioDir = path.parent_path();
    openAudio(path);
}

void MainWindow::onSelectLyrics() {
    const auto& lastDir = std::as_const(CONFIG).paths().lastLyricsDir;
    QString path = QFileDialog::getOpenFileName(this,
                                                "Select lyrics file",
                                                dirOrHome(lastDir),
                                                "JSON (*.json)",
                                                nullptr,
                                                QFileDialog::DontUseNativeDialog);
    if (path.isEmpty())
        return;

    fs::path p(path.toStdString());
    CONFIG.paths().lastLyricsDir = p.parent_path();
    openLyrics(p);
}

void MainWindow::onLoadFromEditor() {
    const auto* edited = editor_->lyrics();
    if (!edited)
        return;
    panel_->setLyricsPath("From editor");
    setLyrics(std::make_shared<const lyrics::BabelLyrics>(*edited), "From editor");
}

void MainWindow::onShowSettings() {
    SettingsDialog dialog(this);
    if (dialog.exec() == QDialog::Accepted) {
        lyricsView_->updateStyle();
        captions_->applySettings();
        updateTimer_.setInterval(
                static_cast<int>(std::as_const(CONFIG).player().tickIntervalMs));
    }
}

void MainWindow::onShowAbout() {
    QMessageBox::about(
            this,
            "About Babel Player",
            "<h2>Babel Player</h2><p>Version 0.1.0</p>"
            "<p>Plays music with word-by-word synchronized lyrics and "
            "translations.</p>"
            "<p>Built with Qt6, SDL2_mixer and FFmpeg.</p>");
}

void MainWindow::closeEvent(QCloseEvent* event) {
    captions_->close();
    editor_->close();
    if (CONFIG.isDirty()) {
        if (auto res = CONFIG.save(CONFIG.configPath()); !res)
            LOG_ERROR("Failed to save config: {}", res.error().message);
    }
    event->accept();
}

void MainWindow::dragEnterEvent(QDragEnterEvent* event) {
    if (event->mimeData()->hasUrls())
        event->acceptProposedAction();
}

void MainWindow::dropEvent(QDropEvent* event) {
    for (const auto& url : event->mimeData()->urls()) {
        if (url.isLocalFile())
            openPath(fs::path(url.toLocalFile().toStdString()));
    }
}

} // namespace babel
