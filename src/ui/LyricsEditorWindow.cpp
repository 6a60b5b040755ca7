#include "LyricsEditorWindow.hpp"
#include "Colors.hpp"
#include "LineEditor.hpp"
#include "core/Config.hpp"
#include "core/Logger.hpp"
#include "lyrics/LyricsJson.hpp"

#include <QDir>
#include <QFileDialog>
#include <QFileInfo>
#include <QFrame>
#include <QGridLayout>
#include <QGroupBox>
#include <QHBoxLayout>
#include <QLabel>
#include <QLineEdit>
#include <QListWidget>
#include <QMessageBox>
#include <QProgressBar>
#include <QPushButton>
#include <QScrollArea>
#include <QSignalBlocker>
#include <QSplitter>
#include <QToolButton>
#include <QVBoxLayout>
#include <utility>

namespace babel {

namespace {
const QString kNone = QStringLiteral("-");

QString lineTitle(const lyrics::LyricsLine& line, size_t index) {
    auto text = QString::fromStdString(lyrics::lineText(line));
    if (text.trimmed().isEmpty())
        text = QString("(empty line %1)").arg(index + 1);
    return text;
}

QString startDir() {
    const auto& dir = std::as_const(CONFIG).paths().lastLyricsDir;
    return dir.empty() ? QDir::homePath() : QString::fromStdString(dir.string());
}
} // namespace

LyricsEditorWindow::LyricsEditorWindow(QWidget* parent)
    : QWidget(parent, Qt::Window) {
    setWindowTitle("Lyrics Editor");
    resize(1000, 760);
    setupUI();
    connectLoader();
    refreshDetails();
}

LyricsEditorWindow::~LyricsEditorWindow() {
    loader_.fileSelected.disconnectAll();
    loader_.loaded.disconnectAll();
    loader_.failed.disconnectAll();
}

const lyrics::BabelLyrics* LyricsEditorWindow::lyrics() const {
    return document_ ? &document_->lyrics() : nullptr;
}

void LyricsEditorWindow::setupUI() {
    auto* layout = new QVBoxLayout(this);

    auto* topRow = new QHBoxLayout();
    importBtn_ = new QPushButton("Import AMLL TTML", this);
    importBtn_->setToolTip(
            QString("<p>Import AMLL TTML file to edit lyrics.</p>"
                    "<p>You may wish to check <span style=\"color: %1;\">"
                    "[ AMLL TTML Tool ]</span> "
                    "(https://steve-xmh.github.io/amll-ttml-tool/) "
                    "to create a word-by-word lyrics file first.</p>")
                    .arg(colors::BLUE_300.name()));
    selectBtn_ = new QPushButton("Select lyrics file", this);
    busy_ = new QProgressBar(this);
    busy_->setRange(0, 0);
    busy_->setTextVisible(false);
    busy_->setMaximumWidth(80);
    busy_->setMaximumHeight(12);
    busy_->hide();
    pathLabel_ = new QLabel(this);
    pathLabel_->setTextInteractionFlags(Qt::TextSelectableByMouse);
    topRow->addWidget(importBtn_);
    topRow->addWidget(selectBtn_);
    topRow->addWidget(busy_);
    topRow->addWidget(pathLabel_, 1);
    layout->addLayout(topRow);

    auto* exportRow = new QHBoxLayout();
    exportBtn_ = new QPushButton("Export Babel Lyrics", this);
    exportBtn_->setEnabled(false);
    exportRow->addWidget(exportBtn_);
    exportRow->addStretch();
    layout->addLayout(exportRow);

    auto* sep1 = new QFrame(this);
    sep1->setFrameShape(QFrame::HLine);
    layout->addWidget(sep1);

    auto* details = new QGridLayout();
    details->addWidget(new QLabel("File name", this), 0, 0);
    fileNameValue_ = new QLabel(kNone, this);
    details->addWidget(fileNameValue_, 0, 1);
    details->addWidget(new QLabel("Lyrics data", this), 1, 0);
    dataValue_ = new QLabel(kNone, this);
    details->addWidget(dataValue_, 1, 1);
    details->setColumnStretch(1, 1);
    layout->addLayout(details);

    auto* sep2 = new QFrame(this);
    sep2->setFrameShape(QFrame::HLine);
    layout->addWidget(sep2);

    // Everything below needs a document
    body_ = new QWidget(this);
    auto* bodyLayout = new QVBoxLayout(body_);
    bodyLayout->setContentsMargins(0, 0, 0, 0);

    auto* languagesBox = new QGroupBox("Translations", body_);
    languagesBox->setCheckable(true);
    languagesBox->setChecked(true);
    auto* languagesOuter = new QVBoxLayout(languagesBox);
    auto* languagesContent = new QWidget(languagesBox);
    languagesLayout_ = new QVBoxLayout(languagesContent);
    languagesLayout_->setContentsMargins(0, 0, 0, 0);
    languagesOuter->addWidget(languagesContent);
    auto* addLanguageBtn = new QPushButton("Add Language", languagesBox);
    languagesOuter->addWidget(addLanguageBtn, 0, Qt::AlignLeft);
    connect(languagesBox, &QGroupBox::toggled, languagesContent, &QWidget::setVisible);
    connect(languagesBox, &QGroupBox::toggled, addLanguageBtn, &QWidget::setVisible);
    bodyLayout->addWidget(languagesBox);

    auto* splitter = new QSplitter(Qt::Horizontal, body_);

    auto* linesPane = new QWidget(splitter);
    auto* linesLayout = new QVBoxLayout(linesPane);
    linesLayout->setContentsMargins(0, 0, 0, 0);
    lineList_ = new QListWidget(linesPane);
    linesLayout->addWidget(lineList_, 1);
    auto* addLineBtn = new QPushButton("+ Add Line", linesPane);
    linesLayout->addWidget(addLineBtn);
    splitter->addWidget(linesPane);

    auto* scroll = new QScrollArea(splitter);
    scroll->setWidgetResizable(true);
    lineEditor_ = new LineEditor(scroll);
    scroll->setWidget(lineEditor_);
    splitter->addWidget(scroll);
    splitter->setStretchFactor(0, 1);
    splitter->setStretchFactor(1, 3);
    bodyLayout->addWidget(splitter, 1);

    body_->setEnabled(false);
    layout->addWidget(body_, 1);

    connect(importBtn_, &QPushButton::clicked, this, &LyricsEditorWindow::onImportClicked);
    connect(selectBtn_, &QPushButton::clicked, this, &LyricsEditorWindow::onSelectClicked);
    connect(exportBtn_, &QPushButton::clicked, this, &LyricsEditorWindow::onExportClicked);

    connect(addLanguageBtn, &QPushButton::clicked, this, [this] {
        if (!document_)
            return;
        document_->addLanguage("");
        refreshLanguages();
        lineEditor_->rebuild();
    });

    connect(addLineBtn, &QPushButton::clicked, this, [this] {
        if (!document_)
            return;
        size_t index = document_->addLine();
        refreshLines();
        lineList_->setCurrentRow(static_cast<int>(index));
    });

    connect(lineList_, &QListWidget::currentRowChanged, this, [this](int row) {
        if (row < 0)
            lineEditor_->setLine(std::nullopt);
        else
            lineEditor_->setLine(static_cast<size_t>(row));
    });

    connect(lineEditor_, &LineEditor::lineTextChanged, this,
            &LyricsEditorWindow::refreshLineTitle);
    connect(lineEditor_, &LineEditor::lineRemoved, this, [this](size_t) {
        refreshLines();
    });
}

void LyricsEditorWindow::connectLoader() {
    loader_.fileSelected.connect(
            [this](const std::filesystem::path& path, const std::string& name) {
                QMetaObject::invokeMethod(this, [this, path, name] {
                    pathLabel_->setText(QString::fromStdString(path.string()));
                    fileName_ = QString::fromStdString(name);
                    refreshDetails();
                });
            });

    loader_.loaded.connect([this](std::shared_ptr<lyrics::BabelLyrics> data) {
        QMetaObject::invokeMethod(this, [this, data] {
            setLoading(false);
            setLyrics(std::move(*data), fileName_);
            LOG_INFO("Editor: {} lines loaded from {}",
                     document_->lineCount(),
                     fileName_.toStdString());
        });
    });

    loader_.failed.connect([this](const std::string& message) {
        LOG_ERROR("Editor: {}", message);
        QMetaObject::invokeMethod(this, [this, message] {
            setLoading(false);
            emit statusMessage(QString::fromStdString(message));
        });
    });
}

void LyricsEditorWindow::setLoading(bool loading) {
    importBtn_->setEnabled(!loading);
    selectBtn_->setEnabled(!loading);
    busy_->setVisible(loading);
    pathLabel_->setVisible(!loading);
}

void LyricsEditorWindow::load(const std::filesystem::path& path,
                              lyrics::LyricsFormat format) {
    if (!loader_.loadAsync(path, format)) {
        emit statusMessage("A lyrics file is already loading");
        return;
    }
    setLoading(true);
}

void LyricsEditorWindow::importTtml(const std::filesystem::path& path) {
    load(path, lyrics::LyricsFormat::AmllTtml);
}

void LyricsEditorWindow::openLyrics(const std::filesystem::path& path) {
    load(path, lyrics::LyricsFormat::BabelJson);
}

void LyricsEditorWindow::setLyrics(lyrics::BabelLyrics lyrics,
                                   const QString& fileName) {
    fileName_ = fileName;
    document_ = std::make_unique<lyrics::LyricsDocument>(std::move(lyrics));
    lineEditor_->setDocument(document_.get());
    body_->setEnabled(true);
    exportBtn_->setEnabled(true);
    refreshDetails();
    refreshLanguages();
    {
        QSignalBlocker blocker(lineList_);
        lineList_->clear();
    }
    refreshLines();
    emit lyricsAvailabilityChanged(true);
}

void LyricsEditorWindow::onImportClicked() {
    QString path = QFileDialog::getOpenFileName(this,
                                                "Import AMLL TTML",
                                                startDir(),
                                                "TTML Lyrics (*.ttml)",
                                                nullptr,
                                                QFileDialog::DontUseNativeDialog);
    if (path.isEmpty())
        return;
    std::filesystem::path p(path.toStdString());
    CONFIG.paths().lastLyricsDir = p.parent_path();
    importTtml(p);
}

void LyricsEditorWindow::onSelectClicked() {
    QString path = QFileDialog::getOpenFileName(this,
                                                "Select lyrics file",
                                                startDir(),
                                                "JSON (*.json)",
                                                nullptr,
                                                QFileDialog::DontUseNativeDialog);
    if (path.isEmpty())
        return;
    std::filesystem::path p(path.toStdString());
    CONFIG.paths().lastLyricsDir = p.parent_path();
    openLyrics(p);
}

void LyricsEditorWindow::onExportClicked() {
    if (!document_)
        return;

    QString suggested = startDir();
    if (!fileName_.isEmpty())
        suggested += "/" + QFileInfo(fileName_).completeBaseName() + ".json";

    QString path = QFileDialog::getSaveFileName(this,
                                                "Export Babel Lyrics",
                                                suggested,
                                                "JSON (*.json)",
                                                nullptr,
                                                QFileDialog::DontUseNativeDialog);
    if (path.isEmpty())
        return;
    if (!path.endsWith(".json", Qt::CaseInsensitive))
        path += ".json";

    std::filesystem::path p(path.toStdString());
    if (auto res = lyrics::LyricsJson::saveFile(p, document_->lyrics()); !res) {
        LOG_ERROR("Export failed: {}", res.error().message);
        QMessageBox::critical(this,
                              "Export Error",
                              QString::fromStdString(res.error().message));
        return;
    }
    CONFIG.paths().lastLyricsDir = p.parent_path();
    LOG_INFO("Exported lyrics to {}", p.string());
    emit statusMessage("Exported " + path);
}

void LyricsEditorWindow::refreshDetails() {
    fileNameValue_->setText(fileName_.isEmpty() ? kNone : fileName_);
    dataValue_->setText(document_ ? QStringLiteral("✓ In memory") : kNone);
}

void LyricsEditorWindow::refreshLanguages() {
    while (auto* item = languagesLayout_->takeAt(0)) {
        if (auto* w = item->widget()) {
            w->hide();
            w->deleteLater();
        }
        delete item;
    }
    if (!document_)
        return;

    for (const auto& entry : document_->lyrics().metadata.translations) {
        auto* row = new QWidget();
        auto* h = new QHBoxLayout(row);
        h->setContentsMargins(0, 0, 0, 0);

        auto* del = new QToolButton(row);
        del->setText("✕");
        del->setToolTip("Remove language");
        del->setAutoRaise(true);
        auto* nameEdit = new QLineEdit(QString::fromStdString(entry.language), row);
        nameEdit->setPlaceholderText("Language");
        auto* idLabel = new QLabel(QString::fromStdString(entry.id), row);
        idLabel->setStyleSheet(QString("color: %1;").arg(colors::GRAY_500.name()));
        idLabel->setTextInteractionFlags(Qt::TextSelectableByMouse);
        h->addWidget(del);
        h->addWidget(nameEdit, 1);
        h->addWidget(idLabel);

        lyrics::Uuid id = entry.id;
        connect(del, &QToolButton::clicked, this, [this, id] {
            if (auto res = document_->removeLanguage(id); !res) {
                LOG_WARN("{}", res.error().message);
                return;
            }
            // Queued: the refresh deletes the row this button lives in
            QMetaObject::invokeMethod(this, [this] {
                refreshLanguages();
                lineEditor_->rebuild();
            }, Qt::QueuedConnection);
        });
        connect(nameEdit, &QLineEdit::editingFinished, this, [this, id, nameEdit] {
            if (auto res = document_->renameLanguage(id, nameEdit->text().toStdString()); !res) {
                LOG_WARN("{}", res.error().message);
                return;
            }
            lineEditor_->rebuild();
        });

        languagesLayout_->addWidget(row);
    }
}

void LyricsEditorWindow::refreshLines() {
    int current = lineList_->currentRow();
    QSignalBlocker blocker(lineList_);
    lineList_->clear();
    if (document_) {
        for (size_t i = 0; i < document_->lineCount(); ++i)
            lineList_->addItem(lineTitle(*document_->line(i), i));
    }
    if (current >= lineList_->count())
        current = lineList_->count() - 1;
    lineList_->setCurrentRow(current);

    if (current < 0)
        lineEditor_->setLine(std::nullopt);
    else
        lineEditor_->setLine(static_cast<size_t>(current));
}

void LyricsEditorWindow::refreshLineTitle(size_t line) {
    if (!document_ || !document_->line(line))
        return;
    if (auto* item = lineList_->item(static_cast<int>(line)))
        item->setText(lineTitle(*document_->line(line), line));
}

void LyricsEditorWindow::showEvent(QShowEvent* event) {
    QWidget::showEvent(event);
    emit visibilityChanged(true);
}

void LyricsEditorWindow::hideEvent(QHideEvent* event) {
    QWidget::hideEvent(event);
    emit visibilityChanged(false);
}

} // namespace babel
