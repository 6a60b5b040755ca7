#include "LineEditor.hpp"
#include "Colors.hpp"
#include "TimeEdit.hpp"
#include "core/Logger.hpp"

#include <QCheckBox>
#include <QGridLayout>
#include <QGroupBox>
#include <QHBoxLayout>
#include <QLabel>
#include <QLineEdit>
#include <QPushButton>
#include <QToolButton>
#include <QVBoxLayout>

namespace babel {

namespace {
const QString kSpace = QStringLiteral("(space)");

QLabel* spaceLabel(QWidget* parent) {
    auto* label = new QLabel(kSpace, parent);
    label->setStyleSheet(QString("color: %1;").arg(colors::GRAY_500.name()));
    return label;
}

QString segmentTitle(const std::string& text) {
    return text == " " ? kSpace : QString::fromStdString(text);
}

QToolButton* iconButton(const QString& text,
                        const QString& tip,
                        QWidget* parent) {
    auto* btn = new QToolButton(parent);
    btn->setText(text);
    btn->setToolTip(tip);
    btn->setAutoRaise(true);
    return btn;
}
} // namespace

LineEditor::LineEditor(QWidget* parent) : QWidget(parent) {
    layout_ = new QVBoxLayout(this);
    layout_->setContentsMargins(4, 4, 4, 4);
}

void LineEditor::setDocument(lyrics::LyricsDocument* doc) {
    doc_ = doc;
    line_.reset();
    rebuild();
}

void LineEditor::setLine(std::optional<size_t> line) {
    line_ = line;
    rebuild();
}

void LineEditor::scheduleRebuild() {
    if (rebuildPending_)
        return;
    rebuildPending_ = true;
    QMetaObject::invokeMethod(
            this, [this] { rebuild(); }, Qt::QueuedConnection);
}

bool LineEditor::apply(Result<void> result) {
    if (!result) {
        LOG_WARN("Lyrics edit rejected: {}", result.error().message);
        return false;
    }
    emit documentChanged();
    return true;
}

void LineEditor::rebuild() {
    rebuildPending_ = false;
    segmentLabels_.clear();
    if (content_) {
        layout_->removeWidget(content_);
        content_->deleteLater();
        content_ = nullptr;
    }

    if (!doc_ || !line_ || !doc_->line(*line_)) {
        line_.reset();
        auto* empty = new QLabel("Select a line to edit it.", this);
        empty->setAlignment(Qt::AlignCenter);
        empty->setStyleSheet(QString("color: %1;").arg(colors::GRAY_500.name()));
        content_ = empty;
        layout_->addWidget(content_);
        return;
    }

    size_t index = *line_;
    segmentLabels_.resize(doc_->line(index)->original.size());

    content_ = new QWidget(this);
    auto* v = new QVBoxLayout(content_);
    v->setContentsMargins(0, 0, 0, 0);
    v->addWidget(buildHeader(index));
    v->addWidget(buildTranslations(index));
    v->addWidget(buildSegments(index));
    v->addStretch();
    layout_->addWidget(content_);
}

QWidget* LineEditor::buildHeader(size_t index) {
    const auto* line = doc_->line(index);
    auto* w = new QWidget(content_);
    auto* grid = new QGridLayout(w);
    grid->setContentsMargins(0, 0, 0, 0);

    grid->addWidget(new QLabel("Agent", w), 0, 0);
    auto* agentEdit = new QLineEdit(QString::fromStdString(line->agentId), w);
    agentEdit->setPlaceholderText("v1");
    grid->addWidget(agentEdit, 0, 1, 1, 3);
    connect(agentEdit, &QLineEdit::textEdited, this, [this, index](const QString& text) {
        apply(doc_->setAgent(index, text.toStdString()));
    });

    grid->addWidget(new QLabel("Line", w), 1, 0);
    auto* beginEdit = new TimeEdit(w);
    auto* endEdit = new TimeEdit(w);
    beginEdit->setTime(line->begin);
    endEdit->setTime(line->end);
    grid->addWidget(beginEdit, 1, 1);
    grid->addWidget(new QLabel("-", w), 1, 2);
    grid->addWidget(endEdit, 1, 3);
    auto updateTimes = [this, index, beginEdit, endEdit] {
        apply(doc_->setLineTimes(index, beginEdit->time(), endEdit->time()));
    };
    connect(beginEdit, &TimeEdit::timeChanged, this, updateTimes);
    connect(endEdit, &TimeEdit::timeChanged, this, updateTimes);

    auto* removeBtn = new QPushButton("Remove Line", w);
    grid->addWidget(removeBtn, 0, 4);
    connect(removeBtn, &QPushButton::clicked, this, [this, index] {
        if (apply(doc_->removeLine(index))) {
            line_.reset();
            scheduleRebuild();
            emit lineRemoved(index);
        }
    });

    grid->setColumnStretch(5, 1);
    return w;
}

QWidget* LineEditor::buildTranslations(size_t index) {
    auto* box = new QGroupBox("Translation", content_);
    auto* v = new QVBoxLayout(box);

    const auto& meta = doc_->lyrics().metadata;
    if (meta.translations.empty()) {
        auto* hint = new QLabel("No translation languages. Add one above.", box);
        hint->setStyleSheet(QString("color: %1;").arg(colors::GRAY_500.name()));
        v->addWidget(hint);
    }

    for (const auto& entry : meta.translations) {
        auto* langBox = new QGroupBox(QString::fromStdString(entry.language), box);
        langBox->setCheckable(true);
        langBox->setChecked(false);
        auto* lv = new QVBoxLayout(langBox);
        auto* grid = buildTranslationGrid(index, entry.id);
        grid->setVisible(false);
        lv->addWidget(grid);
        connect(langBox, &QGroupBox::toggled, grid, &QWidget::setVisible);
        v->addWidget(langBox);
    }
    return box;
}

QWidget* LineEditor::buildTranslationGrid(size_t index, const lyrics::Uuid& language) {
    auto* w = new QWidget();
    auto* grid = new QGridLayout(w);
    grid->setContentsMargins(0, 0, 0, 0);

    const auto* line = doc_->line(index);
    const auto* words = doc_->translationWords(index, language);
    size_t wordCount = words ? words->size() : 0;

    auto* original = new QLabel("(Original)", w);
    original->setStyleSheet(QString("color: %1;").arg(colors::GRAY_500.name()));
    grid->addWidget(original, 0, 0);

    for (size_t i = 0; i < wordCount; ++i) {
        auto* cell = new QWidget(w);
        auto* h = new QHBoxLayout(cell);
        h->setContentsMargins(0, 0, 0, 0);
        h->setSpacing(2);

        auto* del = iconButton("✕", "Remove word", cell);
        h->addWidget(del);
        connect(del, &QToolButton::clicked, this, [this, index, language, i] {
            if (apply(doc_->removeTranslationWord(index, language, i)))
                scheduleRebuild();
        });

        const auto& word = (*words)[i];
        if (word == " ") {
            h->addWidget(spaceLabel(cell));
        } else {
            auto* edit = new QLineEdit(QString::fromStdString(word), cell);
            edit->setMinimumWidth(60);
            h->addWidget(edit);
            connect(edit, &QLineEdit::textEdited, this,
                    [this, index, language, i](const QString& text) {
                        apply(doc_->setTranslationWord(index, language, i,
                                                       text.toStdString()));
                    });
        }
        grid->addWidget(cell, 0, static_cast<int>(i) + 1);
    }

    auto* add = iconButton("+", "Add word", w);
    grid->addWidget(add, 0, static_cast<int>(wordCount) + 1);
    connect(add, &QToolButton::clicked, this, [this, index, language] {
        auto res = doc_->addTranslationWord(index, language);
        if (!res) {
            LOG_WARN("Lyrics edit rejected: {}", res.error().message);
            return;
        }
        emit documentChanged();
        scheduleRebuild();
    });

    for (size_t s = 0; s < line->original.size(); ++s) {
        int row = static_cast<int>(s) + 1;
        const auto& text = line->original[s].text;
        QLabel* label = text == " " ? spaceLabel(w)
                                    : new QLabel(segmentTitle(text), w);
        segmentLabels_[s].push_back(label);
        grid->addWidget(label, row, 0);

        for (size_t i = 0; i < wordCount; ++i) {
            auto* check = new QCheckBox(w);
            check->setChecked(doc_->isLinked(index, s, language, i));
            grid->addWidget(check, row, static_cast<int>(i) + 1, Qt::AlignCenter);
            connect(check, &QCheckBox::toggled, this,
                    [this, index, s, language, i](bool linked) {
                        apply(doc_->setLink(index, s, language, i, linked));
                    });
        }
    }

    grid->setColumnStretch(static_cast<int>(wordCount) + 2, 1);
    return w;
}

QWidget* LineEditor::buildSegments(size_t index) {
    auto* box = new QGroupBox("Segments", content_);
    auto* grid = new QGridLayout(box);

    int col = 0;
    for (const char* title : {"Options", "Start", "End", "Text"}) {
        auto* header = new QLabel(title, box);
        header->setStyleSheet(QString("color: %1;").arg(colors::GRAY_500.name()));
        grid->addWidget(header, 0, col++);
    }

    const auto* line = doc_->line(index);
    size_t count = line->original.size();
    for (size_t s = 0; s < count; ++s) {
        const auto& seg = line->original[s];
        int row = static_cast<int>(s) + 1;

        auto* options = new QWidget(box);
        auto* h = new QHBoxLayout(options);
        h->setContentsMargins(0, 0, 0, 0);
        h->setSpacing(2);

        auto* del = iconButton("✕", "Remove segment", options);
        auto* insert = iconButton("+", "Insert segment after", options);
        h->addWidget(del);
        h->addWidget(insert);
        connect(del, &QToolButton::clicked, this, [this, index, s] {
            if (apply(doc_->removeSegment(index, s))) {
                emit lineTextChanged(index);
                scheduleRebuild();
            }
        });
        connect(insert, &QToolButton::clicked, this, [this, index, s] {
            if (apply(doc_->insertSegment(index, s + 1)))
                scheduleRebuild();
        });

        if (s != 0) {
            auto* up = iconButton("↑", "Move up", options);
            h->addWidget(up);
            connect(up, &QToolButton::clicked, this, [this, index, s] {
                if (apply(doc_->moveSegment(index, s, s - 1))) {
                    emit lineTextChanged(index);
                    scheduleRebuild();
                }
            });
        }
        if (s + 1 != count) {
            auto* down = iconButton("↓", "Move down", options);
            h->addWidget(down);
            connect(down, &QToolButton::clicked, this, [this, index, s] {
                if (apply(doc_->moveSegment(index, s, s + 1))) {
                    emit lineTextChanged(index);
                    scheduleRebuild();
                }
            });
        }
        h->addStretch();
        grid->addWidget(options, row, 0);

        auto* beginEdit = new TimeEdit(box);
        auto* endEdit = new TimeEdit(box);
        beginEdit->setTime(seg.begin);
        endEdit->setTime(seg.end);
        grid->addWidget(beginEdit, row, 1);
        grid->addWidget(endEdit, row, 2);
        auto updateTimes = [this, index, s, beginEdit, endEdit] {
            apply(doc_->setSegmentTimes(index, s, beginEdit->time(), endEdit->time()));
        };
        connect(beginEdit, &TimeEdit::timeChanged, this, updateTimes);
        connect(endEdit, &TimeEdit::timeChanged, this, updateTimes);

        if (seg.text == " ") {
            grid->addWidget(spaceLabel(box), row, 3);
        } else {
            auto* edit = new QLineEdit(QString::fromStdString(seg.text), box);
            edit->setMinimumWidth(200);
            grid->addWidget(edit, row, 3);
            connect(edit, &QLineEdit::textEdited, this,
                    [this, index, s](const QString& text) {
                        if (!apply(doc_->setSegmentText(index, s, text.toStdString())))
                            return;
                        for (auto* label : segmentLabels_[s])
                            label->setText(segmentTitle(text.toStdString()));
                        emit lineTextChanged(index);
                    });
        }
    }

    if (count == 0) {
        auto* add = new QPushButton("+ Add Segment", box);
        grid->addWidget(add, 1, 0);
        connect(add, &QPushButton::clicked, this, [this, index] {
            if (apply(doc_->insertSegment(index, 0)))
                scheduleRebuild();
        });
    }

    grid->setColumnStretch(3, 1);
    return box;
}

} // namespace babel
