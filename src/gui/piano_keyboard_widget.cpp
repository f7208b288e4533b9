#include "airchord/gui/piano_keyboard_widget.hpp"

#include <QPainter>
#include <QMouseEvent>
#include <QDebug>

namespace airchord {
namespace gui {

namespace {
const QColor WHITE_KEY_COLOR("#FFFFFF");
const QColor BLACK_KEY_COLOR("#000000");
const QColor SELECTED_COLOR("#FF4444");
const QColor HIGHLIGHTED_COLOR("#4444FF");
const QColor BORDER_COLOR("#CCCCCC");
constexpr qreal MARGIN = 10.0;
constexpr qreal BLACK_KEY_WIDTH_RATIO = 0.6;
constexpr qreal BLACK_KEY_HEIGHT_RATIO = 0.6;
}

PianoKeyboardWidget::PianoKeyboardWidget(QWidget* parent)
    : QWidget(parent)
{
    setMinimumHeight(120);
    setMouseTracking(false);
    layoutKeys();
}

QSize PianoKeyboardWidget::sizeHint() const {
    return QSize(900, 200);
}

bool PianoKeyboardWidget::isBlackKey(int note) {
    switch (note % 12) {
        case 1: case 3: case 6: case 8: case 10:
            return true;
        default:
            return false;
    }
}

void PianoKeyboardWidget::setSelectedNotes(const QSet<int>& notes, bool notify) {
    selected_notes_ = notes;
    update();
    if (notify) {
        emit notesChanged(selected_notes_);
    }
}

void PianoKeyboardWidget::setHighlightedNotes(const QSet<int>& notes) {
    highlighted_notes_ = notes;
    update();
}

void PianoKeyboardWidget::clearHighlight() {
    setHighlightedNotes(QSet<int>());
}

void PianoKeyboardWidget::layoutKeys() {
    key_rects_.clear();

    int white_count = 0;
    for (int note = FIRST_NOTE; note <= LAST_NOTE; ++note) {
        if (!isBlackKey(note)) {
            ++white_count;
        }
    }

    const qreal white_width = (width() - 2 * MARGIN) / white_count;
    const qreal white_height = height() - 2 * MARGIN;
    const qreal black_width = white_width * BLACK_KEY_WIDTH_RATIO;
    const qreal black_height = height() * BLACK_KEY_HEIGHT_RATIO;

    int white_index = 0;
    for (int note = FIRST_NOTE; note <= LAST_NOTE; ++note) {
        if (isBlackKey(note)) {
            // Centered on the boundary with the previous white key
            qreal x = MARGIN + white_index * white_width - black_width / 2.0;
            key_rects_[note] = QRectF(x, MARGIN, black_width, black_height);
        } else {
            qreal x = MARGIN + white_index * white_width;
            key_rects_[note] = QRectF(x, MARGIN, white_width, white_height);
            ++white_index;
        }
    }
}

int PianoKeyboardWidget::noteAt(const QPointF& pos) const {
    for (auto it = key_rects_.constBegin(); it != key_rects_.constEnd(); ++it) {
        if (isBlackKey(it.key()) && it.value().contains(pos)) {
            return it.key();
        }
    }
    for (auto it = key_rects_.constBegin(); it != key_rects_.constEnd(); ++it) {
        if (!isBlackKey(it.key()) && it.value().contains(pos)) {
            return it.key();
        }
    }
    return -1;
}

void PianoKeyboardWidget::toggleNote(int note) {
    if (selected_notes_.contains(note)) {
        selected_notes_.remove(note);
    } else {
        selected_notes_.insert(note);
    }
    update();
    emit notesChanged(selected_notes_);
}

void PianoKeyboardWidget::paintEvent(QPaintEvent* /*event*/) {
    QPainter painter(this);
    painter.setRenderHint(QPainter::Antialiasing, false);
    painter.fillRect(rect(), Qt::white);

    auto keyColor = [this](int note) {
        if (selected_notes_.contains(note)) {
            return SELECTED_COLOR;
        }
        if (highlighted_notes_.contains(note)) {
            return HIGHLIGHTED_COLOR;
        }
        return isBlackKey(note) ? BLACK_KEY_COLOR : WHITE_KEY_COLOR;
    };

    // White keys first, black keys on top
    for (int pass = 0; pass < 2; ++pass) {
        const bool black = (pass == 1);
        for (auto it = key_rects_.constBegin(); it != key_rects_.constEnd(); ++it) {
            if (isBlackKey(it.key()) != black) {
                continue;
            }
            painter.setPen(BORDER_COLOR);
            painter.setBrush(keyColor(it.key()));
            painter.drawRect(it.value());

            if (!black && it.key() % 12 == 0) {
                painter.setPen(Qt::gray);
                QRectF label = it.value().adjusted(0, it.value().height() - 20, 0, 0);
                painter.drawText(label, Qt::AlignCenter,
                                 QString("C%1").arg(it.key() / 12 - 1));
            }
        }
    }
}

void PianoKeyboardWidget::resizeEvent(QResizeEvent* event) {
    QWidget::resizeEvent(event);
    layoutKeys();
}

void PianoKeyboardWidget::mousePressEvent(QMouseEvent* event) {
    int note = noteAt(event->pos());
    if (note >= 0) {
        toggleNote(note);
    }
}

void PianoKeyboardWidget::mouseMoveEvent(QMouseEvent* event) {
    if (!(event->buttons() & Qt::LeftButton)) {
        return;
    }
    int note = noteAt(event->pos());
    if (note >= 0 && !selected_notes_.contains(note)) {
        selected_notes_.insert(note);
        update();
        emit notesChanged(selected_notes_);
    }
}

} // namespace gui
} // namespace airchord
