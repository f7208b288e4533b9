#pragma once

#include <QWidget>
#include <QSet>
#include <QRectF>
#include <QMap>

namespace airchord {
namespace gui {

/**
 * @brief Clickable piano keyboard used to edit chord notes
 *
 * Spans A0 (21) to C8 (108). Clicking a key toggles it in the selection,
 * dragging adds keys. Highlighted notes (chord playing from a gesture) are
 * drawn in a second colour and never change the selection.
 */
class PianoKeyboardWidget : public QWidget {
    Q_OBJECT

public:
    static constexpr int FIRST_NOTE = 21;
    static constexpr int LAST_NOTE = 108;

    explicit PianoKeyboardWidget(QWidget* parent = nullptr);

    /**
     * @brief Replace the selection
     * @param notify Emit notesChanged() for the new selection
     */
    void setSelectedNotes(const QSet<int>& notes, bool notify = false);
    QSet<int> selectedNotes() const { return selected_notes_; }

    void setHighlightedNotes(const QSet<int>& notes);
    void clearHighlight();

    static bool isBlackKey(int note);

    /**
     * @brief Note under a widget position (black keys take precedence)
     * @return MIDI note, or -1 outside the keyboard
     */
    int noteAt(const QPointF& pos) const;

    QSize sizeHint() const override;

signals:
    void notesChanged(const QSet<int>& notes);

protected:
    void paintEvent(QPaintEvent* event) override;
    void resizeEvent(QResizeEvent* event) override;
    void mousePressEvent(QMouseEvent* event) override;
    void mouseMoveEvent(QMouseEvent* event) override;

private:
    void layoutKeys();
    void toggleNote(int note);

    QSet<int> selected_notes_;
    QSet<int> highlighted_notes_;
    QMap<int, QRectF> key_rects_;
};

} // namespace gui
} // namespace airchord
