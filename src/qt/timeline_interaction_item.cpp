#include <entrylog/qt/timeline_interaction_item.h>
#include <entrylog/core/constants.h>

#include <QMouseEvent>
#include <QWheelEvent>

namespace entrylog {

Timeline_interaction_item::Timeline_interaction_item(QQuickItem* parent)
:
    QQuickItem(parent)
{
    setAcceptedMouseButtons(Qt::LeftButton);
}

Timeline_interaction_item::~Timeline_interaction_item() = default;

Timeline_controller* Timeline_interaction_item::controller() const
{
    return m_controller;
}

void Timeline_interaction_item::set_controller(Timeline_controller* controller)
{
    if (m_controller == controller) {
        return;
    }
    m_controller = controller;
    m_dragging = false;
    emit controller_changed();
}

bool Timeline_interaction_item::is_interaction_enabled() const
{
    return m_interaction_enabled;
}

void Timeline_interaction_item::set_interaction_enabled(bool enabled)
{
    if (m_interaction_enabled == enabled) {
        return;
    }
    m_interaction_enabled = enabled;
    emit interaction_enabled_changed();
}

void Timeline_interaction_item::mousePressEvent(QMouseEvent* event)
{
    if (!m_interaction_enabled || !m_controller || !m_controller->is_composing()) {
        event->ignore();
        return;
    }

    if (event->button() != Qt::LeftButton) {
        event->ignore();
        return;
    }

    m_dragging = true;
    m_drag_start_y = event->position().y();
    m_drag_start_offset = m_controller->draft_preview_y();
    event->accept();
}

void Timeline_interaction_item::mouseMoveEvent(QMouseEvent* event)
{
    if (!m_interaction_enabled || !m_controller || !m_dragging) {
        return;
    }

    // Dragging down moves the draft further into the past.
    const qreal dy = event->position().y() - m_drag_start_y;
    m_controller->drag_to(m_drag_start_offset + dy);
}

void Timeline_interaction_item::mouseReleaseEvent(QMouseEvent* event)
{
    Q_UNUSED(event)
    m_dragging = false;
    m_drag_start_y = 0;
    m_drag_start_offset = 0;
}

void Timeline_interaction_item::wheelEvent(QWheelEvent* event)
{
    if (!m_interaction_enabled || !m_controller || !m_controller->is_composing()) {
        event->ignore();
        return;
    }

    qreal delta_px = 0.0;
    const qreal angle = event->angleDelta().y();
    if (angle != 0.0) {
        delta_px = -angle / 120.0 * core::constants::k_wheel_px_per_notch;
    }
    else {
        delta_px = -static_cast<qreal>(event->pixelDelta().y());
    }

    if (delta_px == 0.0) {
        event->ignore();
        return;
    }

    m_controller->scroll_by(delta_px);
    event->accept();
}

} // namespace entrylog
