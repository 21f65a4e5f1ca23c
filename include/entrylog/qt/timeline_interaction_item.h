#pragma once

// Entrylog Library - Timeline Interaction Item
// Transparent Qt Quick overlay that turns wheel and vertical drag input
// into draft backdating on a Timeline_controller.

#include <entrylog/qt/timeline_controller.h>

#include <QQuickItem>

namespace entrylog {

class Timeline_interaction_item : public QQuickItem
{
    Q_OBJECT
    Q_PROPERTY(Timeline_controller* controller READ controller WRITE set_controller NOTIFY controller_changed REQUIRED)
    Q_PROPERTY(bool interaction_enabled READ is_interaction_enabled WRITE set_interaction_enabled NOTIFY interaction_enabled_changed)

public:
    explicit Timeline_interaction_item(QQuickItem* parent = nullptr);
    ~Timeline_interaction_item() override;

    Timeline_controller* controller() const;
    void set_controller(Timeline_controller* controller);

    bool is_interaction_enabled() const;
    void set_interaction_enabled(bool enabled);

signals:
    void controller_changed();
    void interaction_enabled_changed();

protected:
    void mousePressEvent(QMouseEvent* event) override;
    void mouseMoveEvent(QMouseEvent* event) override;
    void mouseReleaseEvent(QMouseEvent* event) override;
    void wheelEvent(QWheelEvent* event) override;

private:
    Timeline_controller* m_controller = nullptr;
    bool m_interaction_enabled = true;

    bool m_dragging = false;
    qreal m_drag_start_y = 0;
    qreal m_drag_start_offset = 0;
};

} // namespace entrylog
