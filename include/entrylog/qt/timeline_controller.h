#pragma once

// Entrylog Library - Timeline Controller
// Qt Quick facing list model over a Timeline_session. Each row is an entry
// or a day separator, positioned at its axis y. The draft is exposed
// through properties; QML drives it through the invokables below.
// Lives on the GUI thread. Entry source and sink calls run on a
// QThreadPool worker; their results are applied back on the GUI thread.

#include <entrylog/core/timeline_session.h>

#include <QAbstractListModel>
#include <QBasicTimer>
#include <QColor>
#include <QString>

#include <memory>
#include <vector>

namespace entrylog {

class Timeline_controller : public QAbstractListModel
{
    Q_OBJECT

    Q_PROPERTY(bool composing READ is_composing NOTIFY phase_changed)
    Q_PROPERTY(bool committing READ is_committing NOTIFY phase_changed)
    Q_PROPERTY(QString draft_text READ draft_text WRITE set_draft_text NOTIFY draft_changed)
    Q_PROPERTY(int draft_energy READ draft_energy WRITE set_draft_energy NOTIFY draft_changed)
    Q_PROPERTY(QColor draft_energy_color READ draft_energy_color NOTIFY draft_changed)
    Q_PROPERTY(QString draft_timestamp_label READ draft_timestamp_label NOTIFY draft_changed)
    Q_PROPERTY(double draft_preview_y READ draft_preview_y NOTIFY draft_changed)
    Q_PROPERTY(double content_height READ content_height NOTIFY layout_changed)
    Q_PROPERTY(double max_backdate_offset READ max_backdate_offset NOTIFY layout_changed)
    Q_PROPERTY(QString error_message READ error_message NOTIFY error_message_changed)
    Q_PROPERTY(bool loading READ is_loading NOTIFY loading_changed)
    Q_PROPERTY(bool dark_mode READ is_dark_mode WRITE set_dark_mode NOTIFY palette_changed)
    Q_PROPERTY(QColor separator_color READ separator_color NOTIFY palette_changed)
    Q_PROPERTY(QColor draft_marker_color READ draft_marker_color NOTIFY palette_changed)
    Q_PROPERTY(QColor text_color READ text_color NOTIFY palette_changed)
    Q_PROPERTY(QColor energy_idle_color READ energy_idle_color NOTIFY palette_changed)

public:
    enum Roles {
        KindRole = Qt::UserRole + 1,
        YRole,
        LabelRole,
        DescriptionRole,
        EnergyRole,
        EnergyColorRole,
        EntryIdRole
    };

    explicit Timeline_controller(QObject* parent = nullptr);
    Timeline_controller(
        Timeline_config config,
        std::shared_ptr<Clock> clock,
        QObject* parent = nullptr);
    ~Timeline_controller() override;

    // QAbstractListModel interface
    int rowCount(const QModelIndex& parent = QModelIndex()) const override;
    QVariant data(const QModelIndex& index, int role = Qt::DisplayRole) const override;
    QHash<int, QByteArray> roleNames() const override;

    void set_entry_source(std::shared_ptr<Entry_source> source);
    void set_entry_sink(std::shared_ptr<Entry_sink> sink);

    Timeline_session& session() { return *m_session; }
    const Timeline_session& session() const { return *m_session; }

    bool is_composing() const;
    bool is_committing() const;

    QString draft_text() const;
    void set_draft_text(const QString& text);

    // 0 while the draft has no energy.
    int draft_energy() const;
    void set_draft_energy(int energy);
    QColor draft_energy_color() const;

    QString draft_timestamp_label() const;
    double draft_preview_y() const;
    double content_height() const;
    double max_backdate_offset() const;
    QString error_message() const;

    // True while a fetch is in flight.
    bool is_loading() const;

    // Palette
    bool is_dark_mode() const;
    void set_dark_mode(bool dark_mode);
    QColor separator_color() const;
    QColor draft_marker_color() const;
    QColor text_color() const;
    QColor energy_idle_color() const;

    Q_INVOKABLE void set_energy_from_track(double fraction);
    Q_INVOKABLE void scroll_by(double delta_px);
    Q_INVOKABLE void drag_to(double offset_px);
    // Hands the draft to the entry sink. Returns false if nothing was sent;
    // the outcome arrives later (entry_created, or error_message).
    Q_INVOKABLE bool commit();
    Q_INVOKABLE void discard();

    // Starts a fetch. A refresh requested while one is in flight runs
    // after it. Returns false only when no source is configured.
    Q_INVOKABLE bool refresh();

    Q_INVOKABLE double position_for_timestamp(double t) const;
    Q_INVOKABLE double timestamp_for_position(double y) const;

signals:
    void phase_changed();
    void draft_changed();
    void layout_changed();
    void error_message_changed();
    void loading_changed();
    void palette_changed();
    void entry_created(qint64 id);
    void refresh_finished(bool ok);

protected:
    void timerEvent(QTimerEvent* event) override;

private:
    void sync();
    void start_fetch();
    void finish_fetch(fetch_result_t result);
    void finish_commit(const create_result_t& result);

    std::unique_ptr<Timeline_session> m_session;
    std::shared_ptr<Entry_source>     m_source;
    std::shared_ptr<Entry_sink>       m_sink;
    std::vector<timeline_row_t>       m_rows;
    QBasicTimer                       m_tick_timer;

    bool m_fetch_in_flight = false;
    bool m_refresh_queued  = false;

    Draft_phase m_last_phase = Draft_phase::IDLE;
    QString     m_last_error;
};

// glm color to QColor
QColor to_qcolor(const glm::vec4& c);

} // namespace entrylog
