#include <entrylog/qt/timeline_controller.h>
#include <entrylog/core/constants.h>
#include <entrylog/core/draft_interaction.h>

#include <QDebug>
#include <QMetaObject>
#include <QPointer>
#include <QThreadPool>
#include <QTimerEvent>

#include <exception>
#include <utility>

namespace entrylog {

namespace {

Timeline_config with_qt_logging(Timeline_config config)
{
    if (!config.log_debug) {
        config.log_debug = [](const std::string& message) {
            qDebug().noquote() << QString::fromStdString(message);
        };
    }
    if (!config.log_error) {
        config.log_error = [](const std::string& message) {
            qWarning().noquote() << QString::fromStdString(message);
        };
    }
    return config;
}

bool same_structure(const std::vector<timeline_row_t>& a, const std::vector<timeline_row_t>& b)
{
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (a[i].kind != b[i].kind || a[i].entry_id != b[i].entry_id || a[i].time != b[i].time) {
            return false;
        }
    }
    return true;
}

// Runs `call` on a pool thread and hands its result to `done` on the
// receiver's thread. The result is dropped if the receiver is gone.
template<class Result, class Call, class Done>
void run_on_pool(QObject* receiver, Call call, Done done)
{
    QPointer<QObject> guard(receiver);
    QThreadPool::globalInstance()->start([guard, call, done]() {
        Result result;
        try {
            result = call();
        }
        catch (const std::exception& e) {
            result.status = Status::FAILED;
            result.message = e.what();
        }

        QObject* target = guard.data();
        if (!target) {
            return;
        }
        const bool queued = QMetaObject::invokeMethod(
            target,
            [guard, done, result]() {
                if (guard) {
                    done(result);
                }
            },
            Qt::QueuedConnection);
        if (!queued) {
            qWarning() << "entrylog: could not deliver a boundary result";
        }
    });
}

} // namespace

QColor to_qcolor(const glm::vec4& c)
{
    return QColor::fromRgbF(c.r, c.g, c.b, c.a);
}

Timeline_controller::Timeline_controller(QObject* parent)
:
    Timeline_controller(Timeline_config::make_default(), nullptr, parent)
{}

Timeline_controller::Timeline_controller(
    Timeline_config config,
    std::shared_ptr<Clock> clock,
    QObject* parent)
:
    QAbstractListModel(parent),
    m_session(std::make_unique<Timeline_session>(with_qt_logging(std::move(config)), std::move(clock)))
{
    m_rows = m_session->rows();
    m_tick_timer.start(core::constants::k_tick_interval_ms, this);
}

Timeline_controller::~Timeline_controller()
{
    m_tick_timer.stop();
}

// -----------------------------------------------------------------------------
// Model
// -----------------------------------------------------------------------------

int Timeline_controller::rowCount(const QModelIndex& parent) const
{
    if (parent.isValid()) {
        return 0;
    }
    return static_cast<int>(m_rows.size());
}

QVariant Timeline_controller::data(const QModelIndex& index, int role) const
{
    if (!index.isValid() || index.row() < 0 || index.row() >= static_cast<int>(m_rows.size())) {
        return QVariant();
    }

    const timeline_row_t& row = m_rows[static_cast<std::size_t>(index.row())];

    switch (role) {
        case KindRole:
            return row.kind == Row_kind::DAY_SEPARATOR
                ? QStringLiteral("day")
                : QStringLiteral("entry");
        case YRole:
            return row.y;
        case LabelRole:
            return QString::fromStdString(row.label);
        case DescriptionRole:
            return row.description ? QString::fromStdString(*row.description) : QString();
        case EnergyRole:
            return row.energy ? *row.energy : 0;
        case EnergyColorRole:
            return to_qcolor(row.energy_color);
        case EntryIdRole:
            return static_cast<qint64>(row.entry_id);
        default:
            return QVariant();
    }
}

QHash<int, QByteArray> Timeline_controller::roleNames() const
{
    return {
        {KindRole, "kind"},
        {YRole, "y_pos"},
        {LabelRole, "label"},
        {DescriptionRole, "description"},
        {EnergyRole, "energy"},
        {EnergyColorRole, "energy_color"},
        {EntryIdRole, "entry_id"}
    };
}

// -----------------------------------------------------------------------------
// Boundary
// -----------------------------------------------------------------------------

void Timeline_controller::set_entry_source(std::shared_ptr<Entry_source> source)
{
    m_source = source;
    m_session->set_entry_source(std::move(source));
}

void Timeline_controller::set_entry_sink(std::shared_ptr<Entry_sink> sink)
{
    m_sink = sink;
    m_session->set_entry_sink(std::move(sink));
}

// -----------------------------------------------------------------------------
// Draft properties
// -----------------------------------------------------------------------------

bool Timeline_controller::is_composing() const
{
    return m_session->phase() == Draft_phase::COMPOSING;
}

bool Timeline_controller::is_committing() const
{
    return m_session->phase() == Draft_phase::COMMITTING;
}

QString Timeline_controller::draft_text() const
{
    return QString::fromStdString(m_session->draft().text);
}

void Timeline_controller::set_draft_text(const QString& text)
{
    if (text == draft_text()) {
        return;
    }
    m_session->set_text(text.toStdString());
    sync();
}

int Timeline_controller::draft_energy() const
{
    const auto& energy = m_session->draft().energy;
    return energy ? *energy : 0;
}

void Timeline_controller::set_draft_energy(int energy)
{
    m_session->set_energy(energy);
    sync();
}

QColor Timeline_controller::draft_energy_color() const
{
    return to_qcolor(energy_color_for(m_session->draft().energy, m_session->config().palette));
}

QString Timeline_controller::draft_timestamp_label() const
{
    return QString::fromStdString(m_session->draft_offset_label());
}

double Timeline_controller::draft_preview_y() const
{
    return m_session->draft_preview_position();
}

double Timeline_controller::content_height() const
{
    return timeline_extent(m_session->anchors());
}

double Timeline_controller::max_backdate_offset() const
{
    return entrylog::max_backdate_offset(
        m_session->anchors(), m_session->now(), m_session->config().max_backdate_s);
}

QString Timeline_controller::error_message() const
{
    return QString::fromStdString(m_session->last_error());
}

bool Timeline_controller::is_loading() const
{
    return m_fetch_in_flight;
}

bool Timeline_controller::is_dark_mode() const
{
    return m_session->config().dark_mode;
}

void Timeline_controller::set_dark_mode(bool dark_mode)
{
    if (dark_mode == is_dark_mode()) {
        return;
    }
    m_session->set_dark_mode(dark_mode);
    emit palette_changed();

    // energy colors are baked into the rows
    m_rows = m_session->rows();
    if (!m_rows.empty()) {
        emit dataChanged(index(0), index(static_cast<int>(m_rows.size()) - 1), {EnergyColorRole});
    }
    emit draft_changed();
}

QColor Timeline_controller::separator_color() const
{
    return to_qcolor(m_session->config().palette.day_separator);
}

QColor Timeline_controller::draft_marker_color() const
{
    return to_qcolor(m_session->config().palette.draft_marker);
}

QColor Timeline_controller::text_color() const
{
    return to_qcolor(m_session->config().palette.entry_text);
}

QColor Timeline_controller::energy_idle_color() const
{
    return to_qcolor(m_session->config().palette.energy_idle);
}

// -----------------------------------------------------------------------------
// Invokables
// -----------------------------------------------------------------------------

void Timeline_controller::set_energy_from_track(double fraction)
{
    m_session->set_energy_from_track(fraction);
    sync();
}

void Timeline_controller::scroll_by(double delta_px)
{
    m_session->scroll_by(delta_px);
    sync();
}

void Timeline_controller::drag_to(double offset_px)
{
    m_session->drag_to(offset_px);
    sync();
}

bool Timeline_controller::commit()
{
    if (!m_sink) {
        // the session reports the missing sink
        const bool ok = m_session->commit();
        sync();
        return ok;
    }

    const auto request = m_session->begin_commit();
    sync();
    if (!request) {
        return false;
    }

    run_on_pool<create_result_t>(
        this,
        [sink = m_sink, req = *request]() { return sink->create_entry(req); },
        [this](const create_result_t& result) { finish_commit(result); });
    return true;
}

void Timeline_controller::discard()
{
    m_session->discard();
    sync();
}

bool Timeline_controller::refresh()
{
    if (!m_source) {
        // the session reports the missing source
        const bool ok = m_session->refresh();
        sync();
        return ok;
    }

    if (m_fetch_in_flight) {
        m_refresh_queued = true;
        return true;
    }
    start_fetch();
    return true;
}

double Timeline_controller::position_for_timestamp(double t) const
{
    return m_session->time_to_position(t);
}

double Timeline_controller::timestamp_for_position(double y) const
{
    return m_session->position_to_time(y);
}

// -----------------------------------------------------------------------------
// Internals
// -----------------------------------------------------------------------------

void Timeline_controller::timerEvent(QTimerEvent* event)
{
    if (event->timerId() == m_tick_timer.timerId()) {
        m_session->tick();
        sync();
    }
    else {
        QAbstractListModel::timerEvent(event);
    }
}

void Timeline_controller::start_fetch()
{
    m_fetch_in_flight = true;
    emit loading_changed();

    run_on_pool<fetch_result_t>(
        this,
        [source = m_source]() { return source->fetch_entries(); },
        [this](const fetch_result_t& result) { finish_fetch(result); });
}

void Timeline_controller::finish_fetch(fetch_result_t result)
{
    m_fetch_in_flight = false;
    const bool ok = m_session->apply_fetch_result(std::move(result));
    sync();
    emit loading_changed();
    emit refresh_finished(ok);

    if (m_refresh_queued) {
        m_refresh_queued = false;
        refresh();
    }
}

void Timeline_controller::finish_commit(const create_result_t& result)
{
    m_session->complete_commit(result);
    sync();
    if (result) {
        emit entry_created(static_cast<qint64>(result.entry.id));
    }
}

void Timeline_controller::sync()
{
    std::vector<timeline_row_t> rows = m_session->rows();

    if (same_structure(m_rows, rows)) {
        m_rows = std::move(rows);
        if (!m_rows.empty()) {
            emit dataChanged(index(0), index(static_cast<int>(m_rows.size()) - 1), {YRole, LabelRole});
        }
    }
    else {
        beginResetModel();
        m_rows = std::move(rows);
        endResetModel();
    }

    if (m_session->phase() != m_last_phase) {
        m_last_phase = m_session->phase();
        emit phase_changed();
    }

    const QString error = error_message();
    if (error != m_last_error) {
        m_last_error = error;
        emit error_message_changed();
    }

    emit draft_changed();
    emit layout_changed();
}

} // namespace entrylog
