#include <entrylog/core/timeline_session.h>
#include <entrylog/core/algo.h>
#include <entrylog/core/anchor_builder.h>
#include <entrylog/core/axis_mapper.h>
#include <entrylog/core/entry_rules.h>
#include <entrylog/core/gap_allocation.h>
#include <entrylog/core/time_format.h>

#include <algorithm>
#include <utility>

namespace entrylog {

Timeline_session::Timeline_session(Timeline_config config, std::shared_ptr<Clock> clock)
:
    m_config(std::move(config)),
    m_clock(std::move(clock))
{
    if (!m_clock) {
        m_clock = std::make_shared<System_clock>();
    }

    bool adjusted = false;
    m_config.gap_table = normalize_gap_table(m_config.gap_table, &adjusted);
    if (adjusted) {
        log_debug("gap table was not monotonic and has been normalized");
    }

    begin_pass();
    m_state.interaction = make_idle_state(m_state.now);
}

void Timeline_session::set_entry_source(std::shared_ptr<Entry_source> source)
{
    m_source = std::move(source);
}

void Timeline_session::set_entry_sink(std::shared_ptr<Entry_sink> sink)
{
    m_sink = std::move(sink);
}

// -----------------------------------------------------------------------------
// Entry list
// -----------------------------------------------------------------------------

bool Timeline_session::refresh()
{
    if (!m_source) {
        m_last_error = "no entry source";
        log_error("refresh: no entry source configured");
        return false;
    }
    return apply_fetch_result(m_source->fetch_entries());
}

bool Timeline_session::apply_fetch_result(fetch_result_t result)
{
    if (!result) {
        m_last_error = result.message.empty() ? "failed to fetch entries" : result.message;
        log_error("refresh: " + m_last_error + ", keeping " +
            std::to_string(m_state.entries.size()) + " known entries");
        return false;
    }

    m_state.entries = sanitize_entries(std::move(result.entries), m_config);
    m_last_error.clear();
    begin_pass();
    step(interaction_event_t::tick());
    return true;
}

// -----------------------------------------------------------------------------
// Interaction
// -----------------------------------------------------------------------------

void Timeline_session::tick()
{
    begin_pass();
    step(interaction_event_t::tick());
}

Interaction_effect Timeline_session::handle(const interaction_event_t& event)
{
    if (event.kind == Interaction_event_kind::COMMIT_SUCCEEDED ||
        event.kind == Interaction_event_kind::COMMIT_FAILED)
    {
        log_debug("handle: commit outcomes are reported through complete_commit");
        return Interaction_effect::NONE;
    }

    begin_pass();
    const interaction_result_t result = step_interaction(m_state.interaction, event, context());
    m_state.interaction = result.state;

    if (result.effect != Interaction_effect::CREATE_ENTRY) {
        return result.effect;
    }

    const Entry_validation validation = validate_entry_request(result.request);
    if (validation != Entry_validation::OK) {
        m_last_error = to_string(validation);
        log_error("commit rejected: " + m_last_error);
        step(interaction_event_t::commit_failed());
        return Interaction_effect::NONE;
    }

    m_pending_request = result.request;
    return result.effect;
}

void Timeline_session::set_text(std::string text)
{
    handle(interaction_event_t::text_changed(std::move(text)));
}

void Timeline_session::set_energy(int energy)
{
    handle(interaction_event_t::energy_set(energy));
}

void Timeline_session::set_energy_from_track(double fraction)
{
    handle(interaction_event_t::energy_set(energy_from_track_fraction(fraction)));
}

void Timeline_session::scroll_by(double delta_px)
{
    handle(interaction_event_t::scroll(delta_px));
}

void Timeline_session::drag_to(double offset_px)
{
    handle(interaction_event_t::drag(offset_px));
}

void Timeline_session::discard()
{
    handle(interaction_event_t::discard());
}

// -----------------------------------------------------------------------------
// Commit
// -----------------------------------------------------------------------------

std::optional<entry_request_t> Timeline_session::begin_commit()
{
    if (m_pending_request) {
        log_debug("begin_commit: a commit is already pending");
        return std::nullopt;
    }
    if (handle(interaction_event_t::commit_requested()) != Interaction_effect::CREATE_ENTRY) {
        return std::nullopt;
    }
    return m_pending_request;
}

void Timeline_session::complete_commit(const create_result_t& result)
{
    if (!m_pending_request) {
        log_debug("complete_commit: no commit pending, result ignored");
        return;
    }
    m_pending_request.reset();

    if (!result) {
        m_last_error = result.message.empty() ? "failed to save entry" : result.message;
        log_error("commit: " + m_last_error + ", draft kept");
        begin_pass();
        step(interaction_event_t::commit_failed());
        return;
    }

    m_last_error.clear();
    // A refresh that landed while the commit was in flight may already
    // carry the new entry.
    const bool known = result.entry.id != 0 && std::any_of(
        m_state.entries.begin(), m_state.entries.end(),
        [&](const entry_t& e) { return e.id == result.entry.id; });
    if (!known) {
        m_state.entries.insert(m_state.entries.begin(), result.entry);
    }
    begin_pass();
    step(interaction_event_t::commit_succeeded());
}

bool Timeline_session::commit()
{
    if (!m_sink) {
        m_last_error = "no entry sink";
        log_error("commit: no entry sink configured");
        return false;
    }

    const auto request = begin_commit();
    if (!request) {
        return false;
    }

    const create_result_t result = m_sink->create_entry(*request);
    complete_commit(result);
    return static_cast<bool>(result);
}

// -----------------------------------------------------------------------------
// Presentation
// -----------------------------------------------------------------------------

void Timeline_session::set_dark_mode(bool dark_mode)
{
    m_config.dark_mode = dark_mode;
    m_config.palette = Color_palette::for_theme(dark_mode);
}

std::vector<timeline_row_t> Timeline_session::rows() const
{
    return build_timeline_rows(m_state.anchors, m_config);
}

double Timeline_session::draft_preview_position() const
{
    return entrylog::draft_preview_position(m_state.interaction.draft, m_state.anchors);
}

std::string Timeline_session::draft_offset_label() const
{
    return format_draft_offset(m_state.interaction.draft.timestamp, m_state.now);
}

double Timeline_session::time_to_position(double t) const
{
    return entrylog::time_to_position(t, m_state.anchors);
}

double Timeline_session::position_to_time(double p) const
{
    return entrylog::position_to_time(p, m_state.anchors);
}

// -----------------------------------------------------------------------------
// Internals
// -----------------------------------------------------------------------------

void Timeline_session::begin_pass()
{
    m_state.now = detail::finite_or(m_clock->now(), m_state.now);
    m_state.anchors = build_anchor_map(m_state.entries, m_state.now, m_config);
}

void Timeline_session::step(const interaction_event_t& event)
{
    m_state.interaction = step_interaction(m_state.interaction, event, context()).state;
}

interaction_context_t Timeline_session::context() const
{
    interaction_context_t ctx;
    ctx.now = m_state.now;
    ctx.anchors = &m_state.anchors;
    ctx.max_backdate_s = m_config.max_backdate_s;
    return ctx;
}

void Timeline_session::log_debug(const std::string& message) const
{
    if (m_config.log_debug) {
        m_config.log_debug("entrylog: " + message);
    }
}

void Timeline_session::log_error(const std::string& message) const
{
    if (m_config.log_error) {
        m_config.log_error("entrylog: " + message);
    }
}

} // namespace entrylog
