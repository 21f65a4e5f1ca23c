#include <entrylog/core/draft_interaction.h>
#include <entrylog/core/algo.h>
#include <entrylog/core/axis_mapper.h>
#include <entrylog/core/constants.h>

#include <algorithm>
#include <cmath>
#include <utility>

namespace entrylog {

namespace constants = core::constants;

// -----------------------------------------------------------------------------
// Event factories
// -----------------------------------------------------------------------------

interaction_event_t interaction_event_t::text_changed(std::string text)
{
    interaction_event_t e;
    e.kind = Interaction_event_kind::TEXT_CHANGED;
    e.text = std::move(text);
    return e;
}

interaction_event_t interaction_event_t::energy_set(int energy)
{
    interaction_event_t e;
    e.kind = Interaction_event_kind::ENERGY_SET;
    e.energy = energy;
    return e;
}

interaction_event_t interaction_event_t::scroll(double delta_px)
{
    interaction_event_t e;
    e.kind = Interaction_event_kind::SCROLL;
    e.offset_px = delta_px;
    return e;
}

interaction_event_t interaction_event_t::drag(double offset_px)
{
    interaction_event_t e;
    e.kind = Interaction_event_kind::DRAG;
    e.offset_px = offset_px;
    return e;
}

interaction_event_t interaction_event_t::tick()
{
    interaction_event_t e;
    e.kind = Interaction_event_kind::TICK;
    return e;
}

interaction_event_t interaction_event_t::commit_requested()
{
    interaction_event_t e;
    e.kind = Interaction_event_kind::COMMIT_REQUESTED;
    return e;
}

interaction_event_t interaction_event_t::commit_succeeded()
{
    interaction_event_t e;
    e.kind = Interaction_event_kind::COMMIT_SUCCEEDED;
    return e;
}

interaction_event_t interaction_event_t::commit_failed()
{
    interaction_event_t e;
    e.kind = Interaction_event_kind::COMMIT_FAILED;
    return e;
}

interaction_event_t interaction_event_t::discard()
{
    interaction_event_t e;
    e.kind = Interaction_event_kind::DISCARD;
    return e;
}

// -----------------------------------------------------------------------------
// Helpers
// -----------------------------------------------------------------------------

interaction_state_t make_idle_state(double now)
{
    interaction_state_t state;
    state.phase = Draft_phase::IDLE;
    state.draft.timestamp = now;
    state.backdated = false;
    return state;
}

double clamp_backdate(double t, double now, double max_backdate_s)
{
    const double window = detail::non_negative_duration(max_backdate_s);
    if (!std::isfinite(t)) {
        return now;
    }
    return std::clamp(t, now - window, now);
}

double max_backdate_offset(const anchor_map_t& anchors, double now, double max_backdate_s)
{
    const double window = detail::non_negative_duration(max_backdate_s);
    return std::max(0.0, time_to_position(now - window, anchors));
}

double backdate_from_offset(
    double offset_px,
    const anchor_map_t& anchors,
    double now,
    double max_backdate_s)
{
    const double max_offset = max_backdate_offset(anchors, now, max_backdate_s);
    const double offset = std::clamp(detail::finite_or(offset_px, 0.0), 0.0, max_offset);
    return clamp_backdate(position_to_time(offset, anchors), now, max_backdate_s);
}

int clamp_energy(int energy)
{
    return std::clamp(energy, constants::k_energy_min, constants::k_energy_max);
}

int energy_from_track_fraction(double fraction)
{
    const double f = std::clamp(detail::finite_or(fraction, 0.0), 0.0, 1.0);
    const double span = static_cast<double>(constants::k_energy_max - constants::k_energy_min);
    return clamp_energy(static_cast<int>(std::lround(constants::k_energy_min + f * span)));
}

// -----------------------------------------------------------------------------
// Transition function
// -----------------------------------------------------------------------------

namespace {

void apply_backdate(interaction_state_t& s, double offset_px, const interaction_context_t& ctx)
{
    if (!ctx.anchors) {
        return;
    }
    const double t = backdate_from_offset(offset_px, *ctx.anchors, ctx.now, ctx.max_backdate_s);
    s.draft.timestamp = t;
    s.backdated = t < ctx.now;
}

// An un-backdated draft follows now; a backdated one stays in the window.
void settle_timestamp(interaction_state_t& s, const interaction_context_t& ctx)
{
    if (s.backdated) {
        s.draft.timestamp = clamp_backdate(s.draft.timestamp, ctx.now, ctx.max_backdate_s);
    }
    else {
        s.draft.timestamp = ctx.now;
    }
}

entry_request_t make_request(const draft_t& draft)
{
    entry_request_t request;
    request.timestamp = draft.timestamp;
    if (!draft.text.empty()) {
        request.description = draft.text;
    }
    request.energy = draft.energy;
    return request;
}

} // namespace

interaction_result_t step_interaction(
    const interaction_state_t& state,
    const interaction_event_t& event,
    const interaction_context_t& context)
{
    interaction_result_t result;
    result.state = state;
    interaction_state_t& s = result.state;

    switch (event.kind) {
        case Interaction_event_kind::TEXT_CHANGED:
            if (s.phase == Draft_phase::COMMITTING) {
                break;
            }
            s.draft.text = event.text;
            if (s.phase == Draft_phase::IDLE && !s.draft.text.empty()) {
                s.phase = Draft_phase::COMPOSING;
            }
            break;

        case Interaction_event_kind::ENERGY_SET:
            if (s.phase == Draft_phase::COMMITTING) {
                break;
            }
            s.draft.energy = clamp_energy(event.energy);
            s.phase = Draft_phase::COMPOSING;
            break;

        case Interaction_event_kind::SCROLL:
            if (s.phase != Draft_phase::COMPOSING || !context.anchors) {
                break;
            }
            settle_timestamp(s, context);
            apply_backdate(
                s,
                time_to_position(s.draft.timestamp, *context.anchors) +
                    detail::finite_or(event.offset_px, 0.0),
                context);
            break;

        case Interaction_event_kind::DRAG:
            if (s.phase != Draft_phase::COMPOSING) {
                break;
            }
            apply_backdate(s, event.offset_px, context);
            break;

        case Interaction_event_kind::TICK:
            break;

        case Interaction_event_kind::COMMIT_REQUESTED:
            if (s.phase != Draft_phase::COMPOSING || !s.draft.has_content()) {
                break;
            }
            settle_timestamp(s, context);
            s.phase = Draft_phase::COMMITTING;
            result.effect = Interaction_effect::CREATE_ENTRY;
            result.request = make_request(s.draft);
            break;

        case Interaction_event_kind::COMMIT_SUCCEEDED:
            if (s.phase == Draft_phase::COMMITTING) {
                s = make_idle_state(context.now);
            }
            break;

        case Interaction_event_kind::COMMIT_FAILED:
            if (s.phase == Draft_phase::COMMITTING) {
                s.phase = Draft_phase::COMPOSING;
            }
            break;

        case Interaction_event_kind::DISCARD:
            if (s.phase != Draft_phase::COMMITTING) {
                s = make_idle_state(context.now);
            }
            break;
    }

    // Every transition re-samples the window, so time passing between
    // events can never leave the draft outside it.
    settle_timestamp(s, context);
    return result;
}

} // namespace entrylog
