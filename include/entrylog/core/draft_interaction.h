#pragma once
// Entrylog Library - Draft Interaction
// Pure state machine for composing and backdating a new entry.
//
// Phases: IDLE -> COMPOSING -> COMMITTING -> IDLE (committed)
//                 COMPOSING -> IDLE (discarded)
//                 COMMITTING -> COMPOSING (commit failed, draft kept)
//
// Scroll and drag gestures report pixel offsets from the "now" baseline.
// Offsets are clamped to the backdating window on the axis, mapped to a
// timestamp through the anchor map, and the timestamp is clamped again to
// [now - max_backdate, now].

#include "types.h"

#include <string>

namespace entrylog {

enum class Draft_phase
{
    IDLE,
    COMPOSING,
    COMMITTING
};

struct interaction_state_t
{
    Draft_phase phase = Draft_phase::IDLE;
    draft_t     draft;
    bool        backdated = false;   ///< Draft timestamp no longer follows now
};

enum class Interaction_event_kind
{
    TEXT_CHANGED,
    ENERGY_SET,
    SCROLL,              ///< offset_px is a delta
    DRAG,                ///< offset_px is absolute from the now baseline
    TICK,
    COMMIT_REQUESTED,
    COMMIT_SUCCEEDED,
    COMMIT_FAILED,
    DISCARD
};

struct interaction_event_t
{
    Interaction_event_kind kind = Interaction_event_kind::TICK;
    std::string            text;
    int                    energy    = 0;
    double                 offset_px = 0.0;

    static interaction_event_t text_changed(std::string text);
    static interaction_event_t energy_set(int energy);
    static interaction_event_t scroll(double delta_px);
    static interaction_event_t drag(double offset_px);
    static interaction_event_t tick();
    static interaction_event_t commit_requested();
    static interaction_event_t commit_succeeded();
    static interaction_event_t commit_failed();
    static interaction_event_t discard();
};

// Everything a transition may read besides the state itself.
// `anchors` must have been built from the same `now`.
struct interaction_context_t
{
    double              now            = 0.0;
    const anchor_map_t* anchors        = nullptr;
    double              max_backdate_s = 0.0;
};

enum class Interaction_effect
{
    NONE,
    CREATE_ENTRY     ///< Caller must hand `request` to the entry sink
};

struct interaction_result_t
{
    interaction_state_t state;
    Interaction_effect  effect = Interaction_effect::NONE;
    entry_request_t     request;
};

// The transition function (state, event) -> state'.
interaction_result_t step_interaction(
    const interaction_state_t& state,
    const interaction_event_t& event,
    const interaction_context_t& context);

// Fresh idle state whose draft timestamp is `now`.
interaction_state_t make_idle_state(double now);

// Clamps t into [now - max_backdate_s, now].
double clamp_backdate(double t, double now, double max_backdate_s);

// Axis offset of the oldest allowed backdate.
double max_backdate_offset(const anchor_map_t& anchors, double now, double max_backdate_s);

// Timestamp chosen by an offset from the now baseline, with both clamps.
double backdate_from_offset(
    double offset_px,
    const anchor_map_t& anchors,
    double now,
    double max_backdate_s);

int clamp_energy(int energy);

// Energy track drag: fraction 0 (top) .. 1 (bottom) maps to 1 .. 10.
int energy_from_track_fraction(double fraction);

} // namespace entrylog
