#pragma once

// Entrylog Library - Timeline Session
// Owns the state of one timeline view (entries, draft interaction, anchor
// map) and drives it against the boundary collaborators.
//
// Every public operation samples the clock once, rebuilds the anchor map
// from that value and only then reads or mutates state, so a map is never
// queried against a different "now" than the one it was built from.
// Single-threaded: call from one thread only.

#include "draft_interaction.h"
#include "entry_source.h"
#include "timeline_config.h"
#include "timeline_layout.h"
#include "types.h"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace entrylog {

struct timeline_state_t
{
    std::vector<entry_t> entries;        ///< Newest first
    interaction_state_t  interaction;
    anchor_map_t         anchors;
    double               now = 0.0;      ///< Sample the anchors were built from
};

class Timeline_session
{
public:
    explicit Timeline_session(
        Timeline_config config = Timeline_config::make_default(),
        std::shared_ptr<Clock> clock = nullptr);

    Timeline_session(const Timeline_session&) = delete;
    Timeline_session& operator=(const Timeline_session&) = delete;

    void set_entry_source(std::shared_ptr<Entry_source> source);
    void set_entry_sink(std::shared_ptr<Entry_sink> sink);

    const Timeline_config& config() const { return m_config; }
    const timeline_state_t& state() const { return m_state; }
    const anchor_map_t& anchors() const { return m_state.anchors; }
    const draft_t& draft() const { return m_state.interaction.draft; }
    Draft_phase phase() const { return m_state.interaction.phase; }
    double now() const { return m_state.now; }

    // Message of the last failed boundary call (empty after a success).
    const std::string& last_error() const { return m_last_error; }

    // --- Entry list ---

    // Fetches through the entry source. On failure the last-known entries
    // stay in place and false is returned.
    bool refresh();

    // Applies a fetch that completed elsewhere (e.g. asynchronously).
    bool apply_fetch_result(fetch_result_t result);

    // --- Interaction ---

    // Periodic tick: resamples now, rebuilds, keeps the draft in bounds.
    void tick();

    // Feeds one event through the draft state machine.
    // COMMIT_SUCCEEDED / COMMIT_FAILED are driven by complete_commit().
    Interaction_effect handle(const interaction_event_t& event);

    void set_text(std::string text);
    void set_energy(int energy);
    void set_energy_from_track(double fraction);
    void scroll_by(double delta_px);
    void drag_to(double offset_px);
    void discard();

    // --- Commit ---

    // Moves the draft to COMMITTING and returns the request to persist.
    // Returns nullopt if there is nothing to commit or a commit is pending.
    std::optional<entry_request_t> begin_commit();

    // Completes the pending commit. Success prepends the entry and resets
    // the draft; failure keeps the draft for a retry.
    void complete_commit(const create_result_t& result);

    // begin_commit + entry sink + complete_commit, synchronously.
    bool commit();

    bool has_pending_commit() const { return m_pending_request.has_value(); }

    // --- Presentation ---

    // Switches the palette between the dark and light themes.
    void set_dark_mode(bool dark_mode);

    std::vector<timeline_row_t> rows() const;
    double draft_preview_position() const;
    std::string draft_offset_label() const;

    // Pure mapping against the current pass.
    double time_to_position(double t) const;
    double position_to_time(double p) const;

private:
    void begin_pass();
    void step(const interaction_event_t& event);
    interaction_context_t context() const;
    void log_debug(const std::string& message) const;
    void log_error(const std::string& message) const;

    Timeline_config                 m_config;
    std::shared_ptr<Clock>          m_clock;
    std::shared_ptr<Entry_source>   m_source;
    std::shared_ptr<Entry_sink>     m_sink;

    timeline_state_t                m_state;
    std::optional<entry_request_t>  m_pending_request;
    std::string                     m_last_error;
};

} // namespace entrylog
