// entrylog draft interaction tests

#include <entrylog/core/anchor_builder.h>
#include <entrylog/core/axis_mapper.h>
#include <entrylog/core/draft_interaction.h>
#include <entrylog/core/timeline_config.h>

#include <cmath>
#include <iostream>
#include <limits>
#include <random>
#include <vector>

namespace el = entrylog;

namespace {

#define TEST_ASSERT(cond, msg) \
    do { \
        if (!(cond)) { \
            std::cerr << "FAIL: " << msg << " (line " << __LINE__ << ")" << std::endl; \
            return false; \
        } \
    } while (0)

#define RUN_TEST(test_fn) \
    do { \
        std::cout << "Running " << #test_fn << "... "; \
        if (test_fn()) { \
            std::cout << "OK" << std::endl; \
            ++passed; \
        } else { \
            std::cout << "FAIL" << std::endl; \
            ++failed; \
        } \
    } while (0)

constexpr double k_now = 1'700'000'000.0;
constexpr double k_minute = 60.0;
constexpr double k_hour = 3600.0;
constexpr double k_window = 12.0 * k_hour;

el::entry_t make_entry(std::int64_t id, double timestamp)
{
    el::entry_t e;
    e.id = id;
    e.timestamp = timestamp;
    e.description = "x";
    return e;
}

const std::vector<el::entry_t>& example_entries()
{
    static const std::vector<el::entry_t> entries = {
        make_entry(1, k_now - 5 * k_minute),
        make_entry(2, k_now - 40 * k_minute),
        make_entry(3, k_now - 3 * k_hour),
    };
    return entries;
}

// Anchor map and context for one pass at a given now.
struct pass_t
{
    el::anchor_map_t          anchors;
    el::interaction_context_t context;

    explicit pass_t(double now, const std::vector<el::entry_t>& entries = example_entries())
    :
        anchors(el::build_anchor_map(entries, now, el::Timeline_config::make_default()))
    {
        context.now = now;
        context.anchors = &anchors;
        context.max_backdate_s = k_window;
    }

    pass_t(const pass_t&) = delete;
    pass_t& operator=(const pass_t&) = delete;
};

el::interaction_state_t step(const el::interaction_state_t& s, const el::interaction_event_t& e, const pass_t& pass)
{
    return el::step_interaction(s, e, pass.context).state;
}

el::interaction_state_t composing_state(const pass_t& pass)
{
    return step(el::make_idle_state(pass.context.now), el::interaction_event_t::text_changed("tired"), pass);
}

bool in_window(double t, double now)
{
    return t >= now - k_window && t <= now;
}

bool test_typing_starts_composing()
{
    const pass_t pass(k_now);
    const auto idle = el::make_idle_state(k_now);

    const auto empty = step(idle, el::interaction_event_t::text_changed(""), pass);
    TEST_ASSERT(empty.phase == el::Draft_phase::IDLE, "empty text must not start a draft");

    const auto s = step(idle, el::interaction_event_t::text_changed("coffee"), pass);
    TEST_ASSERT(s.phase == el::Draft_phase::COMPOSING, "typing should start composing");
    TEST_ASSERT(s.draft.text == "coffee", "draft text mismatch");
    TEST_ASSERT(s.draft.timestamp == k_now, "a fresh draft is stamped now");
    TEST_ASSERT(!s.backdated, "a fresh draft is not backdated");
    return true;
}

bool test_energy_is_clamped()
{
    const pass_t pass(k_now);
    const auto idle = el::make_idle_state(k_now);

    auto s = step(idle, el::interaction_event_t::energy_set(0), pass);
    TEST_ASSERT(s.phase == el::Draft_phase::COMPOSING, "setting energy should start composing");
    TEST_ASSERT(s.draft.energy && *s.draft.energy == 1, "energy below range should clamp to 1");

    s = step(s, el::interaction_event_t::energy_set(15), pass);
    TEST_ASSERT(*s.draft.energy == 10, "energy above range should clamp to 10");

    s = step(s, el::interaction_event_t::energy_set(7), pass);
    TEST_ASSERT(*s.draft.energy == 7, "energy in range should be kept");
    return true;
}

bool test_energy_track_fraction()
{
    TEST_ASSERT(el::energy_from_track_fraction(0.0) == 1, "bottom of the track is 1");
    TEST_ASSERT(el::energy_from_track_fraction(1.0) == 10, "top of the track is 10");
    TEST_ASSERT(el::energy_from_track_fraction(0.5) == 6, "middle rounds to 6");
    TEST_ASSERT(el::energy_from_track_fraction(-3.0) == 1, "below the track clamps");
    TEST_ASSERT(el::energy_from_track_fraction(4.0) == 10, "above the track clamps");
    TEST_ASSERT(el::energy_from_track_fraction(std::numeric_limits<double>::quiet_NaN()) == 1,
        "NaN counts as the bottom");
    return true;
}

bool test_gestures_ignored_while_idle()
{
    const pass_t pass(k_now);
    const auto idle = el::make_idle_state(k_now);

    const auto scrolled = step(idle, el::interaction_event_t::scroll(200.0), pass);
    TEST_ASSERT(scrolled.phase == el::Draft_phase::IDLE, "scroll must not start a draft");
    TEST_ASSERT(scrolled.draft.timestamp == k_now, "idle scroll must not backdate");

    const auto dragged = step(idle, el::interaction_event_t::drag(200.0), pass);
    TEST_ASSERT(dragged.draft.timestamp == k_now, "idle drag must not backdate");
    return true;
}

bool test_scroll_backdates_along_the_axis()
{
    const pass_t pass(k_now);
    auto s = composing_state(pass);

    s = step(s, el::interaction_event_t::scroll(110.0), pass);
    TEST_ASSERT(s.draft.timestamp == k_now - 5 * k_minute, "110px should land on the 5m entry");
    TEST_ASSERT(s.backdated, "draft should be backdated");

    s = step(s, el::interaction_event_t::scroll(180.0), pass);
    TEST_ASSERT(std::abs(s.draft.timestamp - (k_now - 40 * k_minute)) < 1e-3,
        "scroll deltas should accumulate along the axis");

    s = step(s, el::interaction_event_t::scroll(-1e6), pass);
    TEST_ASSERT(s.draft.timestamp == k_now, "scrolling back past now clamps to now");
    TEST_ASSERT(!s.backdated, "a draft at now follows now again");
    return true;
}

bool test_drag_is_absolute()
{
    const pass_t pass(k_now);
    auto s = composing_state(pass);

    s = step(s, el::interaction_event_t::drag(290.0), pass);
    TEST_ASSERT(s.draft.timestamp == k_now - 40 * k_minute, "drag to 290px should land on the 40m entry");

    s = step(s, el::interaction_event_t::drag(110.0), pass);
    TEST_ASSERT(s.draft.timestamp == k_now - 5 * k_minute, "drag offsets are absolute");
    return true;
}

bool test_backdate_clamps_to_window()
{
    const pass_t pass(k_now);
    auto s = composing_state(pass);

    s = step(s, el::interaction_event_t::scroll(1e9), pass);
    TEST_ASSERT(in_window(s.draft.timestamp, k_now), "backdate left the window");
    TEST_ASSERT(std::abs(s.draft.timestamp - (k_now - k_window)) < 1e-3,
        "maximum scroll should reach the window edge");

    const double max_offset = el::max_backdate_offset(pass.anchors, k_now, k_window);
    TEST_ASSERT(std::abs(max_offset - el::time_to_position(k_now - k_window, pass.anchors)) < 1e-9,
        "max offset is the axis position of the window edge");
    return true;
}

bool test_tick_keeps_draft_in_window()
{
    const pass_t first(k_now);
    auto s = composing_state(first);
    s = step(s, el::interaction_event_t::scroll(1e9), first);
    const double chosen = s.draft.timestamp;

    const double later = k_now + k_hour;
    const pass_t second(later);
    s = step(s, el::interaction_event_t::tick(), second);
    TEST_ASSERT(s.draft.timestamp > chosen, "window edge moved, draft should follow it");
    TEST_ASSERT(in_window(s.draft.timestamp, later), "tick left the draft outside the window");

    // An un-backdated draft keeps tracking now.
    auto fresh = composing_state(first);
    fresh = step(fresh, el::interaction_event_t::tick(), second);
    TEST_ASSERT(fresh.draft.timestamp == later, "un-backdated draft should follow now");
    return true;
}

bool test_random_sequences_stay_in_window()
{
    std::mt19937 rng(2024);
    std::uniform_int_distribution<int> pick(0, 8);
    std::uniform_real_distribution<double> delta(-600.0, 600.0);
    std::uniform_real_distribution<double> advance(0.0, 900.0);

    double now = k_now;
    auto s = el::make_idle_state(now);

    for (int i = 0; i < 5000; ++i) {
        now += advance(rng);
        const pass_t pass(now);

        el::interaction_event_t e;
        switch (pick(rng)) {
            case 0: e = el::interaction_event_t::text_changed("note"); break;
            case 1: e = el::interaction_event_t::energy_set(static_cast<int>(delta(rng) / 50.0)); break;
            case 2: e = el::interaction_event_t::scroll(delta(rng)); break;
            case 3: e = el::interaction_event_t::drag(delta(rng) * 2.0); break;
            case 4: e = el::interaction_event_t::tick(); break;
            case 5: e = el::interaction_event_t::commit_requested(); break;
            case 6: e = el::interaction_event_t::commit_succeeded(); break;
            case 7: e = el::interaction_event_t::commit_failed(); break;
            default: e = el::interaction_event_t::discard(); break;
        }

        const auto result = el::step_interaction(s, e, pass.context);
        s = result.state;

        TEST_ASSERT(in_window(s.draft.timestamp, now), "draft left the window at step " << i);
        if (result.effect == el::Interaction_effect::CREATE_ENTRY) {
            TEST_ASSERT(in_window(result.request.timestamp, now), "request left the window at step " << i);
        }
        if (s.draft.energy) {
            TEST_ASSERT(*s.draft.energy >= 1 && *s.draft.energy <= 10, "energy out of range at step " << i);
        }
    }
    return true;
}

bool test_commit_cycle()
{
    const pass_t pass(k_now);
    auto s = composing_state(pass);
    s = step(s, el::interaction_event_t::energy_set(4), pass);
    s = step(s, el::interaction_event_t::drag(110.0), pass);

    const auto requested = el::step_interaction(s, el::interaction_event_t::commit_requested(), pass.context);
    TEST_ASSERT(requested.effect == el::Interaction_effect::CREATE_ENTRY, "commit should request a create");
    TEST_ASSERT(requested.state.phase == el::Draft_phase::COMMITTING, "commit should enter COMMITTING");
    TEST_ASSERT(requested.request.description && *requested.request.description == "tired", "description mismatch");
    TEST_ASSERT(requested.request.energy && *requested.request.energy == 4, "energy mismatch");
    TEST_ASSERT(requested.request.timestamp == k_now - 5 * k_minute, "request should carry the backdated time");

    s = requested.state;

    // Input is frozen while the commit is in flight.
    auto frozen = step(s, el::interaction_event_t::text_changed("changed"), pass);
    frozen = step(frozen, el::interaction_event_t::energy_set(9), pass);
    frozen = step(frozen, el::interaction_event_t::drag(290.0), pass);
    frozen = step(frozen, el::interaction_event_t::discard(), pass);
    TEST_ASSERT(frozen.phase == el::Draft_phase::COMMITTING, "COMMITTING must not be left by input");
    TEST_ASSERT(frozen.draft == s.draft, "draft must not change while committing");

    const auto again = el::step_interaction(s, el::interaction_event_t::commit_requested(), pass.context);
    TEST_ASSERT(again.effect == el::Interaction_effect::NONE, "a second commit must not be issued");

    const auto retry = step(s, el::interaction_event_t::commit_failed(), pass);
    TEST_ASSERT(retry.phase == el::Draft_phase::COMPOSING, "failure returns to COMPOSING");
    TEST_ASSERT(retry.draft == s.draft, "failure keeps the draft");

    const auto done = step(s, el::interaction_event_t::commit_succeeded(), pass);
    TEST_ASSERT(done.phase == el::Draft_phase::IDLE, "success returns to IDLE");
    TEST_ASSERT(done.draft.text.empty() && !done.draft.energy, "success clears the draft");
    TEST_ASSERT(done.draft.timestamp == k_now, "success restamps the draft at now");
    TEST_ASSERT(!done.backdated, "success clears the backdate");
    return true;
}

bool test_commit_requires_content()
{
    const pass_t pass(k_now);
    auto s = composing_state(pass);
    s = step(s, el::interaction_event_t::text_changed(""), pass);
    TEST_ASSERT(s.phase == el::Draft_phase::COMPOSING, "clearing text keeps composing");

    const auto r = el::step_interaction(s, el::interaction_event_t::commit_requested(), pass.context);
    TEST_ASSERT(r.effect == el::Interaction_effect::NONE, "an empty draft must not be committed");
    TEST_ASSERT(r.state.phase == el::Draft_phase::COMPOSING, "an empty commit keeps composing");

    s = step(s, el::interaction_event_t::energy_set(3), pass);
    const auto energy_only = el::step_interaction(s, el::interaction_event_t::commit_requested(), pass.context);
    TEST_ASSERT(energy_only.effect == el::Interaction_effect::CREATE_ENTRY, "energy alone is enough");
    TEST_ASSERT(!energy_only.request.description, "empty text is sent as no description");
    return true;
}

bool test_discard_resets()
{
    const pass_t pass(k_now);
    auto s = composing_state(pass);
    s = step(s, el::interaction_event_t::drag(290.0), pass);

    s = step(s, el::interaction_event_t::discard(), pass);
    TEST_ASSERT(s.phase == el::Draft_phase::IDLE, "discard returns to IDLE");
    TEST_ASSERT(s.draft.text.empty(), "discard clears the text");
    TEST_ASSERT(s.draft.timestamp == k_now, "discard restamps at now");
    return true;
}

bool test_clamp_backdate()
{
    TEST_ASSERT(el::clamp_backdate(k_now + 10.0, k_now, k_window) == k_now, "future clamps to now");
    TEST_ASSERT(el::clamp_backdate(k_now - 2 * k_window, k_now, k_window) == k_now - k_window,
        "too old clamps to the window edge");
    TEST_ASSERT(el::clamp_backdate(k_now - k_hour, k_now, k_window) == k_now - k_hour, "inside is kept");
    TEST_ASSERT(el::clamp_backdate(std::numeric_limits<double>::quiet_NaN(), k_now, k_window) == k_now,
        "NaN clamps to now");
    return true;
}

} // namespace

int main()
{
    std::cout << "Draft interaction tests" << std::endl;

    int passed = 0;
    int failed = 0;

    RUN_TEST(test_typing_starts_composing);
    RUN_TEST(test_energy_is_clamped);
    RUN_TEST(test_energy_track_fraction);
    RUN_TEST(test_gestures_ignored_while_idle);
    RUN_TEST(test_scroll_backdates_along_the_axis);
    RUN_TEST(test_drag_is_absolute);
    RUN_TEST(test_backdate_clamps_to_window);
    RUN_TEST(test_tick_keeps_draft_in_window);
    RUN_TEST(test_random_sequences_stay_in_window);
    RUN_TEST(test_commit_cycle);
    RUN_TEST(test_commit_requires_content);
    RUN_TEST(test_discard_resets);
    RUN_TEST(test_clamp_backdate);

    std::cout << "Results: " << passed << " passed, " << failed << " failed" << std::endl;
    return failed > 0 ? 1 : 0;
}
