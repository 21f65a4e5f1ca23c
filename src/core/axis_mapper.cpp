#include <entrylog/core/axis_mapper.h>
#include <entrylog/core/algo.h>

#include <cmath>

namespace entrylog {

namespace {

// Builder output always carries a positive rate; hand-made maps may not.
double usable_rate(const anchor_map_t& map)
{
    const double rate = map.extrapolation_rate;
    return (std::isfinite(rate) && rate > 0.0) ? rate : 1.0;
}

} // namespace

double time_to_position(double t, const anchor_map_t& map)
{
    if (map.empty() || !std::isfinite(t)) {
        return 0.0;
    }

    const auto& anchors = map.anchors;
    const anchor_t& first = anchors.front();
    const double rate = usable_rate(map);

    if (t >= first.time) {
        return first.position - (t - first.time) * rate;
    }

    const std::size_t idx = detail::first_anchor_at_or_before(anchors, t);
    if (idx >= anchors.size()) {
        const anchor_t& oldest = anchors.back();
        return oldest.position + (oldest.time - t) * rate;
    }

    // idx >= 1 here because t < first.time.
    const anchor_t& newer = anchors[idx - 1];
    const anchor_t& older = anchors[idx];
    const double duration = newer.time - older.time;
    if (!(duration > 0.0)) {
        return newer.position;
    }

    const double fraction = (newer.time - t) / duration;
    return newer.position + fraction * (older.position - newer.position);
}

double position_to_time(double p, const anchor_map_t& map)
{
    if (map.empty()) {
        return 0.0;
    }

    const auto& anchors = map.anchors;
    const anchor_t& first = anchors.front();
    if (!std::isfinite(p)) {
        return first.time;
    }

    const double rate = usable_rate(map);

    if (p <= first.position) {
        return first.time + (first.position - p) / rate;
    }

    const std::size_t idx = detail::first_anchor_at_or_beyond(anchors, p);
    if (idx >= anchors.size()) {
        const anchor_t& oldest = anchors.back();
        return oldest.time - (p - oldest.position) / rate;
    }

    // idx >= 1 here because p > first.position.
    const anchor_t& newer = anchors[idx - 1];
    const anchor_t& older = anchors[idx];
    const double span = older.position - newer.position;
    if (!(span > 0.0)) {
        return older.time;
    }

    const double fraction = (p - newer.position) / span;
    return newer.time - fraction * (newer.time - older.time);
}

} // namespace entrylog
