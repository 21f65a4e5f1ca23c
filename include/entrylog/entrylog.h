#pragma once
// Entrylog Library - Main Header
// Entry-centric time axis for a personal energy log.
//
// The axis is not linear in time. Each entry becomes an anchor and the
// space between two anchors depends only on how much time separates
// them, so minutes-apart notes stay readable next to day-long silences.
//
// This library provides:
// - Anchor map construction from a list of entries
// - Forward and inverse mapping between time and axis position
// - The draft/backdating state machine and its session driver
// - Qt Quick integration (list model, input overlay, JSON codec)
//
// Usage:
//   #include <entrylog/entrylog.h>
//   entrylog::Timeline_session session;
//   session.set_entry_source(source);
//   session.refresh();
//   for (const auto& row : session.rows()) { ... }
#include <entrylog/core.h>

#if defined(ENTRYLOG_WITH_QT)
#include <entrylog/qt/entry_json.h>
#include <entrylog/qt/timeline_controller.h>
#include <entrylog/qt/timeline_interaction_item.h>
#endif

namespace entrylog {

// Library version
constexpr int k_version_major = 0;
constexpr int k_version_minor = 1;
constexpr int k_version_patch = 0;

constexpr const char* k_version_string = "0.1.0";

} // namespace entrylog
