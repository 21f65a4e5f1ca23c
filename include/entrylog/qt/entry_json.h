#pragma once

// Entrylog Library - Entry JSON Codec
// Wire format of entries:
//   {"id": 12, "timestamp": "2026-10-18T09:30:00Z", "description": "...", "energy": 7}
// description and energy may be null or missing. A timestamp without a
// zone designator is read as UTC. Records whose timestamp does not parse
// are rejected so they never reach the anchor builder.

#include <entrylog/core/types.h>

#include <QByteArray>
#include <QJsonObject>
#include <QString>

#include <optional>
#include <vector>

namespace entrylog {

struct entry_list_decode_t
{
    bool                 ok       = false;   ///< Document was a JSON array
    std::vector<entry_t> entries;
    int                  rejected = 0;       ///< Records dropped as malformed
    QString              error;
};

std::optional<entry_t> entry_from_json(const QJsonObject& obj);
QJsonObject entry_to_json(const entry_t& entry);

entry_list_decode_t entries_from_json(const QByteArray& bytes);
QByteArray entries_to_json(const std::vector<entry_t>& entries);

// Body of a create request (no id).
QJsonObject entry_request_to_json(const entry_request_t& request);

// ISO-8601 text to unix seconds (millisecond resolution). Text without a
// zone designator is UTC. nullopt when QDateTime cannot parse it.
std::optional<double> timestamp_from_iso(const QString& text);

// "YYYY-MM-DDTHH:MM:SS.mmmZ"; empty for non-finite input.
QString timestamp_to_iso(double t);

} // namespace entrylog
