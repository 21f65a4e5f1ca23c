#include <entrylog/qt/entry_json.h>
#include <entrylog/core/entry_rules.h>

#include <QDateTime>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QJsonValue>
#include <QTimeZone>

#include <cmath>

namespace entrylog {

namespace {

void write_optional_fields(
    QJsonObject& obj,
    const std::optional<std::string>& description,
    const std::optional<int>& energy)
{
    obj["description"] = description
        ? QJsonValue(QString::fromStdString(*description))
        : QJsonValue(QJsonValue::Null);
    obj["energy"] = energy ? QJsonValue(*energy) : QJsonValue(QJsonValue::Null);
}

} // namespace

std::optional<double> timestamp_from_iso(const QString& text)
{
    QDateTime dt = QDateTime::fromString(text.trimmed(), Qt::ISODateWithMs);
    if (!dt.isValid()) {
        return std::nullopt;
    }
    if (dt.timeSpec() == Qt::LocalTime) {
        // no zone designator
        dt = QDateTime(dt.date(), dt.time(), QTimeZone::utc());
        if (!dt.isValid()) {
            return std::nullopt;
        }
    }
    return static_cast<double>(dt.toMSecsSinceEpoch()) / 1000.0;
}

QString timestamp_to_iso(double t)
{
    if (!std::isfinite(t)) {
        return QString();
    }
    const qint64 ms = static_cast<qint64>(std::llround(t * 1000.0));
    return QDateTime::fromMSecsSinceEpoch(ms).toUTC().toString(Qt::ISODateWithMs);
}

std::optional<entry_t> entry_from_json(const QJsonObject& obj)
{
    const QJsonValue ts = obj.value("timestamp");
    if (!ts.isString()) {
        return std::nullopt;
    }

    const auto parsed = timestamp_from_iso(ts.toString());
    if (!parsed) {
        return std::nullopt;
    }

    entry_t entry;
    entry.timestamp = *parsed;
    entry.id = static_cast<std::int64_t>(obj.value("id").toDouble(0.0));

    const QJsonValue description = obj.value("description");
    if (description.isString()) {
        entry.description = description.toString().toStdString();
    }

    const QJsonValue energy = obj.value("energy");
    if (energy.isDouble()) {
        const double v = energy.toDouble();
        if (std::floor(v) == v && is_valid_energy(static_cast<int>(v))) {
            entry.energy = static_cast<int>(v);
        }
    }

    return entry;
}

QJsonObject entry_to_json(const entry_t& entry)
{
    QJsonObject obj;
    obj["id"] = static_cast<double>(entry.id);
    obj["timestamp"] = timestamp_to_iso(entry.timestamp);
    write_optional_fields(obj, entry.description, entry.energy);
    return obj;
}

entry_list_decode_t entries_from_json(const QByteArray& bytes)
{
    entry_list_decode_t result;

    QJsonParseError parse_error;
    const QJsonDocument doc = QJsonDocument::fromJson(bytes, &parse_error);
    if (parse_error.error != QJsonParseError::NoError) {
        result.error = parse_error.errorString();
        return result;
    }
    if (!doc.isArray()) {
        result.error = QStringLiteral("expected a JSON array of entries");
        return result;
    }

    const QJsonArray array = doc.array();
    result.entries.reserve(static_cast<std::size_t>(array.size()));
    for (const QJsonValue& value : array) {
        const auto entry = value.isObject() ? entry_from_json(value.toObject()) : std::nullopt;
        if (entry) {
            result.entries.push_back(*entry);
        }
        else {
            ++result.rejected;
        }
    }

    result.ok = true;
    return result;
}

QByteArray entries_to_json(const std::vector<entry_t>& entries)
{
    QJsonArray array;
    for (const auto& entry : entries) {
        array.append(entry_to_json(entry));
    }
    return QJsonDocument(array).toJson(QJsonDocument::Indented);
}

QJsonObject entry_request_to_json(const entry_request_t& request)
{
    QJsonObject obj;
    obj["timestamp"] = timestamp_to_iso(request.timestamp);
    write_optional_fields(obj, request.description, request.energy);
    return obj;
}

} // namespace entrylog
