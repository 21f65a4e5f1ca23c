#include "json_file_store.h"

#include <entrylog/core/entry_rules.h>
#include <entrylog/qt/entry_json.h>

#include <QDebug>
#include <QFile>
#include <QSaveFile>

#include <algorithm>
#include <utility>

using namespace entrylog;

Json_file_store::Json_file_store(QString path)
:
    m_path(std::move(path))
{}

bool Json_file_store::load(std::vector<entry_t>& entries, std::string& error) const
{
    QFile file(m_path);
    if (!file.exists()) {
        entries.clear();
        return true;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        error = "cannot open " + m_path.toStdString() + ": " + file.errorString().toStdString();
        return false;
    }

    entry_list_decode_t decoded = entries_from_json(file.readAll());
    if (!decoded.ok) {
        error = "malformed entry file: " + decoded.error.toStdString();
        return false;
    }
    if (decoded.rejected > 0) {
        qWarning() << "energy_log: skipped" << decoded.rejected << "malformed entries in" << m_path;
    }
    entries = std::move(decoded.entries);
    return true;
}

bool Json_file_store::save(const std::vector<entry_t>& entries, std::string& error) const
{
    QSaveFile file(m_path);
    if (!file.open(QIODevice::WriteOnly)) {
        error = "cannot write " + m_path.toStdString() + ": " + file.errorString().toStdString();
        return false;
    }
    file.write(entries_to_json(entries));
    if (!file.commit()) {
        error = "cannot write " + m_path.toStdString() + ": " + file.errorString().toStdString();
        return false;
    }
    return true;
}

fetch_result_t Json_file_store::fetch_entries()
{
    std::lock_guard<std::mutex> lock(m_mutex);

    fetch_result_t result;
    if (!load(result.entries, result.message)) {
        result.status = Status::FAILED;
        result.entries.clear();
        return result;
    }

    std::stable_sort(result.entries.begin(), result.entries.end(),
        [](const entry_t& a, const entry_t& b) { return a.timestamp > b.timestamp; });
    result.status = Status::OK;
    return result;
}

create_result_t Json_file_store::create_entry(const entry_request_t& request)
{
    create_result_t result;

    const Entry_validation validation = validate_entry_request(request);
    if (validation != Entry_validation::OK) {
        result.status = Status::FAILED;
        result.message = to_string(validation);
        return result;
    }

    std::lock_guard<std::mutex> lock(m_mutex);

    std::vector<entry_t> entries;
    if (!load(entries, result.message)) {
        result.status = Status::FAILED;
        return result;
    }

    std::int64_t next_id = 1;
    for (const auto& e : entries) {
        next_id = std::max(next_id, e.id + 1);
    }

    entry_t entry;
    entry.id = next_id;
    entry.timestamp = request.timestamp;
    entry.description = request.description;
    entry.energy = request.energy;
    entries.push_back(entry);

    if (!save(entries, result.message)) {
        result.status = Status::FAILED;
        return result;
    }

    result.status = Status::OK;
    result.entry = entry;
    return result;
}
