#pragma once

// Energy Log Example - JSON File Store
// Entry_source and Entry_sink over a single JSON array on disk.
// Ids are assigned as max(id) + 1. Calls may arrive from worker threads
// and are serialized.

#include <entrylog/core/entry_source.h>

#include <QString>

#include <mutex>
#include <vector>

class Json_file_store : public entrylog::Entry_source, public entrylog::Entry_sink
{
public:
    explicit Json_file_store(QString path);

    entrylog::fetch_result_t fetch_entries() override;
    entrylog::create_result_t create_entry(const entrylog::entry_request_t& request) override;

    const QString& path() const { return m_path; }

private:
    bool load(std::vector<entrylog::entry_t>& entries, std::string& error) const;
    bool save(const std::vector<entrylog::entry_t>& entries, std::string& error) const;

    QString            m_path;
    mutable std::mutex m_mutex;
};
