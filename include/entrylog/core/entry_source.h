#pragma once
// Entrylog Library - Boundary Interfaces
// Abstract entry source, entry sink and clock consumed by Timeline_session.
// Implementations own transport and storage; the core only sees results.

#include "types.h"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace entrylog {

enum class Status
{
    OK,
    FAILED
};

struct fetch_result_t
{
    Status               status = Status::FAILED;
    std::vector<entry_t> entries;
    std::string          message;

    explicit operator bool() const { return status == Status::OK; }
};

struct create_result_t
{
    Status      status = Status::FAILED;
    entry_t     entry;
    std::string message;

    explicit operator bool() const { return status == Status::OK; }
};

// -----------------------------------------------------------------------------
// Entry_source: where the entry list comes from
// -----------------------------------------------------------------------------
class Entry_source
{
public:
    virtual ~Entry_source() = default;

    // May fail; the session then keeps its last-known entries.
    virtual fetch_result_t fetch_entries() = 0;
};

// -----------------------------------------------------------------------------
// Entry_sink: where new entries are persisted
// -----------------------------------------------------------------------------
class Entry_sink
{
public:
    virtual ~Entry_sink() = default;

    // On success the returned entry carries the persisted id and timestamp.
    virtual create_result_t create_entry(const entry_request_t& request) = 0;
};

// -----------------------------------------------------------------------------
// Clock
// -----------------------------------------------------------------------------
class Clock
{
public:
    virtual ~Clock() = default;

    // UTC unix seconds.
    virtual double now() const = 0;
};

class System_clock : public Clock
{
public:
    double now() const override
    {
        using namespace std::chrono;
        const auto since_epoch = system_clock::now().time_since_epoch();
        return duration_cast<duration<double>>(since_epoch).count();
    }
};

// Clock that only moves when told to.
class Manual_clock : public Clock
{
public:
    explicit Manual_clock(double now = 0.0) : m_now(now) {}

    double now() const override { return m_now; }

    void set(double now) { m_now = now; }
    void advance(double seconds) { m_now += seconds; }

private:
    double m_now;
};

} // namespace entrylog
