// entrylog Qt timeline controller tests

#include <entrylog/qt/timeline_controller.h>

#include <QCoreApplication>
#include <QElapsedTimer>
#include <QEventLoop>
#include <QThread>
#include <QThreadPool>

#include <algorithm>
#include <atomic>
#include <functional>
#include <future>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
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
constexpr double k_hour = 3600.0;

el::entry_t make_entry(std::int64_t id, double timestamp)
{
    el::entry_t e;
    e.id = id;
    e.timestamp = timestamp;
    e.description = "entry " + std::to_string(id);
    return e;
}

el::Timeline_config utc_config()
{
    auto config = el::Timeline_config::make_default();
    config.use_utc_calendar = true;
    return config;
}

// Spins the event loop until `done` holds or the timeout expires.
bool wait_until(const std::function<bool()>& done, int timeout_ms = 5000)
{
    QElapsedTimer timer;
    timer.start();
    while (!done() && timer.elapsed() < timeout_ms) {
        QCoreApplication::processEvents(QEventLoop::AllEvents, 10);
        QThread::msleep(1);
    }
    return done();
}

class Shared_source : public el::Entry_source
{
public:
    el::fetch_result_t fetch_entries() override
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        thread = QThread::currentThread();
        el::fetch_result_t result;
        result.status = el::Status::OK;
        result.entries = m_entries;
        return result;
    }

    void set_entries(std::vector<el::entry_t> entries)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_entries = std::move(entries);
    }

    std::atomic<QThread*> thread{nullptr};

private:
    std::mutex               m_mutex;
    std::vector<el::entry_t> m_entries;
};

// Sink that holds every request until the gate opens.
class Gated_sink : public el::Entry_sink
{
public:
    Gated_sink() : m_gate(m_release.get_future().share()) {}

    el::create_result_t create_entry(const el::entry_request_t& request) override
    {
        thread = QThread::currentThread();
        ++calls;
        m_gate.wait();

        el::create_result_t result;
        if (fail) {
            result.status = el::Status::FAILED;
            result.message = "server rejected entry";
            return result;
        }
        result.status = el::Status::OK;
        result.entry.id = next_id++;
        result.entry.timestamp = request.timestamp;
        result.entry.description = request.description;
        result.entry.energy = request.energy;
        return result;
    }

    void open()
    {
        if (!m_opened.exchange(true)) {
            m_release.set_value();
        }
    }

    std::atomic<QThread*>     thread{nullptr};
    std::atomic<int>          calls{0};
    std::atomic<bool>         fail{false};
    std::atomic<std::int64_t> next_id{100};

private:
    std::promise<void>       m_release;
    std::shared_future<void> m_gate;
    std::atomic<bool>        m_opened{false};
};

// Opens the gate on scope exit so a failed assertion cannot strand a worker.
struct gate_guard_t
{
    std::shared_ptr<Gated_sink> sink;
    ~gate_guard_t() { sink->open(); }
};

bool test_commit_runs_off_the_gui_thread()
{
    auto sink = std::make_shared<Gated_sink>();
    const gate_guard_t gate{sink};
    el::Timeline_controller controller(utc_config(), std::make_shared<el::Manual_clock>(k_now));
    controller.set_entry_sink(sink);

    qint64 created = 0;
    QObject::connect(&controller, &el::Timeline_controller::entry_created,
        [&created](qint64 id) { created = id; });

    controller.set_draft_text("walk");
    TEST_ASSERT(controller.is_composing(), "text starts composing");

    TEST_ASSERT(controller.commit(), "commit is handed to the sink");
    TEST_ASSERT(controller.is_committing(), "commit returns while the sink is still working");
    TEST_ASSERT(!controller.commit(), "a second commit is refused while one is pending");

    sink->open();
    TEST_ASSERT(wait_until([&] { return created != 0; }), "entry_created arrives");
    TEST_ASSERT(sink->thread.load() != QThread::currentThread(), "sink ran on a worker thread");
    TEST_ASSERT(sink->calls.load() == 1, "exactly one request reached the sink");
    TEST_ASSERT(created == 100, "created id is reported");
    TEST_ASSERT(!controller.is_committing() && !controller.is_composing(), "back to idle");
    TEST_ASSERT(controller.rowCount() == 1, "new entry is listed");
    TEST_ASSERT(controller.draft_text().isEmpty(), "draft is reset");
    return true;
}

bool test_refresh_while_commit_pending_then_failure()
{
    auto source = std::make_shared<Shared_source>();
    auto sink = std::make_shared<Gated_sink>();
    const gate_guard_t gate{sink};
    sink->fail = true;
    source->set_entries({make_entry(1, k_now - k_hour)});

    el::Timeline_controller controller(utc_config(), std::make_shared<el::Manual_clock>(k_now));
    controller.set_entry_source(source);
    controller.set_entry_sink(sink);

    int fetches = 0;
    QObject::connect(&controller, &el::Timeline_controller::refresh_finished,
        [&fetches](bool ok) { if (ok) { ++fetches; } });

    TEST_ASSERT(controller.refresh(), "refresh starts");
    TEST_ASSERT(controller.is_loading(), "loading while the fetch is out");
    TEST_ASSERT(wait_until([&] { return fetches == 1; }), "first fetch lands");
    TEST_ASSERT(source->thread.load() != QThread::currentThread(), "source ran on a worker thread");
    TEST_ASSERT(controller.rowCount() == 1, "one entry listed");

    controller.set_draft_text("swim");
    controller.drag_to(110.0);
    const QString offset_label = controller.draft_timestamp_label();
    TEST_ASSERT(offset_label != "now", "draft is backdated");
    TEST_ASSERT(controller.commit(), "commit is handed to the sink");

    source->set_entries({make_entry(2, k_now - 0.5 * k_hour), make_entry(1, k_now - k_hour)});
    TEST_ASSERT(controller.refresh(), "refresh while committing starts");
    TEST_ASSERT(wait_until([&] { return fetches == 2; }), "second fetch lands");
    TEST_ASSERT(controller.is_committing(), "fetch keeps the commit in flight");
    TEST_ASSERT(controller.rowCount() == 2, "fetched entries are listed");

    sink->open();
    TEST_ASSERT(wait_until([&] { return !controller.is_committing(); }), "commit completes");
    TEST_ASSERT(controller.is_composing(), "failure returns to composing");
    TEST_ASSERT(controller.draft_text() == "swim", "text survives the failure");
    TEST_ASSERT(controller.draft_timestamp_label() == offset_label, "backdated time survives the failure");
    TEST_ASSERT(controller.error_message() == "server rejected entry", "sink message is shown");
    TEST_ASSERT(controller.rowCount() == 2, "failure leaves the list alone");

    sink->fail = false;
    qint64 created = 0;
    QObject::connect(&controller, &el::Timeline_controller::entry_created,
        [&created](qint64 id) { created = id; });
    TEST_ASSERT(controller.commit(), "retry is handed to the sink");
    TEST_ASSERT(wait_until([&] { return created != 0; }), "retry succeeds");
    TEST_ASSERT(sink->calls.load() == 2, "retry issued a second request");
    TEST_ASSERT(controller.rowCount() == 3, "retried entry is listed");
    TEST_ASSERT(controller.error_message().isEmpty(), "error clears after success");
    return true;
}

bool test_missing_boundary_is_reported()
{
    el::Timeline_controller controller(utc_config(), std::make_shared<el::Manual_clock>(k_now));

    TEST_ASSERT(!controller.refresh(), "refresh without a source fails");
    TEST_ASSERT(!controller.error_message().isEmpty(), "missing source is shown");
    TEST_ASSERT(!controller.is_loading(), "nothing is loading");

    controller.set_draft_text("tea");
    TEST_ASSERT(!controller.commit(), "commit without a sink fails");
    TEST_ASSERT(controller.is_composing(), "draft stays open");
    return true;
}

bool test_dark_mode_switches_palette()
{
    el::Timeline_controller controller(utc_config(), std::make_shared<el::Manual_clock>(k_now));

    int palette_signals = 0;
    QObject::connect(&controller, &el::Timeline_controller::palette_changed,
        [&palette_signals]() { ++palette_signals; });

    TEST_ASSERT(controller.is_dark_mode(), "dark by default");
    TEST_ASSERT(controller.text_color() == el::to_qcolor(el::Color_palette::dark().entry_text), "dark text");

    controller.set_dark_mode(false);
    TEST_ASSERT(!controller.is_dark_mode(), "light after the switch");
    TEST_ASSERT(controller.text_color() == el::to_qcolor(el::Color_palette::light().entry_text), "light text");
    TEST_ASSERT(palette_signals == 1, "palette change is signalled once");

    controller.set_dark_mode(false);
    TEST_ASSERT(palette_signals == 1, "setting the same theme is silent");
    return true;
}

} // namespace

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);

    // The gated sink occupies a worker while fetches run beside it.
    QThreadPool::globalInstance()->setMaxThreadCount(std::max(4, QThread::idealThreadCount()));

    std::cout << "Timeline controller tests" << std::endl;

    int passed = 0;
    int failed = 0;

    RUN_TEST(test_commit_runs_off_the_gui_thread);
    RUN_TEST(test_refresh_while_commit_pending_then_failure);
    RUN_TEST(test_missing_boundary_is_reported);
    RUN_TEST(test_dark_mode_switches_palette);

    std::cout << "Results: " << passed << " passed, " << failed << " failed" << std::endl;
    return failed > 0 ? 1 : 0;
}
