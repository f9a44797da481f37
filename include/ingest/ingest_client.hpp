#pragma once
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LOGGER_TRACE

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

#include "ingest/ingest_options.hpp"
#include "ingest/ingest_worker.hpp"
#include "ingest/record_queue.hpp"
#include "transport/auth.hpp"
#include "transport/http_transport.hpp"

enum class WorkerState {
    Uninitialized,
    Running,
    Draining,
    Stopped
};

const char* to_string(WorkerState s);

// Fire-and-forget batching client for a JSONL ingest endpoint.
//
// Records are queued by ingest() and shipped by one background worker as
// `POST {endpoint}/ingest`. The worker starts on the first ingest() call;
// every setter must be called before that. A setter called later changes
// nothing, logs a warning and returns false.
class IngestClient
{
public:
    explicit IngestClient(std::string endpoint, std::size_t queue_capacity = 0);
    explicit IngestClient(IngestOptions options);
    ~IngestClient();

    // Client wired from a loaded `ingest_config` section: curl transport with
    // the HTTP options, static headers and bearer auth. Not started yet.
    static std::unique_ptr<IngestClient> from_settings(const IngestSettings& settings);

    IngestClient(const IngestClient&) = delete;
    IngestClient& operator=(const IngestClient&) = delete;

    bool set_transport(std::shared_ptr<HttpTransport> transport);
    bool set_auth(AuthDecorator auth);
    bool set_batch_size(std::size_t batch_size);
    bool set_max_delay(std::chrono::milliseconds max_delay);
    bool set_queue_capacity(std::size_t capacity);
    bool set_backpressure(Backpressure mode);
    bool set_max_pending(std::size_t max_pending);

    // Queues each argument as one record (anything nlohmann::json can hold,
    // including types with a to_json overload). Blocks or drops per the
    // backpressure mode. Throws std::logic_error once close() was called.
    template <typename... Records>
    void ingest(Records&&... records)
    {
        std::call_once(start_once_, [this] { start(); });
        (enqueue(Record(std::forward<Records>(records))), ...);
    }

    // Stops accepting records, waits for the worker to drain the queue and
    // make its final flush attempt. Later calls log a warning and return once
    // that first close has finished.
    void close();

    WorkerState                state() const;
    std::optional<std::string> fault() const;
    IngestStats                stats() const { return counters_.snapshot(); }
    std::string                endpoint() const;

private:
    void start();
    void enqueue(Record record);
    bool configurable(const char* setter) const;
    void on_worker_exit(std::optional<std::string> fault);

    IngestOptions                  options_;
    std::shared_ptr<HttpTransport> transport_;
    AuthDecorator                  auth_;

    mutable std::mutex             mtx_;
    std::once_flag                 start_once_;
    WorkerState                    state_  = WorkerState::Uninitialized;
    bool                           closed_ = false;
    bool                           close_done_ = false;
    std::condition_variable        close_done_cv_;
    std::optional<std::string>     fault_;

    IngestCounters                 counters_;
    std::unique_ptr<RecordQueue>   queue_;
    std::unique_ptr<IngestWorker>  worker_;
};
