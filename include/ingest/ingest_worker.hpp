#pragma once
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LOGGER_TRACE

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include "ingest/batch.hpp"
#include "ingest/flusher.hpp"
#include "ingest/ingest_options.hpp"
#include "ingest/record_queue.hpp"

struct IngestStats {
    std::uint64_t queued         = 0;
    std::uint64_t dropped        = 0;   // backpressure, overflow, abort, lost at shutdown
    std::uint64_t delivered      = 0;
    std::uint64_t flush_attempts = 0;
    std::uint64_t failed_flushes = 0;
};

struct IngestCounters {
    std::atomic<std::uint64_t> queued{0};
    std::atomic<std::uint64_t> dropped{0};
    std::atomic<std::uint64_t> delivered{0};
    std::atomic<std::uint64_t> flush_attempts{0};
    std::atomic<std::uint64_t> failed_flushes{0};

    IngestStats snapshot() const;
};

// Single background consumer: drains the queue into the batch and flushes
// it on size, on a fixed-period tick, and once more when the queue closes.
class IngestWorker
{
public:
    // Called from the worker thread right before it exits; carries the
    // fault message when the worker stopped on a fatal flush.
    using OnExit = std::function<void(std::optional<std::string> fault)>;

    IngestWorker(IngestOptions opt,
                 RecordQueue& queue,
                 std::unique_ptr<Flusher> flusher,
                 IngestCounters& counters,
                 OnExit on_exit);
    ~IngestWorker();

    IngestWorker(const IngestWorker&) = delete;
    IngestWorker& operator=(const IngestWorker&) = delete;

    void start();
    void join();

private:
    enum class Trigger { Size, Timer, Shutdown };

    void run();
    bool backlogged() const;
    void accept(Record record);
    void flush_batch(Trigger trigger);
    void fail(const std::string& reason);

    const IngestOptions      opt_;
    RecordQueue&             queue_;
    std::unique_ptr<Flusher> flusher_;
    IngestCounters&          counters_;
    OnExit                   on_exit_;

    Batch                      batch_;
    bool                       retry_pending_ = false;
    std::optional<std::string> fault_;
    std::thread                thread_;
};
