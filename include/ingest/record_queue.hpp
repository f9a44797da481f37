#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>

#include "ingest/ingest_options.hpp"
#include "ingest/record.hpp"

// Bounded FIFO between producer threads and the single ingest worker.
class RecordQueue
{
public:
    using Clock     = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;

    enum class PushStatus {
        Queued,
        Dropped,   // full under Backpressure::Drop, or queue aborted
        Closed     // close() was called; pushing is a caller bug
    };

    enum class PopStatus {
        Record,
        Timeout,
        Closed     // closed and fully drained
    };

    explicit RecordQueue(std::size_t capacity);

    RecordQueue(const RecordQueue&) = delete;
    RecordQueue& operator=(const RecordQueue&) = delete;

    PushStatus push(Record record, Backpressure mode);

    // Waits until a record is available, the deadline passes, or the queue
    // is closed and empty. Buffered records are still delivered after close.
    PopStatus pop_until(Record& out, TimePoint deadline);

    // Waits without taking anything until the queue is closed (or aborted)
    // or the deadline passes. Returns true when closed.
    bool wait_closed_until(TimePoint deadline);

    // No more pushes; records already queued stay poppable.
    // Returns false when the queue was already closed.
    bool close();

    // Fatal stop: buffered records are discarded, blocked producers are
    // released and every later push is dropped. Returns the discard count.
    std::size_t abort();

    bool        closed() const;
    std::size_t size() const;
    std::size_t capacity() const { return capacity_; }

private:
    const std::size_t       capacity_;
    std::deque<Record>      items_;
    mutable std::mutex      mtx_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    bool                    closed_  = false;
    bool                    aborted_ = false;
};
