#include "ingest/record_queue.hpp"

#include <stdexcept>

RecordQueue::RecordQueue(std::size_t capacity)
    : capacity_(capacity)
{
    if (capacity_ == 0)
        throw std::invalid_argument("RecordQueue: capacity must be positive");
}

RecordQueue::PushStatus RecordQueue::push(Record record, Backpressure mode)
{
    std::unique_lock lk(mtx_);
    if (mode == Backpressure::Block) {
        not_full_.wait(lk, [this] {
            return closed_ || aborted_ || items_.size() < capacity_;
        });
    }
    if (aborted_) return PushStatus::Dropped;
    if (closed_) return PushStatus::Closed;
    if (items_.size() >= capacity_) return PushStatus::Dropped;

    items_.push_back(std::move(record));
    lk.unlock();
    not_empty_.notify_one();
    return PushStatus::Queued;
}

RecordQueue::PopStatus RecordQueue::pop_until(Record& out, TimePoint deadline)
{
    std::unique_lock lk(mtx_);
    bool ready = not_empty_.wait_until(lk, deadline, [this] {
        return !items_.empty() || closed_ || aborted_;
    });
    if (!ready) return PopStatus::Timeout;
    if (items_.empty()) return PopStatus::Closed;

    out = std::move(items_.front());
    items_.pop_front();
    lk.unlock();
    not_full_.notify_one();
    return PopStatus::Record;
}

bool RecordQueue::wait_closed_until(TimePoint deadline)
{
    std::unique_lock lk(mtx_);
    return not_empty_.wait_until(lk, deadline, [this] { return closed_ || aborted_; });
}

bool RecordQueue::close()
{
    {
        std::lock_guard lg(mtx_);
        if (closed_) return false;
        closed_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();
    return true;
}

std::size_t RecordQueue::abort()
{
    std::size_t discarded = 0;
    {
        std::lock_guard lg(mtx_);
        aborted_ = true;
        discarded = items_.size();
        items_.clear();
    }
    not_empty_.notify_all();
    not_full_.notify_all();
    return discarded;
}

bool RecordQueue::closed() const
{
    std::lock_guard lg(mtx_);
    return closed_ || aborted_;
}

std::size_t RecordQueue::size() const
{
    std::lock_guard lg(mtx_);
    return items_.size();
}
