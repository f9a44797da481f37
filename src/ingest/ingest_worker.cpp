#include "ingest/ingest_worker.hpp"

#include <spdlog/spdlog.h>

#include "common/ticker.hpp"

IngestStats IngestCounters::snapshot() const
{
    IngestStats s;
    s.queued = queued.load();
    s.dropped = dropped.load();
    s.delivered = delivered.load();
    s.flush_attempts = flush_attempts.load();
    s.failed_flushes = failed_flushes.load();
    return s;
}

/* ---------- construct / destroy ---------- */
IngestWorker::IngestWorker(IngestOptions opt,
                           RecordQueue& queue,
                           std::unique_ptr<Flusher> flusher,
                           IngestCounters& counters,
                           OnExit on_exit)
    : opt_(opt.normalized()),
      queue_(queue),
      flusher_(std::move(flusher)),
      counters_(counters),
      on_exit_(std::move(on_exit)),
      batch_(opt_.batch_size)
{
}

IngestWorker::~IngestWorker()
{
    join();
}

void IngestWorker::start()
{
    if (thread_.joinable()) return;
    thread_ = std::thread(&IngestWorker::run, this);
}

void IngestWorker::join()
{
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id())
        thread_.join();
}

/* ---------- event loop ---------- */
void IngestWorker::run()
{
    spdlog::debug("ingest_worker: started, url={} batch_size={} max_delay={}ms",
                  flusher_->url(), opt_.batch_size, opt_.max_delay.count());
    try {
        // period is fixed from start and not reset by size-triggered flushes
        Ticker ticker(opt_.max_delay);
        while (!fault_) {
            auto now = Ticker::Clock::now();
            if (ticker.due(now)) {
                // served before further deliveries so a busy queue cannot starve the timer
                ticker.advance(now);
                flush_batch(Trigger::Timer);
                continue;
            }

            if (backlogged()) {
                // leave records in the queue so its backpressure mode applies
                queue_.wait_closed_until(ticker.nextRun());
                continue;
            }

            Record record;
            auto st = queue_.pop_until(record, ticker.nextRun());
            if (st == RecordQueue::PopStatus::Record) {
                accept(std::move(record));
            } else if (st == RecordQueue::PopStatus::Closed) {
                flush_batch(Trigger::Shutdown);
                break;
            }
        }
    } catch (const std::exception& e) {
        fail(std::string("ingest worker error: ") + e.what());
    }

    if (fault_) {
        auto discarded = queue_.abort() + batch_.size();
        batch_.clear();
        counters_.dropped += discarded;
        spdlog::critical("ingest_worker: stopped on fatal fault, {} records discarded: {}",
                         discarded, *fault_);
    } else {
        spdlog::debug("ingest_worker: stopped");
    }

    if (on_exit_) on_exit_(fault_);
}

// A failed batch waiting for its timer retry stops intake, unless a pending
// cap was configured, in which case intake continues and the oldest records
// are trimmed instead. Once the queue is closed it is drained regardless.
bool IngestWorker::backlogged() const
{
    return retry_pending_
        && opt_.max_pending == 0
        && batch_.size() >= opt_.batch_size
        && !queue_.closed();
}

void IngestWorker::accept(Record record)
{
    batch_.append(std::move(record));

    if (opt_.max_pending > 0) {
        if (auto n = batch_.trim_oldest(opt_.max_pending); n > 0) {
            counters_.dropped += n;
            spdlog::warn("ingest_worker: pending records over limit {}, dropped {} oldest",
                         opt_.max_pending, n);
        }
    }

    if (batch_.size() < opt_.batch_size) return;
    // after a failed attempt only the timer (or shutdown) retries
    if (retry_pending_) return;
    flush_batch(Trigger::Size);
}

void IngestWorker::flush_batch(Trigger trigger)
{
    if (batch_.empty()) return;

    auto n = batch_.size();
    ++counters_.flush_attempts;
    auto result = flusher_->flush(batch_);

    switch (result) {
    case FlushResult::Delivered:
        counters_.delivered += n;
        retry_pending_ = false;
        break;
    case FlushResult::Retry:
        ++counters_.failed_flushes;
        retry_pending_ = true;
        if (trigger == Trigger::Shutdown) {
            counters_.dropped += n;
            spdlog::warn("ingest_worker: final flush failed, {} records lost", n);
            batch_.clear();
        }
        break;
    case FlushResult::Fatal:
        ++counters_.failed_flushes;
        fail(flusher_->last_error());
        break;
    case FlushResult::Empty:
        break;
    }
}

void IngestWorker::fail(const std::string& reason)
{
    if (!fault_) fault_ = reason;
}
