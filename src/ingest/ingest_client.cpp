#include "ingest/ingest_client.hpp"

#include <cstdlib>
#include <stdexcept>
#include <vector>

#include <spdlog/spdlog.h>

#include "ingest/flusher.hpp"
#include "transport/curl_transport.hpp"

const char* to_string(WorkerState s)
{
    switch (s) {
    case WorkerState::Uninitialized: return "uninitialized";
    case WorkerState::Running:       return "running";
    case WorkerState::Draining:      return "draining";
    case WorkerState::Stopped:       return "stopped";
    }
    return "unknown";
}

/* ---------- construct / destroy ---------- */
IngestClient::IngestClient(std::string endpoint, std::size_t queue_capacity)
{
    options_.endpoint = std::move(endpoint);
    options_.queue_capacity = queue_capacity;
}

IngestClient::IngestClient(IngestOptions options)
    : options_(std::move(options))
{
}

IngestClient::~IngestClient()
{
    bool need_close = false;
    {
        std::lock_guard lg(mtx_);
        need_close = !closed_;
    }
    if (need_close) close();
}

std::unique_ptr<IngestClient> IngestClient::from_settings(const IngestSettings& settings)
{
    auto client = std::make_unique<IngestClient>(settings.ingest);

    CurlTransport::options topt;
    topt.timeout_ms = settings.http.timeout_ms;
    topt.connect_timeout_ms = settings.http.connect_timeout_ms;
    topt.verify_tls = settings.http.verify_tls;
    topt.proxy = settings.http.proxy;
    client->set_transport(std::make_shared<CurlTransport>(topt));

    std::vector<AuthDecorator> chain;
    for (const auto& h : settings.headers)
        chain.push_back(header_auth(h.name, h.value));
    if (!settings.bearer_token_env.empty()) {
        // read per attempt so a rotated token is used by the next flush
        chain.push_back(bearer_auth([env = settings.bearer_token_env] {
            const char* v = std::getenv(env.c_str());
            return v ? std::string(v) : std::string();
        }));
    } else if (!settings.bearer_token.empty()) {
        chain.push_back(bearer_auth(settings.bearer_token));
    }
    if (!chain.empty())
        client->set_auth(chain_auth(std::move(chain)));

    return client;
}

/* ---------- configuration ---------- */
bool IngestClient::configurable(const char* setter) const
{
    if (state_ == WorkerState::Uninitialized && !closed_) return true;
    spdlog::warn("ingest_client: {} ignored, client is {} (setters only apply before the first ingest)",
                 setter, to_string(state_));
    return false;
}

bool IngestClient::set_transport(std::shared_ptr<HttpTransport> transport)
{
    std::lock_guard lg(mtx_);
    if (!configurable("set_transport")) return false;
    transport_ = std::move(transport);
    return true;
}

bool IngestClient::set_auth(AuthDecorator auth)
{
    std::lock_guard lg(mtx_);
    if (!configurable("set_auth")) return false;
    auth_ = std::move(auth);
    return true;
}

bool IngestClient::set_batch_size(std::size_t batch_size)
{
    std::lock_guard lg(mtx_);
    if (!configurable("set_batch_size")) return false;
    options_.batch_size = batch_size;
    return true;
}

bool IngestClient::set_max_delay(std::chrono::milliseconds max_delay)
{
    std::lock_guard lg(mtx_);
    if (!configurable("set_max_delay")) return false;
    options_.max_delay = max_delay;
    return true;
}

bool IngestClient::set_queue_capacity(std::size_t capacity)
{
    std::lock_guard lg(mtx_);
    if (!configurable("set_queue_capacity")) return false;
    options_.queue_capacity = capacity;
    return true;
}

bool IngestClient::set_backpressure(Backpressure mode)
{
    std::lock_guard lg(mtx_);
    if (!configurable("set_backpressure")) return false;
    options_.backpressure = mode;
    return true;
}

bool IngestClient::set_max_pending(std::size_t max_pending)
{
    std::lock_guard lg(mtx_);
    if (!configurable("set_max_pending")) return false;
    options_.max_pending = max_pending;
    return true;
}

/* ---------- lifecycle ---------- */
void IngestClient::start()
{
    std::lock_guard lg(mtx_);
    if (state_ != WorkerState::Uninitialized || closed_) return;

    options_ = options_.normalized();
    if (!transport_) transport_ = std::make_shared<CurlTransport>();

    // nothing is committed until the thread runs, so a failed start leaves
    // the client uninitialized and the next ingest() tries again
    auto queue = std::make_unique<RecordQueue>(options_.queue_capacity);
    auto worker = std::make_unique<IngestWorker>(
        options_, *queue,
        std::make_unique<Flusher>(options_.endpoint, transport_, auth_),
        counters_,
        [this](std::optional<std::string> fault) { on_worker_exit(std::move(fault)); });
    worker->start();

    queue_ = std::move(queue);
    worker_ = std::move(worker);
    state_ = WorkerState::Running;
    spdlog::info("ingest_client: started endpoint={} batch_size={} max_delay={}ms queue_capacity={} backpressure={}",
                 options_.endpoint, options_.batch_size, options_.max_delay.count(),
                 options_.queue_capacity, to_string(options_.backpressure));
}

void IngestClient::enqueue(Record record)
{
    // queue_ is written once inside call_once, which orders it before this read
    if (!queue_)
        throw std::logic_error("ingest_client: ingest called after close");

    switch (queue_->push(std::move(record), options_.backpressure)) {
    case RecordQueue::PushStatus::Queued:
        ++counters_.queued;
        break;
    case RecordQueue::PushStatus::Dropped:
        ++counters_.dropped;
        break;
    case RecordQueue::PushStatus::Closed:
        throw std::logic_error("ingest_client: ingest called after close");
    }
}

void IngestClient::close()
{
    RecordQueue* queue = nullptr;
    IngestWorker* worker = nullptr;
    {
        std::unique_lock lk(mtx_);
        if (closed_) {
            spdlog::warn("ingest_client: close called more than once");
            // a concurrent first close may still be draining
            close_done_cv_.wait(lk, [this] { return close_done_; });
            return;
        }
        closed_ = true;
        if (state_ == WorkerState::Uninitialized) {
            state_ = WorkerState::Stopped;
            close_done_ = true;
            spdlog::debug("ingest_client: closed before first ingest");
            return;
        }
        if (state_ == WorkerState::Running) state_ = WorkerState::Draining;
        queue = queue_.get();
        worker = worker_.get();
    }

    queue->close();
    worker->join();

    {
        std::lock_guard lg(mtx_);
        close_done_ = true;
    }
    close_done_cv_.notify_all();

    auto s = counters_.snapshot();
    spdlog::info("ingest_client: closed, queued={} delivered={} dropped={} flush_attempts={} failed_flushes={}",
                 s.queued, s.delivered, s.dropped, s.flush_attempts, s.failed_flushes);
}

void IngestClient::on_worker_exit(std::optional<std::string> fault)
{
    std::lock_guard lg(mtx_);
    if (fault) fault_ = std::move(fault);
    state_ = WorkerState::Stopped;
}

WorkerState IngestClient::state() const
{
    std::lock_guard lg(mtx_);
    return state_;
}

std::optional<std::string> IngestClient::fault() const
{
    std::lock_guard lg(mtx_);
    return fault_;
}

std::string IngestClient::endpoint() const
{
    std::lock_guard lg(mtx_);
    return options_.endpoint;
}
