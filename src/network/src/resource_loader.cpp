/**
 * Asynchronous Resource Loader implementation
 */

#include "vellum/network/resource_loader.hpp"
#include "vellum/core/logger.hpp"
#include <algorithm>
#include <cmath>

namespace vellum::network {

namespace {

Logger& log() {
    return logging::get("loader");
}

std::string accept_header_for(ResourceType type) {
    switch (type) {
        case ResourceType::Texture: return "image/*";
        case ResourceType::Font: return "font/*,application/font-woff";
        case ResourceType::Audio: return "audio/*";
        case ResourceType::Json: return "application/json";
        case ResourceType::Svg: return "image/svg+xml";
        case ResourceType::Binary: return "*/*";
    }
    return "*/*";
}

} // anonymous namespace

std::string_view to_string(LoadingState state) {
    switch (state) {
        case LoadingState::Pending: return "pending";
        case LoadingState::Loading: return "loading";
        case LoadingState::Loaded: return "loaded";
        case LoadingState::Error: return "error";
        case LoadingState::Cancelled: return "cancelled";
    }
    return "pending";
}

// ============================================================================
// Internal state
// ============================================================================

struct AsyncResourceLoader::TaskRecord {
    TaskRecord(EventLoop& loop, const CancellationToken& parent)
        : promise(loop), cancel(parent) {}

    LoadingTask info;
    Promise<ResourcePtr> promise;
    CancellationSource cancel;

    // Current attempt
    std::unique_ptr<CancellationSource> attempt_cancel;
    bool attempt_active{false};
    TimerId timeout_timer{INVALID_TIMER};
    TimerId retry_timer{INVALID_TIMER};
    HttpHeaders response_headers;
    std::vector<u8> body;
    f64 body_started_at{0.0};
};

struct AsyncResourceLoader::BatchState {
    explicit BatchState(EventLoop& loop) : promise(loop) {}

    std::string id;
    std::vector<std::string> task_ids;
    std::vector<std::optional<ResourceResult<ResourcePtr>>> results;
    usize remaining{0};
    std::vector<ConnectionId> connections;
    Promise<std::vector<ResourcePtr>> promise;
};

// ============================================================================
// Construction
// ============================================================================

AsyncResourceLoader::AsyncResourceLoader(EventLoop& loop, Transport& transport,
                                         const DecoderRegistry& decoders, LoaderOptions options)
    : m_loop(loop)
    , m_transport(transport)
    , m_decoders(decoders)
    , m_options(options)
    , m_global_cancel(std::make_unique<CancellationSource>())
    , m_alive(std::make_shared<bool>(true)) {
    if (m_options.max_concurrent_loads == 0) {
        m_options.max_concurrent_loads = 1;
    }
}

AsyncResourceLoader::~AsyncResourceLoader() {
    dispose();
}

ResourceConfig AsyncResourceLoader::normalize_config(const ResourceConfig& config) const {
    ResourceConfig normalized = config;
    if (!normalized.priority) {
        normalized.priority = m_options.default_priority;
    }
    if (!normalized.timeout_ms) {
        normalized.timeout_ms = m_options.default_timeout_ms;
    }
    if (!normalized.retries) {
        normalized.retries = m_options.default_retries;
    }
    if (!normalized.credentials) {
        normalized.credentials = Credentials::SameOrigin;
    }
    return normalized;
}

// ============================================================================
// Public API
// ============================================================================

Future<ResourcePtr> AsyncResourceLoader::load_resource(const ResourceConfig& config) {
    if (m_disposed) {
        return make_failed_future<ResourcePtr>(
            m_loop, ResourceError::configuration("Resource loader has been disposed"));
    }

    ResourceConfig normalized = normalize_config(config);

    auto existing = m_tasks.find(normalized.id);
    if (existing != m_tasks.end()) {
        const auto& record = existing->second;
        if (record->info.state == LoadingState::Loaded) {
            return make_ready_future(m_loop, record->info.data);
        }
        if (record->info.state == LoadingState::Pending ||
            record->info.state == LoadingState::Loading) {
            return record->promise.future();
        }
    }

    auto record = std::make_shared<TaskRecord>(m_loop, m_global_cancel->token());
    record->info.config = std::move(normalized);
    record->info.start_time = m_loop.now_ms();
    m_tasks[record->info.config.id] = record;

    log().debug_fmt("Queued {} ({}, priority {})", record->info.config.id,
                    to_string(record->info.config.type), *record->info.config.priority);

    auto future = record->promise.future();
    enqueue(record);
    pump();
    return future;
}

Future<std::vector<ResourcePtr>> AsyncResourceLoader::load_batch(
    const std::vector<ResourceConfig>& configs, std::optional<std::string> batch_id) {
    auto batch = std::make_shared<BatchState>(m_loop);
    batch->id = batch_id ? *batch_id : "batch_" + std::to_string(m_next_batch_id++);
    batch->results.resize(configs.size());
    batch->remaining = configs.size();
    for (const auto& config : configs) {
        batch->task_ids.push_back(config.id);
    }

    on_batch_started.emit(batch->id);

    if (configs.empty()) {
        on_batch_completed.emit(batch->id);
        batch->promise.resolve({});
        return batch->promise.future();
    }

    // Recompute the aggregate whenever a member reports anything
    std::weak_ptr<BatchState> weak_batch = batch;
    auto track = [this, weak_batch](const LoadingTask& task) {
        auto tracked = weak_batch.lock();
        if (!tracked) {
            return;
        }
        const auto& ids = tracked->task_ids;
        if (std::find(ids.begin(), ids.end(), task.config.id) != ids.end()) {
            emit_batch_progress(*tracked);
        }
    };
    batch->connections.push_back(on_task_progress.connect(
        [track](const LoadingTask& task, const LoadingProgress&) { track(task); }));
    batch->connections.push_back(on_task_completed.connect(track));
    batch->connections.push_back(on_task_failed.connect(
        [track](const LoadingTask& task, const ResourceError&) { track(task); }));
    batch->connections.push_back(on_task_cancelled.connect(track));

    auto future = batch->promise.future();
    std::weak_ptr<bool> alive = m_alive;
    for (usize i = 0; i < configs.size(); ++i) {
        load_resource(configs[i]).then([this, alive, batch, i](const ResourceResult<ResourcePtr>& result) {
            if (!alive.lock()) {
                return;
            }
            batch->results[i] = result;
            if (--batch->remaining == 0) {
                finish_batch(batch);
            }
        });
    }
    return future;
}

Future<ResourcePtr> AsyncResourceLoader::preload_resource(const ResourceConfig& config) {
    ResourceConfig preload = config;
    preload.priority = config.priority.value_or(0) - m_options.preload_priority_penalty;

    Promise<ResourcePtr> promise(m_loop);
    std::string id = config.id;
    load_resource(preload).then([promise, id](const ResourceResult<ResourcePtr>& result) mutable {
        if (result) {
            promise.resolve(result.value());
            return;
        }
        log().warn_fmt("Preload failed for {}: {}", id, result.error().describe());
        promise.resolve(nullptr);
    });
    return promise.future();
}

bool AsyncResourceLoader::cancel_resource(const std::string& id) {
    auto it = m_tasks.find(id);
    if (it == m_tasks.end()) {
        return false;
    }
    auto record = it->second;
    if (is_terminal(record->info.state)) {
        return false;
    }
    cancel_task(record);
    pump();
    return true;
}

void AsyncResourceLoader::cancel_all() {
    m_global_cancel->cancel();
    m_global_cancel = std::make_unique<CancellationSource>();

    std::vector<RecordPtr> live;
    for (const auto& [id, record] : m_tasks) {
        if (!is_terminal(record->info.state)) {
            live.push_back(record);
        }
    }
    for (const auto& record : live) {
        cancel_task(record);
    }

    m_queue.clear();
    m_active.clear();
    if (!live.empty()) {
        log().info_fmt("Cancelled {} tasks", live.size());
    }
}

std::optional<LoadingTask> AsyncResourceLoader::get_task(const std::string& id) const {
    auto it = m_tasks.find(id);
    if (it == m_tasks.end()) {
        return std::nullopt;
    }
    return it->second->info;
}

std::vector<LoadingTask> AsyncResourceLoader::get_all_tasks() const {
    std::vector<LoadingTask> tasks;
    tasks.reserve(m_tasks.size());
    for (const auto& [id, record] : m_tasks) {
        tasks.push_back(record->info);
    }
    return tasks;
}

LoaderStats AsyncResourceLoader::get_stats() const {
    LoaderStats stats;
    stats.total = m_tasks.size();
    stats.queue_size = m_queue.size();
    stats.active_loaders = m_active.size();

    for (const auto& [id, record] : m_tasks) {
        switch (record->info.state) {
            case LoadingState::Pending: ++stats.pending; break;
            case LoadingState::Loading: ++stats.loading; break;
            case LoadingState::Loaded: ++stats.loaded; break;
            case LoadingState::Error: ++stats.error; break;
            case LoadingState::Cancelled: ++stats.cancelled; break;
        }
    }
    return stats;
}

usize AsyncResourceLoader::cleanup() {
    usize removed = 0;
    for (auto it = m_tasks.begin(); it != m_tasks.end();) {
        if (is_terminal(it->second->info.state)) {
            it = m_tasks.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

void AsyncResourceLoader::dispose() {
    if (m_disposed) {
        return;
    }
    cancel_all();
    m_tasks.clear();
    m_disposed = true;

    on_task_started.disconnect_all();
    on_task_progress.disconnect_all();
    on_task_completed.disconnect_all();
    on_task_failed.disconnect_all();
    on_task_cancelled.disconnect_all();
    on_batch_started.disconnect_all();
    on_batch_progress.disconnect_all();
    on_batch_completed.disconnect_all();
    on_batch_failed.disconnect_all();
}

// ============================================================================
// Queue
// ============================================================================

void AsyncResourceLoader::enqueue(const RecordPtr& record) {
    i32 priority = *record->info.config.priority;
    auto position = std::find_if(m_queue.begin(), m_queue.end(), [priority](const RecordPtr& queued) {
        return *queued->info.config.priority < priority;
    });
    m_queue.insert(position, record);
}

void AsyncResourceLoader::pump() {
    while (m_active.size() < m_options.max_concurrent_loads && !m_queue.empty()) {
        auto record = m_queue.front();
        m_queue.pop_front();
        if (record->info.state == LoadingState::Pending) {
            start_task(record);
        }
    }
}

void AsyncResourceLoader::start_task(const RecordPtr& record) {
    record->info.state = LoadingState::Loading;
    m_active.insert(record->info.config.id);
    on_task_started.emit(record->info);
    start_attempt(record);
}

// ============================================================================
// Attempts
// ============================================================================

bool AsyncResourceLoader::is_current(const TaskRecord& record, u32 attempt) {
    return record.info.state == LoadingState::Loading && record.attempt_active &&
           record.info.attempts == attempt;
}

FetchRequest AsyncResourceLoader::build_request(const ResourceConfig& config) const {
    FetchRequest request;
    request.url = config.url;
    request.headers.set("Accept", accept_header_for(config.type));
    request.headers.merge(config.headers);
    request.credentials = config.credentials.value_or(Credentials::SameOrigin);
    request.timeout_ms = config.timeout_ms.value_or(m_options.default_timeout_ms);
    return request;
}

void AsyncResourceLoader::start_attempt(const RecordPtr& record) {
    record->retry_timer = INVALID_TIMER;
    record->attempt_active = true;
    record->body.clear();
    record->response_headers = HttpHeaders();
    record->attempt_cancel = std::make_unique<CancellationSource>(record->cancel.token());

    u32 attempt = ++record->info.attempts;
    const ResourceConfig& config = record->info.config;
    std::weak_ptr<TaskRecord> weak = record;

    record->timeout_timer = m_loop.schedule(*config.timeout_ms, [this, weak, attempt] {
        auto current = weak.lock();
        if (!current || !is_current(*current, attempt)) {
            return;
        }
        current->timeout_timer = INVALID_TIMER;
        fail_attempt(current, ResourceError::transient(format_message(
            "Loading {} timed out after {}ms: {}", to_string(current->info.config.type),
            *current->info.config.timeout_ms, current->info.config.url)));
    });

    m_transport.fetch(build_request(config), record->attempt_cancel->token(),
        [this, weak, attempt](ResourceResult<FetchResponse> result) {
            auto current = weak.lock();
            if (!current || !is_current(*current, attempt)) {
                return;
            }
            handle_response(current, std::move(result));
        });
}

void AsyncResourceLoader::handle_response(const RecordPtr& record,
                                          ResourceResult<FetchResponse> result) {
    if (!result) {
        fail_attempt(record, result.error());
        return;
    }

    FetchResponse& response = result.value();
    if (!response.ok()) {
        fail_attempt(record, ResourceError::transient(format_message(
            "{} loading failed: {} {}", to_string(record->info.config.type),
            response.status, response.status_text), response.status));
        return;
    }
    if (!response.body) {
        fail_attempt(record, ResourceError::transient("Unable to read response body"));
        return;
    }

    record->response_headers = response.headers;
    record->body_started_at = m_loop.now_ms();
    LoadingProgress progress;
    progress.total = response.content_length();
    record->info.progress = progress;

    read_body(record, response.body);
}

void AsyncResourceLoader::read_body(const RecordPtr& record, std::shared_ptr<BodyReader> reader) {
    std::weak_ptr<TaskRecord> weak = record;
    u32 attempt = record->info.attempts;

    BodyReader* raw = reader.get();
    raw->read([this, weak, attempt, reader = std::move(reader)](ResourceResult<BodyChunk> result) {
        auto current = weak.lock();
        if (!current || !is_current(*current, attempt)) {
            return;
        }
        if (!result) {
            fail_attempt(current, result.error());
            return;
        }

        auto& chunk = result.value();
        if (!chunk) {
            finish_body(current);
            return;
        }

        current->body.insert(current->body.end(), chunk->begin(), chunk->end());

        LoadingProgress progress = current->info.progress;
        progress.loaded = current->body.size();
        progress.percentage = progress.total > 0
            ? static_cast<f64>(progress.loaded) / static_cast<f64>(progress.total) * 100.0 : 0.0;
        f64 elapsed = (m_loop.now_ms() - current->body_started_at) / 1000.0;
        if (elapsed > 0.0) {
            progress.speed = static_cast<f64>(progress.loaded) / elapsed;
            if (progress.total > 0 && *progress.speed > 0.0) {
                f64 left = static_cast<f64>(progress.total) - static_cast<f64>(progress.loaded);
                progress.remaining_time = std::max(left, 0.0) / *progress.speed;
            }
        }
        update_progress(current, progress);

        // Progress handlers may cancel the task
        if (is_current(*current, attempt)) {
            read_body(current, reader);
        }
    });
}

void AsyncResourceLoader::finish_body(const RecordPtr& record) {
    const ResourceConfig& config = record->info.config;
    DecodeInput input{config.id, config.url, record->response_headers, record->body};
    auto decoded = m_decoders.decode(config.type, input);
    if (!decoded) {
        fail_attempt(record, decoded.error());
        return;
    }

    ResourcePtr data = decoded.value();
    if (auto image = std::dynamic_pointer_cast<ImageResource>(data)) {
        LoadingProgress progress = record->info.progress;
        progress.loaded = progress.total = static_cast<usize>(image->width()) * image->height() * 4;
        progress.percentage = 100.0;
        update_progress(record, progress);
        if (record->info.state != LoadingState::Loading) {
            return;
        }
    }
    complete_task(record, std::move(data));
}

void AsyncResourceLoader::end_attempt(TaskRecord& record) {
    record.attempt_active = false;
    if (record.timeout_timer != INVALID_TIMER) {
        m_loop.cancel(record.timeout_timer);
        record.timeout_timer = INVALID_TIMER;
    }
    if (record.attempt_cancel) {
        // Aborts the in-flight fetch, if any
        record.attempt_cancel->cancel();
    }
    record.body.clear();
    record.body.shrink_to_fit();
}

void AsyncResourceLoader::fail_attempt(const RecordPtr& record, const ResourceError& error) {
    end_attempt(*record);

    const ResourceConfig& config = record->info.config;
    u32 attempts = record->info.attempts;
    if (error.is_retryable() && attempts <= *config.retries) {
        f64 delay = std::pow(2.0, static_cast<f64>(attempts)) * m_options.retry_base_delay_ms;
        log().warn_fmt("Attempt {} for {} failed ({}), retrying in {}ms",
                       attempts, config.id, error.message, delay);

        std::weak_ptr<TaskRecord> weak = record;
        record->retry_timer = m_loop.schedule(delay, [this, weak] {
            auto current = weak.lock();
            if (!current || current->info.state != LoadingState::Loading) {
                return;
            }
            start_attempt(current);
        });
        return;
    }

    fail_task(record, error);
}

// ============================================================================
// Terminal transitions
// ============================================================================

void AsyncResourceLoader::complete_task(const RecordPtr& record, ResourcePtr data) {
    end_attempt(*record);
    record->info.state = LoadingState::Loaded;
    record->info.data = data;
    record->info.end_time = m_loop.now_ms();

    log().debug_fmt("Loaded {} ({} bytes, {} attempts)", record->info.config.id,
                    data ? data->byte_size() : 0, record->info.attempts);

    record->promise.resolve(std::move(data));
    on_task_completed.emit(record->info);
    release_slot(record->info.config.id);
}

void AsyncResourceLoader::fail_task(const RecordPtr& record, const ResourceError& error) {
    record->info.state = LoadingState::Error;
    record->info.error = error;
    record->info.end_time = m_loop.now_ms();

    log().error_fmt("Failed to load {} from {}: {}", record->info.config.id,
                    record->info.config.url, error.describe());

    record->promise.reject(error);
    on_task_failed.emit(record->info, error);
    release_slot(record->info.config.id);
}

void AsyncResourceLoader::cancel_task(const RecordPtr& record) {
    end_attempt(*record);
    if (record->retry_timer != INVALID_TIMER) {
        m_loop.cancel(record->retry_timer);
        record->retry_timer = INVALID_TIMER;
    }
    record->cancel.cancel();

    record->info.state = LoadingState::Cancelled;
    record->info.error = ResourceError::cancelled();
    record->info.end_time = m_loop.now_ms();

    m_queue.erase(std::remove(m_queue.begin(), m_queue.end(), record), m_queue.end());
    m_active.erase(record->info.config.id);

    log().debug_fmt("Cancelled {}", record->info.config.id);
    record->promise.reject(ResourceError::cancelled());
    on_task_cancelled.emit(record->info);
}

void AsyncResourceLoader::release_slot(const std::string& id) {
    m_active.erase(id);
    pump();
}

// ============================================================================
// Progress
// ============================================================================

void AsyncResourceLoader::update_progress(const RecordPtr& record, const LoadingProgress& progress) {
    record->info.progress = progress;
    on_task_progress.emit(record->info, progress);
}

void AsyncResourceLoader::emit_batch_progress(const BatchState& batch) {
    LoadingProgress aggregate;
    f64 percentage_sum = 0.0;
    usize counted = 0;

    for (const auto& id : batch.task_ids) {
        auto it = m_tasks.find(id);
        if (it == m_tasks.end()) {
            continue;
        }
        const auto& progress = it->second->info.progress;
        aggregate.loaded += progress.loaded;
        aggregate.total += progress.total;
        percentage_sum += progress.percentage;
        ++counted;
    }
    aggregate.percentage = counted > 0 ? percentage_sum / static_cast<f64>(counted) : 0.0;
    on_batch_progress.emit(batch.id, aggregate);
}

void AsyncResourceLoader::finish_batch(const std::shared_ptr<BatchState>& batch) {
    on_task_progress.disconnect(batch->connections[0]);
    on_task_completed.disconnect(batch->connections[1]);
    on_task_failed.disconnect(batch->connections[2]);
    on_task_cancelled.disconnect(batch->connections[3]);

    std::vector<ResourcePtr> payloads;
    payloads.reserve(batch->results.size());
    for (const auto& result : batch->results) {
        if (result && result->is_err()) {
            log().warn_fmt("Batch {} failed: {}", batch->id, result->error().describe());
            on_batch_failed.emit(batch->id, result->error());
            batch->promise.reject(result->error());
            return;
        }
        payloads.push_back(result ? result->value() : nullptr);
    }

    on_batch_completed.emit(batch->id);
    batch->promise.resolve(std::move(payloads));
}

} // namespace vellum::network
