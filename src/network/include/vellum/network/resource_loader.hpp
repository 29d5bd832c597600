#pragma once

/**
 * Asynchronous Resource Loader
 *
 * Fetches and decodes typed resources through a Transport. Requests wait in
 * a priority queue (higher priority first, FIFO among equals) and at most
 * max_concurrent_loads of them run at once. Failed attempts are retried
 * with exponential backoff; each attempt races a timeout timer.
 *
 * Task lifecycle: Pending -> Loading -> {Loaded | Error | Cancelled}.
 */

#include "decoder.hpp"
#include "transport.hpp"
#include "vellum/core/future.hpp"
#include "vellum/core/signal.hpp"
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace vellum::network {

// ============================================================================
// Task model
// ============================================================================

enum class LoadingState : u8 {
    Pending,
    Loading,
    Loaded,
    Error,
    Cancelled,
};

[[nodiscard]] std::string_view to_string(LoadingState state);

[[nodiscard]] constexpr bool is_terminal(LoadingState state) {
    return state == LoadingState::Loaded || state == LoadingState::Error ||
           state == LoadingState::Cancelled;
}

struct LoadingProgress {
    usize loaded{0};
    usize total{0};
    f64 percentage{0.0};
    std::optional<f64> speed;           // bytes per second
    std::optional<f64> remaining_time;  // seconds
};

struct ResourceConfig {
    std::string id;
    std::string url;
    ResourceType type{ResourceType::Binary};

    // Unset fields take the loader defaults
    std::optional<i32> priority;  // higher loads first
    std::optional<u32> timeout_ms;
    std::optional<u32> retries;
    HttpHeaders headers;
    std::optional<Credentials> credentials;
    std::optional<std::string> cross_origin;
};

// Snapshot of a task; copies never change after they are taken
struct LoadingTask {
    ResourceConfig config;
    LoadingState state{LoadingState::Pending};
    LoadingProgress progress;
    ResourcePtr data;
    std::optional<ResourceError> error;
    f64 start_time{0.0};
    std::optional<f64> end_time;
    u32 attempts{0};
};

struct LoaderStats {
    usize total{0};
    usize pending{0};
    usize loading{0};
    usize loaded{0};
    usize error{0};
    usize cancelled{0};
    usize queue_size{0};
    usize active_loaders{0};
};

struct LoaderOptions {
    /// @brief Tasks allowed in the Loading state at once
    usize max_concurrent_loads{6};

    /// @brief Per-attempt timeout
    u32 default_timeout_ms{30000};

    /// @brief Retries after the first failed attempt
    u32 default_retries{3};

    /// @brief Priority of configs that do not set one
    i32 default_priority{50};

    /// @brief Backoff unit; attempt n waits 2^n of these before retrying
    f64 retry_base_delay_ms{1000.0};

    /// @brief Subtracted from the priority of preloads
    i32 preload_priority_penalty{50};
};

// ============================================================================
// AsyncResourceLoader
// ============================================================================

class AsyncResourceLoader {
public:
    AsyncResourceLoader(EventLoop& loop, Transport& transport,
                        const DecoderRegistry& decoders, LoaderOptions options = {});
    ~AsyncResourceLoader();

    AsyncResourceLoader(const AsyncResourceLoader&) = delete;
    AsyncResourceLoader& operator=(const AsyncResourceLoader&) = delete;

    // Requests for an id that is already Pending or Loading share its future;
    // a Loaded id resolves immediately with the stored data.
    [[nodiscard]] Future<ResourcePtr> load_resource(const ResourceConfig& config);

    // Settles once every member has settled: resolves with the payloads in
    // config order, or rejects with the first member failure.
    [[nodiscard]] Future<std::vector<ResourcePtr>> load_batch(
        const std::vector<ResourceConfig>& configs,
        std::optional<std::string> batch_id = std::nullopt);

    // Low-priority load that resolves to nullptr instead of failing
    [[nodiscard]] Future<ResourcePtr> preload_resource(const ResourceConfig& config);

    bool cancel_resource(const std::string& id);
    void cancel_all();

    [[nodiscard]] std::optional<LoadingTask> get_task(const std::string& id) const;
    [[nodiscard]] std::vector<LoadingTask> get_all_tasks() const;
    [[nodiscard]] LoaderStats get_stats() const;

    // Drops terminal tasks from the task table; returns how many were dropped
    usize cleanup();

    void dispose();

    [[nodiscard]] ResourceConfig normalize_config(const ResourceConfig& config) const;
    [[nodiscard]] const LoaderOptions& options() const { return m_options; }

    // Events
    Signal<const LoadingTask&> on_task_started;
    Signal<const LoadingTask&, const LoadingProgress&> on_task_progress;
    Signal<const LoadingTask&> on_task_completed;
    Signal<const LoadingTask&, const ResourceError&> on_task_failed;
    Signal<const LoadingTask&> on_task_cancelled;
    Signal<const std::string&> on_batch_started;
    Signal<const std::string&, const LoadingProgress&> on_batch_progress;
    Signal<const std::string&> on_batch_completed;
    Signal<const std::string&, const ResourceError&> on_batch_failed;

private:
    struct TaskRecord;
    struct BatchState;
    using RecordPtr = std::shared_ptr<TaskRecord>;

    void enqueue(const RecordPtr& record);
    void pump();
    void start_task(const RecordPtr& record);

    void start_attempt(const RecordPtr& record);
    void handle_response(const RecordPtr& record, ResourceResult<FetchResponse> result);
    void read_body(const RecordPtr& record, std::shared_ptr<BodyReader> reader);
    void finish_body(const RecordPtr& record);
    void fail_attempt(const RecordPtr& record, const ResourceError& error);
    void end_attempt(TaskRecord& record);

    void complete_task(const RecordPtr& record, ResourcePtr data);
    void fail_task(const RecordPtr& record, const ResourceError& error);
    void cancel_task(const RecordPtr& record);
    void release_slot(const std::string& id);

    void update_progress(const RecordPtr& record, const LoadingProgress& progress);
    void emit_batch_progress(const BatchState& batch);
    void finish_batch(const std::shared_ptr<BatchState>& batch);

    [[nodiscard]] FetchRequest build_request(const ResourceConfig& config) const;
    [[nodiscard]] static bool is_current(const TaskRecord& record, u32 attempt);

    EventLoop& m_loop;
    Transport& m_transport;
    const DecoderRegistry& m_decoders;
    LoaderOptions m_options;

    std::unordered_map<std::string, RecordPtr> m_tasks;
    std::deque<RecordPtr> m_queue;
    std::unordered_set<std::string> m_active;
    std::unique_ptr<CancellationSource> m_global_cancel;
    std::shared_ptr<bool> m_alive;
    u64 m_next_batch_id{1};
    bool m_disposed{false};
};

} // namespace vellum::network
