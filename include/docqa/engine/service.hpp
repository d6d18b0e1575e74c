#pragma once

/** \file service.hpp
 *  \brief Engine lifecycle and request dispatch.
 *
 * The service owns one Engine and a worker pool. start() builds the engine on a
 * background thread; until that finishes, operations complete immediately with
 * not_initialized, and after a failed start with unavailable (carrying the
 * failure message). health() never blocks on initialization.
 *
 * Operations run on the worker pool and run to completion once started.
 * shutdown() (also run by the destructor) refuses new operations with
 * unavailable, lets queued ones finish, then stops the workers.
 */

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <expected>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "docqa/engine/engine.hpp"
#include "docqa/engine/worker_pool.hpp"
#include "docqa/error.hpp"

namespace docqa::engine {

enum class Lifecycle : std::uint8_t { Uninitialized, Initializing, Ready, Failed };

auto to_string(Lifecycle s) noexcept -> std::string_view;

struct HealthReport {
  Lifecycle state{Lifecycle::Uninitialized};
  std::string message;           /**< failure message when state == Failed */
  std::uint64_t total_documents{0};
  std::uint64_t total_chunks{0};
};

class EngineService {
public:
    using Factory = std::function<std::expected<std::unique_ptr<Engine>, core::error>()>;

    /** \param workers Number of request workers (0 = hardware concurrency / 2) */
    explicit EngineService(Factory factory, std::size_t workers = 0);
    ~EngineService();

    EngineService(const EngineService&) = delete;
    EngineService& operator=(const EngineService&) = delete;

    /** \brief Begin background initialization. Calls after the first, or after shutdown(), are ignored. */
    void start();

    /** \brief Block until initialization has finished (ready or failed). */
    auto wait_ready() -> Lifecycle;

    /** \brief Stop accepting operations and finish the queued ones. Idempotent. */
    void shutdown();

    [[nodiscard]] auto state() const noexcept -> Lifecycle { return state_.load(std::memory_order_acquire); }
    [[nodiscard]] auto health() const -> HealthReport;

    auto upload(UploadRequest request) -> std::future<std::expected<UploadOutcome, core::error>>;
    auto upload_batch(std::vector<UploadRequest> requests)
        -> std::future<std::expected<std::vector<UploadOutcome>, core::error>>;
    auto ask(std::string question, std::uint32_t top_k)
        -> std::future<std::expected<AskResult, core::error>>;
    auto remove_document(std::string doc_id) -> std::future<std::expected<DeleteResult, core::error>>;
    auto list_documents() -> std::future<std::expected<std::vector<registry::Document>, core::error>>;
    auto get_stats() -> std::future<std::expected<EngineStats, core::error>>;

private:
    // Ready engine, or the error an operation should complete with.
    auto acquire() const -> std::expected<Engine*, core::error>;

    template <typename T, typename Fn>
    auto dispatch(Fn fn) -> std::future<std::expected<T, core::error>>;

    Factory factory_;
    std::atomic<Lifecycle> state_{Lifecycle::Uninitialized};
    mutable std::mutex mu_;
    std::condition_variable ready_cv_;
    std::unique_ptr<Engine> engine_;
    std::string failure_;
    std::thread init_thread_;
    std::atomic<bool> stopping_{false};
    std::once_flag shutdown_once_;
    WorkerPool pool_;
};

/** \brief Service whose factory opens an Engine over \p cfg, with cfg.worker_threads workers. Not started. */
auto make_service(core::EngineConfig cfg,
                  std::shared_ptr<TextExtractor> extractor,
                  std::shared_ptr<Embedder> embedder,
                  std::shared_ptr<AnswerGenerator> generator) -> std::unique_ptr<EngineService>;

} // namespace docqa::engine
