#include "docqa/engine/service.hpp"
#include "docqa/core/platform_utils.hpp"

#include <exception>
#include <iostream>
#include <utility>

namespace docqa::engine {

using core::error;
using core::error_code;

auto to_string(Lifecycle s) noexcept -> std::string_view {
    switch (s) {
        case Lifecycle::Uninitialized: return "uninitialized";
        case Lifecycle::Initializing: return "initializing";
        case Lifecycle::Ready: return "ready";
        case Lifecycle::Failed: return "failed";
    }
    return "uninitialized";
}

EngineService::EngineService(Factory factory, std::size_t workers)
    : factory_(std::move(factory)), pool_(workers) {}

EngineService::~EngineService() { shutdown(); }

void EngineService::shutdown() {
    std::call_once(shutdown_once_, [this] {
        stopping_.store(true, std::memory_order_release);
        if (init_thread_.joinable()) init_thread_.join();
        const auto pending = pool_.outstanding();
        pool_.close();
        if (core::log_enabled()) {
            std::cerr << "[docqa][service] shut down after draining " << pending << " request(s)" << std::endl;
        }
    });
}

void EngineService::start() {
    if (stopping_.load(std::memory_order_acquire)) return;
    auto expected = Lifecycle::Uninitialized;
    if (!state_.compare_exchange_strong(expected, Lifecycle::Initializing, std::memory_order_acq_rel)) {
        return;
    }
    init_thread_ = std::thread([this] {
        std::expected<std::unique_ptr<Engine>, error> built = std::unexpected(
            error{error_code::internal, "no engine factory", "engine.service"});
        if (factory_) {
            try {
                built = factory_();
            } catch (const std::exception& e) {
                built = std::unexpected(error{error_code::internal, e.what(), "engine.service"});
            }
        }

        std::lock_guard<std::mutex> lock(mu_);
        if (built) {
            engine_ = std::move(*built);
            state_.store(Lifecycle::Ready, std::memory_order_release);
            if (core::log_enabled()) std::cerr << "[docqa][service] engine ready" << std::endl;
        } else {
            failure_ = built.error().message;
            state_.store(Lifecycle::Failed, std::memory_order_release);
            std::cerr << "[docqa][service] engine initialization failed: " << failure_ << std::endl;
        }
        ready_cv_.notify_all();
    });
}

auto EngineService::wait_ready() -> Lifecycle {
    std::unique_lock<std::mutex> lock(mu_);
    ready_cv_.wait(lock, [this] {
        const auto s = state_.load(std::memory_order_acquire);
        return s == Lifecycle::Ready || s == Lifecycle::Failed || s == Lifecycle::Uninitialized;
    });
    return state_.load(std::memory_order_acquire);
}

auto EngineService::health() const -> HealthReport {
    HealthReport report;
    report.state = state_.load(std::memory_order_acquire);
    if (report.state == Lifecycle::Failed) {
        std::lock_guard<std::mutex> lock(mu_);
        report.message = failure_;
    } else if (report.state == Lifecycle::Ready) {
        const auto stats = engine_->get_stats();
        report.total_documents = stats.total_documents;
        report.total_chunks = stats.total_chunks;
    }
    return report;
}

auto EngineService::acquire() const -> std::expected<Engine*, error> {
    if (stopping_.load(std::memory_order_acquire)) {
        return std::unexpected(error{error_code::unavailable, "engine is shutting down", "engine.service"});
    }
    switch (state_.load(std::memory_order_acquire)) {
        case Lifecycle::Ready:
            return engine_.get();
        case Lifecycle::Failed: {
            std::lock_guard<std::mutex> lock(mu_);
            return std::unexpected(error{error_code::unavailable, failure_, "engine.service"});
        }
        case Lifecycle::Uninitialized:
        case Lifecycle::Initializing:
            break;
    }
    return std::unexpected(error{error_code::not_initialized, "engine is initializing", "engine.service"});
}

template <typename T, typename Fn>
auto EngineService::dispatch(Fn fn) -> std::future<std::expected<T, error>> {
    auto refused = [](error e) {
        std::promise<std::expected<T, error>> p;
        p.set_value(std::unexpected(std::move(e)));
        return p.get_future();
    };
    auto engine = acquire();
    if (!engine) return refused(engine.error());

    Engine* e = *engine;
    auto queued = pool_.submit([e, fn = std::move(fn)]() -> std::expected<T, error> {
        try {
            return fn(*e);
        } catch (const std::exception& ex) {
            return std::unexpected(error{error_code::internal, ex.what(), "engine.service"});
        }
    });
    // Lost a race with shutdown() after acquire().
    if (!queued) return refused(error{error_code::unavailable, "engine is shutting down", "engine.service"});
    return std::move(*queued);
}

auto EngineService::upload(UploadRequest request) -> std::future<std::expected<UploadOutcome, error>> {
    return dispatch<UploadOutcome>([request = std::move(request)](Engine& e) -> std::expected<UploadOutcome, error> {
        return e.upload(request.filename, request.bytes, request.action);
    });
}

auto EngineService::upload_batch(std::vector<UploadRequest> requests)
    -> std::future<std::expected<std::vector<UploadOutcome>, error>> {
    return dispatch<std::vector<UploadOutcome>>(
        [requests = std::move(requests)](Engine& e) -> std::expected<std::vector<UploadOutcome>, error> {
            return e.upload_batch(requests);
        });
}

auto EngineService::ask(std::string question, std::uint32_t top_k) -> std::future<std::expected<AskResult, error>> {
    return dispatch<AskResult>([question = std::move(question), top_k](Engine& e) {
        return e.ask(question, top_k);
    });
}

auto EngineService::remove_document(std::string doc_id) -> std::future<std::expected<DeleteResult, error>> {
    return dispatch<DeleteResult>([doc_id = std::move(doc_id)](Engine& e) {
        return e.remove_document(doc_id);
    });
}

auto EngineService::list_documents() -> std::future<std::expected<std::vector<registry::Document>, error>> {
    return dispatch<std::vector<registry::Document>>(
        [](Engine& e) -> std::expected<std::vector<registry::Document>, error> { return e.list_documents(); });
}

auto EngineService::get_stats() -> std::future<std::expected<EngineStats, error>> {
    return dispatch<EngineStats>([](Engine& e) -> std::expected<EngineStats, error> { return e.get_stats(); });
}

auto make_service(core::EngineConfig cfg,
                  std::shared_ptr<TextExtractor> extractor,
                  std::shared_ptr<Embedder> embedder,
                  std::shared_ptr<AnswerGenerator> generator) -> std::unique_ptr<EngineService> {
    const std::size_t workers = cfg.worker_threads;
    auto factory = [cfg = std::move(cfg), extractor = std::move(extractor), embedder = std::move(embedder),
                    generator = std::move(generator)]() {
        return Engine::open(cfg, extractor, embedder, generator);
    };
    return std::make_unique<EngineService>(std::move(factory), workers);
}

} // namespace docqa::engine
