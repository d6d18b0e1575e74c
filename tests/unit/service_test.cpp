#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <variant>
#include <vector>

#include "docqa/engine/service.hpp"
#include "docqa/storage/store.hpp"
#include "tests/support/fake_collaborators.hpp"

using docqa::core::EngineConfig;
using docqa::core::error_code;
using docqa::engine::Engine;
using docqa::engine::EngineService;
using docqa::engine::DuplicateAction;
using docqa::engine::Lifecycle;
using docqa::engine::UploadSuccess;
using docqa::test::bytes_of;
using docqa::test::cleanup_dir;
using docqa::test::make_test_dir;
using docqa::test::numbered_words;

namespace {

auto make_factory(const std::filesystem::path& dir) -> EngineService::Factory {
  return [dir]() {
    EngineConfig cfg;
    cfg.storage_dir = dir;
    cfg.dimension = 16;
    return Engine::open(cfg, std::make_shared<docqa::test::TextFileExtractor>(),
                        std::make_shared<docqa::test::CountingEmbedder>(16),
                        std::make_shared<docqa::test::RecordingGenerator>());
  };
}

// Blocks the factory until release() so tests can observe the initializing state.
struct Gate {
  std::mutex mu;
  std::condition_variable cv;
  bool open{false};
  void release() { { std::lock_guard<std::mutex> l(mu); open = true; } cv.notify_all(); }
  void wait() { std::unique_lock<std::mutex> l(mu); cv.wait(l, [this] { return open; }); }
};

} // namespace

TEST_CASE("service: operations before start report not_initialized", "[service]") {
  auto dir = make_test_dir("service_unstarted");
  {
    EngineService svc(make_factory(dir), 1);
    REQUIRE(svc.state() == Lifecycle::Uninitialized);
    auto r = svc.ask("anything", 5).get();
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.error().code == error_code::not_initialized);
    REQUIRE(r.error().message == "engine is initializing");
  }
  cleanup_dir(dir);
}

TEST_CASE("service: health answers while initialization is in progress", "[service]") {
  auto dir = make_test_dir("service_initializing");
  auto gate = std::make_shared<Gate>();
  {
    auto inner = make_factory(dir);
    EngineService svc([gate, inner]() { gate->wait(); return inner(); }, 1);
    svc.start();
    REQUIRE(svc.health().state == Lifecycle::Initializing);
    auto early = svc.get_stats().get();
    REQUIRE(early.error().code == error_code::not_initialized);

    gate->release();
    REQUIRE(svc.wait_ready() == Lifecycle::Ready);
    REQUIRE(svc.health().state == Lifecycle::Ready);
  }
  cleanup_dir(dir);
}

TEST_CASE("service: requests run on workers once ready", "[service]") {
  auto dir = make_test_dir("service_ready");
  {
    EngineService svc(make_factory(dir), 2);
    svc.start();
    REQUIRE(svc.wait_ready() == Lifecycle::Ready);

    auto up = svc.upload({"a.pdf", bytes_of("service test document"), docqa::engine::DuplicateAction::Auto}).get();
    REQUIRE(up.has_value());
    REQUIRE(std::holds_alternative<docqa::engine::UploadSuccess>(*up));
    const auto id = std::get<docqa::engine::UploadSuccess>(*up).doc_id;

    auto ask = svc.ask("service test document", 5).get();
    REQUIRE(ask.has_value());
    REQUIRE(ask->num_chunks_used == 1);

    auto docs = svc.list_documents().get();
    REQUIRE(docs.has_value());
    REQUIRE(docs->size() == 1);

    auto health = svc.health();
    REQUIRE(health.total_documents == 1);
    REQUIRE(health.total_chunks == 1);

    auto del = svc.remove_document(id).get();
    REQUIRE(del.has_value());
    auto missing = svc.remove_document(id).get();
    REQUIRE(missing.error().code == error_code::not_found);
    REQUIRE(svc.get_stats().get()->total_documents == 0);
  }
  cleanup_dir(dir);
}

TEST_CASE("service: make_service opens the configured engine", "[service]") {
  auto dir = make_test_dir("service_make");
  {
    EngineConfig cfg;
    cfg.storage_dir = dir;
    cfg.dimension = 16;
    cfg.worker_threads = 2;
    auto svc = docqa::engine::make_service(cfg, std::make_shared<docqa::test::TextFileExtractor>(),
                                           std::make_shared<docqa::test::CountingEmbedder>(16),
                                           std::make_shared<docqa::test::RecordingGenerator>());
    svc->start();
    REQUIRE(svc->wait_ready() == Lifecycle::Ready);
    auto stats = svc->get_stats().get();
    REQUIRE(stats.has_value());
    REQUIRE(stats->embedding_dimension == 16);
  }
  cleanup_dir(dir);
}

TEST_CASE("service: failed initialization makes the service unavailable", "[service]") {
  EngineService svc([]() -> std::expected<std::unique_ptr<Engine>, docqa::core::error> {
    return std::unexpected(docqa::core::error{error_code::dimension_mismatch, "stored index has dimension 8", "test"});
  }, 1);
  svc.start();
  REQUIRE(svc.wait_ready() == Lifecycle::Failed);

  auto h = svc.health();
  REQUIRE(h.state == Lifecycle::Failed);
  REQUIRE(h.message == "stored index has dimension 8");

  auto r = svc.upload({"a.pdf", bytes_of("x"), docqa::engine::DuplicateAction::Auto}).get();
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.error().code == error_code::unavailable);
  REQUIRE(r.error().message == "stored index has dimension 8");
}

TEST_CASE("service: shutdown finishes queued requests and refuses new ones", "[service]") {
  auto dir = make_test_dir("service_shutdown");
  {
    EngineService svc(make_factory(dir), 1);
    svc.start();
    REQUIRE(svc.wait_ready() == Lifecycle::Ready);

    std::vector<std::future<std::expected<docqa::engine::UploadOutcome, docqa::core::error>>> queued;
    for (int i = 0; i < 5; ++i) {
      queued.push_back(svc.upload({"s" + std::to_string(i) + ".pdf", bytes_of(numbered_words("s" + std::to_string(i) + "_", 30)),
                                   DuplicateAction::Auto}));
    }
    svc.shutdown();
    for (auto& f : queued) {
      REQUIRE(f.wait_for(std::chrono::seconds(0)) == std::future_status::ready);
      auto out = f.get();
      REQUIRE(out.has_value());
      REQUIRE(std::holds_alternative<UploadSuccess>(*out));
    }

    auto late = svc.ask("anything", 3).get();
    REQUIRE_FALSE(late.has_value());
    REQUIRE(late.error().code == error_code::unavailable);
    REQUIRE(late.error().message == "engine is shutting down");
    REQUIRE(svc.health().total_documents == 5);
    svc.shutdown();
  }
  cleanup_dir(dir);
}

TEST_CASE("service: concurrent uploads, deletes and reads keep the stores consistent", "[service]") {
  auto dir = make_test_dir("service_concurrent");
  {
    EngineService svc(make_factory(dir), 4);
    svc.start();
    REQUIRE(svc.wait_ready() == Lifecycle::Ready);

    std::vector<std::future<std::expected<docqa::engine::UploadOutcome, docqa::core::error>>> uploads;
    std::vector<std::future<std::expected<docqa::engine::AskResult, docqa::core::error>>> asks;
    std::vector<std::future<std::expected<docqa::engine::EngineStats, docqa::core::error>>> stats;
    for (int i = 0; i < 20; ++i) {
      const std::string tag = "c" + std::to_string(i) + "_";
      uploads.push_back(svc.upload({"doc" + std::to_string(i) + ".pdf", bytes_of(numbered_words(tag, 40 + 30 * (i % 7))),
                                    DuplicateAction::Auto}));
      asks.push_back(svc.ask(tag + "1 " + tag + "2", 3));
      stats.push_back(svc.get_stats());
    }

    std::set<std::string> ids;
    std::vector<std::future<std::expected<docqa::engine::DeleteResult, docqa::core::error>>> removals;
    for (std::size_t i = 0; i < uploads.size(); ++i) {
      auto out = uploads[i].get();
      REQUIRE(out.has_value());
      REQUIRE(std::holds_alternative<UploadSuccess>(*out));
      const auto id = std::get<UploadSuccess>(*out).doc_id;
      ids.insert(id);
      if (i % 3 == 0) removals.push_back(svc.remove_document(id));
      asks.push_back(svc.ask("c" + std::to_string(i) + "_5", 2));
      stats.push_back(svc.get_stats());
    }
    REQUIRE(ids.size() == 20);

    for (auto& r : removals) REQUIRE(r.get().has_value());
    for (auto& a : asks) REQUIRE(a.get().has_value());
    for (auto& s : stats) {
      auto st = s.get();
      REQUIRE(st.has_value());
      REQUIRE(st->index_size == st->total_chunks);
    }

    const auto state = docqa::storage::load_store(dir, 16).value();
    REQUIRE(docqa::storage::check_invariants(state).has_value());
    REQUIRE(state.registry.size() == 20 - removals.size());

    auto docs = svc.list_documents().get();
    REQUIRE(docs.has_value());
    std::uint64_t total = 0;
    for (const auto& d : *docs) total += d.num_chunks;
    auto final_stats = svc.get_stats().get();
    REQUIRE(final_stats.has_value());
    REQUIRE(final_stats->total_documents == docs->size());
    REQUIRE(final_stats->total_chunks == total);
    REQUIRE(state.index.size() == total);
  }
  cleanup_dir(dir);
}

TEST_CASE("worker_pool: wait_idle returns once every request has run", "[service]") {
  docqa::engine::WorkerPool pool(3);
  REQUIRE(pool.num_threads() == 3);
  std::vector<std::future<int>> futures;
  for (int i = 0; i < 20; ++i) {
    auto f = pool.submit([i] { return i * i; });
    REQUIRE(f.has_value());
    futures.push_back(std::move(*f));
  }
  pool.wait_idle();
  REQUIRE(pool.outstanding() == 0);
  int sum = 0;
  for (auto& f : futures) {
    REQUIRE(f.wait_for(std::chrono::seconds(0)) == std::future_status::ready);
    sum += f.get();
  }
  REQUIRE(sum == 2470);
}

TEST_CASE("worker_pool: close drains the queue before refusing work", "[service]") {
  docqa::engine::WorkerPool pool(1);
  auto gate = std::make_shared<Gate>();
  std::atomic<int> ran{0};

  auto blocker = pool.submit([gate] { gate->wait(); return 0; });
  REQUIRE(blocker.has_value());
  for (int i = 0; i < 5; ++i) {
    REQUIRE(pool.submit([&ran] { return ran.fetch_add(1) + 1; }).has_value());
  }
  // One worker, held by the gate: everything is still queued or running.
  REQUIRE(pool.outstanding() == 6);

  gate->release();
  pool.close();
  REQUIRE(ran.load() == 5);
  REQUIRE(blocker->get() == 0);

  auto refused = pool.submit([] { return 1; });
  REQUIRE_FALSE(refused.has_value());
  REQUIRE(refused.error().code == error_code::unavailable);
  pool.close();
}
