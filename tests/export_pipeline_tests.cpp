#include "fakes.hpp"

#include <atomic>
#include <catch2/catch_all.hpp>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <sonar/pipeline/export_pipeline.hpp>
#include <sonar/sonar.hpp>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using Sonar::ExportResult;
using Sonar::detail::ExportPipeline;
using Sonar::testing::fast_options;
using Sonar::testing::Recording;
using Sonar::testing::RecordingExporter;

namespace {

Sonar::SpanData make_span(int i) {
  Sonar::SpanData span;
  span.trace_id.bytes[0] = 1;
  span.span_id.bytes[0] = static_cast<uint8_t>(i + 1);
  span.name = "span-" + std::to_string(i);
  span.start_time_unix_nano = 1000;
  span.end_time_unix_nano = 2000;
  return span;
}

Sonar::LogRecord make_log(int i) {
  Sonar::LogRecord record;
  record.time_unix_nano = 1000;
  record.message = "log-" + std::to_string(i);
  return record;
}

// Only the manual flush path runs in these tests.
Sonar::Options manual_flush_options() {
  auto options = fast_options();
  options.schedule_delay = 60s;
  options.max_export_batch_size = 1024;
  return options;
}

template <typename Predicate>
bool eventually(Predicate predicate,
                std::chrono::milliseconds timeout = 3000ms) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (predicate()) {
      return true;
    }
    std::this_thread::sleep_for(2ms);
  }
  return predicate();
}

// Blocks every export until released.
class GatedExporter : public Sonar::Exporter {
public:
  struct Gate {
    std::mutex mutex;
    std::condition_variable cv;
    bool open = false;
    std::atomic<int> entered{0};
    std::atomic<size_t> exported{0};

    void release() {
      {
        std::lock_guard<std::mutex> lock(mutex);
        open = true;
      }
      cv.notify_all();
    }
  };

  explicit GatedExporter(std::shared_ptr<Gate> gate) : _gate(std::move(gate)) {}

  ExportResult export_spans(const std::vector<Sonar::SpanData> &spans) override {
    _gate->entered.fetch_add(1);
    std::unique_lock<std::mutex> lock(_gate->mutex);
    _gate->cv.wait(lock, [this] { return _gate->open; });
    _gate->exported.fetch_add(spans.size());
    return ExportResult::kSuccess;
  }

  ExportResult export_logs(const std::vector<Sonar::LogRecord> &) override {
    return ExportResult::kSuccess;
  }

private:
  std::shared_ptr<Gate> _gate;
};

} // namespace

TEST_CASE("Pipeline exports everything on force_flush", "[pipeline]") {
  auto recording = std::make_shared<Recording>();
  ExportPipeline pipeline(manual_flush_options(),
                          std::make_unique<RecordingExporter>(recording));
  pipeline.start();
  REQUIRE(pipeline.state() == ExportPipeline::State::kRunning);

  for (int i = 0; i < 10; ++i) {
    REQUIRE(pipeline.enqueue(make_span(i)));
    REQUIRE(pipeline.enqueue(make_log(i)));
  }
  REQUIRE(pipeline.force_flush(2s));

  REQUIRE(recording->span_count() == 10);
  REQUIRE(recording->log_count() == 10);
  const auto stats = pipeline.stats();
  REQUIRE(stats.spans_enqueued == 10);
  REQUIRE(stats.spans_exported == 10);
  REQUIRE(stats.logs_exported == 10);
  REQUIRE(stats.spans_dropped == 0);
  REQUIRE(stats.spans_lost == 0);

  // Per-producer order survives the queue.
  const auto spans = recording->spans_snapshot();
  for (int i = 0; i < 10; ++i) {
    REQUIRE(spans[i].name == "span-" + std::to_string(i));
  }
}

TEST_CASE("Batches never exceed the configured size", "[pipeline]") {
  auto options = manual_flush_options();
  options.max_export_batch_size = 16;
  auto recording = std::make_shared<Recording>();
  ExportPipeline pipeline(options,
                          std::make_unique<RecordingExporter>(recording));
  pipeline.start();

  for (int i = 0; i < 100; ++i) {
    REQUIRE(pipeline.enqueue(make_span(i)));
  }
  REQUIRE(pipeline.force_flush(2s));

  REQUIRE(recording->span_count() == 100);
  REQUIRE(recording->largest_batch.load() <= 16);
  REQUIRE(recording->span_calls.load() >= 7);
}

TEST_CASE("A full batch wakes the flush thread early", "[pipeline]") {
  auto options = manual_flush_options();
  options.max_export_batch_size = 8;
  auto recording = std::make_shared<Recording>();
  ExportPipeline pipeline(options,
                          std::make_unique<RecordingExporter>(recording));
  pipeline.start();

  for (int i = 0; i < 8; ++i) {
    REQUIRE(pipeline.enqueue(make_span(i)));
  }
  // No force_flush and the schedule is a minute away.
  REQUIRE(eventually([&] { return recording->span_count() == 8; }));
}

TEST_CASE("The scheduled tick exports without a full batch", "[pipeline]") {
  auto recording = std::make_shared<Recording>();
  ExportPipeline pipeline(fast_options(),
                          std::make_unique<RecordingExporter>(recording));
  pipeline.start();

  REQUIRE(pipeline.enqueue(make_span(0)));
  REQUIRE(eventually([&] { return recording->span_count() == 1; }));
}

TEST_CASE("Retryable failures are retried until success", "[pipeline][retry]") {
  auto recording = std::make_shared<Recording>();
  ExportPipeline pipeline(manual_flush_options(),
                          std::make_unique<RecordingExporter>(recording));
  pipeline.start();

  const int failures = GENERATE(0, 1, 3);
  recording->fail_next(failures, ExportResult::kRetryableFailure);
  REQUIRE(pipeline.enqueue(make_span(0)));
  REQUIRE(pipeline.force_flush(2s));

  const auto stats = pipeline.stats();
  REQUIRE(stats.export_attempts == static_cast<uint64_t>(failures + 1));
  REQUIRE(stats.spans_exported == 1);
  REQUIRE(stats.spans_lost == 0);
  REQUIRE(recording->span_count() == 1);
}

TEST_CASE("A batch is dropped once the attempt budget is spent",
          "[pipeline][retry]") {
  auto options = manual_flush_options();
  options.max_attempts = 3;
  auto recording = std::make_shared<Recording>();
  ExportPipeline pipeline(options,
                          std::make_unique<RecordingExporter>(recording));
  pipeline.start();

  recording->fail_next(3, ExportResult::kRetryableFailure);
  REQUIRE(pipeline.enqueue(make_span(0)));
  REQUIRE_FALSE(pipeline.force_flush(2s));

  auto stats = pipeline.stats();
  REQUIRE(stats.export_attempts == 3);
  REQUIRE(stats.spans_lost == 1);
  REQUIRE(stats.spans_exported == 0);
  REQUIRE(recording->span_count() == 0);

  // The pipeline keeps working for later batches.
  REQUIRE(pipeline.enqueue(make_span(1)));
  REQUIRE(pipeline.force_flush(2s));
  stats = pipeline.stats();
  REQUIRE(stats.spans_exported == 1);
  REQUIRE(stats.export_attempts == 4);
}

TEST_CASE("Permanent failures are not retried", "[pipeline][retry]") {
  auto recording = std::make_shared<Recording>();
  ExportPipeline pipeline(manual_flush_options(),
                          std::make_unique<RecordingExporter>(recording));
  pipeline.start();

  recording->fail_next(1, ExportResult::kPermanentFailure);
  REQUIRE(pipeline.enqueue(make_log(0)));
  REQUIRE_FALSE(pipeline.force_flush(2s));

  const auto stats = pipeline.stats();
  REQUIRE(stats.export_attempts == 1);
  REQUIRE(stats.logs_lost == 1);
  REQUIRE(recording->log_count() == 0);
}

TEST_CASE("A full queue drops new records", "[pipeline][backpressure]") {
  auto options = manual_flush_options();
  options.max_queue_size = 4;
  options.max_export_batch_size = 1;
  auto gate = std::make_shared<GatedExporter::Gate>();
  ExportPipeline pipeline(options, std::make_unique<GatedExporter>(gate));
  pipeline.start();

  // The first span wakes the flush thread, which then blocks in the exporter
  // with an empty queue behind it.
  REQUIRE(pipeline.enqueue(make_span(0)));
  REQUIRE(eventually([&] { return gate->entered.load() == 1; }));

  for (int i = 1; i <= 4; ++i) {
    REQUIRE(pipeline.enqueue(make_span(i)));
  }
  REQUIRE_FALSE(pipeline.enqueue(make_span(5)));
  REQUIRE_FALSE(pipeline.enqueue(make_span(6)));

  auto stats = pipeline.stats();
  REQUIRE(stats.spans_enqueued == 5);
  REQUIRE(stats.spans_dropped == 2);

  gate->release();
  REQUIRE(pipeline.shutdown());
  REQUIRE(gate->exported.load() == 5);
  stats = pipeline.stats();
  REQUIRE(stats.spans_exported == 5);
}

TEST_CASE("Shutdown drains, stops and is idempotent", "[pipeline][shutdown]") {
  auto recording = std::make_shared<Recording>();
  ExportPipeline pipeline(manual_flush_options(),
                          std::make_unique<RecordingExporter>(recording));

  SECTION("Records enqueued before start are rejected") {
    REQUIRE_FALSE(pipeline.enqueue(make_span(0)));
    REQUIRE(pipeline.stats().spans_dropped == 1);
  }

  pipeline.start();
  for (int i = 0; i < 20; ++i) {
    REQUIRE(pipeline.enqueue(make_span(i)));
  }

  REQUIRE(pipeline.shutdown());
  REQUIRE(pipeline.state() == ExportPipeline::State::kStopped);
  REQUIRE(recording->span_count() == 20);
  REQUIRE(recording->shut_down.load());

  const auto dropped_before = pipeline.stats().spans_dropped;
  REQUIRE_FALSE(pipeline.enqueue(make_span(99)));
  REQUIRE(pipeline.stats().spans_dropped == dropped_before + 1);
  REQUIRE_FALSE(pipeline.force_flush(100ms));

  REQUIRE(pipeline.shutdown());
  REQUIRE(recording->span_count() == 20);
}

TEST_CASE("Shutdown is bounded by its timeout", "[pipeline][shutdown]") {
  auto options = manual_flush_options();
  options.max_attempts = 100;
  options.initial_backoff = 1000ms;
  options.max_backoff = 1000ms;
  options.shutdown_timeout = 200ms;
  auto recording = std::make_shared<Recording>();
  recording->fail_next(1000, ExportResult::kRetryableFailure);
  ExportPipeline pipeline(options,
                          std::make_unique<RecordingExporter>(recording));
  pipeline.start();
  REQUIRE(pipeline.enqueue(make_span(0)));

  const auto started = std::chrono::steady_clock::now();
  REQUIRE_FALSE(pipeline.shutdown());
  const auto elapsed = std::chrono::steady_clock::now() - started;

  REQUIRE(elapsed < 2s);
  REQUIRE(pipeline.stats().spans_lost == 1);
  REQUIRE(recording->shut_down.load());
}

TEST_CASE("Shutdown cancels an export stuck in flight", "[pipeline][shutdown]") {
  auto options = fast_options();
  options.export_timeout = 10s;
  options.shutdown_timeout = 200ms;
  auto recording = std::make_shared<Recording>();
  recording->latency = 3000ms;
  ExportPipeline pipeline(options,
                          std::make_unique<RecordingExporter>(recording));
  pipeline.start();
  REQUIRE(pipeline.enqueue(make_span(0)));
  // The scheduled tick picks the span up and blocks in the exporter.
  REQUIRE(eventually([&] { return recording->span_calls.load() == 1; }));

  const auto started = std::chrono::steady_clock::now();
  REQUIRE_FALSE(pipeline.shutdown());
  const auto elapsed = std::chrono::steady_clock::now() - started;

  REQUIRE(elapsed < 1500ms);
  REQUIRE(recording->was_cancelled());
  REQUIRE(recording->span_count() == 0);
  REQUIRE(pipeline.stats().spans_lost == 1);
  REQUIRE(recording->shut_down.load());
}

TEST_CASE("Never-started pipeline flushes on shutdown", "[pipeline][shutdown]") {
  auto recording = std::make_shared<Recording>();
  ExportPipeline pipeline(manual_flush_options(),
                          std::make_unique<RecordingExporter>(recording));
  REQUIRE(pipeline.shutdown());
  REQUIRE(pipeline.state() == ExportPipeline::State::kStopped);
  REQUIRE(recording->shut_down.load());
}

TEST_CASE("Null exporter is rejected", "[pipeline]") {
  REQUIRE_THROWS_AS(ExportPipeline(fast_options(), nullptr),
                    std::invalid_argument);
}

TEST_CASE("Concurrent producers lose nothing", "[pipeline][threads]") {
  auto options = fast_options();
  options.max_queue_size = 8192;
  options.max_export_batch_size = 256;
  auto recording = Sonar::testing::initialize_recording(options);
  REQUIRE(recording);

  const int threads = 8;
  const int spans_per_thread = 400;
  const uint64_t total = threads * spans_per_thread;
  std::vector<std::thread> producers;
  for (int t = 0; t < threads; ++t) {
    producers.emplace_back([t] {
      for (int i = 0; i < spans_per_thread; ++i) {
        auto span = Sonar::start_span("work");
        span.set_tag("thread", std::to_string(t));
        Sonar::write_log("step", Sonar::Severity::kDebug);
        span.end();
      }
    });
  }
  for (auto &p : producers) {
    p.join();
  }

  REQUIRE(Sonar::force_flush(5s));
  const auto stats = Sonar::stats();
  REQUIRE(stats.spans_dropped == 0);
  REQUIRE(stats.spans_exported == total);
  REQUIRE(stats.logs_exported == total);
  Sonar::shutdown();

  REQUIRE(recording->span_count() == total);
  REQUIRE(recording->log_count() == total);
  // Logs were written inside their span on the same thread.
  for (const auto &record : recording->logs_snapshot()) {
    REQUIRE(record.is_correlated());
  }
}
