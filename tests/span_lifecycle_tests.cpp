#include "fakes.hpp"

#include <atomic>
#include <catch2/catch_all.hpp>
#include <set>
#include <sonar/sonar.hpp>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using Sonar::testing::initialize_recording;

namespace {
const Sonar::SpanData *find_span(const std::vector<Sonar::SpanData> &spans,
                                 const std::string &name) {
  for (const auto &span : spans) {
    if (span.name == name) {
      return &span;
    }
  }
  return nullptr;
}
} // namespace

TEST_CASE("Nested spans share a trace and link to their parent", "[span]") {
  auto recording = initialize_recording();
  REQUIRE(recording);

  auto a = Sonar::start_span("A", "Internal");
  auto b = Sonar::start_span("B", "Client", a);

  REQUIRE(b.parent_span_id() == a.span_id());
  REQUIRE(b.trace_id() == a.trace_id());
  REQUIRE_FALSE(a.parent_span_id().has_value());
  REQUIRE(b.kind() == Sonar::SpanKind::kClient);

  Sonar::stop_span(b);
  Sonar::stop_span(a);
  REQUIRE_FALSE(Sonar::current_span().has_value());

  REQUIRE(Sonar::force_flush(2s));
  const auto spans = recording->spans_snapshot();
  REQUIRE(spans.size() == 2);
  const auto *exported_b = find_span(spans, "B");
  REQUIRE(exported_b != nullptr);
  REQUIRE(exported_b->parent_span_id == a.span_id());
  REQUIRE(exported_b->end_time_unix_nano >= exported_b->start_time_unix_nano);

  Sonar::shutdown();
}

TEST_CASE("Implicit parent comes from the current span", "[span]") {
  auto recording = initialize_recording();
  REQUIRE(recording);

  auto outer = Sonar::start_span("outer");
  REQUIRE(Sonar::current_span() == outer);

  auto inner = Sonar::start_span("inner", Sonar::SpanKind::kProducer);
  REQUIRE(inner.parent_span_id() == outer.span_id());
  REQUIRE(Sonar::current_span() == inner);

  Sonar::stop_span();
  REQUIRE(Sonar::current_span() == outer);
  REQUIRE_FALSE(inner.is_recording());

  Sonar::stop_span();
  REQUIRE_FALSE(Sonar::current_span().has_value());

  Sonar::shutdown();
}

TEST_CASE("Stopping a span twice exports it once", "[span]") {
  auto recording = initialize_recording();
  REQUIRE(recording);

  auto span = Sonar::start_span("once");
  Sonar::stop_span(span);
  span.end();
  Sonar::stop_span(span);

  REQUIRE(Sonar::force_flush(2s));
  REQUIRE(recording->span_count() == 1);
  REQUIRE(Sonar::stats().spans_enqueued == 1);

  Sonar::shutdown();
}

TEST_CASE("Stopping a non-current span does not change the current span",
          "[span][context]") {
  auto recording = initialize_recording();
  REQUIRE(recording);

  auto a = Sonar::start_span("A");
  auto b = Sonar::start_span("B");
  auto c = Sonar::start_span("C");

  Sonar::stop_span(b);
  REQUIRE(Sonar::current_span() == c);

  // Once C is gone, the stopped B is skipped and A is current again.
  Sonar::stop_span(c);
  REQUIRE(Sonar::current_span() == a);

  Sonar::stop_span(a);
  REQUIRE_FALSE(Sonar::current_span().has_value());

  Sonar::shutdown();
}

TEST_CASE("Tags", "[span][tags]") {
  auto recording = initialize_recording();
  REQUIRE(recording);

  auto span = Sonar::start_span("tagged");

  SECTION("Last write wins and first-write order is kept") {
    Sonar::set_tag(span, "http.method", "GET");
    Sonar::set_tag(span, "http.route", "/users");
    Sonar::set_tag(span, "http.method", "POST");
    REQUIRE(span.tag("http.method") == "POST");
    Sonar::stop_span(span);

    REQUIRE(Sonar::force_flush(2s));
    const auto spans = recording->spans_snapshot();
    REQUIRE(spans.size() == 1);
    REQUIRE(spans[0].tags.size() == 2);
    REQUIRE(spans[0].tags[0] == Sonar::Tag("http.method", "POST"));
    REQUIRE(spans[0].tags[1] == Sonar::Tag("http.route", "/users"));
  }

  SECTION("Tags set after stop are silently dropped") {
    Sonar::set_tag(span, "before", "1");
    Sonar::stop_span(span);
    REQUIRE_NOTHROW(Sonar::set_tag(span, "after", "2"));
    REQUIRE_NOTHROW(span.set_status(Sonar::SpanStatus::kError, "late"));

    REQUIRE_FALSE(span.tag("after").has_value());
    REQUIRE(span.status() == Sonar::SpanStatus::kUnset);

    REQUIRE(Sonar::force_flush(2s));
    const auto spans = recording->spans_snapshot();
    REQUIRE(spans.size() == 1);
    REQUIRE(spans[0].tags.size() == 1);
  }

  Sonar::shutdown();
}

TEST_CASE("Span status", "[span]") {
  auto recording = initialize_recording();
  REQUIRE(recording);

  auto failed = Sonar::start_span("failed");
  failed.set_status(Sonar::SpanStatus::kError, "timeout talking to db");
  failed.end();

  auto fine = Sonar::start_span("fine");
  fine.set_status(Sonar::SpanStatus::kOk, "ignored for ok");
  fine.end();

  REQUIRE(Sonar::force_flush(2s));
  const auto spans = recording->spans_snapshot();
  const auto *f = find_span(spans, "failed");
  const auto *o = find_span(spans, "fine");
  REQUIRE(f != nullptr);
  REQUIRE(o != nullptr);
  REQUIRE(f->status == Sonar::SpanStatus::kError);
  REQUIRE(f->status_description == "timeout talking to db");
  REQUIRE(o->status == Sonar::SpanStatus::kOk);
  REQUIRE(o->status_description.empty());

  Sonar::shutdown();
}

TEST_CASE("Unknown span kind is rejected", "[span][errors]") {
  auto recording = initialize_recording();
  REQUIRE(recording);

  auto outer = Sonar::start_span("outer");
  REQUIRE_THROWS_AS(Sonar::start_span("bad", "Sideways"),
                    Sonar::InvalidArgumentError);
  REQUIRE(Sonar::current_span() == outer);

  // Matching ignores case.
  auto server = Sonar::start_span("ok", "server");
  REQUIRE(server.kind() == Sonar::SpanKind::kServer);

  server.end();
  outer.end();
  Sonar::shutdown();
}

TEST_CASE("Span ids are unique and valid", "[span][ids]") {
  auto recording = initialize_recording();
  REQUIRE(recording);

  std::set<std::string> span_ids;
  std::set<std::string> trace_ids;
  for (int i = 0; i < 500; ++i) {
    auto span = Sonar::start_span("root");
    REQUIRE(span.trace_id().is_valid());
    REQUIRE(span.span_id().is_valid());
    span_ids.insert(span.span_id().to_hex());
    trace_ids.insert(span.trace_id().to_hex());
    span.end();
  }
  REQUIRE(span_ids.size() == 500);
  REQUIRE(trace_ids.size() == 500);

  Sonar::shutdown();
}

TEST_CASE("Explicit parent from another thread", "[span][threads]") {
  auto recording = initialize_recording();
  REQUIRE(recording);

  auto request = Sonar::start_span("request", Sonar::SpanKind::kServer);

  std::vector<Sonar::Span> children(4);
  std::atomic<int> inherited_context{0};
  std::vector<std::thread> workers;
  for (size_t i = 0; i < children.size(); ++i) {
    workers.emplace_back([&, i] {
      // Worker threads start with an empty context.
      if (Sonar::current_span()) {
        ++inherited_context;
      }
      children[i] = Sonar::start_span("work", Sonar::SpanKind::kInternal,
                                      request);
      children[i].end();
      if (Sonar::current_span()) {
        ++inherited_context;
      }
    });
  }
  for (auto &w : workers) {
    w.join();
  }

  REQUIRE(inherited_context.load() == 0);
  for (const auto &child : children) {
    REQUIRE(child.trace_id() == request.trace_id());
    REQUIRE(child.parent_span_id() == request.span_id());
  }
  REQUIRE(Sonar::current_span() == request);

  request.end();
  REQUIRE(Sonar::force_flush(2s));
  REQUIRE(recording->span_count() == 5);

  Sonar::shutdown();
}

TEST_CASE("A span may be stopped from another thread", "[span][threads]") {
  auto recording = initialize_recording();
  REQUIRE(recording);

  auto span = Sonar::start_span("handoff");
  std::thread([span]() mutable { span.end(); }).join();

  REQUIRE_FALSE(span.is_recording());
  // The stopped entry no longer counts as current here either.
  REQUIRE_FALSE(Sonar::current_span().has_value());

  REQUIRE(Sonar::force_flush(2s));
  REQUIRE(recording->span_count() == 1);

  Sonar::shutdown();
}

TEST_CASE("ScopedSpan stops at scope exit", "[span][raii]") {
  auto recording = initialize_recording();
  REQUIRE(recording);

  {
    SONAR_SPAN("scoped");
    REQUIRE(Sonar::current_span().has_value());
    REQUIRE(Sonar::current_span()->name() == "scoped");
    {
      Sonar::ScopedSpan inner(Sonar::start_span("inner"));
      inner->set_tag("depth", "2");
      REQUIRE(Sonar::current_span() == inner.get());
    }
    REQUIRE(Sonar::current_span()->name() == "scoped");
  }
  REQUIRE_FALSE(Sonar::current_span().has_value());

  REQUIRE(Sonar::force_flush(2s));
  const auto spans = recording->spans_snapshot();
  REQUIRE(spans.size() == 2);
  const auto *inner = find_span(spans, "inner");
  REQUIRE(inner != nullptr);
  REQUIRE(inner->tags.size() == 1);

  Sonar::shutdown();
}

TEST_CASE("traceparent renders the W3C header", "[span]") {
  auto recording = initialize_recording();
  REQUIRE(recording);

  auto span = Sonar::start_span("remote-call", Sonar::SpanKind::kClient);
  const auto header = span.traceparent();
  REQUIRE(header == "00-" + span.trace_id().to_hex() + "-" +
                        span.span_id().to_hex() + "-01");
  REQUIRE(header.size() == 55);

  span.end();
  REQUIRE(Sonar::Span().traceparent().empty());
  Sonar::shutdown();
}

TEST_CASE("Re-initialization resets context and discards old spans",
          "[span][lifecycle]") {
  auto first = initialize_recording();
  REQUIRE(first);

  auto stale = Sonar::start_span("stale");
  REQUIRE(Sonar::current_span() == stale);

  auto second = initialize_recording();
  REQUIRE(second);
  REQUIRE(first->shut_down.load());
  REQUIRE_FALSE(Sonar::current_span().has_value());

  stale.end();
  REQUIRE_FALSE(stale.is_recording());

  auto fresh = Sonar::start_span("fresh");
  REQUIRE_FALSE(fresh.parent_span_id().has_value());
  fresh.end();

  REQUIRE(Sonar::force_flush(2s));
  const auto spans = second->spans_snapshot();
  REQUIRE(spans.size() == 1);
  REQUIRE(spans[0].name == "fresh");
  REQUIRE(first->span_count() == 0);

  Sonar::shutdown();
}

TEST_CASE("After shutdown spans are no-ops", "[span][lifecycle]") {
  auto recording = initialize_recording();
  REQUIRE(recording);
  Sonar::shutdown();

  REQUIRE_FALSE(Sonar::is_initialized());
  auto span = Sonar::start_span("late");
  REQUIRE(span.is_noop());
  REQUIRE_FALSE(span.is_recording());
  REQUIRE_NOTHROW(span.set_tag("k", "v"));
  REQUIRE_NOTHROW(Sonar::stop_span(span));
  REQUIRE_FALSE(Sonar::current_span().has_value());
  REQUIRE(recording->shut_down.load());

  // Idempotent.
  REQUIRE_NOTHROW(Sonar::shutdown());
}
