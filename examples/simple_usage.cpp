#include "sonar/sonar.hpp"
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

using namespace std::chrono_literals;

namespace {

void load_inventory(int order_id) {
  // Parent is the caller's current span.
  SONAR_SPAN("load_inventory", Sonar::SpanKind::kClient);
  Sonar::write_log("Querying inventory for order " + std::to_string(order_id),
                   Sonar::Severity::kDebug);
  std::this_thread::sleep_for(5ms);
}

void handle_order(int order_id) {
  auto request = Sonar::start_span("handle_order", Sonar::SpanKind::kServer);
  request.set_tag("order.id", std::to_string(order_id));

  load_inventory(order_id);

  // Hand the request's context to a worker thread explicitly.
  auto ctx = Sonar::context::capture();
  std::thread worker([ctx, order_id] {
    Sonar::ContextScope scope(ctx);
    auto charge = Sonar::start_span("charge_card", "Client");
    try {
      if (order_id % 2 == 1) {
        throw std::runtime_error("card declined");
      }
      charge.set_status(Sonar::SpanStatus::kOk);
    } catch (const std::exception &e) {
      charge.set_status(Sonar::SpanStatus::kError, e.what());
      Sonar::write_log("Payment failed", Sonar::Severity::kError,
                       Sonar::ErrorInfo{"std::runtime_error", e.what(), ""});
    }
    charge.end();
  });
  worker.join();

  Sonar::write_log("Order handled");
  std::cout << "traceparent for order " << order_id << ": "
            << request.traceparent() << "\n";
  request.end();
}

} // namespace

// Configure through the usual variables, for example:
//   OTEL_SERVICE_NAME=orders OTEL_EXPORTER_OTLP_ENDPOINT=http://localhost:4317 \
//   SONAR_CONSOLE_ECHO=1 ./build/sonar_example
int main() {
  auto options = Sonar::Options::from_env();
  if (auto error = Sonar::initialize(options)) {
    std::cerr << "Sonar setup failed (" << Sonar::to_string(error->code)
              << "): " << error->message << "\n";
    return 1;
  }

  for (int order_id = 1; order_id <= 3; ++order_id) {
    handle_order(order_id);
  }

  if (!Sonar::force_flush(2s)) {
    std::cerr << "Some telemetry could not be delivered\n";
  }
  const auto stats = Sonar::stats();
  std::cout << "Exported " << stats.spans_exported << "/"
            << stats.spans_enqueued << " spans and " << stats.logs_exported
            << "/" << stats.logs_enqueued << " logs\n";

  Sonar::shutdown();
  return 0;
}
