#pragma once

#include "sonar/sonar_records.hpp"

#include <atomic>
#include <memory>
#include <mutex>

namespace Sonar::detail {

class Tracer;

/**
 * @brief Mutable state behind a Span handle.
 *
 * Identity fields are fixed at construction and may be read without the
 * lock. Everything in `data` past the identity fields is guarded by `mutex`
 * until `ended` flips to true, after which it is frozen.
 */
struct SpanState {
  SpanState(SpanData initial, std::weak_ptr<Tracer> owner, uint64_t gen)
      : data(std::move(initial)), tracer(std::move(owner)), generation(gen) {}

  SpanData data;
  std::weak_ptr<Tracer> tracer;
  // Pipeline generation the span was started under.
  const uint64_t generation;

  mutable std::mutex mutex;
  std::atomic<bool> ended{false};
};

} // namespace Sonar::detail
