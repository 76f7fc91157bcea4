#pragma once

#include "sonar_core.hpp"
#include <cstddef>
#include <optional>

namespace Sonar {

/**
 * @brief A captured "current span", used to carry context across a thread
 * or task boundary explicitly instead of through shared state.
 */
class Context {
public:
  Context() = default;
  explicit Context(Span span) : _span(std::move(span)) {}

  bool has_span() const { return !_span.is_noop(); }
  const Span &span() const { return _span; }

private:
  Span _span;
};

namespace context {

// The calling thread's current span, if an open one exists.
std::optional<Span> current_span();

// Snapshot of the calling thread's current span.
Context capture();

} // namespace context

/**
 * @brief Installs a captured Context as current on the calling thread for
 * the lifetime of the scope.
 *
 * On destruction the thread's context stack is restored to the depth it had
 * on construction, which also discards any child spans that were started in
 * the scope and never stopped.
 *
 * Example:
 *   auto ctx = Sonar::context::capture();
 *   std::thread worker([ctx] {
 *     Sonar::ContextScope scope(ctx);
 *     auto child = Sonar::start_span("work"); // parent is ctx.span()
 *     ...
 *   });
 */
class ContextScope {
public:
  explicit ContextScope(const Context &ctx);
  ~ContextScope();

  ContextScope(const ContextScope &) = delete;
  ContextScope &operator=(const ContextScope &) = delete;

private:
  size_t _saved_depth;
};

} // namespace Sonar
