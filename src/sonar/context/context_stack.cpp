#include "sonar/context/context_stack.hpp"
#include "sonar/sonar_context.hpp"

#include <atomic>

namespace Sonar {
namespace detail {

namespace {
std::atomic<uint64_t> g_generation{0};
} // namespace

uint64_t current_generation() {
  return g_generation.load(std::memory_order_acquire);
}

uint64_t advance_generation() {
  return g_generation.fetch_add(1, std::memory_order_acq_rel) + 1;
}

ContextStack &this_thread_stack() {
  static thread_local ContextStack stack;
  return stack;
}

void ContextStack::sync_generation() {
  const uint64_t generation = current_generation();
  if (_generation != generation) {
    _entries.clear();
    _generation = generation;
  }
}

void ContextStack::trim_stopped() {
  while (!_entries.empty() && !_entries.back().is_recording()) {
    _entries.pop_back();
  }
}

void ContextStack::push(const Span &span) {
  sync_generation();
  if (span.is_noop()) {
    return;
  }
  _entries.push_back(span);
}

void ContextStack::pop(const Span &span) {
  sync_generation();
  if (!_entries.empty() && _entries.back() == span) {
    _entries.pop_back();
    trim_stopped();
  }
}

std::optional<Span> ContextStack::current() {
  sync_generation();
  trim_stopped();
  if (_entries.empty()) {
    return std::nullopt;
  }
  return _entries.back();
}

size_t ContextStack::depth() {
  sync_generation();
  return _entries.size();
}

void ContextStack::truncate(size_t depth) {
  sync_generation();
  if (_entries.size() > depth) {
    _entries.resize(depth);
  }
}

} // namespace detail

// --- Public context API ---

namespace context {
std::optional<Span> current_span() {
  return detail::this_thread_stack().current();
}

Context capture() {
  auto span = detail::this_thread_stack().current();
  return span ? Context(*span) : Context();
}
} // namespace context

ContextScope::ContextScope(const Context &ctx)
    : _saved_depth(detail::this_thread_stack().depth()) {
  if (ctx.has_span()) {
    detail::this_thread_stack().push(ctx.span());
  }
}

ContextScope::~ContextScope() {
  detail::this_thread_stack().truncate(_saved_depth);
}

} // namespace Sonar
