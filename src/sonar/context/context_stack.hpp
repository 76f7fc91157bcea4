#pragma once

#include "sonar/sonar_core.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace Sonar::detail {

/**
 * @brief Per-thread stack of open spans; the top open entry is "current".
 *
 * Invariants:
 * - pop(span) only removes `span` when it is the top entry. Stopping any
 *   other span leaves current() unchanged.
 * - Entries stopped out of order stay in place until they are uncovered,
 *   then they are discarded so current() always returns an open span.
 * - A stack filled under an older pipeline generation reads as empty.
 */
class ContextStack {
public:
  void push(const Span &span);
  void pop(const Span &span);
  std::optional<Span> current();

  size_t depth();
  // Drops entries above `depth`. Used by ContextScope.
  void truncate(size_t depth);

private:
  void sync_generation();
  void trim_stopped();

  uint64_t _generation = 0;
  std::vector<Span> _entries;
};

ContextStack &this_thread_stack();

// Re-initialization bumps the generation, which lazily empties every thread's
// stack on its next access.
uint64_t current_generation();
uint64_t advance_generation();

} // namespace Sonar::detail
