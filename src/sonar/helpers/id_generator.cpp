#include "sonar/helpers/id_generator.hpp"

#include <cstring>
#include <random>

namespace Sonar::detail {

namespace {
std::mt19937_64 &engine() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  return rng;
}

template <size_t N> void fill_random(std::array<uint8_t, N> &bytes) {
  auto &rng = engine();
  for (size_t offset = 0; offset < N; offset += sizeof(uint64_t)) {
    const uint64_t word = rng();
    std::memcpy(bytes.data() + offset, &word, sizeof(word));
  }
}
} // namespace

TraceId generate_trace_id() {
  TraceId id;
  do {
    fill_random(id.bytes);
  } while (!id.is_valid());
  return id;
}

SpanId generate_span_id() {
  SpanId id;
  do {
    fill_random(id.bytes);
  } while (!id.is_valid());
  return id;
}

} // namespace Sonar::detail
