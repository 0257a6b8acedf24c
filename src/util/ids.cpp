#include "util/ids.hpp"
#include <fmt/core.h>
#include <random>
#include <cstdint>

namespace runbox::util {

std::string generate_execution_id() {
    thread_local std::mt19937_64 rng{std::random_device{}()};

    uint64_t hi = rng();
    uint64_t lo = rng();

    // Version 4, RFC 4122 variant
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    return fmt::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}",
                       static_cast<uint32_t>(hi >> 32),
                       static_cast<uint32_t>((hi >> 16) & 0xFFFF),
                       static_cast<uint32_t>(hi & 0xFFFF),
                       static_cast<uint32_t>(lo >> 48),
                       lo & 0xFFFFFFFFFFFFULL);
}

} // namespace runbox::util
