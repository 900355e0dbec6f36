#include "kernel/RandomSource.h"

namespace {

// splitmix64 finalizer
std::uint64_t mix64(std::uint64_t z) {
    z += 0x9e3779b97f4a7c15ULL;
    z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
    z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
    return z ^ (z >> 31);
}

}

RandomSource RandomSource::forCell(std::uint64_t seed, std::uint64_t generation,
                                   std::uint32_t phase, std::size_t cell) {
    std::uint64_t key = mix64(seed);
    key = mix64(key ^ generation);
    key = mix64(key ^ static_cast<std::uint64_t>(phase));
    key = mix64(key ^ static_cast<std::uint64_t>(cell));
    return RandomSource(key);
}
