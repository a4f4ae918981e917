#pragma once

#include <cstdint>
#include <initializer_list>
#include <random>

namespace heliocorr::utils {

/// Generator used by every resampling routine. Callers own it and pass it by reference.
using RandomEngine = std::mt19937_64;

/// Seed used by the convenience layer when the caller does not supply a generator.
constexpr std::uint64_t kDefaultSeed = 42;

/**
 * @brief Creates a generator from a list of seed words.
 *
 * Used to derive independent, reproducible streams (e.g. one per variable
 * pair) from a single base seed.
 */
inline RandomEngine makeEngine(std::initializer_list<std::uint64_t> words) {
	std::seed_seq sequence(words.begin(), words.end());
	return RandomEngine(sequence);
}

} // namespace heliocorr::utils
