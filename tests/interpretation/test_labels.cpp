#include <catch2/catch_test_macros.hpp>

#include "helio-corr/interpretation/labels.hpp"

#include <string>

using namespace heliocorr::interpretation;

TEST_CASE("Strength buckets use inclusive lower bounds on |r|", "[interpretation]") {
	REQUIRE(classifyStrength(0.7) == CorrelationStrength::VeryStrong);
	REQUIRE(classifyStrength(-0.69) == CorrelationStrength::Strong);
	REQUIRE(classifyStrength(0.5) == CorrelationStrength::Strong);
	REQUIRE(classifyStrength(-0.3) == CorrelationStrength::Moderate);
	REQUIRE(classifyStrength(0.1) == CorrelationStrength::Weak);
	REQUIRE(classifyStrength(0.09) == CorrelationStrength::VeryWeak);
	REQUIRE(classifyStrength(0.0) == CorrelationStrength::VeryWeak);
}

TEST_CASE("Effect size buckets", "[interpretation]") {
	REQUIRE(classifyEffectSize(-0.8) == EffectSize::Large);
	REQUIRE(classifyEffectSize(0.5) == EffectSize::Large);
	REQUIRE(classifyEffectSize(0.35) == EffectSize::Medium);
	REQUIRE(classifyEffectSize(-0.1) == EffectSize::Small);
	REQUIRE(classifyEffectSize(0.05) == EffectSize::Negligible);
}

TEST_CASE("Custom thresholds shift the buckets", "[interpretation]") {
	StrengthThresholds strict;
	strict.very_strong = 0.9;
	REQUIRE(classifyStrength(0.8, strict) == CorrelationStrength::Strong);
}

TEST_CASE("Coherence levels use strict lower bounds", "[interpretation]") {
	REQUIRE(classifyCoherence(0.71) == CoherenceLevel::VeryHigh);
	REQUIRE(classifyCoherence(0.7) == CoherenceLevel::High);
	REQUIRE(classifyCoherence(0.5) == CoherenceLevel::Moderate);
	REQUIRE(classifyCoherence(0.3) == CoherenceLevel::Low);
}

TEST_CASE("Significance is strictly below alpha", "[interpretation]") {
	REQUIRE(isSignificant(0.049, 0.05));
	REQUIRE_FALSE(isSignificant(0.05, 0.05));
	REQUIRE_FALSE(isSignificant(0.2, 0.05));
}

TEST_CASE("Labels render as text", "[interpretation]") {
	REQUIRE(toString(CorrelationStrength::VeryStrong) == "very strong");
	REQUIRE(toString(CorrelationStrength::VeryWeak) == "very weak/none");
	REQUIRE(toString(EffectSize::Medium) == "medium");
	REQUIRE(toString(CoherenceLevel::High) == "high");
}

TEST_CASE("Coherence description names level and period", "[interpretation]") {
	REQUIRE(describeCoherence(0.6, 16.0) == "high wavelet coherence with dominant period of 16.0 time units");
	REQUIRE(describeCoherence(0.1, 27.3) == "low wavelet coherence with dominant period of 27.3 time units");
}
