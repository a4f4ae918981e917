#pragma once

#include <string>

namespace heliocorr::interpretation {

enum class CorrelationStrength {
	VeryWeak,
	Weak,
	Moderate,
	Strong,
	VeryStrong
};

enum class EffectSize {
	Negligible,
	Small,
	Medium,
	Large
};

enum class CoherenceLevel {
	Low,
	Moderate,
	High,
	VeryHigh
};

/**
 * @brief Lower bounds on |r| for each strength bucket.
 */
struct StrengthThresholds {
	double very_strong = 0.7;
	double strong = 0.5;
	double moderate = 0.3;
	double weak = 0.1;
};

/**
 * @brief Lower bounds on |r| for each effect-size bucket.
 */
struct EffectSizeThresholds {
	double large = 0.5;
	double medium = 0.3;
	double small = 0.1;
};

/**
 * @brief Strict lower bounds on the average coherence for each level.
 */
struct CoherenceThresholds {
	double very_high = 0.7;
	double high = 0.5;
	double moderate = 0.3;
};

CorrelationStrength classifyStrength(double coefficient, const StrengthThresholds &thresholds = {});
EffectSize classifyEffectSize(double coefficient, const EffectSizeThresholds &thresholds = {});
CoherenceLevel classifyCoherence(double average_coherence, const CoherenceThresholds &thresholds = {});

/// Significance test shared by every method: p strictly below alpha.
bool isSignificant(double p_value, double alpha);

std::string toString(CorrelationStrength strength);
std::string toString(EffectSize effect);
std::string toString(CoherenceLevel level);

/**
 * @brief One-line summary of a wavelet coherence run, e.g.
 * "high wavelet coherence with dominant period of 16.0 time units".
 */
std::string describeCoherence(double average_coherence, double dominant_period,
                              const CoherenceThresholds &thresholds = {});

} // namespace heliocorr::interpretation
