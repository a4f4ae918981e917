#include "helio-corr/interpretation/labels.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace heliocorr::interpretation {

CorrelationStrength classifyStrength(double coefficient, const StrengthThresholds &thresholds) {
	const double magnitude = std::abs(coefficient);
	if (magnitude >= thresholds.very_strong) {
		return CorrelationStrength::VeryStrong;
	}
	if (magnitude >= thresholds.strong) {
		return CorrelationStrength::Strong;
	}
	if (magnitude >= thresholds.moderate) {
		return CorrelationStrength::Moderate;
	}
	if (magnitude >= thresholds.weak) {
		return CorrelationStrength::Weak;
	}
	return CorrelationStrength::VeryWeak;
}

EffectSize classifyEffectSize(double coefficient, const EffectSizeThresholds &thresholds) {
	const double magnitude = std::abs(coefficient);
	if (magnitude >= thresholds.large) {
		return EffectSize::Large;
	}
	if (magnitude >= thresholds.medium) {
		return EffectSize::Medium;
	}
	if (magnitude >= thresholds.small) {
		return EffectSize::Small;
	}
	return EffectSize::Negligible;
}

CoherenceLevel classifyCoherence(double average_coherence, const CoherenceThresholds &thresholds) {
	if (average_coherence > thresholds.very_high) {
		return CoherenceLevel::VeryHigh;
	}
	if (average_coherence > thresholds.high) {
		return CoherenceLevel::High;
	}
	if (average_coherence > thresholds.moderate) {
		return CoherenceLevel::Moderate;
	}
	return CoherenceLevel::Low;
}

bool isSignificant(double p_value, double alpha) {
	return p_value < alpha;
}

std::string toString(CorrelationStrength strength) {
	switch (strength) {
	case CorrelationStrength::VeryStrong:
		return "very strong";
	case CorrelationStrength::Strong:
		return "strong";
	case CorrelationStrength::Moderate:
		return "moderate";
	case CorrelationStrength::Weak:
		return "weak";
	case CorrelationStrength::VeryWeak:
		return "very weak/none";
	}
	return "unknown";
}

std::string toString(EffectSize effect) {
	switch (effect) {
	case EffectSize::Large:
		return "large";
	case EffectSize::Medium:
		return "medium";
	case EffectSize::Small:
		return "small";
	case EffectSize::Negligible:
		return "negligible";
	}
	return "unknown";
}

std::string toString(CoherenceLevel level) {
	switch (level) {
	case CoherenceLevel::VeryHigh:
		return "very high";
	case CoherenceLevel::High:
		return "high";
	case CoherenceLevel::Moderate:
		return "moderate";
	case CoherenceLevel::Low:
		return "low";
	}
	return "unknown";
}

std::string describeCoherence(double average_coherence, double dominant_period,
                              const CoherenceThresholds &thresholds) {
	std::ostringstream out;
	out << toString(classifyCoherence(average_coherence, thresholds))
	    << " wavelet coherence with dominant period of " << std::fixed << std::setprecision(1) << dominant_period
	    << " time units";
	return out.str();
}

} // namespace heliocorr::interpretation
