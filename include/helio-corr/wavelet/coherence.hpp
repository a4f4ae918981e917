#pragma once

#include "helio-corr/wavelet/transform.hpp"

#include <Eigen/Dense>
#include <cstddef>
#include <string>
#include <vector>

namespace heliocorr::wavelet {

struct CoherenceCell {
	std::size_t scale_index = 0;
	std::size_t time_index = 0;
};

struct CoherenceResult {
	Eigen::MatrixXd coherence; ///< scales x time, values in [0, 1]
	Eigen::MatrixXd phase;     ///< radians, argument of the cross spectrum
	std::vector<double> scales;
	std::vector<double> frequencies;
	double dominant_scale = 0.0;
	double dominant_period = 0.0;
	double average_coherence = 0.0;
	double max_coherence = 0.0;
	std::vector<CoherenceCell> high_coherence_regions;
	std::size_t n_observations = 0;
	std::string interpretation;
};

/**
 * @class WaveletCoherence
 * @brief Time-frequency localized correlation between two series.
 *
 * Both series are z-normalized and transformed with the configured mother
 * wavelet. Coherence at each (scale, time) cell is
 * |S(W_xy / s)|^2 / (S(|W_x|^2 / s) * S(|W_y|^2 / s)), where S smooths with a
 * Gaussian of width s along time and a three-point boxcar across scales.
 * The phase is the argument of W_x * conj(W_y).
 */
class WaveletCoherence {
public:
	class Builder {
	public:
		Builder &scales(std::vector<double> value);
		Builder &motherWavelet(MotherWavelet value);
		Builder &samplingPeriod(double value);
		Builder &highCoherenceThreshold(double value);
		WaveletCoherence build() const;

	private:
		std::vector<double> scales_;
		MotherWavelet wavelet_ = MotherWavelet::Morlet;
		double sampling_period_ = 1.0;
		double threshold_ = 0.7;
	};

	static Builder builder();

	/// Scales 1, 2, ..., 64.
	static std::vector<double> defaultScales();

	/**
	 * @throws core::InsufficientDataError Fewer than 128 jointly observed values.
	 * @throws core::DegenerateInputError Either series is constant.
	 * @throws core::ComputationError The transform produced non-finite coefficients.
	 */
	CoherenceResult compute(const std::vector<double> &x, const std::vector<double> &y) const;

	const std::vector<double> &scales() const {
		return scales_;
	}
	MotherWavelet motherWavelet() const {
		return wavelet_;
	}
	double samplingPeriod() const {
		return sampling_period_;
	}

private:
	WaveletCoherence(std::vector<double> scales, MotherWavelet wavelet, double sampling_period, double threshold);

	std::vector<double> scales_;
	MotherWavelet wavelet_;
	double sampling_period_;
	double threshold_;
};

} // namespace heliocorr::wavelet
