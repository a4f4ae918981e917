#pragma once

#include <Eigen/Dense>
#include <string>
#include <vector>

namespace heliocorr::wavelet {

enum class MotherWavelet {
	Morlet,    ///< Complex Morlet, omega0 = 6
	MexicanHat ///< Real second derivative of a Gaussian
};

std::string toString(MotherWavelet wavelet);

/**
 * @brief Parses "morlet"/"morl" and "mexican_hat"/"mexh".
 * @throws std::invalid_argument For any other name.
 */
MotherWavelet parseMotherWavelet(const std::string &name);

/**
 * @brief Ratio between the equivalent Fourier period and the wavelet scale.
 */
double fourierFactor(MotherWavelet wavelet);

/**
 * @brief Continuous wavelet transform by direct convolution.
 *
 * Row i holds the coefficients at scales[i] (in samples), column t the
 * coefficient centred on sample t:
 * W(s, t) = sum_k x[k] conj(psi((k - t) / s)) / sqrt(s). The wavelet is
 * truncated to its effective support and the signal is zero-padded at the
 * edges.
 *
 * @throws std::invalid_argument If the signal is empty or a scale is not positive.
 */
Eigen::MatrixXcd continuousWaveletTransform(const std::vector<double> &signal, const std::vector<double> &scales,
                                            MotherWavelet wavelet = MotherWavelet::Morlet);

} // namespace heliocorr::wavelet
