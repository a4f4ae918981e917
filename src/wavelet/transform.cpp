#include "helio-corr/wavelet/transform.hpp"

#include <algorithm>
#include <cmath>
#include <complex>
#include <stdexcept>

namespace heliocorr::wavelet {

namespace {

constexpr double kPi = 3.14159265358979323846;
constexpr double kMorletOmega0 = 6.0;
// Gaussian envelope below exp(-8) is ignored.
constexpr double kSupportWidth = 4.0;

std::complex<double> motherValue(MotherWavelet wavelet, double eta) {
	const double envelope = std::exp(-0.5 * eta * eta);
	switch (wavelet) {
	case MotherWavelet::Morlet: {
		const double norm = std::pow(kPi, -0.25);
		return norm * envelope * std::complex<double>(std::cos(kMorletOmega0 * eta), std::sin(kMorletOmega0 * eta));
	}
	case MotherWavelet::MexicanHat: {
		const double norm = 2.0 / (std::sqrt(3.0) * std::pow(kPi, 0.25));
		return {norm * (1.0 - eta * eta) * envelope, 0.0};
	}
	}
	throw std::invalid_argument("Unsupported mother wavelet");
}

} // namespace

std::string toString(MotherWavelet wavelet) {
	switch (wavelet) {
	case MotherWavelet::Morlet:
		return "morlet";
	case MotherWavelet::MexicanHat:
		return "mexican_hat";
	}
	return "unknown";
}

MotherWavelet parseMotherWavelet(const std::string &name) {
	if (name == "morlet" || name == "morl") {
		return MotherWavelet::Morlet;
	}
	if (name == "mexican_hat" || name == "mexh") {
		return MotherWavelet::MexicanHat;
	}
	throw std::invalid_argument("Unknown mother wavelet '" + name + "'");
}

double fourierFactor(MotherWavelet wavelet) {
	switch (wavelet) {
	case MotherWavelet::Morlet:
		return 4.0 * kPi / (kMorletOmega0 + std::sqrt(2.0 + kMorletOmega0 * kMorletOmega0));
	case MotherWavelet::MexicanHat:
		return 2.0 * kPi / std::sqrt(2.5);
	}
	throw std::invalid_argument("Unsupported mother wavelet");
}

Eigen::MatrixXcd continuousWaveletTransform(const std::vector<double> &signal, const std::vector<double> &scales,
                                            MotherWavelet wavelet) {
	if (signal.empty()) {
		throw std::invalid_argument("Cannot transform an empty signal");
	}
	if (scales.empty()) {
		throw std::invalid_argument("At least one scale is required");
	}

	const int n = static_cast<int>(signal.size());
	Eigen::MatrixXcd coefficients = Eigen::MatrixXcd::Zero(static_cast<Eigen::Index>(scales.size()), n);

	for (std::size_t row = 0; row < scales.size(); ++row) {
		const double scale = scales[row];
		if (!(scale > 0.0) || !std::isfinite(scale)) {
			throw std::invalid_argument("Wavelet scales must be positive and finite");
		}
		// Offsets beyond the signal length are never read.
		const int half_width = static_cast<int>(std::min<double>(std::ceil(kSupportWidth * scale), n));
		const double amplitude = 1.0 / std::sqrt(scale);

		// Sampled, conjugated kernel for offsets -half_width..half_width.
		std::vector<std::complex<double>> kernel(static_cast<std::size_t>(2 * half_width + 1));
		for (int offset = -half_width; offset <= half_width; ++offset) {
			kernel[static_cast<std::size_t>(offset + half_width)] =
			    amplitude * std::conj(motherValue(wavelet, static_cast<double>(offset) / scale));
		}

		for (int t = 0; t < n; ++t) {
			const int begin = std::max(0, t - half_width);
			const int end = std::min(n - 1, t + half_width);
			std::complex<double> accum(0.0, 0.0);
			for (int k = begin; k <= end; ++k) {
				accum += signal[static_cast<std::size_t>(k)] * kernel[static_cast<std::size_t>(k - t + half_width)];
			}
			coefficients(static_cast<Eigen::Index>(row), t) = accum;
		}
	}
	return coefficients;
}

} // namespace heliocorr::wavelet
