#include "helio-corr/wavelet/coherence.hpp"
#include "helio-corr/alignment/aligner.hpp"
#include "helio-corr/core/errors.hpp"
#include "helio-corr/interpretation/labels.hpp"
#include "helio-corr/utils/logging.hpp"
#include "helio-corr/utils/statistics.hpp"

#include <algorithm>
#include <cmath>
#include <complex>
#include <numeric>
#include <stdexcept>
#include <utility>

namespace heliocorr::wavelet {

namespace {

constexpr const char *kMethodName = "wavelet";
// Time-smoothing Gaussian truncated at three standard deviations.
constexpr double kTimeSmoothingWidth = 3.0;
constexpr double kMinimumPower = 1e-300;

std::vector<double> zNormalize(const std::vector<double> &data) {
	const double mean = utils::Statistics::mean(data);
	const double sd = utils::Statistics::populationStdDev(data);
	std::vector<double> result(data.size());
	std::transform(data.begin(), data.end(), result.begin(), [mean, sd](double v) { return (v - mean) / sd; });
	return result;
}

template <typename Matrix>
Matrix divideRowsByScale(const Matrix &input, const std::vector<double> &scales) {
	Matrix result = input;
	for (Eigen::Index row = 0; row < result.rows(); ++row) {
		result.row(row) *= typename Matrix::Scalar(1.0 / scales[static_cast<std::size_t>(row)]);
	}
	return result;
}

// Gaussian smoothing along time; the kernel width follows the row's scale.
template <typename Matrix>
Matrix smoothTime(const Matrix &input, const std::vector<double> &scales) {
	const Eigen::Index cols = input.cols();
	Matrix result(input.rows(), cols);
	for (Eigen::Index row = 0; row < input.rows(); ++row) {
		const double scale = scales[static_cast<std::size_t>(row)];
		const int half_width =
		    static_cast<int>(std::min<double>(std::ceil(kTimeSmoothingWidth * scale), static_cast<double>(cols)));
		std::vector<double> weights(static_cast<std::size_t>(2 * half_width + 1));
		for (int offset = -half_width; offset <= half_width; ++offset) {
			const double ratio = static_cast<double>(offset) / scale;
			weights[static_cast<std::size_t>(offset + half_width)] = std::exp(-0.5 * ratio * ratio);
		}

		for (Eigen::Index t = 0; t < cols; ++t) {
			const Eigen::Index begin = std::max<Eigen::Index>(0, t - half_width);
			const Eigen::Index end = std::min<Eigen::Index>(cols - 1, t + half_width);
			typename Matrix::Scalar accum(0.0);
			double weight_sum = 0.0;
			for (Eigen::Index k = begin; k <= end; ++k) {
				const double w = weights[static_cast<std::size_t>(k - t + half_width)];
				accum += w * input(row, k);
				weight_sum += w;
			}
			result(row, t) = accum / weight_sum;
		}
	}
	return result;
}

// Three-point boxcar across neighbouring scales.
template <typename Matrix>
Matrix smoothScale(const Matrix &input) {
	const Eigen::Index rows = input.rows();
	Matrix result(rows, input.cols());
	for (Eigen::Index row = 0; row < rows; ++row) {
		const Eigen::Index begin = std::max<Eigen::Index>(0, row - 1);
		const Eigen::Index end = std::min<Eigen::Index>(rows - 1, row + 1);
		const auto count = end - begin + 1;
		result.row(row) =
		    input.middleRows(begin, count).colwise().sum() * typename Matrix::Scalar(1.0 / static_cast<double>(count));
	}
	return result;
}

template <typename Matrix>
Matrix smooth(const Matrix &input, const std::vector<double> &scales) {
	return smoothScale(smoothTime(divideRowsByScale(input, scales), scales));
}

bool allFinite(const Eigen::MatrixXcd &coefficients) {
	return coefficients.real().allFinite() && coefficients.imag().allFinite();
}

} // namespace

WaveletCoherence::WaveletCoherence(std::vector<double> scales, MotherWavelet wavelet, double sampling_period,
                                   double threshold)
    : scales_(std::move(scales)), wavelet_(wavelet), sampling_period_(sampling_period), threshold_(threshold) {}

WaveletCoherence::Builder &WaveletCoherence::Builder::scales(std::vector<double> value) {
	scales_ = std::move(value);
	return *this;
}

WaveletCoherence::Builder &WaveletCoherence::Builder::motherWavelet(MotherWavelet value) {
	wavelet_ = value;
	return *this;
}

WaveletCoherence::Builder &WaveletCoherence::Builder::samplingPeriod(double value) {
	sampling_period_ = value;
	return *this;
}

WaveletCoherence::Builder &WaveletCoherence::Builder::highCoherenceThreshold(double value) {
	threshold_ = value;
	return *this;
}

WaveletCoherence WaveletCoherence::Builder::build() const {
	auto scales = scales_.empty() ? defaultScales() : scales_;
	for (double scale : scales) {
		if (!(scale > 0.0) || !std::isfinite(scale)) {
			throw std::invalid_argument("Wavelet scales must be positive and finite");
		}
	}
	if (!(sampling_period_ > 0.0) || !std::isfinite(sampling_period_)) {
		throw std::invalid_argument("Sampling period must be positive");
	}
	if (!(threshold_ >= 0.0 && threshold_ <= 1.0)) {
		throw std::invalid_argument("High coherence threshold must lie in [0, 1]");
	}
	return WaveletCoherence(std::move(scales), wavelet_, sampling_period_, threshold_);
}

WaveletCoherence::Builder WaveletCoherence::builder() {
	return Builder();
}

std::vector<double> WaveletCoherence::defaultScales() {
	std::vector<double> scales(64);
	std::iota(scales.begin(), scales.end(), 1.0);
	return scales;
}

CoherenceResult WaveletCoherence::compute(const std::vector<double> &x, const std::vector<double> &y) const {
	const auto pair = alignment::prepare(x, y, alignment::kMinWaveletObservations, kMethodName);

	const Eigen::MatrixXcd wx = continuousWaveletTransform(zNormalize(pair.x), scales_, wavelet_);
	const Eigen::MatrixXcd wy = continuousWaveletTransform(zNormalize(pair.y), scales_, wavelet_);
	if (!allFinite(wx) || !allFinite(wy)) {
		throw core::ComputationError(kMethodName, "wavelet transform produced non-finite coefficients");
	}

	const Eigen::MatrixXcd cross = wx.cwiseProduct(wy.conjugate());
	const Eigen::MatrixXd power_x = wx.cwiseAbs2();
	const Eigen::MatrixXd power_y = wy.cwiseAbs2();

	const Eigen::MatrixXcd smoothed_cross = smooth(cross, scales_);
	const Eigen::MatrixXd smoothed_x = smooth(power_x, scales_);
	const Eigen::MatrixXd smoothed_y = smooth(power_y, scales_);

	const Eigen::Index rows = cross.rows();
	const Eigen::Index cols = cross.cols();

	CoherenceResult result;
	result.n_observations = pair.size();
	result.scales = scales_;
	result.coherence.resize(rows, cols);
	result.phase.resize(rows, cols);
	for (Eigen::Index i = 0; i < rows; ++i) {
		for (Eigen::Index t = 0; t < cols; ++t) {
			const double denominator = smoothed_x(i, t) * smoothed_y(i, t);
			const double value = denominator > kMinimumPower ? std::norm(smoothed_cross(i, t)) / denominator : 0.0;
			result.coherence(i, t) = std::clamp(value, 0.0, 1.0);
			result.phase(i, t) = std::arg(cross(i, t));
			if (result.coherence(i, t) > threshold_) {
				result.high_coherence_regions.push_back({static_cast<std::size_t>(i), static_cast<std::size_t>(t)});
			}
		}
	}

	const double factor = fourierFactor(wavelet_);
	result.frequencies.reserve(scales_.size());
	for (double scale : scales_) {
		result.frequencies.push_back(1.0 / (factor * scale * sampling_period_));
	}

	const Eigen::VectorXd average_by_scale = result.coherence.rowwise().mean();
	Eigen::Index dominant = 0;
	average_by_scale.maxCoeff(&dominant);
	result.dominant_scale = scales_[static_cast<std::size_t>(dominant)];
	result.dominant_period = result.dominant_scale * sampling_period_;
	result.average_coherence = result.coherence.mean();
	result.max_coherence = result.coherence.maxCoeff();
	result.interpretation = interpretation::describeCoherence(result.average_coherence, result.dominant_period);

	HELIOCORR_DEBUG("wavelet avg={:.3f} max={:.3f} dominant_period={} high_cells={}", result.average_coherence,
	                result.max_coherence, result.dominant_period, result.high_coherence_regions.size());
	return result;
}

} // namespace heliocorr::wavelet
