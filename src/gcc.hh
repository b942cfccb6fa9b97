#pragma once

#include "array.hh"
#include "options.hh"

#include <cstddef>
#include <optional>
#include <vector>

namespace Xcorr {

/// Largest sample count whose transform length still fits FFTW's `int` sizes (2^30 points).
inline constexpr std::size_t maxSamples = std::size_t{1} << 29;

/// Exponent `e` such that `2^e >= n`, with `2^(e-1) < n` for `n > 1`.
int nextPowerOfTwo(std::size_t n);

/// Transform length for `numSamples`: the smallest power of two holding `2 * numSamples - 1`.
std::size_t fftLength(std::size_t numSamples);

/// Output length: `min(2 * numSamples - 1, maxDelay)`.
std::size_t correlationLength(std::size_t numSamples, std::optional<std::size_t> maxDelay);

/// Lag carried by each output index of a correlation sequence of `ncorr` samples.
std::vector<std::ptrdiff_t> lags(std::size_t ncorr);

/**
 * @brief Checks that `x0` and `x1` form a valid signal pair.
 *
 * Both must be of rank 1 (`[N]`) or rank 2 (`[batch, N]`) with the same non-zero `N`. Batch
 * sizes must be equal, or one side must hold a single row which is then broadcast.
 *
 * @return The shared sample count `N`.
 * @throws ShapeError
 */
std::size_t validatePair(const RealArray &x0, const RealArray &x1);

/// Subtracts the mean of every row.
RealArray removeDc(const RealArray &x);

/**
 * @brief Cross-spectrum `conj(FFT(x0)) * FFT(x1)` of signals zero-padded to `nfft`.
 *
 * A positive lag in the resulting correlation means `x1` is delayed relative to `x0`.
 * The result has `nfft / 2 + 1` bins per row.
 */
ComplexArray crossSpectrum(const RealArray &x0, const RealArray &x1, std::size_t nfft);

ComplexArray applyWeighting(ComplexArray crossSpectrum, Weighting weighting);

/**
 * @brief Normalized inverse transform of a one-sided spectrum back to `nfft` samples.
 * @throws NumericalError if any output sample is NaN or Inf.
 */
RealArray inverseTransform(const ComplexArray &crossSpectrum, std::size_t nfft);

/**
 * @brief Reorders a circular correlation into `ncorr` lags, most negative first.
 *
 * Takes the last `(ncorr - 1) / 2` samples (negative lags) followed by the first
 * `ncorr - (ncorr - 1) / 2` samples (lag 0 and positive lags).
 *
 * @throws ConfigError if `nfft <= ncorr`.
 */
RealArray shiftLags(const RealArray &circular, std::size_t nfft, std::size_t ncorr);

/// Overlap count `max(1, numSamples - |lag|)` per output lag, edge-extended for even `ncorr`.
std::vector<float> unbiasedDenominator(std::size_t numSamples, std::size_t ncorr);

RealArray applyScale(RealArray correlation, std::size_t numSamples, Scale scale);

/**
 * Generalized cross-correlation estimator for a fixed sample count.
 *
 * The transform and output lengths are derived once at construction.
 */
class Estimator
{
  public:
    /// @throws ShapeError if `numSamples` is 0, ConfigError for an invalid `maxDelay`.
    Estimator(std::size_t numSamples, Options options = {});

    /// @throws ShapeError if the inputs do not hold `numSamples()` samples per row.
    [[nodiscard]] RealArray operator()(const RealArray &x0, const RealArray &x1) const;

    [[nodiscard]] std::size_t numSamples() const { return numSamples_; }
    [[nodiscard]] std::size_t fftLength() const { return nfft_; }
    [[nodiscard]] std::size_t correlationLength() const { return ncorr_; }
    [[nodiscard]] const Options &options() const { return options_; }

  private:
    std::size_t numSamples_;
    Options options_;
    std::size_t nfft_, ncorr_;
};

/**
 * @brief Estimates the cross-correlation sequence of `x0` (reference) and `x1` (delayed
 * replica) with the generalized cross-correlation (Knapp & Carter 1976).
 *
 * By default there is neither weighting nor scaling and the output holds
 * `min(2 * N - 1, maxDelay)` lags.
 *
 * @return Array of shape `[ncorr]`, or `[batch, ncorr]` if either input is batched.
 */
RealArray gcc(
    const RealArray &x0, const RealArray &x1, std::optional<std::size_t> maxDelay = {},
    Weighting weighting = Weighting::None, Scale scale = Scale::None
);

/**
 * @brief Same as `gcc` on channel-stacked waveforms of shape `[channel, N]` or
 * `[batch, channel, N]`, channel 0 being the reference and channel 1 the delayed replica.
 */
RealArray gccStacked(
    const RealArray &waveforms, std::optional<std::size_t> maxDelay = {},
    Weighting weighting = Weighting::None, Scale scale = Scale::None
);

} // namespace Xcorr
