#pragma once

#include <complex>
#include <cstddef>
#include <span>
#include <vector>

namespace Xcorr::Fft
{

using ComplexFloat = std::complex<float>;

/**
 * @brief Batched one-sided forward transform.
 *
 * `input` holds `count` rows of equal length, each zero-padded to `length` samples.
 * Returns `count` rows of `length / 2 + 1` bins.
 */
std::vector<ComplexFloat> r2c(std::span<const float> input, std::size_t length, std::size_t count = 1);

/**
 * @brief Batched one-sided inverse transform.
 *
 * `input` holds `count` rows of `length / 2 + 1` bins. Returns `count` rows of `length`
 * samples, unnormalized (scaled by `length` like FFTW).
 */
std::vector<float> c2r(std::span<const ComplexFloat> input, std::size_t length, std::size_t count = 1);

} // namespace Xcorr::Fft
