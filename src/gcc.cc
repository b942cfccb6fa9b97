#include "gcc.hh"

#include "fft.hh"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <bit>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <numeric>

namespace Xcorr
{

namespace
{

Shape withLength(Shape shape, std::size_t length)
{
    shape.back() = length;
    return shape;
}

// Rows of the broadcast result, assuming a validated pair.
std::size_t broadcastRows(const RealArray &x0, const RealArray &x1)
{
    return std::max(x0.rows(), x1.rows());
}

Shape broadcastShape(const RealArray &x0, const RealArray &x1, std::size_t length)
{
    if(x0.rank() == 1 && x1.rank() == 1) { return {length}; }
    return {broadcastRows(x0, x1), length};
}

RealArray pipeline(
    const RealArray &x0, const RealArray &x1, std::size_t numSamples, std::size_t nfft,
    std::size_t ncorr, Weighting weighting, Scale scale
)
{
    auto spectrum    = applyWeighting(crossSpectrum(removeDc(x0), removeDc(x1), nfft), weighting);
    auto correlation = shiftLags(inverseTransform(spectrum, nfft), nfft, ncorr);
    return applyScale(std::move(correlation), numSamples, scale);
}

} // namespace

int nextPowerOfTwo(std::size_t n)
{
    if(n <= 1) { return 0; }
    return static_cast<int>(std::bit_width(n - 1));
}

std::size_t fftLength(std::size_t numSamples)
{
    if(numSamples == 0) { throw ShapeError("the sample count must be statically defined"); }
    if(numSamples > maxSamples) {
        throw ShapeError(fmt::format("{} samples exceed the supported maximum of {}", numSamples, maxSamples));
    }
    return std::size_t{1} << nextPowerOfTwo(2 * numSamples - 1);
}

std::size_t correlationLength(std::size_t numSamples, std::optional<std::size_t> maxDelay)
{
    if(numSamples == 0) { throw ShapeError("the sample count must be statically defined"); }
    if(numSamples > maxSamples) {
        throw ShapeError(fmt::format("{} samples exceed the supported maximum of {}", numSamples, maxSamples));
    }
    const auto m = 2 * numSamples - 1;
    if(!maxDelay) { return m; }
    if(*maxDelay == 0) { throw ConfigError("max delay must be positive"); }
    return std::min(m, *maxDelay);
}

std::vector<std::ptrdiff_t> lags(std::size_t ncorr)
{
    std::vector<std::ptrdiff_t> values(ncorr);
    std::iota(values.begin(), values.end(), -static_cast<std::ptrdiff_t>((ncorr - 1) / 2));
    return values;
}

std::size_t validatePair(const RealArray &x0, const RealArray &x1)
{
    for(const auto *x : {&x0, &x1}) {
        if(x->rank() != 1 && x->rank() != 2) {
            throw ShapeError(fmt::format("waveforms must be of rank 1 or 2, got rank {}", x->rank()));
        }
        if(x->length() == 0) {
            throw ShapeError("the inner most dimension of x0 and x1 must be statically defined");
        }
        if(x->rows() == 0) { throw ShapeError("waveforms must hold at least one row"); }
    }
    if(x0.length() != x1.length()) {
        throw ShapeError(fmt::format(
            "x0 and x1 must have the same number of samples, got {} and {}", x0.length(),
            x1.length()
        ));
    }
    if(x0.rows() != x1.rows() && x0.rows() != 1 && x1.rows() != 1) {
        throw ShapeError(fmt::format(
            "batch sizes {} and {} cannot be broadcast", x0.rows(), x1.rows()
        ));
    }
    return x0.length();
}

RealArray removeDc(const RealArray &x)
{
    auto centered = x;
    for(std::size_t row = 0; row < centered.rows(); ++row) {
        auto samples    = centered.row(row);
        const auto mean = std::accumulate(samples.begin(), samples.end(), 0.0)
                          / static_cast<double>(samples.size());
        std::transform(samples.begin(), samples.end(), samples.begin(), [mean](float sample) {
            return static_cast<float>(sample - mean);
        });
    }
    return centered;
}

ComplexArray crossSpectrum(const RealArray &x0, const RealArray &x1, std::size_t nfft)
{
    const auto bins = nfft / 2 + 1;
    const auto x0Dft = Fft::r2c(x0.data(), nfft, x0.rows()); // Reference signal spectrum
    const auto x1Dft = Fft::r2c(x1.data(), nfft, x1.rows()); // Delayed replica spectrum

    auto spectrum = ComplexArray::zeros(broadcastShape(x0, x1, bins));
    for(std::size_t row = 0; row < spectrum.rows(); ++row) {
        const auto a = std::next(x0Dft.begin(), static_cast<std::ptrdiff_t>((x0.rows() == 1 ? 0 : row) * bins));
        const auto b = std::next(x1Dft.begin(), static_cast<std::ptrdiff_t>((x1.rows() == 1 ? 0 : row) * bins));
        auto out     = spectrum.row(row);
        std::transform(a, std::next(a, static_cast<std::ptrdiff_t>(bins)), b, out.begin(),
                       [](const Fft::ComplexFloat &lhs, const Fft::ComplexFloat &rhs) { return std::conj(lhs) * rhs; });
    }
    return spectrum;
}

ComplexArray applyWeighting(ComplexArray crossSpectrum, Weighting weighting)
{
    switch(weighting) {
    case Weighting::None: return crossSpectrum;
    case Weighting::Phat: {
        auto bins = crossSpectrum.data();
        std::transform(bins.begin(), bins.end(), bins.begin(), [](const Fft::ComplexFloat &value) {
            return std::polar(1.F, std::arg(value));
        });
        return crossSpectrum;
    }
    }
    throw ConfigError("unhandled weighting");
}

RealArray inverseTransform(const ComplexArray &crossSpectrum, std::size_t nfft)
{
    if(crossSpectrum.length() != nfft / 2 + 1) {
        throw ShapeError(fmt::format(
            "a {} point inverse transform needs {} bins, got {}", nfft, nfft / 2 + 1,
            crossSpectrum.length()
        ));
    }

    auto samples = Fft::c2r(crossSpectrum.data(), nfft, crossSpectrum.rows());
    const auto norm = 1.F / static_cast<float>(nfft);
    std::transform(samples.begin(), samples.end(), samples.begin(), [norm](float value) {
        return value * norm;
    });

    if(!std::all_of(samples.begin(), samples.end(), [](float value) { return std::isfinite(value); })) {
        throw NumericalError(
            "inverse transform gives NaN or Inf. Hint: ensure transform length is a power of two "
            "or reduce requested length"
        );
    }
    return RealArray{withLength(crossSpectrum.shape(), nfft), std::move(samples)};
}

RealArray shiftLags(const RealArray &circular, std::size_t nfft, std::size_t ncorr)
{
    if(nfft <= ncorr) {
        throw ConfigError(fmt::format("transform length {} must exceed correlation length {}", nfft, ncorr));
    }
    if(circular.length() != nfft) {
        throw ShapeError(fmt::format("expected rows of {} samples, got {}", nfft, circular.length()));
    }

    const auto negative = (ncorr - 1) / 2;
    auto shifted        = RealArray::zeros(withLength(circular.shape(), ncorr));
    for(std::size_t row = 0; row < circular.rows(); ++row) {
        const auto in  = circular.row(row);
        const auto out = shifted.row(row);
        // Negative lags first, then lag 0 and positive lags
        const auto tail = std::copy(in.end() - static_cast<std::ptrdiff_t>(negative), in.end(), out.begin());
        std::copy_n(in.begin(), ncorr - negative, tail);
    }
    return shifted;
}

std::vector<float> unbiasedDenominator(std::size_t numSamples, std::size_t ncorr)
{
    if(ncorr == 0) { return {}; }

    const auto half = static_cast<int64_t>((ncorr - 1) / 2);
    std::vector<float> denominator;
    denominator.reserve(ncorr);
    for(auto lag = -half; lag <= half; ++lag) {
        const auto overlap = static_cast<int64_t>(numSamples) - std::abs(lag);
        denominator.push_back(static_cast<float>(std::max<int64_t>(overlap, 1)));
    }
    // Even lengths carry one more positive lag than negative ones
    const auto edge = denominator.back();
    denominator.resize(ncorr, edge);
    return denominator;
}

RealArray applyScale(RealArray correlation, std::size_t numSamples, Scale scale)
{
    switch(scale) {
    case Scale::None: return correlation;
    case Scale::Biased: {
        const auto m = static_cast<float>(numSamples);
        auto values  = correlation.data();
        std::transform(values.begin(), values.end(), values.begin(), [m](float value) { return value / m; });
        return correlation;
    }
    case Scale::Unbiased: {
        const auto denominator = unbiasedDenominator(numSamples, correlation.length());
        for(std::size_t row = 0; row < correlation.rows(); ++row) {
            auto values = correlation.row(row);
            std::transform(values.begin(), values.end(), denominator.begin(), values.begin(), std::divides<>{});
        }
        return correlation;
    }
    }
    throw ConfigError("unhandled scale");
}

Estimator::Estimator(std::size_t numSamples, Options options)
    : numSamples_{numSamples}, options_{options}, nfft_{Xcorr::fftLength(numSamples)},
      ncorr_{Xcorr::correlationLength(numSamples, options.maxDelay)}
{
    if(nfft_ <= ncorr_) {
        throw ConfigError(fmt::format(
            "{} samples give a {} point transform, too short for {} lags", numSamples_, nfft_, ncorr_
        ));
    }
    spdlog::debug(
        "gcc: {} samples, nfft {}, ncorr {}, weighting {}, scale {}", numSamples_, nfft_, ncorr_,
        toString(options_.weighting), toString(options_.scale)
    );
}

RealArray Estimator::operator()(const RealArray &x0, const RealArray &x1) const
{
    const auto numSamples = validatePair(x0, x1);
    if(numSamples != numSamples_) {
        throw ShapeError(fmt::format(
            "estimator configured for {} samples, got {}", numSamples_, numSamples
        ));
    }
    return pipeline(x0, x1, numSamples_, nfft_, ncorr_, options_.weighting, options_.scale);
}

RealArray gcc(
    const RealArray &x0, const RealArray &x1, std::optional<std::size_t> maxDelay,
    Weighting weighting, Scale scale
)
{
    const auto numSamples = validatePair(x0, x1);
    return Estimator{numSamples, {maxDelay, weighting, scale}}(x0, x1);
}

RealArray gccStacked(
    const RealArray &waveforms, std::optional<std::size_t> maxDelay, Weighting weighting,
    Scale scale
)
{
    const auto &shape = waveforms.shape();
    if(shape.size() != 2 && shape.size() != 3) {
        throw ShapeError(fmt::format(
            "stacked waveforms must be of rank 2 or 3, got rank {}", shape.size()
        ));
    }
    const auto channels   = shape[shape.size() - 2];
    const auto numSamples = shape.back();
    if(channels < 2) {
        throw ShapeError(fmt::format("stacked waveforms need 2 channels, got {}", channels));
    }

    // Slice channels
    const auto batch = shape.size() == 3 ? shape.front() : 1;
    std::vector<float> x0, x1;
    x0.reserve(batch * numSamples);
    x1.reserve(batch * numSamples);
    for(std::size_t b = 0; b < batch; ++b) {
        const auto reference = waveforms.row(b * channels);
        const auto replica   = waveforms.row(b * channels + 1);
        x0.insert(x0.end(), reference.begin(), reference.end());
        x1.insert(x1.end(), replica.begin(), replica.end());
    }

    Shape pairShape = shape.size() == 3 ? Shape{batch, numSamples} : Shape{numSamples};
    return gcc(RealArray{pairShape, std::move(x0)}, RealArray{pairShape, std::move(x1)}, maxDelay,
               weighting, scale);
}

} // namespace Xcorr
