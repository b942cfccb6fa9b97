#include "fft.hh"

#include "errors.hh"

#include <fftw3.h>
#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <iterator>
#include <limits>
#include <mutex>

namespace Xcorr::Fft
{

namespace
{

// The FFTW planner is not re-entrant.
std::mutex plannerMutex;

void destroyPlan(fftwf_plan plan)
{
    const std::lock_guard lock{plannerMutex};
    fftwf_destroy_plan(plan);
}

// FFTW takes sizes and batch counts as int.
void checkPlanSize(std::size_t length, std::size_t count)
{
    constexpr auto limit = static_cast<std::size_t>(std::numeric_limits<int>::max());
    if(length > limit || count > limit) {
        throw ShapeError(fmt::format(
            "a {} point transform over {} rows exceeds the FFTW size limit {}", length, count, limit
        ));
    }
}

} // namespace

std::vector<ComplexFloat> r2c(std::span<const float> input, std::size_t length, std::size_t count)
{
    checkPlanSize(length, count);
    if(count == 0 || input.size() % count != 0) {
        throw ShapeError(fmt::format("{} samples cannot be split into {} rows", input.size(), count));
    }
    const auto nInput = input.size() / count;
    if(nInput > length) {
        throw ShapeError(fmt::format("rows of {} samples do not fit a {} point transform", nInput, length));
    }
    const auto nOutput = length / 2 + 1;

    std::vector<float> padded(length * count, 0.F);
    for(std::size_t row = 0; row < count; ++row) {
        std::copy_n(std::next(input.begin(), static_cast<std::ptrdiff_t>(row * nInput)), nInput,
                    std::next(padded.begin(), static_cast<std::ptrdiff_t>(row * length)));
    }

    std::vector<ComplexFloat> output(nOutput * count);

    fftwf_plan plan = nullptr;
    {
        const std::lock_guard lock{plannerMutex};
        const int n = static_cast<int>(length);
        plan        = fftwf_plan_many_dft_r2c(
            1, &n, static_cast<int>(count), padded.data(), nullptr, 1, static_cast<int>(length),
            reinterpret_cast<fftwf_complex *>(output.data()), nullptr, 1, static_cast<int>(nOutput),
            FFTW_ESTIMATE
        );
    }
    if(plan == nullptr) {
        throw NumericalError(fmt::format("FFTW could not plan a {} point forward transform", length));
    }
    fftwf_execute(plan);
    destroyPlan(plan);
    return output;
}

std::vector<float> c2r(std::span<const ComplexFloat> input, std::size_t length, std::size_t count)
{
    checkPlanSize(length, count);
    const auto nInput = length / 2 + 1;
    if(count == 0 || input.size() != nInput * count) {
        throw ShapeError(fmt::format(
            "{} bins do not match {} rows of a {} point transform", input.size(), count, length
        ));
    }

    // c2r overwrites its input
    std::vector<ComplexFloat> spectrum(input.begin(), input.end());
    std::vector<float> output(length * count);

    fftwf_plan plan = nullptr;
    {
        const std::lock_guard lock{plannerMutex};
        const int n = static_cast<int>(length);
        plan        = fftwf_plan_many_dft_c2r(
            1, &n, static_cast<int>(count), reinterpret_cast<fftwf_complex *>(spectrum.data()),
            nullptr, 1, static_cast<int>(nInput), output.data(), nullptr, 1, static_cast<int>(length),
            FFTW_ESTIMATE
        );
    }
    if(plan == nullptr) {
        throw NumericalError(fmt::format("FFTW could not plan a {} point inverse transform", length));
    }
    fftwf_execute(plan);
    destroyPlan(plan);
    return output;
}

} // namespace Xcorr::Fft
