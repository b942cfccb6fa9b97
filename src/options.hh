#pragma once

#include <cstddef>
#include <optional>
#include <string_view>

namespace Xcorr {

/// Frequency-domain filtering applied to the cross-spectrum.
enum class Weighting { None, Phat };

/// Correlation scaling convention.
enum class Scale { None, Biased, Unbiased };

struct Options {
    std::optional<std::size_t> maxDelay; ///< Caps the output length, full length if empty
    Weighting weighting = Weighting::None;
    Scale scale         = Scale::None;
};

/**
 * @brief Parses a weighting name: "PHAT", or an empty string / "none" for no weighting.
 * @throws ConfigError for any other value.
 */
Weighting parseWeighting(std::string_view name);

/**
 * @brief Parses a scale name: "biased", "unbiased", or an empty string / "none".
 * @throws ConfigError for any other value.
 */
Scale parseScale(std::string_view name);

std::string_view toString(Weighting weighting);
std::string_view toString(Scale scale);

} // namespace Xcorr
