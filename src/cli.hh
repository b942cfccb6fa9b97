#pragma once

#include "array.hh"

#include <cstddef>
#include <istream>
#include <string>
#include <string_view>
#include <vector>

namespace Xcorr::Cli {

/**
 * @brief Parses a `--max-delay` value: a positive decimal integer and nothing else.
 * @throws ConfigError for signs, trailing characters, zero or out-of-range values.
 */
std::size_t parseMaxDelay(std::string_view text);

/**
 * @brief Reads whitespace separated samples, one signal per non-empty line.
 *
 * A single line gives an array of shape `[N]`, several lines give `[lines, N]`.
 * `name` only labels error messages.
 *
 * @throws Error for unreadable samples or an empty input, ShapeError for ragged lines.
 */
RealArray readSamples(std::istream &input, std::string_view name);

/// Same as above on the file at `path`.
RealArray readSamples(const std::string &path);

/// One line per row of `correlation`, made of space separated `lag:value` pairs.
std::vector<std::string> formatCorrelation(const RealArray &correlation);

} // namespace Xcorr::Cli
