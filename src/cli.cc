#include "cli.hh"

#include "errors.hh"
#include "gcc.hh"

#include <spdlog/fmt/fmt.h>

#include <charconv>
#include <fstream>
#include <sstream>
#include <system_error>

namespace Xcorr::Cli
{

std::size_t parseMaxDelay(std::string_view text)
{
    std::size_t value = 0;
    const auto *end   = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if(ec == std::errc::result_out_of_range) {
        throw ConfigError(fmt::format("max delay {} is out of range", text));
    }
    if(ec != std::errc{} || ptr != end) {
        throw ConfigError(fmt::format("max delay must be a positive integer, got '{}'", text));
    }
    if(value == 0) { throw ConfigError("max delay must be positive"); }
    return value;
}

RealArray readSamples(std::istream &input, std::string_view name)
{
    std::vector<std::vector<float>> signals;
    std::string line;
    while(std::getline(input, line)) {
        std::istringstream stream{line};
        std::vector<float> samples;
        float value = 0;
        while(stream >> value) { samples.push_back(value); }
        if(!stream.eof()) { throw Error(fmt::format("{}: invalid sample in '{}'", name, line)); }
        if(!samples.empty()) { signals.push_back(std::move(samples)); }
    }
    if(signals.empty()) { throw Error(fmt::format("{} holds no samples", name)); }

    if(signals.size() == 1) { return RealArray{std::move(signals.front())}; }

    const auto numSamples = signals.front().size();
    std::vector<float> data;
    data.reserve(signals.size() * numSamples);
    for(const auto &samples : signals) {
        if(samples.size() != numSamples) {
            throw ShapeError(fmt::format(
                "{}: every line must hold {} samples, got {}", name, numSamples, samples.size()
            ));
        }
        data.insert(data.end(), samples.begin(), samples.end());
    }
    return RealArray{{signals.size(), numSamples}, std::move(data)};
}

RealArray readSamples(const std::string &path)
{
    std::ifstream file{path};
    if(!file) { throw Error(fmt::format("cannot open {}", path)); }
    return readSamples(file, path);
}

std::vector<std::string> formatCorrelation(const RealArray &correlation)
{
    const auto lag = lags(correlation.length());
    std::vector<std::string> lines;
    lines.reserve(correlation.rows());
    for(std::size_t row = 0; row < correlation.rows(); ++row) {
        const auto values = correlation.row(row);
        std::string line;
        for(std::size_t i = 0; i < values.size(); ++i) {
            line += fmt::format("{}{}:{}", i == 0 ? "" : " ", lag[i], values[i]);
        }
        lines.push_back(std::move(line));
    }
    return lines;
}

} // namespace Xcorr::Cli
