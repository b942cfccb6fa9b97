#include "cli.hh"
#include "gcc.hh"

#include <spdlog/cfg/env.h>
#include <spdlog/spdlog.h>

#include <cstdio>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace
{

constexpr std::string_view usage =
    "usage: xcorr <x0-file> <x1-file> [--max-delay N] [--weighting PHAT] "
    "[--scale biased|unbiased] [--verbose]";

} // namespace

int main(int argc, char *argv[])
{
    spdlog::cfg::load_env_levels();

    std::vector<std::string> positional;
    Xcorr::Options options;
    try {
        for(int i = 1; i < argc; ++i) {
            const std::string_view arg{argv[i]};
            const auto value = [&]() -> std::string_view {
                if(i + 1 >= argc) { throw std::invalid_argument(fmt::format("{} needs a value", arg)); }
                return argv[++i];
            };

            if(arg == "--max-delay") {
                options.maxDelay = Xcorr::Cli::parseMaxDelay(value());
            } else if(arg == "--weighting") {
                options.weighting = Xcorr::parseWeighting(value());
            } else if(arg == "--scale") {
                options.scale = Xcorr::parseScale(value());
            } else if(arg == "--verbose") {
                spdlog::set_level(spdlog::level::debug);
            } else if(arg.starts_with("--")) {
                throw std::invalid_argument(fmt::format("unknown option {}", arg));
            } else {
                positional.emplace_back(arg);
            }
        }
        if(positional.size() != 2) { throw std::invalid_argument("expected two sample files"); }
    } catch(const std::exception &e) {
        spdlog::error("{}", e.what());
        std::fprintf(stderr, "%s\n", usage.data());
        return 1;
    }

    try {
        const auto x0 = Xcorr::Cli::readSamples(positional[0]);
        const auto x1 = Xcorr::Cli::readSamples(positional[1]);
        spdlog::debug("x0 shape [{}], x1 shape [{}]", fmt::join(x0.shape(), ", "), fmt::join(x1.shape(), ", "));

        const auto numSamples  = Xcorr::validatePair(x0, x1);
        const auto correlation = Xcorr::Estimator{numSamples, options}(x0, x1);
        for(const auto &line : Xcorr::Cli::formatCorrelation(correlation)) { fmt::print("{}\n", line); }
    } catch(const Xcorr::Error &e) {
        spdlog::error("gcc failed: {}", e.what());
        return 1;
    }
    return 0;
}
