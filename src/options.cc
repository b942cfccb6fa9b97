#include "options.hh"

#include "errors.hh"

#include <spdlog/fmt/fmt.h>

namespace Xcorr
{

Weighting parseWeighting(std::string_view name)
{
    if(name.empty() || name == "none") { return Weighting::None; }
    if(name == "PHAT") { return Weighting::Phat; }
    throw ConfigError(fmt::format("weighting {} not supported", name));
}

Scale parseScale(std::string_view name)
{
    if(name.empty() || name == "none") { return Scale::None; }
    if(name == "biased") { return Scale::Biased; }
    if(name == "unbiased") { return Scale::Unbiased; }
    throw ConfigError(fmt::format("scale {} not supported", name));
}

std::string_view toString(Weighting weighting)
{
    switch(weighting) {
    case Weighting::None: return "none";
    case Weighting::Phat: return "PHAT";
    }
    throw ConfigError("unhandled weighting");
}

std::string_view toString(Scale scale)
{
    switch(scale) {
    case Scale::None: return "none";
    case Scale::Biased: return "biased";
    case Scale::Unbiased: return "unbiased";
    }
    throw ConfigError("unhandled scale");
}

} // namespace Xcorr
