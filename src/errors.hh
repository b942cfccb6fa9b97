#pragma once

#include <stdexcept>
#include <string>

namespace Xcorr {

class Error : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

/// Malformed or incompatible array shapes, or an unknown sample count.
class ShapeError : public Error
{
  public:
    using Error::Error;
};

/// Unrecognized weighting or scale, or an unreachable length configuration.
class ConfigError : public Error
{
  public:
    using Error::Error;
};

/// The transform backend produced non-finite values.
class NumericalError : public Error
{
  public:
    using Error::Error;
};

} // namespace Xcorr
