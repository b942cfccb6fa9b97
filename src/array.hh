#pragma once

#include "errors.hh"

#include <spdlog/fmt/ranges.h>

#include <complex>
#include <cstddef>
#include <functional>
#include <iterator>
#include <numeric>
#include <span>
#include <vector>

namespace Xcorr {

using Shape = std::vector<std::size_t>;

/**
 * Owning row-major array with an explicit shape.
 *
 * The last dimension is the sample (or bin, or lag) axis; every leading dimension is folded
 * into `rows()`.
 */
template<typename T>
class Array
{
  public:
    using value_type = T;

    Array() = default;

    explicit Array(std::vector<T> data) : shape_{data.size()}, data_{std::move(data)} {}

    Array(Shape shape, std::vector<T> data) : shape_{std::move(shape)}, data_{std::move(data)}
    {
        if(elementCount(shape_) != data_.size()) {
            throw ShapeError(fmt::format(
                "shape [{}] holds {} elements but {} were given", fmt::join(shape_, ", "),
                elementCount(shape_), data_.size()
            ));
        }
    }

    static Array zeros(Shape shape)
    {
        const auto count = elementCount(shape);
        return Array{std::move(shape), std::vector<T>(count)};
    }

    [[nodiscard]] std::size_t rank() const { return shape_.size(); }
    [[nodiscard]] const Shape &shape() const { return shape_; }
    [[nodiscard]] std::size_t size() const { return data_.size(); }
    [[nodiscard]] bool empty() const { return data_.empty(); }

    /// Length of the innermost axis, 0 for a rank-0 array.
    [[nodiscard]] std::size_t length() const { return shape_.empty() ? 0 : shape_.back(); }

    /// Number of rows of `length()` elements.
    [[nodiscard]] std::size_t rows() const
    {
        return shape_.empty() ? 0 : elementCount({shape_.begin(), std::prev(shape_.end())});
    }

    [[nodiscard]] std::span<const T> row(std::size_t index) const
    {
        return std::span<const T>{data_}.subspan(index * length(), length());
    }
    [[nodiscard]] std::span<T> row(std::size_t index)
    {
        return std::span<T>{data_}.subspan(index * length(), length());
    }

    [[nodiscard]] std::span<const T> data() const { return data_; }
    [[nodiscard]] std::span<T> data() { return data_; }

    const T &operator[](std::size_t index) const { return data_[index]; }
    T &operator[](std::size_t index) { return data_[index]; }

    [[nodiscard]] const T &at(std::size_t row, std::size_t column) const
    {
        return data_.at(row * length() + column);
    }

  private:
    static std::size_t elementCount(const Shape &shape)
    {
        return std::accumulate(shape.begin(), shape.end(), std::size_t{1}, std::multiplies<>{});
    }

    Shape shape_;
    std::vector<T> data_;
};

using RealArray    = Array<float>;
using ComplexArray = Array<std::complex<float>>;

} // namespace Xcorr
