#pragma once

#include <tl/expected.hpp>

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace starship {

// ─────────────────────────────────────────────────────────────────────────────
// DType
// ─────────────────────────────────────────────────────────────────────────────
// Element type of the payload an NdArray was decoded from. Values are stored
// as double regardless; 64-bit integers above 2^53 lose precision.

enum class DType {
    Bool,
    Int8,
    Int16,
    Int32,
    Int64,
    UInt8,
    UInt16,
    UInt32,
    UInt64,
    Float32,
    Float64
};

[[nodiscard]] std::string_view to_string(DType dtype) noexcept;

[[nodiscard]] std::size_t item_size(DType dtype) noexcept;

[[nodiscard]] bool is_integral(DType dtype) noexcept;

// ─────────────────────────────────────────────────────────────────────────────
// NdArray
// ─────────────────────────────────────────────────────────────────────────────
// Dense row-major numeric array. An empty shape denotes a 0-d scalar holding
// exactly one value.

class NdArray {
public:
    NdArray() = default;

    /// Throws std::invalid_argument if values.size() != product(shape).
    NdArray(std::vector<std::size_t> shape, std::vector<double> values,
            DType dtype = DType::Int64);

    /// 2-D array from nested rows; all rows must have equal length.
    [[nodiscard]] static NdArray from_rows(
        std::initializer_list<std::initializer_list<double>> rows,
        DType dtype = DType::Int64);

    [[nodiscard]] const std::vector<std::size_t>& shape() const noexcept { return shape_; }
    [[nodiscard]] const std::vector<double>& values() const noexcept { return values_; }
    [[nodiscard]] DType dtype() const noexcept { return dtype_; }

    [[nodiscard]] std::size_t ndim() const noexcept { return shape_.size(); }
    [[nodiscard]] std::size_t size() const noexcept { return values_.size(); }
    [[nodiscard]] bool empty() const noexcept { return values_.empty(); }

    /// Flat (row-major) access. Throws std::out_of_range.
    [[nodiscard]] double at(std::size_t flat_index) const;

    /// Multi-index access. Throws std::out_of_range on rank or bound mismatch.
    [[nodiscard]] double at(std::initializer_list<std::size_t> index) const;

    /// Row i of a 2-D array. Throws std::logic_error if ndim() != 2.
    [[nodiscard]] std::span<const double> row(std::size_t i) const;

    [[nodiscard]] std::size_t rows() const;

    /// NumPy-style text rendering, e.g. "[[0 1 0 2]]" or "[0.5 1.25]".
    [[nodiscard]] std::string to_string() const;

    /// Structural equality: shape and values. dtype is provenance only.
    friend bool operator==(const NdArray& lhs, const NdArray& rhs) {
        return lhs.shape_ == rhs.shape_ && lhs.values_ == rhs.values_;
    }

private:
    std::vector<std::size_t> shape_;
    std::vector<double> values_;
    DType dtype_{DType::Int64};
};

// ─────────────────────────────────────────────────────────────────────────────
// NPY Codec
// ─────────────────────────────────────────────────────────────────────────────
// NumPy .npy format (numpy.lib.format), versions 1.0, 2.0 and 3.0:
//   "\x93NUMPY" major minor
//   header length (uint16 LE for v1, uint32 LE for v2/v3)
//   header: Python dict literal {'descr': ..., 'fortran_order': ..., 'shape': (...)}
//   raw data

struct NpyError {
    enum class Code {
        BadMagic,
        UnsupportedVersion,
        Truncated,
        MalformedHeader,
        UnsupportedDType,
        SizeMismatch
    };

    Code code;
    std::string message;
};

[[nodiscard]] tl::expected<NdArray, NpyError> decode_npy(std::string_view bytes);

/// Encode as format 1.0, little-endian, C order, using the array's dtype.
[[nodiscard]] std::string encode_npy(const NdArray& array);

}  // namespace starship
