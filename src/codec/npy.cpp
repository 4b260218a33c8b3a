#include "starship/codec/npy.hpp"

#include <algorithm>
#include <bit>
#include <cctype>
#include <cmath>
#include <cstring>
#include <format>
#include <limits>
#include <optional>
#include <stdexcept>

namespace starship {

// ─────────────────────────────────────────────────────────────────────────────
// DType
// ─────────────────────────────────────────────────────────────────────────────

std::string_view to_string(DType dtype) noexcept {
    switch (dtype) {
        case DType::Bool:    return "bool";
        case DType::Int8:    return "int8";
        case DType::Int16:   return "int16";
        case DType::Int32:   return "int32";
        case DType::Int64:   return "int64";
        case DType::UInt8:   return "uint8";
        case DType::UInt16:  return "uint16";
        case DType::UInt32:  return "uint32";
        case DType::UInt64:  return "uint64";
        case DType::Float32: return "float32";
        case DType::Float64: return "float64";
    }
    return "unknown";
}

std::size_t item_size(DType dtype) noexcept {
    switch (dtype) {
        case DType::Bool:
        case DType::Int8:
        case DType::UInt8:   return 1;
        case DType::Int16:
        case DType::UInt16:  return 2;
        case DType::Int32:
        case DType::UInt32:
        case DType::Float32: return 4;
        case DType::Int64:
        case DType::UInt64:
        case DType::Float64: return 8;
    }
    return 0;
}

bool is_integral(DType dtype) noexcept {
    return dtype != DType::Float32 && dtype != DType::Float64;
}

// ─────────────────────────────────────────────────────────────────────────────
// NdArray
// ─────────────────────────────────────────────────────────────────────────────

namespace {

constexpr std::size_t kMaxSize = std::numeric_limits<std::size_t>::max();

// Product of the dimensions, or nullopt if it does not fit in size_t
std::optional<std::size_t> element_count(const std::vector<std::size_t>& shape) {
    std::size_t count = 1;
    for (const std::size_t dim : shape) {
        if (dim != 0 && count > kMaxSize / dim) {
            return std::nullopt;
        }
        count *= dim;
    }
    return count;
}

}  // namespace

NdArray::NdArray(std::vector<std::size_t> shape, std::vector<double> values, DType dtype)
    : shape_(std::move(shape))
    , values_(std::move(values))
    , dtype_(dtype)
{
    const auto expected = element_count(shape_);
    if (!expected) {
        throw std::invalid_argument("NdArray: shape has more elements than can be addressed");
    }
    if (values_.size() != *expected) {
        throw std::invalid_argument(std::format(
            "NdArray: {} values do not fill a shape of {} elements", values_.size(), *expected));
    }
}

NdArray NdArray::from_rows(std::initializer_list<std::initializer_list<double>> rows, DType dtype) {
    const std::size_t cols = (rows.size() == 0) ? 0 : rows.begin()->size();
    std::vector<double> values;
    values.reserve(rows.size() * cols);
    for (const auto& r : rows) {
        if (r.size() != cols) {
            throw std::invalid_argument("NdArray::from_rows: rows have different lengths");
        }
        values.insert(values.end(), r.begin(), r.end());
    }
    return NdArray({rows.size(), cols}, std::move(values), dtype);
}

double NdArray::at(std::size_t flat_index) const {
    if (flat_index >= values_.size()) {
        throw std::out_of_range(std::format(
            "NdArray: flat index {} out of range for {} elements", flat_index, values_.size()));
    }
    return values_[flat_index];
}

double NdArray::at(std::initializer_list<std::size_t> index) const {
    if (index.size() != shape_.size()) {
        throw std::out_of_range(std::format(
            "NdArray: {}-d index used on a {}-d array", index.size(), shape_.size()));
    }
    std::size_t flat = 0;
    std::size_t dim = 0;
    for (const std::size_t i : index) {
        if (i >= shape_[dim]) {
            throw std::out_of_range(std::format(
                "NdArray: index {} out of range for axis {} with size {}", i, dim, shape_[dim]));
        }
        flat = flat * shape_[dim] + i;
        ++dim;
    }
    return values_[flat];
}

std::size_t NdArray::rows() const {
    if (shape_.size() != 2) {
        throw std::logic_error("NdArray::rows requires a 2-d array");
    }
    return shape_[0];
}

std::span<const double> NdArray::row(std::size_t i) const {
    if (i >= rows()) {
        throw std::out_of_range(std::format("NdArray: row {} out of range", i));
    }
    const std::size_t cols = shape_[1];
    return std::span<const double>(values_).subspan(i * cols, cols);
}

namespace {

std::string format_element(double value, DType dtype) {
    if (dtype == DType::Bool) {
        return value != 0.0 ? "True" : "False";
    }
    if (is_integral(dtype)) {
        return std::format("{}", static_cast<long long>(value));
    }
    if (std::isfinite(value) && value == std::floor(value) && std::fabs(value) < 1e16) {
        return std::format("{}.", static_cast<long long>(value));
    }
    return std::format("{}", value);
}

void render(const NdArray& array, std::size_t dim, std::size_t& offset, std::string& out) {
    const auto& shape = array.shape();
    if (dim == shape.size()) {
        out += format_element(array.values()[offset++], array.dtype());
        return;
    }
    out += '[';
    for (std::size_t i = 0; i < shape[dim]; ++i) {
        if (i > 0) {
            if (dim + 1 == shape.size()) {
                out += ' ';
            } else {
                out += '\n';
                out.append(dim + 1, ' ');
            }
        }
        render(array, dim + 1, offset, out);
    }
    out += ']';
}

}  // namespace

std::string NdArray::to_string() const {
    std::string out;
    std::size_t offset = 0;
    render(*this, 0, offset, out);
    return out;
}

// ─────────────────────────────────────────────────────────────────────────────
// Decoding
// ─────────────────────────────────────────────────────────────────────────────

namespace {

constexpr std::string_view kMagic = "\x93NUMPY";
constexpr std::size_t kArrayAlign = 64;

tl::unexpected<NpyError> npy_error(NpyError::Code code, std::string message) {
    return tl::unexpected(NpyError{code, std::move(message)});
}

struct Descr {
    DType dtype;
    bool big_endian;
};

std::optional<Descr> parse_descr(std::string_view descr) {
    bool big_endian = (std::endian::native == std::endian::big);
    if (!descr.empty() && (descr[0] == '<' || descr[0] == '>' || descr[0] == '|' || descr[0] == '=')) {
        if (descr[0] == '<') big_endian = false;
        if (descr[0] == '>') big_endian = true;
        descr.remove_prefix(1);
    }
    if (descr.size() < 2) {
        return std::nullopt;
    }

    const char kind = descr[0];
    const std::string_view width = descr.substr(1);
    if (width == "1") {
        if (kind == 'b') return Descr{DType::Bool, big_endian};
        if (kind == 'i') return Descr{DType::Int8, big_endian};
        if (kind == 'u') return Descr{DType::UInt8, big_endian};
    } else if (width == "2") {
        if (kind == 'i') return Descr{DType::Int16, big_endian};
        if (kind == 'u') return Descr{DType::UInt16, big_endian};
    } else if (width == "4") {
        if (kind == 'i') return Descr{DType::Int32, big_endian};
        if (kind == 'u') return Descr{DType::UInt32, big_endian};
        if (kind == 'f') return Descr{DType::Float32, big_endian};
    } else if (width == "8") {
        if (kind == 'i') return Descr{DType::Int64, big_endian};
        if (kind == 'u') return Descr{DType::UInt64, big_endian};
        if (kind == 'f') return Descr{DType::Float64, big_endian};
    }
    return std::nullopt;
}

struct NpyHeader {
    std::string descr;
    bool fortran_order{false};
    std::vector<std::size_t> shape;
};

// Reads the Python dict literal NumPy writes as the header. Only the value
// forms NumPy emits are accepted: quoted strings, True/False, int tuples.
class HeaderReader {
public:
    explicit HeaderReader(std::string_view text) : text_(text) {}

    tl::expected<NpyHeader, NpyError> read() {
        NpyHeader header;
        bool seen_descr = false;
        bool seen_order = false;
        bool seen_shape = false;

        skip_ws();
        if (!consume('{')) {
            return fail("header is not a dict");
        }
        while (true) {
            skip_ws();
            if (consume('}')) {
                break;
            }
            auto key = read_string();
            if (!key) {
                return fail("expected a quoted key");
            }
            skip_ws();
            if (!consume(':')) {
                return fail("expected ':' after key '" + *key + "'");
            }
            skip_ws();

            if (*key == "descr") {
                auto value = read_string();
                if (!value) return fail("'descr' must be a string");
                header.descr = std::move(*value);
                seen_descr = true;
            } else if (*key == "fortran_order") {
                auto value = read_bool();
                if (!value) return fail("'fortran_order' must be True or False");
                header.fortran_order = *value;
                seen_order = true;
            } else if (*key == "shape") {
                auto value = read_tuple();
                if (!value) return fail("'shape' must be a tuple of integers");
                header.shape = std::move(*value);
                seen_shape = true;
            } else {
                return fail("unexpected key '" + *key + "'");
            }

            skip_ws();
            if (consume(',')) {
                continue;
            }
            skip_ws();
            if (consume('}')) {
                break;
            }
            return fail("expected ',' or '}'");
        }

        if (!seen_descr || !seen_order || !seen_shape) {
            return fail("header must define 'descr', 'fortran_order' and 'shape'");
        }
        return header;
    }

private:
    tl::unexpected<NpyError> fail(const std::string& what) const {
        return npy_error(NpyError::Code::MalformedHeader,
                         std::format("malformed .npy header at offset {}: {}", pos_, what));
    }

    void skip_ws() {
        while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_]))) {
            ++pos_;
        }
    }

    bool consume(char c) {
        if (pos_ < text_.size() && text_[pos_] == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    bool consume_word(std::string_view word) {
        if (text_.substr(pos_, word.size()) == word) {
            pos_ += word.size();
            return true;
        }
        return false;
    }

    std::optional<std::string> read_string() {
        if (pos_ >= text_.size() || (text_[pos_] != '\'' && text_[pos_] != '"')) {
            return std::nullopt;
        }
        const char quote = text_[pos_++];
        const auto end = text_.find(quote, pos_);
        if (end == std::string_view::npos) {
            return std::nullopt;
        }
        std::string value(text_.substr(pos_, end - pos_));
        pos_ = end + 1;
        return value;
    }

    std::optional<bool> read_bool() {
        if (consume_word("True")) return true;
        if (consume_word("False")) return false;
        return std::nullopt;
    }

    std::optional<std::vector<std::size_t>> read_tuple() {
        if (!consume('(')) {
            return std::nullopt;
        }
        std::vector<std::size_t> dims;
        while (true) {
            skip_ws();
            if (consume(')')) {
                return dims;
            }
            const std::size_t start = pos_;
            std::size_t value = 0;
            while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) {
                const auto digit = static_cast<std::size_t>(text_[pos_] - '0');
                if (value > (kMaxSize - digit) / 10) {
                    return std::nullopt;
                }
                value = value * 10 + digit;
                ++pos_;
            }
            // NumPy writes Python longs as "3L" in old files
            consume('L');
            if (pos_ == start) {
                return std::nullopt;
            }
            dims.push_back(value);
            skip_ws();
            if (consume(',')) {
                continue;
            }
            skip_ws();
            if (consume(')')) {
                return dims;
            }
            return std::nullopt;
        }
    }

    std::string_view text_;
    std::size_t pos_{0};
};

template <typename T>
double load_as(const unsigned char* src, bool swap) {
    unsigned char buf[sizeof(T)];
    std::memcpy(buf, src, sizeof(T));
    if (swap) {
        std::reverse(buf, buf + sizeof(T));
    }
    T value;
    std::memcpy(&value, buf, sizeof(T));
    return static_cast<double>(value);
}

double load_element(const unsigned char* src, DType dtype, bool swap) {
    switch (dtype) {
        case DType::Bool:    return src[0] != 0 ? 1.0 : 0.0;
        case DType::Int8:    return load_as<std::int8_t>(src, false);
        case DType::UInt8:   return load_as<std::uint8_t>(src, false);
        case DType::Int16:   return load_as<std::int16_t>(src, swap);
        case DType::UInt16:  return load_as<std::uint16_t>(src, swap);
        case DType::Int32:   return load_as<std::int32_t>(src, swap);
        case DType::UInt32:  return load_as<std::uint32_t>(src, swap);
        case DType::Int64:   return load_as<std::int64_t>(src, swap);
        case DType::UInt64:  return load_as<std::uint64_t>(src, swap);
        case DType::Float32: return load_as<float>(src, swap);
        case DType::Float64: return load_as<double>(src, swap);
    }
    return 0.0;
}

std::uint32_t read_le(const unsigned char* src, std::size_t width) {
    std::uint32_t value = 0;
    for (std::size_t i = 0; i < width; ++i) {
        value |= static_cast<std::uint32_t>(src[i]) << (8 * i);
    }
    return value;
}

// Row-major position -> column-major (Fortran) position
std::size_t fortran_offset(std::size_t flat, const std::vector<std::size_t>& shape) {
    std::size_t offset = 0;
    std::size_t stride = 1;
    std::vector<std::size_t> index(shape.size());
    for (std::size_t d = shape.size(); d-- > 0;) {
        index[d] = flat % shape[d];
        flat /= shape[d];
    }
    for (std::size_t d = 0; d < shape.size(); ++d) {
        offset += index[d] * stride;
        stride *= shape[d];
    }
    return offset;
}

}  // namespace

tl::expected<NdArray, NpyError> decode_npy(std::string_view bytes) {
    if (bytes.size() < kMagic.size() + 2 || bytes.substr(0, kMagic.size()) != kMagic) {
        return npy_error(NpyError::Code::BadMagic, "payload is not in .npy format");
    }
    const auto* data = reinterpret_cast<const unsigned char*>(bytes.data());

    const unsigned major = data[6];
    const unsigned minor = data[7];
    std::size_t length_width = 0;
    if (major == 1) {
        length_width = 2;
    } else if (major == 2 || major == 3) {
        length_width = 4;
    } else {
        return npy_error(NpyError::Code::UnsupportedVersion,
                         std::format("unsupported .npy format version {}.{}", major, minor));
    }

    const std::size_t prelude = kMagic.size() + 2 + length_width;
    if (bytes.size() < prelude) {
        return npy_error(NpyError::Code::Truncated, "payload ends inside the .npy preamble");
    }
    const std::size_t header_len = read_le(data + kMagic.size() + 2, length_width);
    if (bytes.size() < prelude + header_len) {
        return npy_error(NpyError::Code::Truncated, std::format(
            "payload ends inside the .npy header ({} of {} bytes)",
            bytes.size() - prelude, header_len));
    }

    auto header = HeaderReader(bytes.substr(prelude, header_len)).read();
    if (!header) {
        return tl::unexpected(header.error());
    }

    const auto descr = parse_descr(header->descr);
    if (!descr) {
        return npy_error(NpyError::Code::UnsupportedDType,
                         "unsupported .npy dtype '" + header->descr + "'");
    }

    const std::size_t width = item_size(descr->dtype);
    const auto count = element_count(header->shape);
    if (!count || *count > kMaxSize / width) {
        return npy_error(NpyError::Code::SizeMismatch,
                         ".npy shape describes more data than can be addressed");
    }
    const std::size_t payload = bytes.size() - prelude - header_len;
    if (payload != *count * width) {
        return npy_error(NpyError::Code::SizeMismatch, std::format(
            ".npy data holds {} bytes, shape and dtype require {}", payload, *count * width));
    }

    const bool swap = descr->big_endian != (std::endian::native == std::endian::big);
    const unsigned char* src = data + prelude + header_len;
    std::vector<double> values(*count);
    for (std::size_t i = 0; i < *count; ++i) {
        const std::size_t from = header->fortran_order ? fortran_offset(i, header->shape) : i;
        values[i] = load_element(src + from * width, descr->dtype, swap);
    }

    return NdArray(std::move(header->shape), std::move(values), descr->dtype);
}

// ─────────────────────────────────────────────────────────────────────────────
// Encoding
// ─────────────────────────────────────────────────────────────────────────────

namespace {

std::string descr_for(DType dtype) {
    switch (dtype) {
        case DType::Bool:    return "|b1";
        case DType::Int8:    return "|i1";
        case DType::UInt8:   return "|u1";
        case DType::Int16:   return "<i2";
        case DType::UInt16:  return "<u2";
        case DType::Int32:   return "<i4";
        case DType::UInt32:  return "<u4";
        case DType::Int64:   return "<i8";
        case DType::UInt64:  return "<u8";
        case DType::Float32: return "<f4";
        case DType::Float64: return "<f8";
    }
    return "<f8";
}

template <typename T>
void store_as(double value, std::string& out) {
    const T typed = static_cast<T>(value);
    unsigned char buf[sizeof(T)];
    std::memcpy(buf, &typed, sizeof(T));
    if constexpr (sizeof(T) > 1) {
        if (std::endian::native == std::endian::big) {
            std::reverse(buf, buf + sizeof(T));
        }
    }
    out.append(reinterpret_cast<const char*>(buf), sizeof(T));
}

void store_element(double value, DType dtype, std::string& out) {
    switch (dtype) {
        case DType::Bool:    out.push_back(value != 0.0 ? '\x01' : '\x00'); return;
        case DType::Int8:    store_as<std::int8_t>(value, out); return;
        case DType::UInt8:   store_as<std::uint8_t>(value, out); return;
        case DType::Int16:   store_as<std::int16_t>(value, out); return;
        case DType::UInt16:  store_as<std::uint16_t>(value, out); return;
        case DType::Int32:   store_as<std::int32_t>(value, out); return;
        case DType::UInt32:  store_as<std::uint32_t>(value, out); return;
        case DType::Int64:   store_as<std::int64_t>(value, out); return;
        case DType::UInt64:  store_as<std::uint64_t>(value, out); return;
        case DType::Float32: store_as<float>(value, out); return;
        case DType::Float64: store_as<double>(value, out); return;
    }
}

}  // namespace

std::string encode_npy(const NdArray& array) {
    std::string shape = "(";
    for (std::size_t i = 0; i < array.shape().size(); ++i) {
        if (i > 0) shape += ", ";
        shape += std::to_string(array.shape()[i]);
    }
    if (array.shape().size() == 1) {
        shape += ',';
    }
    shape += ')';

    std::string header = std::format(
        "{{'descr': '{}', 'fortran_order': False, 'shape': {}, }}",
        descr_for(array.dtype()), shape);

    // Pad with spaces so the data starts on an aligned offset, then '\n'
    const std::size_t prelude = kMagic.size() + 2 + 2;
    const std::size_t unpadded = prelude + header.size() + 1;
    const std::size_t padding = (kArrayAlign - unpadded % kArrayAlign) % kArrayAlign;
    header.append(padding, ' ');
    header.push_back('\n');

    std::string out;
    out.reserve(prelude + header.size() + array.size() * item_size(array.dtype()));
    out.append(kMagic);
    out.push_back('\x01');
    out.push_back('\x00');
    out.push_back(static_cast<char>(header.size() & 0xFF));
    out.push_back(static_cast<char>((header.size() >> 8) & 0xFF));
    out.append(header);
    for (const double value : array.values()) {
        store_element(value, array.dtype(), out);
    }
    return out;
}

}  // namespace starship
