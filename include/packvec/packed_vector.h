#pragma once

/// @file packed_vector.h
/// @brief Four normalized components packed into one 32-bit word.
///
/// The word is bit-compatible with the OpenGL vertex attribute type
/// GL_UNSIGNED_INT_2_10_10_10_REV:
///
///   31 30 29        20 19        10 9          0
///   [ w ][     z     ][     y     ][     x     ]
///
/// x, y and z take 10 bits each, w takes 2 bits and can only be 0, 1/3,
/// 2/3 or 1. Inputs are clamped to [0, 1] before quantization, so
/// encoding never fails; every 32-bit word is a valid encoding.

#include <cstdint>
#include <ostream>
#include <string>
#include <type_traits>

#include <fmt/format.h>

#include "packvec/defines.h"
#include "packvec/quantize.h"

namespace packvec {

// ============================================================================
// encode / decode
// ============================================================================

/// @brief Quantize four components into one word.
PackedWord encode(float x, float y, float z, float w);

inline PackedWord encode(const Vec4f &v) { return encode(v(0), v(1), v(2), v(3)); }

/// @brief Reconstruct (x, y, z, w) from a word. Accepts any bit pattern.
Vec4f decode(PackedWord word);

// ============================================================================
// PackedVector
// ============================================================================

/// @brief Immutable 4-byte value holding one packed word.
///
/// Accessors decode on demand. The with_* functions return a new vector in
/// which only the named fields are re-encoded; the bits of all other fields
/// are carried over unchanged.
class PackedVector {
  public:
    PackedVector() = default;

    PackedVector(float x, float y, float z, float w)
        : data_(encode(x, y, z, w)) {}

    explicit PackedVector(const Vec4f &v)
        : data_(encode(v)) {}

    /// @brief Wrap a word produced elsewhere, e.g. read back from a vertex buffer.
    static PackedVector from_raw(PackedWord data) {
        PackedVector v;
        v.data_ = data;
        return v;
    }

    /// @brief Read 4 little-endian bytes.
    static PackedVector load_le(const uint8_t *src);

    float x() const { return XyzField::dequantize(XyzField::extract(data_, kXOffset)); }
    float y() const { return XyzField::dequantize(XyzField::extract(data_, kYOffset)); }
    float z() const { return XyzField::dequantize(XyzField::extract(data_, kZOffset)); }
    float w() const { return WField::dequantize(WField::extract(data_, kWOffset)); }

    Vec4f xyzw() const { return decode(data_); }

    /// @brief Host-order word, ready to be copied into a vertex attribute buffer.
    PackedWord raw() const { return data_; }

    PackedVector with_x(float x) const;
    PackedVector with_y(float y) const;
    PackedVector with_z(float z) const;
    PackedVector with_w(float w) const;
    PackedVector with_xyz(float x, float y, float z) const;

    /// @brief Write the word as 4 little-endian bytes, regardless of host order.
    void store_le(uint8_t *dst) const;

    /// @brief "{x, y, z, w}" with the decoded values.
    std::string to_string() const;

    bool operator==(const PackedVector &other) const { return data_ == other.data_; }
    bool operator!=(const PackedVector &other) const { return !(*this == other); }

  private:
    PackedWord data_ = 0;
};

static_assert(sizeof(PackedVector) == sizeof(PackedWord), "PackedVector must stay 4 bytes");
static_assert(std::is_trivially_copyable_v<PackedVector>, "PackedVector must be memcpy-able");

std::ostream &operator<<(std::ostream &os, const PackedVector &v);

} // namespace packvec

namespace fmt {

template <>
struct formatter<packvec::PackedVector> : formatter<string_view> {
    template <typename FormatContext>
    auto format(const packvec::PackedVector &v, FormatContext &ctx) const {
        return formatter<string_view>::format(v.to_string(), ctx);
    }
};

} // namespace fmt
