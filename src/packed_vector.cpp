/// @file packed_vector.cpp
/// @brief Encoding, decoding and field replacement for the 2_10_10_10_REV word.

#include "packvec/packed_vector.h"

#include <fmt/format.h>

namespace packvec {

// ============================================================================
// encode / decode
// ============================================================================

PackedWord encode(float x, float y, float z, float w) {
    PackedWord word = 0;
    word |= WField::quantize(w) << kWOffset;
    word |= XyzField::quantize(z) << kZOffset;
    word |= XyzField::quantize(y) << kYOffset;
    word |= XyzField::quantize(x) << kXOffset;
    return word;
}

Vec4f decode(PackedWord word) {
    Vec4f v;
    v << XyzField::dequantize(XyzField::extract(word, kXOffset)),
        XyzField::dequantize(XyzField::extract(word, kYOffset)),
        XyzField::dequantize(XyzField::extract(word, kZOffset)),
        WField::dequantize(WField::extract(word, kWOffset));
    return v;
}

// ============================================================================
// PackedVector
// ============================================================================

PackedVector PackedVector::load_le(const uint8_t *src) {
    DCHECK(src != nullptr);
    PackedWord word = static_cast<PackedWord>(src[0]) |
                      static_cast<PackedWord>(src[1]) << 8 |
                      static_cast<PackedWord>(src[2]) << 16 |
                      static_cast<PackedWord>(src[3]) << 24;
    return from_raw(word);
}

void PackedVector::store_le(uint8_t *dst) const {
    DCHECK(dst != nullptr);
    dst[0] = static_cast<uint8_t>(data_ & 0xFF);
    dst[1] = static_cast<uint8_t>((data_ >> 8) & 0xFF);
    dst[2] = static_cast<uint8_t>((data_ >> 16) & 0xFF);
    dst[3] = static_cast<uint8_t>((data_ >> 24) & 0xFF);
}

PackedVector PackedVector::with_x(float x) const {
    return from_raw(XyzField::insert(data_, XyzField::quantize(x), kXOffset));
}

PackedVector PackedVector::with_y(float y) const {
    return from_raw(XyzField::insert(data_, XyzField::quantize(y), kYOffset));
}

PackedVector PackedVector::with_z(float z) const {
    return from_raw(XyzField::insert(data_, XyzField::quantize(z), kZOffset));
}

PackedVector PackedVector::with_w(float w) const {
    return from_raw(WField::insert(data_, WField::quantize(w), kWOffset));
}

PackedVector PackedVector::with_xyz(float x, float y, float z) const {
    PackedWord word = data_ & WField::mask(kWOffset);
    word |= XyzField::quantize(z) << kZOffset;
    word |= XyzField::quantize(y) << kYOffset;
    word |= XyzField::quantize(x) << kXOffset;
    return from_raw(word);
}

std::string PackedVector::to_string() const {
    return fmt::format("{{{}, {}, {}, {}}}", x(), y(), z(), w());
}

std::ostream &operator<<(std::ostream &os, const PackedVector &v) {
    return os << v.to_string();
}

} // namespace packvec
