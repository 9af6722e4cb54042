#pragma once

#include <stdint.h>

#include <cstddef>

#include <Eigen/Core>

namespace packvec {

// Field widths of the 2_10_10_10_REV layout.
constexpr size_t kXyzBits = 10;
constexpr size_t kWBits = 2;

// Bit offsets, least significant first.
constexpr size_t kXOffset = 0;
constexpr size_t kYOffset = kXOffset + kXyzBits;
constexpr size_t kZOffset = kYOffset + kXyzBits;
constexpr size_t kWOffset = kZOffset + kXyzBits;

constexpr size_t kWordBits = 32;

static_assert(kWOffset + kWBits == kWordBits, "fields must tile the 32-bit word");

using PackedWord = uint32_t;

enum class RoundingMode {
    kHalfAwayFromZero, // std::round; ties go up once inputs are clamped to [0, 1]
};

/// Rounding applied when a scaled component becomes its integer code.
constexpr RoundingMode kRoundingMode = RoundingMode::kHalfAwayFromZero;

/// Decoded (x, y, z, w) in [0, 1].
using Vec4f = Eigen::Matrix<float, 1, 4>;

} // namespace packvec
