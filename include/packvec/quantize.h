#pragma once

/// @file quantize.h
/// @brief Unsigned-normalized quantization of a single bit field.
///
/// A component in [0, 1] maps to the integer code round(v * (2^B - 1)) and
/// back to code / (2^B - 1). Ties round away from zero, so after clamping
/// every tie rounds up: 0.5 -> 1, 1.5 -> 2, 2.5 -> 3. Each code decodes to
/// a float that quantizes back to the same code.

#include <cmath>
#include <cstddef>
#include <cstdint>

#include <glog/logging.h>

#include "packvec/defines.h"

namespace packvec {

/// @brief Clamp to [0, 1]. NaN maps to 0.
inline float clamp_unit(float v) {
    if (!(v > 0.0f)) {
        return 0.0f;
    }
    if (v > 1.0f) {
        return 1.0f;
    }
    return v;
}

static_assert(kRoundingMode == RoundingMode::kHalfAwayFromZero,
              "quantize() rounds with std::round");

inline float round_half_away(float v) { return std::round(v); }

template <size_t kBits>
struct UnormField {
    static_assert(kBits > 0 && kBits < kWordBits, "field must fit inside the word");

    static constexpr uint32_t kMaxCode = (1u << kBits) - 1;
    static constexpr float kScale = static_cast<float>(kMaxCode);

    static uint32_t quantize(float v) {
        auto code = static_cast<uint32_t>(round_half_away(clamp_unit(v) * kScale));
        DCHECK_LE(code, kMaxCode);
        return code;
    }

    /// @brief Bits above kBits are ignored.
    static float dequantize(uint32_t code) {
        return static_cast<float>(code & kMaxCode) / kScale;
    }

    static constexpr uint32_t mask(size_t offset) { return kMaxCode << offset; }

    static uint32_t extract(PackedWord word, size_t offset) {
        DCHECK_LE(offset + kBits, kWordBits);
        return (word >> offset) & kMaxCode;
    }

    /// @brief Replace the field at offset, keeping every other bit of word.
    static PackedWord insert(PackedWord word, uint32_t code, size_t offset) {
        DCHECK_LE(offset + kBits, kWordBits);
        DCHECK_LE(code, kMaxCode);
        return (word & ~mask(offset)) | ((code & kMaxCode) << offset);
    }
};

using XyzField = UnormField<kXyzBits>;
using WField = UnormField<kWBits>;

} // namespace packvec
