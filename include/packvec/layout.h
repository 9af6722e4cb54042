#pragma once

/// @file layout.h
/// @brief Field table of the GL_UNSIGNED_INT_2_10_10_10_REV word.

#include <array>
#include <cstddef>
#include <string>

#include "packvec/defines.h"

namespace packvec {

struct FieldSpec {
    const char *name; ///< Logical component name
    size_t offset;    ///< Bit offset, 0 = least significant
    size_t bits;      ///< Field width
};

/// @brief Fields in logical order x, y, z, w.
constexpr std::array<FieldSpec, 4> kFieldLayout = {{
    {"x", kXOffset, kXyzBits},
    {"y", kYOffset, kXyzBits},
    {"z", kZOffset, kXyzBits},
    {"w", kWOffset, kWBits},
}};

/// @brief True when the fields are contiguous, ascending and cover the word exactly.
constexpr bool layout_tiles_word() {
    size_t next = 0;
    for (const auto &f : kFieldLayout) {
        if (f.offset != next || f.bits == 0) {
            return false;
        }
        next = f.offset + f.bits;
    }
    return next == kWordBits;
}

static_assert(layout_tiles_word(), "field layout has a gap or overlap");

/// @brief Render the field table, most significant field first, e.g.
///        "w[31:30] z[29:20] y[19:10] x[9:0]".
std::string layout_to_string();

} // namespace packvec
