/// @file layout.cpp
/// @brief Diagnostic rendering of the packed field table.

#include "packvec/layout.h"

#include <fmt/format.h>

namespace packvec {

std::string layout_to_string() {
    std::string out;
    for (auto it = kFieldLayout.rbegin(); it != kFieldLayout.rend(); ++it) {
        if (!out.empty()) {
            out += ' ';
        }
        out += fmt::format("{}[{}:{}]", it->name, it->offset + it->bits - 1, it->offset);
    }
    return out;
}

} // namespace packvec
