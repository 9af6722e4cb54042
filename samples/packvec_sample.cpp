/// @file packvec_sample.cpp
/// @brief Encode four components into a 2_10_10_10_REV word, or decode one.
///
///   packvec_sample --x=0.444 --y=0.555 --z=0.666 --w=0.2
///   packvec_sample --raw=0x6a98e1c6
///   packvec_sample --print_layout

#include "packvec/layout.h"
#include "packvec/packed_vector.h"

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <string>

#include <fmt/core.h>
#include <gflags/gflags.h>
#include <glog/logging.h>

DEFINE_double(x, 0.0, "x component, clamped to [0, 1]");
DEFINE_double(y, 0.0, "y component, clamped to [0, 1]");
DEFINE_double(z, 0.0, "z component, clamped to [0, 1]");
DEFINE_double(w, 0.0, "w component, clamped to [0, 1], stored in 2 bits");
DEFINE_string(raw, "", "packed word to decode (decimal, or hex with 0x prefix); overrides --x/--y/--z/--w");
DEFINE_bool(print_layout, false, "print the bit layout of the packed word and exit");

using namespace packvec;

namespace {

/// @brief Parse a 32-bit word. Returns false on malformed or out-of-range input.
bool ParseWord(const std::string &text, PackedWord &word) {
    if (text.empty()) {
        return false;
    }
    errno = 0;
    char *end = nullptr;
    unsigned long long value = std::strtoull(text.c_str(), &end, 0);
    if (errno != 0 || end == text.c_str() || *end != '\0' || text[0] == '-') {
        return false;
    }
    if (value > UINT32_MAX) {
        return false;
    }
    word = static_cast<PackedWord>(value);
    return true;
}

void PrintVector(const PackedVector &v) {
    uint8_t bytes[4];
    v.store_le(bytes);
    fmt::print("raw:    0x{:08x}\n", v.raw());
    fmt::print("bytes:  {:02x} {:02x} {:02x} {:02x} (little-endian)\n",
               bytes[0], bytes[1], bytes[2], bytes[3]);
    fmt::print("codes:  x={} y={} z={} w={}\n",
               XyzField::extract(v.raw(), kXOffset), XyzField::extract(v.raw(), kYOffset),
               XyzField::extract(v.raw(), kZOffset), WField::extract(v.raw(), kWOffset));
    fmt::print("values: {}\n", v);
}

} // namespace

int main(int argc, char **argv) {
    gflags::SetUsageMessage("Pack four normalized components into GL_UNSIGNED_INT_2_10_10_10_REV");
    gflags::ParseCommandLineFlags(&argc, &argv, true);
    google::InitGoogleLogging(argv[0]);

    if (FLAGS_print_layout) {
        fmt::print("{}\n", layout_to_string());
        return 0;
    }

    if (!FLAGS_raw.empty()) {
        PackedWord word = 0;
        if (!ParseWord(FLAGS_raw, word)) {
            LOG(ERROR) << "--raw is not a 32-bit unsigned integer: " << FLAGS_raw;
            return 1;
        }
        PrintVector(PackedVector::from_raw(word));
        return 0;
    }

    PackedVector v(static_cast<float>(FLAGS_x), static_cast<float>(FLAGS_y),
                   static_cast<float>(FLAGS_z), static_cast<float>(FLAGS_w));
    LOG(INFO) << fmt::format("encoded ({}, {}, {}, {})", FLAGS_x, FLAGS_y, FLAGS_z, FLAGS_w);
    PrintVector(v);
    return 0;
}
