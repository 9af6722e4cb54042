/// @file concurrency_test.cpp
/// @brief Encode/decode from many threads must match the single-threaded results.

#include "packvec/packed_vector.h"

#include <cassert>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <random>
#include <thread>
#include <vector>

namespace {

constexpr size_t kNumThreads = 8;
constexpr size_t kNumInputs = 1 << 16;
constexpr int kRepeats = 4;

struct Inputs {
  std::vector<packvec::Vec4f> vectors;
  std::vector<packvec::PackedWord> words;
};

Inputs GenerateInputs(uint32_t seed) {
  Inputs in;
  std::mt19937 rng(seed);
  // Slightly wider than [0, 1] so the clamping path runs too.
  std::uniform_real_distribution<float> dist(-0.25f, 1.25f);
  in.vectors.resize(kNumInputs);
  in.words.resize(kNumInputs);
  for (size_t i = 0; i < kNumInputs; ++i) {
    in.vectors[i] = packvec::Vec4f(dist(rng), dist(rng), dist(rng), dist(rng));
    in.words[i] = static_cast<packvec::PackedWord>(rng());
  }
  return in;
}

void EncodeAll(const Inputs &in, std::vector<packvec::PackedWord> &encoded) {
  encoded.resize(in.vectors.size());
  for (size_t i = 0; i < in.vectors.size(); ++i) {
    const auto &v = in.vectors[i];
    encoded[i] = packvec::PackedVector(v(0), v(1), v(2), v(3)).raw();
  }
}

void DecodeAll(const Inputs &in, std::vector<packvec::Vec4f> &decoded) {
  decoded.resize(in.words.size());
  for (size_t i = 0; i < in.words.size(); ++i) {
    decoded[i] = packvec::decode(in.words[i]);
  }
}

bool SameBits(const packvec::Vec4f &a, const packvec::Vec4f &b) {
  return std::memcmp(a.data(), b.data(), sizeof(float) * 4) == 0;
}

void TestConcurrentEncodeDecode() {
  const Inputs in = GenerateInputs(2024);

  std::vector<packvec::PackedWord> ref_encoded;
  std::vector<packvec::Vec4f> ref_decoded;
  EncodeAll(in, ref_encoded);
  DecodeAll(in, ref_decoded);

  std::vector<std::vector<packvec::PackedWord>> encoded(kNumThreads);
  std::vector<std::vector<packvec::Vec4f>> decoded(kNumThreads);
  std::vector<std::thread> workers;
  workers.reserve(kNumThreads);
  for (size_t t = 0; t < kNumThreads; ++t) {
    workers.emplace_back([&, t]() {
      for (int r = 0; r < kRepeats; ++r) {
        EncodeAll(in, encoded[t]);
        DecodeAll(in, decoded[t]);
      }
    });
  }
  for (auto &w : workers) {
    w.join();
  }

  for (size_t t = 0; t < kNumThreads; ++t) {
    assert(encoded[t] == ref_encoded);
    assert(decoded[t].size() == ref_decoded.size());
    for (size_t i = 0; i < ref_decoded.size(); ++i) {
      assert(SameBits(decoded[t][i], ref_decoded[i]));
    }
  }

  std::printf("TestConcurrentEncodeDecode: OK (%zu threads)\n", kNumThreads);
}

void TestConcurrentFieldReplacement() {
  const packvec::PackedVector base(0.1f, 0.2f, 0.3f, 0.4f);
  const packvec::PackedWord expected = base.with_y(0.75f).with_w(1.0f).raw();

  std::vector<packvec::PackedWord> results(kNumThreads * 1024);
  std::vector<std::thread> workers;
  for (size_t t = 0; t < kNumThreads; ++t) {
    workers.emplace_back([&, t]() {
      for (size_t i = 0; i < 1024; ++i) {
        results[t * 1024 + i] = base.with_y(0.75f).with_w(1.0f).raw();
      }
    });
  }
  for (auto &w : workers) {
    w.join();
  }

  for (auto r : results) {
    assert(r == expected);
  }
  assert(base == packvec::PackedVector(0.1f, 0.2f, 0.3f, 0.4f));

  std::printf("TestConcurrentFieldReplacement: OK\n");
}

}  // namespace

int main() {
  TestConcurrentEncodeDecode();
  TestConcurrentFieldReplacement();

  std::printf("\nAll concurrency tests passed!\n");
  return 0;
}
