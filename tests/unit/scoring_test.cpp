#include <cassert>
#include <cstdint>
#include <iostream>

#include "internal/core/scoring.hpp"

namespace {

using provenance::core::ComputeTransferScore;
using provenance::core::IsValidConfidence;
using provenance::core::IsValidScore;
using provenance::core::kMinConfidence;

void TestTransferScoreTruncates() {
  assert(ComputeTransferScore(80, 60) == 72);
  assert(ComputeTransferScore(70, 0) == 42);
  assert(ComputeTransferScore(80, 75) == 78);

  // 71*60 + 33*40 = 5580 -> 55
  assert(ComputeTransferScore(71, 33) == 55);
  // 99*60 + 1*40 = 5980 -> 59, not rounded up
  assert(ComputeTransferScore(99, 1) == 59);
}

void TestTransferScoreStaysInRange() {
  for (uint32_t confidence = 0; confidence <= 100; ++confidence) {
    for (uint32_t score = 0; score <= 100; ++score) {
      const auto updated = ComputeTransferScore(confidence, score);
      assert(updated <= 100);
      assert(updated == (confidence * 60 + score * 40) / 100);
    }
  }
}

void TestScoreBounds() {
  assert(IsValidScore(0));
  assert(IsValidScore(100));
  assert(!IsValidScore(-1));
  assert(!IsValidScore(101));
}

void TestConfidenceBoundsShareTheFloor() {
  assert(kMinConfidence == 70);
  assert(IsValidConfidence(70));
  assert(IsValidConfidence(100));
  assert(!IsValidConfidence(69));
  assert(!IsValidConfidence(101));
  assert(!IsValidConfidence(-70));
}

} // namespace

int main() {
  TestTransferScoreTruncates();
  TestTransferScoreStaysInRange();
  TestScoreBounds();
  TestConfidenceBoundsShareTheFloor();

  std::cout << "provenance_unit_scoring: pass\n";
  return 0;
}
