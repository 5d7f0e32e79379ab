#pragma once

#include <cstdint>

namespace provenance::core {

// Floor for model confidence at registration AND for the post-transfer
// authenticity score. One constant for both.
constexpr uint32_t kMinConfidence = 70;
constexpr uint32_t kMaxScore      = 100;

// Weight of model confidence vs. prior asset score, in percent.
constexpr uint32_t kModelWeight = 60;
constexpr uint32_t kScoreWeight = 40;

constexpr bool IsValidScore(int64_t score) {
  return score >= 0 && score <= static_cast<int64_t>(kMaxScore);
}

constexpr bool IsValidConfidence(int64_t confidence) {
  return confidence >= static_cast<int64_t>(kMinConfidence) && confidence <= static_cast<int64_t>(kMaxScore);
}

// floor((confidence*60 + score*40) / 100); both inputs are in [0,100] so the
// result is too.
constexpr uint32_t ComputeTransferScore(uint32_t model_confidence, uint32_t current_score) {
  return (model_confidence * kModelWeight + current_score * kScoreWeight) / 100;
}

static_assert(ComputeTransferScore(80, 60) == 72);
static_assert(ComputeTransferScore(70, 0) == 42);
static_assert(ComputeTransferScore(80, 75) == 78);
static_assert(ComputeTransferScore(100, 100) == kMaxScore);

} // namespace provenance::core
