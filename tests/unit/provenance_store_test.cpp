#include <cassert>
#include <cstdint>
#include <iostream>
#include <memory>

#include "internal/core/provenance_ledger.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/clock.hpp"
#include "internal/util/errors.hpp"

namespace {

using provenance::core::ProvenanceLedger;
using provenance::db::memory::MemoryRepository;
using provenance::util::ManualClock;

constexpr const char* kOwner    = "SP-OWNER";
constexpr const char* kCreator  = "SP-CREATOR";
constexpr const char* kVerifier = "SP-VERIFIER";

struct Fixture {
  std::shared_ptr<MemoryRepository> repository = std::make_shared<MemoryRepository>();
  std::shared_ptr<ManualClock>      clock      = std::make_shared<ManualClock>(100);
  ProvenanceLedger                  ledger{repository, kOwner, clock};

  Fixture() {
    ledger.RegisterModel(kOwner, "M1", "Vision Attribution", "1.0", 80);
    ledger.AuthorizeVerifier(kOwner, kVerifier);
  }
};

template <typename Error, typename Fn>
void ExpectThrows(Fn&& fn) {
  bool threw = false;
  try {
    fn();
  } catch (const Error&) {
    threw = true;
  }
  assert(threw);
}

void TestRegisterAssetInitializesRecord() {
  Fixture f;
  f.clock->Set(250);

  const auto record = f.ledger.RegisterAsset(kCreator, 1, "M1", 75);
  assert(record.asset_id == 1);
  assert(record.current_owner == kCreator);
  assert(record.creator == kCreator);
  assert(record.ai_model_id == "M1");
  assert(record.authenticity_score == 75);
  assert(record.creation_timestamp == 250);
  assert(record.last_verified == 250);
  assert(record.transfer_count == 0);
  assert(!record.flagged);

  auto stored = f.ledger.GetProvenance(1);
  assert(stored.has_value());
  assert(stored->creation_timestamp == 250);
  assert(f.ledger.GetCounters().total_assets == 1);
}

void TestRegisterAssetScoreBounds() {
  Fixture f;

  ExpectThrows<provenance::util::InvalidAuthenticityScore>([&] { f.ledger.RegisterAsset(kCreator, 1, "M1", -1); });
  ExpectThrows<provenance::util::InvalidAuthenticityScore>([&] { f.ledger.RegisterAsset(kCreator, 1, "M1", 101); });
  assert(!f.ledger.GetProvenance(1).has_value());
  assert(f.ledger.GetCounters().total_assets == 0);

  f.ledger.RegisterAsset(kCreator, 1, "M1", 0);
  f.ledger.RegisterAsset(kCreator, 2, "M1", 100);
  assert(f.ledger.GetCounters().total_assets == 2);
}

void TestRegisterAssetRequiresActiveModel() {
  Fixture f;

  ExpectThrows<provenance::util::InvalidAiModel>([&] { f.ledger.RegisterAsset(kCreator, 1, "unknown", 75); });
  // model check precedes the score check
  ExpectThrows<provenance::util::InvalidAiModel>([&] { f.ledger.RegisterAsset(kCreator, 1, "unknown", 500); });
  assert(!f.ledger.GetProvenance(1).has_value());
}

void TestReRegistrationLeavesRecordUnchanged() {
  Fixture f;
  f.ledger.RegisterAsset(kCreator, 1, "M1", 75);
  f.clock->Advance(10);

  ExpectThrows<provenance::util::AlreadyRegistered>([&] { f.ledger.RegisterAsset("SP-OTHER", 1, "M1", 90); });
  // duplicate wins over model and score checks
  ExpectThrows<provenance::util::AlreadyRegistered>([&] { f.ledger.RegisterAsset("SP-OTHER", 1, "unknown", 900); });

  auto stored = f.ledger.GetProvenance(1);
  assert(stored.has_value());
  assert(stored->current_owner == kCreator);
  assert(stored->authenticity_score == 75);
  assert(stored->creation_timestamp == 100);
  assert(f.ledger.GetCounters().total_assets == 1);
}

void TestUpdateScoreIsPartialMerge() {
  Fixture f;
  f.ledger.RegisterAsset(kCreator, 1, "M1", 75);
  f.ledger.TransferAsset(kCreator, 1, "SP-BUYER", 10, "H0");
  const auto before = *f.ledger.GetProvenance(1);

  f.clock->Set(400);
  const auto after = f.ledger.UpdateScore(kVerifier, 1, 55);

  assert(after.authenticity_score == 55);
  assert(after.last_verified == 400);

  assert(after.current_owner == before.current_owner);
  assert(after.creator == before.creator);
  assert(after.transfer_count == before.transfer_count);
  assert(after.flagged == before.flagged);
  assert(after.ai_model_id == before.ai_model_id);
  assert(after.creation_timestamp == before.creation_timestamp);

  const auto stored = *f.ledger.GetProvenance(1);
  assert(stored.authenticity_score == 55);
  assert(stored.last_verified == 400);
  assert(stored.current_owner == "SP-BUYER");
  assert(stored.transfer_count == 1);
}

void TestUpdateScoreGates() {
  Fixture f;

  ExpectThrows<provenance::util::NftNotFound>([&] { f.ledger.UpdateScore(kVerifier, 42, 50); });
  // missing asset is reported before the caller check
  ExpectThrows<provenance::util::NftNotFound>([&] { f.ledger.UpdateScore("SP-NOBODY", 42, 50); });

  f.ledger.RegisterAsset(kCreator, 1, "M1", 75);

  // neither creator nor owner may set scores
  ExpectThrows<provenance::util::NotAuthorized>([&] { f.ledger.UpdateScore(kCreator, 1, 50); });
  ExpectThrows<provenance::util::NotAuthorized>([&] { f.ledger.UpdateScore(kOwner, 1, 50); });
  ExpectThrows<provenance::util::NotAuthorized>([&] { f.ledger.UpdateScore("SP-NOBODY", 1, 500); });

  ExpectThrows<provenance::util::InvalidAuthenticityScore>([&] { f.ledger.UpdateScore(kVerifier, 1, 101); });
  ExpectThrows<provenance::util::InvalidAuthenticityScore>([&] { f.ledger.UpdateScore(kVerifier, 1, -5); });

  const auto stored = *f.ledger.GetProvenance(1);
  assert(stored.authenticity_score == 75);
  assert(stored.last_verified == 100);
}

void TestUpdateScoreKeepsFlag() {
  Fixture f;

  provenance::db::model::ProvenanceRecord flagged;
  flagged.asset_id           = 9;
  flagged.current_owner      = kCreator;
  flagged.creator            = kCreator;
  flagged.ai_model_id        = "M1";
  flagged.authenticity_score = 90;
  flagged.creation_timestamp = 1;
  flagged.last_verified      = 1;
  flagged.flagged            = true;
  {
    auto tx = f.repository->Begin();
    assert(f.repository->InsertProvenance(*tx, flagged));
    tx->Commit();
  }

  const auto updated = f.ledger.UpdateScore(kVerifier, 9, 20);
  assert(updated.flagged);
  assert(f.ledger.GetProvenance(9)->flagged);
}

} // namespace

int main() {
  TestRegisterAssetInitializesRecord();
  TestRegisterAssetScoreBounds();
  TestRegisterAssetRequiresActiveModel();
  TestReRegistrationLeavesRecordUnchanged();
  TestUpdateScoreIsPartialMerge();
  TestUpdateScoreGates();
  TestUpdateScoreKeepsFlag();

  std::cout << "provenance_unit_provenance_store: pass\n";
  return 0;
}
