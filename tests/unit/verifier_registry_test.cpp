#include <cassert>
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

constexpr const char* kOwner = "SP-OWNER";

void TestAbsentGrantIsNotAuthorized() {
  ProvenanceLedger ledger(std::make_shared<MemoryRepository>(), kOwner, std::make_shared<ManualClock>());
  assert(!ledger.IsAuthorizedVerifier("SP-VERIFIER"));
  // the owner is not implicitly a verifier
  assert(!ledger.IsAuthorizedVerifier(kOwner));
}

void TestOwnerGrantIsIdempotent() {
  ProvenanceLedger ledger(std::make_shared<MemoryRepository>(), kOwner, std::make_shared<ManualClock>());

  const auto grant = ledger.AuthorizeVerifier(kOwner, "SP-VERIFIER");
  assert(grant.principal == "SP-VERIFIER");
  assert(grant.is_authorized);
  assert(ledger.IsAuthorizedVerifier("SP-VERIFIER"));

  ledger.AuthorizeVerifier(kOwner, "SP-VERIFIER");
  assert(ledger.IsAuthorizedVerifier("SP-VERIFIER"));
  assert(!ledger.IsAuthorizedVerifier("SP-OTHER"));
}

void TestNonOwnerCannotGrant() {
  ProvenanceLedger ledger(std::make_shared<MemoryRepository>(), kOwner, std::make_shared<ManualClock>());

  bool threw = false;
  try {
    ledger.AuthorizeVerifier("SP-VERIFIER", "SP-VERIFIER");
  } catch (const provenance::util::NotAuthorized& e) {
    threw = true;
    assert(e.code() == provenance::ledger::v1::ERROR_CODE_NOT_AUTHORIZED);
  }
  assert(threw);
  assert(!ledger.IsAuthorizedVerifier("SP-VERIFIER"));
}

void TestEmptyPrincipalIsRejected() {
  ProvenanceLedger ledger(std::make_shared<MemoryRepository>(), kOwner, std::make_shared<ManualClock>());

  bool threw = false;
  try {
    ledger.AuthorizeVerifier(kOwner, "");
  } catch (const provenance::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestAbsentGrantIsNotAuthorized();
  TestOwnerGrantIsIdempotent();
  TestNonOwnerCannotGrant();
  TestEmptyPrincipalIsRejected();

  std::cout << "provenance_unit_verifier_registry: pass\n";
  return 0;
}
