#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/core/provenance_ledger.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/service/ledger_service.hpp"
#include "internal/util/clock.hpp"

namespace provenance::factory {

/*
  Application

  Owns all long-lived objects of one ledger instance.
*/
struct Application {
  std::shared_ptr<db::Repository> repository;
  std::shared_ptr<core::ProvenanceLedger> ledger;
  std::shared_ptr<service::LedgerService> ledger_service;
};

/*
  Build

  Constructs the ledger over the configured repository.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
  A null clock means util::SystemClock, seeded from the latest stored height.
*/
Application Build(const provenance::runtime::config::RuntimeConfig& config,
                  std::shared_ptr<util::Clock> clock = nullptr);

}
