#pragma once

#include <memory>

namespace provenance::core { class ProvenanceLedger; }

namespace provenance::service {

/*
  Dependency container shared by the ledger service.
*/
struct ServiceContext {
  std::shared_ptr<provenance::core::ProvenanceLedger> ledger;
};

}
