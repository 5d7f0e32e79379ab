#pragma once

#include <cstdint>
#include <string>

namespace provenance::core {

/*
  Per-call host state.

  caller: authenticated principal issuing the call.
  height: block height read once at call start; every timestamp the call
          writes uses this value.
*/
struct CallContext {
  std::string caller;
  uint64_t    height = 0;
};

} // namespace provenance::core
