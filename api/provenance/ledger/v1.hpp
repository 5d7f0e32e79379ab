#pragma once

#include "provenance/ledger/v1/types.pb.h"
#include "provenance/ledger/v1/ledger.pb.h"
