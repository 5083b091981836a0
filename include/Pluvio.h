#ifndef PLUVIO_LIBRARY_H
#define PLUVIO_LIBRARY_H

#include "../src/core.hpp"
#include "../src/common/context.hpp"
#include "../src/common/save_load.hpp"
#include "../src/config/config.hpp"
#include "../src/data/data.hpp"
#include "../src/loss/loss.hpp"
#include "../src/lrscheduler/lrscheduler.hpp"
#include "../src/network/network.hpp"
#include "../src/optimizer/optimizer.hpp"
#include "../src/pool/signal_pool.hpp"
#include "../src/training/objective.hpp"
#include "../src/training/trainer.hpp"

// Public umbrella header.
// -----------------------------------------------------------------------------
//  - Every module is header-only under src/; this file only re-exports them.
//  - The training executable (src/Pluvio.cpp) is the one translation unit that
//    ties configuration, data loading and the trainer together.

#endif // PLUVIO_LIBRARY_H
