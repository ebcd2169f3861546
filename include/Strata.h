#ifndef STRATA_LIBRARY_H
#define STRATA_LIBRARY_H

#include "../src/common/config.hpp"
#include "../src/common/dtype.hpp"
#include "../src/common/error.hpp"
#include "../src/common/logging.hpp"
#include "../src/common/shape.hpp"

#include "../src/graph/executor.hpp"
#include "../src/graph/feed_dict.hpp"
#include "../src/graph/graph.hpp"
#include "../src/graph/scope.hpp"
#include "../src/graph/sequential.hpp"
#include "../src/graph/symbolic.hpp"
#include "../src/layer/layer.hpp"

// Public umbrella header.
// -----------------------------------------------------------------------------
// Intention:
//  - Re-export the API surface downstream code needs: the Scope arena, graph
//    construction, the executor and the built-in layer catalogue.
//  - Header-only; every component lives under src/ and compiles into the
//    including translation unit.

#endif // STRATA_LIBRARY_H
