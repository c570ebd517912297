#pragma once

#include "ipod/common/errors.hpp"  // IWYU pragma: export
#include "ipod/common/records.hpp" // IWYU pragma: export
#include "ipod/common/types.hpp"   // IWYU pragma: export

#include "ipod/algorithms/accumulator.hpp"  // IWYU pragma: export
#include "ipod/algorithms/chunks.hpp"       // IWYU pragma: export
#include "ipod/algorithms/dispatcher.hpp"   // IWYU pragma: export
#include "ipod/algorithms/worker.hpp"       // IWYU pragma: export
#include "ipod/data/record_batch.hpp"       // IWYU pragma: export
#include "ipod/data/results.hpp"            // IWYU pragma: export
#include "ipod/data/tables.hpp"             // IWYU pragma: export
#include "ipod/io/result_writer.hpp"        // IWYU pragma: export
#include "ipod/pipelines/ipod_manager.hpp"  // IWYU pragma: export
#include "ipod/refine/refiner.hpp"          // IWYU pragma: export
#include "ipod/runtime/object_store.hpp"    // IWYU pragma: export
#include "ipod/runtime/runtime.hpp"         // IWYU pragma: export
#include "ipod/runtime/shared_input.hpp"    // IWYU pragma: export
#include "ipod/search/configs.hpp"          // IWYU pragma: export
