#pragma once

/// @file ingest.hpp
/// @brief Main include header for relay_ingest
///
/// relay_ingest loads a known-size batch of records, or a live subscription,
/// into a write-constrained store without overwhelming its admission queue.
///
/// ```cpp
/// relay_ingest::BatchWriter<Row> writer(store, relay_ingest::IngestConfig{}.with_batch_size(100));
/// auto report = writer.write_all("events", rows);
/// if (!report.ok()) {
///     for (const auto* batch : report.failed_batches()) { ... }
/// }
/// ```

#include "types.hpp"
#include "destination.hpp"
#include "batch_writer.hpp"
