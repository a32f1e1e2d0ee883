#pragma once

#include <string>

namespace gridsync {

/**
 * Collision-resistant opaque id ("c" + 25 lowercase hex chars).
 *
 * Layout: 48-bit microsecond timestamp, 24-bit process-wide counter,
 * 28 random bits from a per-thread engine. Ids from two ingest calls on the
 * same table never repeat, so a retried count adds rows instead of upserting.
 * Thread-safe.
 */
std::string generate_id();

} // namespace gridsync
