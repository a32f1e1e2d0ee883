#pragma once

#include <cstdint>
#include <random>

#include "gridsync/types.hpp"

namespace gridsync::ingest {

/**
 * Deterministic synthetic cell values.
 *
 * Two synths built from the same seed produce the same sequence for the same
 * sequence of columns, which lets a batch stream its rows first and then
 * regenerate identical values for the cell stream.
 *
 * TEXT columns: "name" in the name -> first name, "email" -> user<6 digits>@example.com,
 * "age" -> 18..80 as text, otherwise a NATO alphabet word.
 * NUMBER columns: "age" -> 18..80, otherwise 1..100.
 */
class ValueSynth {
public:
    explicit ValueSynth(uint64_t seed) : engine_(seed) {}

    ScalarValue next(const Column& column);

private:
    int uniform(int lo, int hi);

    std::mt19937_64 engine_;
};

// Mix a per-ingest base seed with a batch index.
uint64_t batch_seed(uint64_t base, size_t batch_index);

} // namespace gridsync::ingest
