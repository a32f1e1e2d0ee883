#include "gridsync/ingest/value_synth.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <string>

namespace gridsync::ingest {

namespace {

const char* const kFirstNames[] = {
    "Liam", "Noah", "Olivia", "Emma", "Ava", "Mia", "Amelia", "Sophia", "Isabella", "James",
    "Benjamin", "Lucas", "Henry", "Alexander", "Charlotte", "Harper", "Evelyn", "Ella", "Jack", "Leo",
};

const char* const kWords[] = {
    "alpha", "bravo", "charlie", "delta", "echo", "foxtrot", "golf", "hotel", "india", "juliet",
    "kilo", "lima", "mike", "november", "oscar", "papa", "quebec", "romeo", "sierra", "tango",
    "uniform",
};

std::string lower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // anonymous namespace

int ValueSynth::uniform(int lo, int hi) {
    std::uniform_int_distribution<int> dist(lo, hi);
    return dist(engine_);
}

ScalarValue ValueSynth::next(const Column& column) {
    const std::string name = lower(column.name);
    const bool is_age = name == "age";

    if (column.type == ColumnType::Number) {
        return static_cast<double>(is_age ? uniform(18, 80) : uniform(1, 100));
    }

    if (name.find("email") != std::string::npos) {
        return "user" + std::to_string(uniform(100000, 999999)) + "@example.com";
    }
    if (name.find("name") != std::string::npos) {
        return std::string(kFirstNames[uniform(0, static_cast<int>(std::size(kFirstNames)) - 1)]);
    }
    if (is_age) {
        return std::to_string(uniform(18, 80));
    }
    return std::string(kWords[uniform(0, static_cast<int>(std::size(kWords)) - 1)]);
}

uint64_t batch_seed(uint64_t base, size_t batch_index) {
    // splitmix64 finalizer
    uint64_t z = base + 0x9E3779B97F4A7C15ULL * (static_cast<uint64_t>(batch_index) + 1);
    z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
    z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
    return z ^ (z >> 31);
}

} // namespace gridsync::ingest
