#include "gridsync/util/id.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <random>

namespace gridsync {

namespace {

std::atomic<uint32_t> g_counter{0};

void append_hex(std::string& out, uint64_t value, int digits) {
    static const char kHex[] = "0123456789abcdef";
    for (int i = digits - 1; i >= 0; --i) {
        out += kHex[(value >> (i * 4)) & 0xF];
    }
}

} // anonymous namespace

std::string generate_id() {
    thread_local std::mt19937_64 engine{std::random_device{}()};

    auto now = std::chrono::system_clock::now().time_since_epoch();
    uint64_t micros = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::microseconds>(now).count());
    uint32_t seq = g_counter.fetch_add(1, std::memory_order_relaxed);

    std::string id;
    id.reserve(26);
    id += 'c';
    append_hex(id, micros & 0xFFFFFFFFFFFFULL, 12);
    append_hex(id, seq & 0xFFFFFF, 6);
    append_hex(id, engine() & 0xFFFFFFF, 7);
    return id;
}

} // namespace gridsync
