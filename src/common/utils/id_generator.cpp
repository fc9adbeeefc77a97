// common/utils/id_generator.cpp
#include "common/utils/id_generator.h"
#include <atomic>
#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>

namespace agentgraph {

std::string generate_id(std::string_view prefix) {
    static std::atomic<uint64_t> counter{0};
    thread_local std::mt19937_64 rng{std::random_device{}()};

    // Mix a process-wide counter in so two threads with equal seeds still differ
    const uint64_t value = rng() ^ (counter.fetch_add(1, std::memory_order_relaxed) * 0x9E3779B97F4A7C15ULL);

    std::ostringstream oss;
    oss << prefix << '-' << std::hex << std::setw(16) << std::setfill('0') << value;
    return oss.str();
}

} // namespace agentgraph
