/**
 * @file Random.cpp
 * @brief Random number generation implementation
 */

#include <PixAug/Platform/Random.h>

#include <chrono>
#include <functional>
#include <thread>
#include <utility>

namespace Pix::Aug::Platform {

Random& Random::Instance() {
    thread_local Random instance;
    return instance;
}

Random::Random() {
    // Time mixed with thread ID so concurrent threads start apart
    auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::high_resolution_clock::now().time_since_epoch()).count();
    uint64_t threadHash = std::hash<std::thread::id>{}(std::this_thread::get_id());

    seed_ = static_cast<uint64_t>(nanos) ^ threadHash;
    gen_.seed(seed_);
}

void Random::SetSeed(uint64_t seed) {
    seed_ = seed;
    gen_.seed(seed);
    unitDist_.reset();
}

int32_t Random::Int(int32_t min, int32_t max) {
    if (min > max) {
        std::swap(min, max);
    }
    std::uniform_int_distribution<int32_t> dist(min, max);
    return dist(gen_);
}

double Random::Double() {
    return unitDist_(gen_);
}

double Random::Double(double min, double max) {
    if (min > max) {
        std::swap(min, max);
    }
    if (min == max) {
        return min;
    }
    std::uniform_real_distribution<double> dist(min, max);
    return dist(gen_);
}

} // namespace Pix::Aug::Platform
