#pragma once

/**
 * @file Random.h
 * @brief Random number generation for augmentation parameters
 *
 * Every random augmentation takes a Random& so a caller can replay a
 * sequence after SetSeed().
 */

#include <PixAug/Core/Export.h>

#include <cstdint>
#include <random>

namespace Pix::Aug::Platform {

/**
 * @brief Thread-local random number generator
 *
 * Uses MT19937-64. Each thread has its own generator instance.
 */
class PIXAUG_API Random {
public:
    /**
     * @brief Get thread-local random instance
     */
    static Random& Instance();

    /**
     * @brief Reseed the current thread's generator
     */
    void SetSeed(uint64_t seed);

    uint64_t GetSeed() const { return seed_; }

    /**
     * @brief Random integer in [min, max] (inclusive, swapped if min > max)
     */
    int32_t Int(int32_t min, int32_t max);

    /**
     * @brief Random double in [0, 1)
     */
    double Double();

    /**
     * @brief Random double in [min, max) (swapped if min > max)
     */
    double Double(double min, double max);

    /**
     * @brief Underlying generator (for use with STL distributions)
     */
    std::mt19937_64& Generator() { return gen_; }

private:
    Random();
    Random(const Random&) = delete;
    Random& operator=(const Random&) = delete;

    std::mt19937_64 gen_;
    uint64_t seed_;
    std::uniform_real_distribution<double> unitDist_{0.0, 1.0};
};

/**
 * @brief Set random seed for reproducibility (current thread)
 */
inline void SetRandomSeed(uint64_t seed) {
    Random::Instance().SetSeed(seed);
}

} // namespace Pix::Aug::Platform
