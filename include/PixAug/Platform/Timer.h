#pragma once

/**
 * @file Timer.h
 * @brief Timing and benchmark reporting
 *
 * @code
 * {
 *     ScopedTimer timer("AddSnow");
 *     Weather::AddSnow(image, output, 0.2, 2.5);
 * }  // Prints: "AddSnow: 12.345 ms"
 *
 * auto result = BenchmarkDetailed([&]() { Color::RgbToHls(image, hls); }, 50);
 * PrintBenchmarkResult("RgbToHls", result);
 * @endcode
 */

#include <PixAug/Core/Export.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace Pix::Aug::Platform {

/**
 * @brief Accumulating high-resolution stopwatch
 */
class PIXAUG_API Timer {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Duration = std::chrono::duration<double>;

    explicit Timer(bool autoStart = false);

    void Start();
    void Stop();
    void Reset();

    bool IsRunning() const { return running_; }

    Duration Elapsed() const;
    double ElapsedSeconds() const;
    double ElapsedMs() const;

private:
    TimePoint startTime_;
    Duration accumulated_{0};
    bool running_ = false;
};

/**
 * @brief RAII timer that prints "<name>: <ms> ms" to stdout on destruction
 */
class PIXAUG_API ScopedTimer {
public:
    explicit ScopedTimer(const std::string& name, bool printOnDestruct = true);
    ~ScopedTimer();

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

    double ElapsedMs() const { return timer_.ElapsedMs(); }

    /// Disable printing on destruction
    void Cancel() { printOnDestruct_ = false; }

private:
    std::string name_;
    Timer timer_;
    bool printOnDestruct_;
};

/**
 * @brief Benchmark result with statistics
 */
struct PIXAUG_API BenchmarkResult {
    double minMs = 0.0;
    double maxMs = 0.0;
    double avgMs = 0.0;
    double medianMs = 0.0;
    double stddevMs = 0.0;
    size_t iterations = 0;
};

/**
 * @brief Time @p func individually over @p iterations runs
 * @param warmup Untimed runs before measuring
 * @throws InvalidArgumentException if iterations is 0
 */
PIXAUG_API BenchmarkResult BenchmarkDetailed(const std::function<void()>& func,
                                             size_t iterations = 100,
                                             size_t warmup = 10);

/**
 * @brief Print benchmark result to stdout
 */
PIXAUG_API void PrintBenchmarkResult(const std::string& name, const BenchmarkResult& result);

} // namespace Pix::Aug::Platform
