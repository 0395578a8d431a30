/**
 * @file Timer.cpp
 * @brief Timing and benchmark reporting
 */

#include <PixAug/Platform/Timer.h>
#include <PixAug/Core/Exception.h>

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <vector>

namespace Pix::Aug::Platform {

namespace {

// Order statistics and spread of a set of samples (sorted in place)
BenchmarkResult Summarize(std::vector<double>& samplesMs) {
    std::sort(samplesMs.begin(), samplesMs.end());
    const size_t n = samplesMs.size();

    BenchmarkResult result;
    result.iterations = n;
    result.minMs = samplesMs.front();
    result.maxMs = samplesMs.back();
    result.avgMs = std::accumulate(samplesMs.begin(), samplesMs.end(), 0.0) /
                   static_cast<double>(n);
    result.medianMs = (n % 2 == 1)
        ? samplesMs[n / 2]
        : 0.5 * (samplesMs[n / 2 - 1] + samplesMs[n / 2]);

    double sq = 0.0;
    for (double t : samplesMs) {
        sq += (t - result.avgMs) * (t - result.avgMs);
    }
    result.stddevMs = std::sqrt(sq / static_cast<double>(n));
    return result;
}

} // anonymous namespace

// ============================================================================
// Timer
// ============================================================================

Timer::Timer(bool autoStart) {
    if (autoStart) Start();
}

void Timer::Start() {
    if (running_) return;
    startTime_ = Clock::now();
    running_ = true;
}

void Timer::Stop() {
    if (!running_) return;
    accumulated_ += std::chrono::duration_cast<Duration>(Clock::now() - startTime_);
    running_ = false;
}

void Timer::Reset() {
    accumulated_ = Duration::zero();
    running_ = false;
}

Timer::Duration Timer::Elapsed() const {
    if (!running_) return accumulated_;
    return accumulated_ + std::chrono::duration_cast<Duration>(Clock::now() - startTime_);
}

double Timer::ElapsedSeconds() const {
    return Elapsed().count();
}

double Timer::ElapsedMs() const {
    return std::chrono::duration<double, std::milli>(Elapsed()).count();
}

// ============================================================================
// ScopedTimer
// ============================================================================

ScopedTimer::ScopedTimer(const std::string& name, bool printOnDestruct)
    : name_(name), timer_(true), printOnDestruct_(printOnDestruct) {}

ScopedTimer::~ScopedTimer() {
    if (!printOnDestruct_) return;
    std::cout << name_ << ": " << std::fixed << std::setprecision(3)
              << timer_.ElapsedMs() << " ms" << std::endl;
}

// ============================================================================
// Benchmark
// ============================================================================

BenchmarkResult BenchmarkDetailed(const std::function<void()>& func,
                                  size_t iterations, size_t warmup) {
    if (iterations == 0) {
        throw InvalidArgumentException("BenchmarkDetailed: iterations must be > 0");
    }

    while (warmup-- > 0) {
        func();
    }

    std::vector<double> samplesMs;
    samplesMs.reserve(iterations);
    Timer timer;
    for (size_t i = 0; i < iterations; ++i) {
        timer.Reset();
        timer.Start();
        func();
        timer.Stop();
        samplesMs.push_back(timer.ElapsedMs());
    }
    return Summarize(samplesMs);
}

void PrintBenchmarkResult(const std::string& name, const BenchmarkResult& result) {
    std::cout << std::fixed << std::setprecision(3)
              << "Benchmark: " << name << " (" << result.iterations << " runs)\n"
              << "  avg " << result.avgMs << " ms, median " << result.medianMs
              << " ms, min " << result.minMs << " ms, max " << result.maxMs
              << " ms, stddev " << result.stddevMs << " ms" << std::endl;
}

} // namespace Pix::Aug::Platform
