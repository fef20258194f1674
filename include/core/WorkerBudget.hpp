/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef WORKER_BUDGET_HPP
#define WORKER_BUDGET_HPP

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <utility>

namespace GlyphFlow {

/**
 * @brief Subsystems that split work across the ThreadSystem
 */
enum class SystemType : uint8_t {
    Particle = 0,   // Force kernel parallel-for
    COUNT = 1
};

/**
 * @brief Worker budget snapshot
 *
 * The engine ticks its subsystems one after another, so whichever one is
 * running may use every worker.
 */
struct WorkerBudget {
    size_t totalWorkers{0};
};

// Above this queue fill ratio callers are scaled back to one worker
static constexpr float QUEUE_PRESSURE_CRITICAL = 0.90f;

/**
 * @brief Worker allocation and adaptive batch sizing
 *
 * getBatchStrategy() starts from one batch per worker and applies a per-system
 * multiplier that reportBatchCompletion() nudges toward batches that take
 * between DEAD_BAND_LOW_MS and DEAD_BAND_HIGH_MS each.
 */
class WorkerBudgetManager {
public:
    static WorkerBudgetManager& Instance();

    /**
     * @brief Cached worker budget, recomputed after invalidateCache()
     */
    const WorkerBudget& getBudget();

    /**
     * @brief Worker count for a workload
     * @return 0 for an empty workload, 1 under critical queue pressure,
     *         otherwise every worker
     */
    size_t getOptimalWorkers(SystemType system, size_t workloadSize);

    /**
     * @brief Split a workload into batches
     * @return {batchCount, batchSize}; batchCount * batchSize >= workloadSize
     */
    std::pair<size_t, size_t> getBatchStrategy(SystemType system,
                                               size_t workloadSize,
                                               size_t optimalWorkers);

    /**
     * @brief Feed back the wall time of one threaded pass
     */
    void reportBatchCompletion(SystemType system, size_t batchCount,
                               double totalTimeMs);

    float getBatchMultiplier(SystemType system) const;

    // Call when the ThreadSystem worker count changes
    void invalidateCache();

private:
    WorkerBudgetManager() = default;
    ~WorkerBudgetManager() = default;

    WorkerBudgetManager(const WorkerBudgetManager&) = delete;
    WorkerBudgetManager& operator=(const WorkerBudgetManager&) = delete;

    struct BatchTuningState {
        std::atomic<float> batchMultiplier{1.0f};
        std::atomic<double> avgBatchTimeMs{0.0};

        static constexpr float MIN_MULTIPLIER = 0.25f;
        static constexpr float MAX_MULTIPLIER = 2.0f;
        static constexpr float ADJUST_RATE = 0.02f;
        static constexpr double DEAD_BAND_LOW_MS = 0.1;
        static constexpr double DEAD_BAND_HIGH_MS = 0.5;
    };

    WorkerBudget m_cachedBudget{};
    std::atomic<bool> m_budgetValid{false};
    mutable std::mutex m_cacheMutex;

    std::array<BatchTuningState, static_cast<size_t>(SystemType::COUNT)> m_batchState{};

    double getQueuePressure() const;
    WorkerBudget calculateBudget() const;
};

} // namespace GlyphFlow

#endif // WORKER_BUDGET_HPP
