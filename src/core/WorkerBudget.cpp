/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/WorkerBudget.hpp"
#include "core/ThreadSystem.hpp"
#include <algorithm>

namespace GlyphFlow {

namespace {
constexpr size_t MIN_ITEMS_PER_BATCH = 8;
constexpr size_t FALLBACK_WORKERS = 4;
}

WorkerBudgetManager& WorkerBudgetManager::Instance() {
    static WorkerBudgetManager instance;
    return instance;
}

const WorkerBudget& WorkerBudgetManager::getBudget() {
    if (m_budgetValid.load(std::memory_order_acquire)) {
        return m_cachedBudget;
    }

    std::lock_guard<std::mutex> lock(m_cacheMutex);
    if (!m_budgetValid.load(std::memory_order_relaxed)) {
        m_cachedBudget = calculateBudget();
        m_budgetValid.store(true, std::memory_order_release);
    }
    return m_cachedBudget;
}

size_t WorkerBudgetManager::getOptimalWorkers([[maybe_unused]] SystemType system,
                                              size_t workloadSize) {
    if (workloadSize == 0) {
        return 0;
    }

    if (getQueuePressure() > QUEUE_PRESSURE_CRITICAL) {
        return 1;
    }

    return getBudget().totalWorkers;
}

std::pair<size_t, size_t> WorkerBudgetManager::getBatchStrategy(
    SystemType system,
    size_t workloadSize,
    size_t optimalWorkers) {

    if (workloadSize == 0 || optimalWorkers == 0) {
        return {1, workloadSize};
    }

    const auto& state = m_batchState[static_cast<size_t>(system)];

    // Never split below MIN_ITEMS_PER_BATCH particles per batch
    const size_t maxBatches = std::max(size_t{1}, workloadSize / MIN_ITEMS_PER_BATCH);
    const size_t targetBatches = std::min(optimalWorkers, maxBatches);

    const float multiplier = state.batchMultiplier.load(std::memory_order_relaxed);
    size_t batchCount = static_cast<size_t>(static_cast<float>(targetBatches) * multiplier);
    batchCount = std::clamp(batchCount, size_t{1}, maxBatches);

    const size_t batchSize = (workloadSize + batchCount - 1) / batchCount;
    return {batchCount, batchSize};
}

void WorkerBudgetManager::reportBatchCompletion(SystemType system,
                                                size_t batchCount,
                                                double totalTimeMs) {
    if (batchCount == 0) {
        return;
    }

    auto& state = m_batchState[static_cast<size_t>(system)];
    const double perBatchTimeMs = totalTimeMs / static_cast<double>(batchCount);

    const double oldAvg = state.avgBatchTimeMs.load(std::memory_order_relaxed);
    state.avgBatchTimeMs.store(oldAvg * 0.85 + perBatchTimeMs * 0.15,
                               std::memory_order_relaxed);

    float multiplier = state.batchMultiplier.load(std::memory_order_relaxed);
    if (perBatchTimeMs < BatchTuningState::DEAD_BAND_LOW_MS) {
        multiplier -= BatchTuningState::ADJUST_RATE;
    } else if (perBatchTimeMs > BatchTuningState::DEAD_BAND_HIGH_MS) {
        multiplier += BatchTuningState::ADJUST_RATE;
    }

    multiplier = std::clamp(multiplier,
                            BatchTuningState::MIN_MULTIPLIER,
                            BatchTuningState::MAX_MULTIPLIER);
    state.batchMultiplier.store(multiplier, std::memory_order_relaxed);
}

float WorkerBudgetManager::getBatchMultiplier(SystemType system) const {
    return m_batchState[static_cast<size_t>(system)].batchMultiplier.load(
        std::memory_order_relaxed);
}

void WorkerBudgetManager::invalidateCache() {
    m_budgetValid.store(false, std::memory_order_release);
}

double WorkerBudgetManager::getQueuePressure() const {
    if (!ThreadSystem::Exists()) {
        return 0.0;
    }

    const auto& threadSystem = ThreadSystem::Instance();
    const size_t queueCapacity = threadSystem.getQueueCapacity();
    if (queueCapacity == 0) {
        return 0.0;
    }

    return static_cast<double>(threadSystem.getQueueSize()) /
           static_cast<double>(queueCapacity);
}

WorkerBudget WorkerBudgetManager::calculateBudget() const {
    WorkerBudget budget;
    if (!ThreadSystem::Exists()) {
        budget.totalWorkers = FALLBACK_WORKERS;
    } else {
        budget.totalWorkers = ThreadSystem::Instance().getThreadCount();
    }
    budget.totalWorkers = std::max(budget.totalWorkers, size_t{1});
    return budget;
}

} // namespace GlyphFlow
