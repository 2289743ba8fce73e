/// @file system_scheduler.cpp
/// @brief Stage ordering (Kahn's algorithm) and fixed-interval execution.

#include "cre/ecs/system_scheduler.hpp"

#include <cassert>
#include <queue>
#include <sstream>

#include "cre/foundation/combat_logger.hpp"

namespace cre::ecs {

const std::vector<SystemTypeId> SystemScheduler::kEmptyOrder_;

std::size_t SystemScheduler::SystemCount() const noexcept {
    return systems_.size();
}

bool SystemScheduler::AddDependency(SystemTypeId before, SystemTypeId after) {
    auto itBefore = systems_.find(before);
    auto itAfter = systems_.find(after);

    if (itBefore == systems_.end() || itAfter == systems_.end()) {
        return false;
    }
    if (itBefore->second.stage != itAfter->second.stage) {
        return false;
    }

    dependencies_[before].insert(after);
    reverseDeps_[after].insert(before);
    built_ = false;
    return true;
}

void SystemScheduler::SetEnabled(SystemTypeId system, bool enabled) {
    if (auto it = systems_.find(system); it != systems_.end()) {
        it->second.enabled = enabled;
    }
}

bool SystemScheduler::IsEnabled(SystemTypeId system) const {
    if (auto it = systems_.find(system); it != systems_.end()) {
        return it->second.enabled;
    }
    return false;
}

bool SystemScheduler::Build() {
    lastError_.clear();
    executionOrder_.clear();

    for (const auto& [stage, ids] : stageGroups_) {
        std::vector<SystemTypeId> sorted;
        if (!topologicalSort(ids, sorted)) {
            built_ = false;
            CRE_LOG_ERROR(foundation::LogCategory::ECS, lastError_);
            return false;
        }
        executionOrder_[stage] = std::move(sorted);
    }

    built_ = true;
    return true;
}

bool SystemScheduler::topologicalSort(const std::vector<SystemTypeId>& ids,
                                      std::vector<SystemTypeId>& sorted) {
    std::unordered_set<SystemTypeId> stageSet(ids.begin(), ids.end());

    std::unordered_map<SystemTypeId, uint32_t> inDegree;
    for (auto id : ids) {
        inDegree[id] = 0;
    }
    for (auto id : ids) {
        if (auto it = reverseDeps_.find(id); it != reverseDeps_.end()) {
            for (auto dep : it->second) {
                if (stageSet.contains(dep)) {
                    ++inDegree[id];
                }
            }
        }
    }

    std::queue<SystemTypeId> ready;
    for (auto id : ids) {
        if (inDegree[id] == 0) {
            ready.push(id);
        }
    }

    sorted.clear();
    sorted.reserve(ids.size());

    while (!ready.empty()) {
        auto current = ready.front();
        ready.pop();
        sorted.push_back(current);

        if (auto it = dependencies_.find(current); it != dependencies_.end()) {
            // Release successors in registration order so the plan is
            // deterministic.
            for (auto candidate : ids) {
                if (!it->second.contains(candidate)) {
                    continue;
                }
                if (--inDegree[candidate] == 0) {
                    ready.push(candidate);
                }
            }
        }
    }

    if (sorted.size() != ids.size()) {
        std::ostringstream oss;
        oss << "Circular dependency detected among systems: [";
        bool first = true;
        for (auto id : ids) {
            if (inDegree[id] != 0) {
                if (!first) {
                    oss << ", ";
                }
                oss << systems_.at(id).instance->GetName();
                first = false;
            }
        }
        oss << "]";
        lastError_ = oss.str();
        return false;
    }

    return true;
}

void SystemScheduler::Execute(float deltaTime) {
    assert(built_ && "SystemScheduler::Build() must be called before Execute()");

    static constexpr SystemStage kVariableStages[] = {
        SystemStage::PreUpdate,
        SystemStage::Update,
        SystemStage::PostUpdate,
    };

    for (auto stage : kVariableStages) {
        executeStage(stage, deltaTime);
    }

    auto fixedIt = executionOrder_.find(SystemStage::FixedUpdate);
    if (fixedIt != executionOrder_.end() && !fixedIt->second.empty()) {
        fixedTimeAccumulator_ += deltaTime;

        // Tolerance absorbs float deltas that fall a hair short.
        constexpr double kEpsilon = 1e-6;
        while (fixedTimeAccumulator_ + kEpsilon >= fixedTimeStep_) {
            fixedTimeAccumulator_ -= fixedTimeStep_;
            executeStage(SystemStage::FixedUpdate, fixedTimeStep_);
        }
        if (fixedTimeAccumulator_ < 0.0) {
            fixedTimeAccumulator_ = 0.0;
        }
    }
}

void SystemScheduler::executeStage(SystemStage stage, float deltaTime) {
    auto it = executionOrder_.find(stage);
    if (it == executionOrder_.end()) {
        return;
    }
    for (auto typeId : it->second) {
        auto& entry = systems_.at(typeId);
        if (entry.enabled) {
            entry.instance->Execute(deltaTime);
        }
    }
}

const std::string& SystemScheduler::GetLastError() const noexcept {
    return lastError_;
}

void SystemScheduler::SetFixedTimeStep(float seconds) {
    assert(seconds > 0.0f && "Fixed timestep must be positive");
    fixedTimeStep_ = seconds;
}

float SystemScheduler::GetFixedTimeStep() const noexcept {
    return fixedTimeStep_;
}

const std::vector<SystemTypeId>& SystemScheduler::GetExecutionOrder(SystemStage stage) const {
    auto it = executionOrder_.find(stage);
    if (it != executionOrder_.end()) {
        return it->second;
    }
    return kEmptyOrder_;
}

}  // namespace cre::ecs
