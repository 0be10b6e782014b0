/// @file system_scheduler.cpp
/// @brief Staged system execution with dependency ordering.
///
/// Ordering within a stage is Kahn's algorithm with registration order as
/// the tie-break, so the frame order is deterministic for a given set of
/// registrations and dependencies.

#include "lbx/ecs/system_scheduler.hpp"

#include <cassert>
#include <sstream>

#include "lbx/foundation/game_logger.hpp"

namespace lbx::ecs {

using lbx::foundation::LogCategory;

namespace {

const std::vector<SystemTypeId> kEmptyOrder;

} // namespace

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

    for (std::size_t stage = 0; stage < kSystemStageCount; ++stage) {
        std::vector<SystemTypeId> sorted;
        if (!topologicalSort(stageGroups_[stage], sorted)) {
            built_ = false;
            LBX_LOG_ERROR(LogCategory::ECS, lastError_);
            return false;
        }
        executionOrder_[stage] = std::move(sorted);
    }

    built_ = true;
    LBX_LOG_DEBUG(LogCategory::ECS,
                  "Scheduler built with " + std::to_string(systems_.size()) + " systems");
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
        if (auto it = dependencies_.find(id); it != dependencies_.end()) {
            for (auto successor : it->second) {
                if (stageSet.contains(successor)) {
                    ++inDegree[successor];
                }
            }
        }
    }

    sorted.clear();
    sorted.reserve(ids.size());
    std::unordered_set<SystemTypeId> emitted;

    while (sorted.size() < ids.size()) {
        // First system in registration order whose predecessors all ran.
        SystemTypeId next = kInvalidSystemTypeId;
        for (auto id : ids) {
            if (!emitted.contains(id) && inDegree[id] == 0) {
                next = id;
                break;
            }
        }
        if (next == kInvalidSystemTypeId) {
            break;
        }

        sorted.push_back(next);
        emitted.insert(next);
        if (auto it = dependencies_.find(next); it != dependencies_.end()) {
            for (auto successor : it->second) {
                if (stageSet.contains(successor)) {
                    --inDegree[successor];
                }
            }
        }
    }

    if (sorted.size() != ids.size()) {
        std::ostringstream oss;
        oss << "Circular dependency detected among systems: [";
        bool first = true;
        for (auto id : ids) {
            if (emitted.contains(id)) {
                continue;
            }
            if (!first) {
                oss << ", ";
            }
            oss << systems_.at(id).instance->GetName();
            first = false;
        }
        oss << "]";
        lastError_ = oss.str();
        return false;
    }

    return true;
}

void SystemScheduler::Execute(float deltaTime) {
    assert(built_ && "SystemScheduler::Build() must succeed before Execute()");

    for (const auto& order : executionOrder_) {
        for (auto id : order) {
            auto& entry = systems_.at(id);
            if (entry.enabled) {
                entry.instance->Execute(deltaTime);
            }
        }
    }
}

const std::vector<SystemTypeId>& SystemScheduler::GetExecutionOrder(SystemStage stage) const {
    auto idx = static_cast<std::size_t>(stage);
    return idx < kSystemStageCount ? executionOrder_[idx] : kEmptyOrder;
}

std::vector<std::string> SystemScheduler::GetFrameOrderNames() const {
    std::vector<std::string> names;
    for (const auto& order : executionOrder_) {
        for (auto id : order) {
            names.emplace_back(systems_.at(id).instance->GetName());
        }
    }
    return names;
}

} // namespace lbx::ecs
