#pragma once

/// @file system_scheduler.hpp
/// @brief Staged, dependency-ordered execution of ECS systems.
///
/// Systems are grouped by stage and topologically sorted within each
/// stage according to declared dependencies.  Execution is strictly
/// sequential on the calling thread: a system always observes every
/// mutation made by the systems that ran before it in the same frame.

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace lbx::ecs {

// ── System type identification ──────────────────────────────────────────

using SystemTypeId = uint32_t;

constexpr SystemTypeId kInvalidSystemTypeId = static_cast<SystemTypeId>(-1);

namespace detail {

inline SystemTypeId nextSystemTypeId() noexcept {
    static std::atomic<SystemTypeId> counter{0};
    return counter.fetch_add(1, std::memory_order_relaxed);
}

} // namespace detail

/// Unique runtime id for system type `T`.
template <typename T>
struct SystemType {
    static SystemTypeId Id() noexcept {
        static const SystemTypeId value = detail::nextSystemTypeId();
        return value;
    }
};

// ── Execution stages ────────────────────────────────────────────────────

/// Stages run in declaration order once per frame.
enum class SystemStage : uint8_t {
    PreUpdate,   ///< Producers of shared resources (box generation)
    Update,      ///< Player intents (choose, open, equip, sell)
    PostUpdate   ///< Consequences of the frame (leveling, rankings)
};

inline constexpr std::size_t kSystemStageCount = 3;

// ── System interface ────────────────────────────────────────────────────

/// Base class for ECS systems.
///
/// Systems receive the storages and resources they work on by reference
/// at construction; they hold no ownership of world state.
class ISystem {
public:
    virtual ~ISystem() = default;

    /// Run one frame of this system.
    ///
    /// @param deltaTime  Frame delta time in seconds.
    virtual void Execute(float deltaTime) = 0;

    [[nodiscard]] virtual SystemStage GetStage() const { return SystemStage::Update; }

    /// Human-readable name for diagnostics.
    [[nodiscard]] virtual std::string_view GetName() const = 0;
};

// ── System scheduler ────────────────────────────────────────────────────

/// Owns registered systems and runs them in stage, then dependency, order.
///
/// Usage:
/// @code
///   SystemScheduler scheduler;
///   scheduler.Register<BoxChoiceSystem>(pool, openRequests);
///   scheduler.Register<BoxOpeningSystem>(...);
///   scheduler.AddDependency<BoxChoiceSystem, BoxOpeningSystem>();
///   if (!scheduler.Build()) {
///       log(scheduler.GetLastError());
///   }
///   scheduler.Execute(dt);
/// @endcode
class SystemScheduler {
public:
    SystemScheduler() = default;

    SystemScheduler(const SystemScheduler&) = delete;
    SystemScheduler& operator=(const SystemScheduler&) = delete;
    SystemScheduler(SystemScheduler&&) noexcept = default;
    SystemScheduler& operator=(SystemScheduler&&) noexcept = default;

    // ── Registration ────────────────────────────────────────────────

    /// Construct and register a system of type `T`.
    ///
    /// Re-registering the same type returns the existing instance and
    /// ignores @p args.
    template <typename T, typename... Args>
    T& Register(Args&&... args);

    [[nodiscard]] std::size_t SystemCount() const noexcept { return systems_.size(); }

    // ── Dependencies ────────────────────────────────────────────────

    /// Declare that `before` must execute before `after`.
    ///
    /// @return false if either system is unknown or they live in
    ///         different stages (stage order already decides).
    bool AddDependency(SystemTypeId before, SystemTypeId after);

    template <typename Before, typename After>
    bool AddDependency() {
        return AddDependency(SystemType<Before>::Id(), SystemType<After>::Id());
    }

    // ── Enable / disable ────────────────────────────────────────────

    /// Disabled systems are skipped without changing the execution plan.
    void SetEnabled(SystemTypeId system, bool enabled);

    template <typename T>
    void SetEnabled(bool enabled) {
        SetEnabled(SystemType<T>::Id(), enabled);
    }

    [[nodiscard]] bool IsEnabled(SystemTypeId system) const;

    // ── Execution ───────────────────────────────────────────────────

    /// Compute the per-stage execution order.
    ///
    /// @return false on a dependency cycle; GetLastError() then names
    ///         the systems involved.
    [[nodiscard]] bool Build();

    [[nodiscard]] bool IsBuilt() const noexcept { return built_; }

    /// Run every enabled system once, stage by stage.
    ///
    /// @pre Build() succeeded since the last registration change.
    void Execute(float deltaTime);

    [[nodiscard]] const std::string& GetLastError() const noexcept { return lastError_; }

    // ── Queries ─────────────────────────────────────────────────────

    template <typename T>
    [[nodiscard]] T* GetSystem();

    /// Execution order of a stage after Build().
    [[nodiscard]] const std::vector<SystemTypeId>& GetExecutionOrder(SystemStage stage) const;

    /// Names of every system in full frame order after Build().
    [[nodiscard]] std::vector<std::string> GetFrameOrderNames() const;

private:
    struct SystemEntry {
        std::unique_ptr<ISystem> instance;
        SystemStage stage = SystemStage::Update;
        bool enabled = true;
    };

    [[nodiscard]] bool topologicalSort(const std::vector<SystemTypeId>& ids,
                                       std::vector<SystemTypeId>& sorted);

    std::unordered_map<SystemTypeId, SystemEntry> systems_;

    /// Registration order per stage; ties in the sort keep this order.
    std::vector<std::vector<SystemTypeId>> stageGroups_ =
        std::vector<std::vector<SystemTypeId>>(kSystemStageCount);

    /// dependencies_[A] holds every B with A -> B.
    std::unordered_map<SystemTypeId, std::unordered_set<SystemTypeId>> dependencies_;

    std::vector<std::vector<SystemTypeId>> executionOrder_ =
        std::vector<std::vector<SystemTypeId>>(kSystemStageCount);

    bool built_ = false;
    std::string lastError_;
};

// ── Template implementations ────────────────────────────────────────────

template <typename T, typename... Args>
T& SystemScheduler::Register(Args&&... args) {
    static_assert(std::is_base_of_v<ISystem, T>, "T must derive from ISystem");

    const auto typeId = SystemType<T>::Id();
    if (auto it = systems_.find(typeId); it != systems_.end()) {
        return static_cast<T&>(*it->second.instance);
    }

    auto system = std::make_unique<T>(std::forward<Args>(args)...);
    T& ref = *system;

    SystemEntry entry;
    entry.instance = std::move(system);
    entry.stage = ref.GetStage();

    stageGroups_[static_cast<std::size_t>(entry.stage)].push_back(typeId);
    systems_.emplace(typeId, std::move(entry));
    built_ = false;

    return ref;
}

template <typename T>
T* SystemScheduler::GetSystem() {
    if (auto it = systems_.find(SystemType<T>::Id()); it != systems_.end()) {
        return static_cast<T*>(it->second.instance.get());
    }
    return nullptr;
}

} // namespace lbx::ecs
