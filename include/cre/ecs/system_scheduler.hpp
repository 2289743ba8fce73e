#pragma once

/// @file system_scheduler.hpp
/// @brief Staged, dependency-ordered execution of combat systems.
///
/// One call to Execute() is one physics tick. PreUpdate, Update and
/// PostUpdate run once with the tick's delta; FixedUpdate accumulates time
/// and runs once per elapsed fixed interval (the status tick).

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace cre::ecs {

using SystemTypeId = uint32_t;

constexpr SystemTypeId kInvalidSystemTypeId = static_cast<SystemTypeId>(-1);

namespace detail {

inline SystemTypeId nextSystemTypeId() noexcept {
    static std::atomic<SystemTypeId> counter{0};
    return counter.fetch_add(1, std::memory_order_relaxed);
}

} // namespace detail

/// Process-wide identifier of system type `T`.
template <typename T>
struct SystemType {
    static SystemTypeId Id() noexcept {
        static const SystemTypeId value = detail::nextSystemTypeId();
        return value;
    }
};

/// Stages run in declaration order within a tick.
enum class SystemStage : uint8_t {
    PreUpdate,   ///< Cooldowns and other per-tick bookkeeping
    Update,      ///< Projectile motion and collision
    PostUpdate,  ///< Hit resolution
    FixedUpdate  ///< Status-effect ticks at a fixed interval
};

/// Base class for scheduled systems.
class ISystem {
public:
    virtual ~ISystem() = default;

    /// @param deltaTime  Seconds covered by this invocation.
    virtual void Execute(float deltaTime) = 0;

    [[nodiscard]] virtual SystemStage GetStage() const { return SystemStage::Update; }

    [[nodiscard]] virtual std::string_view GetName() const = 0;
};

/// Owns registered systems and runs them in stage and dependency order.
///
/// Within a stage, systems are topologically sorted by the edges added with
/// AddDependency(); ties keep registration order. A cycle makes Build()
/// fail and names the systems involved in GetLastError().
class SystemScheduler {
public:
    SystemScheduler() = default;

    SystemScheduler(const SystemScheduler&) = delete;
    SystemScheduler& operator=(const SystemScheduler&) = delete;
    SystemScheduler(SystemScheduler&&) noexcept = default;
    SystemScheduler& operator=(SystemScheduler&&) noexcept = default;

    /// Construct and register a system of type `T`. Registering the same
    /// type again returns the existing instance.
    template <typename T, typename... Args>
    T& Register(Args&&... args);

    [[nodiscard]] std::size_t SystemCount() const noexcept;

    /// Declare that `before` runs before `after`. Both must be registered in
    /// the same stage.
    bool AddDependency(SystemTypeId before, SystemTypeId after);

    template <typename Before, typename After>
    bool AddDependency();

    void SetEnabled(SystemTypeId system, bool enabled);

    template <typename T>
    void SetEnabled(bool enabled);

    [[nodiscard]] bool IsEnabled(SystemTypeId system) const;

    /// Compute the per-stage execution order.
    [[nodiscard]] bool Build();

    /// Run one tick. @pre Build() succeeded.
    void Execute(float deltaTime);

    [[nodiscard]] const std::string& GetLastError() const noexcept;

    void SetFixedTimeStep(float seconds);

    [[nodiscard]] float GetFixedTimeStep() const noexcept;

    /// Drop time accumulated toward the next FixedUpdate run.
    void ResetFixedAccumulator() noexcept { fixedTimeAccumulator_ = 0.0; }

    template <typename T>
    [[nodiscard]] T* GetSystem();

    [[nodiscard]] const std::vector<SystemTypeId>&
    GetExecutionOrder(SystemStage stage) const;

private:
    struct SystemEntry {
        std::unique_ptr<ISystem> instance;
        SystemTypeId typeId = kInvalidSystemTypeId;
        SystemStage stage = SystemStage::Update;
        bool enabled = true;
    };

    [[nodiscard]] bool topologicalSort(
        const std::vector<SystemTypeId>& ids,
        std::vector<SystemTypeId>& sorted);

    void executeStage(SystemStage stage, float deltaTime);

    std::unordered_map<SystemTypeId, SystemEntry> systems_;
    std::unordered_map<SystemStage, std::vector<SystemTypeId>> stageGroups_;

    /// dependencies_[A] holds every B that must run after A.
    std::unordered_map<SystemTypeId, std::unordered_set<SystemTypeId>> dependencies_;
    std::unordered_map<SystemTypeId, std::unordered_set<SystemTypeId>> reverseDeps_;

    std::unordered_map<SystemStage, std::vector<SystemTypeId>> executionOrder_;

    bool built_ = false;
    std::string lastError_;

    float fixedTimeStep_ = 1.0f;

    // Double precision keeps sixty 1/60 s ticks adding up to one second.
    double fixedTimeAccumulator_ = 0.0;

    static const std::vector<SystemTypeId> kEmptyOrder_;
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
    entry.typeId = typeId;
    entry.stage = ref.GetStage();

    stageGroups_[entry.stage].push_back(typeId);
    systems_.emplace(typeId, std::move(entry));

    built_ = false;
    return ref;
}

template <typename Before, typename After>
bool SystemScheduler::AddDependency() {
    return AddDependency(SystemType<Before>::Id(), SystemType<After>::Id());
}

template <typename T>
void SystemScheduler::SetEnabled(bool enabled) {
    SetEnabled(SystemType<T>::Id(), enabled);
}

template <typename T>
T* SystemScheduler::GetSystem() {
    const auto typeId = SystemType<T>::Id();
    if (auto it = systems_.find(typeId); it != systems_.end()) {
        return static_cast<T*>(it->second.instance.get());
    }
    return nullptr;
}

} // namespace cre::ecs
