#pragma once

/// @file component_storage.hpp
/// @brief Sparse-set component storage.
///
/// ComponentStorage<T> gives O(1) add / find / remove keyed by entity and
/// packed iteration over all components of type T.  A modification counter
/// lets queries notice when their cached entity list has gone stale.

#include "lbx/ecs/component_type_id.hpp"
#include "lbx/ecs/entity.hpp"

#include <algorithm>
#include <cassert>
#include <cstdint>
#include <limits>
#include <type_traits>
#include <utility>
#include <vector>

namespace lbx::ecs {

/// Type-erased view of a component pool, used by EntityManager for
/// cleanup and by Query for membership tests.
class IComponentStorage {
public:
    virtual ~IComponentStorage() = default;

    virtual void Remove(Entity entity) = 0;
    [[nodiscard]] virtual bool Has(Entity entity) const = 0;
    virtual void Clear() = 0;
    [[nodiscard]] virtual std::size_t Size() const = 0;

    /// Entity id stored at dense @p index.
    [[nodiscard]] virtual uint32_t EntityAt(std::size_t index) const = 0;

    /// Modification counter, bumped by every structural change.
    [[nodiscard]] virtual uint32_t Version() const noexcept = 0;
};

/// Sparse-set component storage.
///
/// @code
///   sparse_  [entity.id] -> dense index  (or kInvalidIndex)
///   dense_   [index]     -> component data
///   entities_[index]     -> entity.id that owns dense_[index]
/// @endcode
///
/// Removal swaps the last element into the hole, so dense order is not
/// stable across removals.  Components are addressed by entity id only;
/// callers that hold long-lived handles check liveness through
/// EntityManager::IsAlive().
template <typename T>
class ComponentStorage final : public IComponentStorage {
public:
    static_assert(std::is_move_constructible_v<T>, "Component type must be move-constructible");

    using value_type = T;
    using iterator = typename std::vector<T>::iterator;
    using const_iterator = typename std::vector<T>::const_iterator;

    [[nodiscard]] std::size_t Size() const override { return dense_.size(); }
    [[nodiscard]] bool Empty() const noexcept { return dense_.empty(); }

    // ── CRUD ────────────────────────────────────────────────────────────

    /// Add a component for @p entity, constructed from @p args.
    /// @pre `!Has(entity)`.
    template <typename... Args>
    T& Add(Entity entity, Args&&... args) {
        assert(entity.isValid() && "Cannot add component to invalid entity");
        assert(!Has(entity) && "Entity already has this component");

        ensureSparseSize(entity.id());
        sparse_[entity.id()] = static_cast<uint32_t>(dense_.size());

        dense_.emplace_back(std::forward<Args>(args)...);
        entities_.push_back(entity.id());
        ++version_;

        return dense_.back();
    }

    /// @pre `Has(entity)`.
    [[nodiscard]] T& Get(Entity entity) {
        assert(Has(entity) && "Entity does not have this component");
        return dense_[sparse_[entity.id()]];
    }

    /// @pre `Has(entity)`.
    [[nodiscard]] const T& Get(Entity entity) const {
        assert(Has(entity) && "Entity does not have this component");
        return dense_[sparse_[entity.id()]];
    }

    /// Component of @p entity, or nullptr when it has none.
    [[nodiscard]] T* Find(Entity entity) {
        return Has(entity) ? &dense_[sparse_[entity.id()]] : nullptr;
    }

    [[nodiscard]] const T* Find(Entity entity) const {
        return Has(entity) ? &dense_[sparse_[entity.id()]] : nullptr;
    }

    [[nodiscard]] bool Has(Entity entity) const override {
        if (!entity.isValid()) {
            return false;
        }
        auto eid = entity.id();
        return eid < sparse_.size() && sparse_[eid] != kInvalidIndex;
    }

    /// Remove the component owned by @p entity; no-op when absent.
    void Remove(Entity entity) override {
        if (!Has(entity)) {
            return;
        }

        auto idx = sparse_[entity.id()];
        auto lastIdx = static_cast<uint32_t>(dense_.size() - 1);

        if (idx != lastIdx) {
            dense_[idx] = std::move(dense_[lastIdx]);
            entities_[idx] = entities_[lastIdx];
            sparse_[entities_[idx]] = idx;
        }

        dense_.pop_back();
        entities_.pop_back();
        sparse_[entity.id()] = kInvalidIndex;

        ++version_;
    }

    void Clear() override {
        dense_.clear();
        entities_.clear();
        std::fill(sparse_.begin(), sparse_.end(), kInvalidIndex);
        ++version_;
    }

    // ── Iteration ───────────────────────────────────────────────────────

    iterator begin() noexcept { return dense_.begin(); }
    iterator end() noexcept { return dense_.end(); }
    [[nodiscard]] const_iterator begin() const noexcept { return dense_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return dense_.end(); }

    [[nodiscard]] uint32_t EntityAt(std::size_t index) const override {
        assert(index < entities_.size());
        return entities_[index];
    }

    [[nodiscard]] uint32_t Version() const noexcept override { return version_; }

    [[nodiscard]] static ComponentTypeId TypeId() noexcept { return ComponentType<T>::Id(); }

private:
    static constexpr uint32_t kInvalidIndex = std::numeric_limits<uint32_t>::max();

    void ensureSparseSize(uint32_t entityId) {
        if (entityId >= sparse_.size()) {
            sparse_.resize(static_cast<std::size_t>(entityId) + 1, kInvalidIndex);
        }
    }

    std::vector<T> dense_;
    std::vector<uint32_t> entities_;
    std::vector<uint32_t> sparse_;
    uint32_t version_ = 0;
};

}  // namespace lbx::ecs
