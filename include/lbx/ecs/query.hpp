#pragma once

/// @file query.hpp
/// @brief Multi-component queries over sparse-set storages.

#include <cstdint>
#include <limits>
#include <tuple>
#include <utility>
#include <vector>

#include "lbx/ecs/component_storage.hpp"
#include "lbx/ecs/entity.hpp"

namespace lbx::ecs {

/// Iterates every entity that owns all of the `Includes...` components.
///
/// The matching entity list is cached and rebuilt only when one of the
/// storages reports a new modification version.
///
/// @note Entity handles yielded by a query carry generation 0; they are
///       valid keys for any storage.  Use EntityManager::HandleOf() to
///       recover the live handle.
///
/// @note Adding or removing components of an included type inside a
///       ForEach callback is undefined behavior.  Mutating component
///       values is fine.
///
/// @code
///   Query<PlayerProfile, Progression> players(profiles, progressions);
///   players.ForEach([](Entity e, PlayerProfile& profile, Progression& prog) {
///       // ...
///   });
/// @endcode
template <typename... Includes>
class Query {
    static_assert(sizeof...(Includes) > 0, "Query must have at least one component type");

public:
    using const_iterator = typename std::vector<Entity>::const_iterator;

    explicit Query(ComponentStorage<Includes>&... storages)
        : storages_{&storages...} {}

    Query(const Query&) = delete;
    Query& operator=(const Query&) = delete;
    Query(Query&&) noexcept = default;
    Query& operator=(Query&&) noexcept = default;

    /// Invoke @p func(entity, components...) for every match.
    template <typename Func>
    void ForEach(Func&& func) {
        refresh();
        for (Entity e : cached_) {
            func(e, std::get<ComponentStorage<Includes>*>(storages_)->Get(e)...);
        }
    }

    [[nodiscard]] std::size_t Count() const {
        refresh();
        return cached_.size();
    }

    [[nodiscard]] const_iterator begin() const {
        refresh();
        return cached_.cbegin();
    }
    [[nodiscard]] const_iterator end() const { return cached_.cend(); }

private:
    [[nodiscard]] uint64_t fingerprint() const noexcept {
        uint64_t fp = 0;
        std::apply([&](auto*... ptrs) { ((fp = fp * 31 + ptrs->Version()), ...); }, storages_);
        return fp;
    }

    void refresh() const {
        const uint64_t fp = fingerprint();
        if (valid_ && cachedFingerprint_ == fp) {
            return;
        }

        cached_.clear();

        // Drive iteration from the smallest storage.
        const IComponentStorage* smallest = nullptr;
        std::size_t smallestSize = std::numeric_limits<std::size_t>::max();
        std::apply(
            [&](auto*... ptrs) {
                auto pick = [&](const IComponentStorage* p) {
                    if (p->Size() < smallestSize) {
                        smallest = p;
                        smallestSize = p->Size();
                    }
                };
                (pick(ptrs), ...);
            },
            storages_);

        for (std::size_t i = 0; smallest != nullptr && i < smallestSize; ++i) {
            const Entity entity(smallest->EntityAt(i), 0);
            const bool matchesAll = std::apply(
                [&](auto*... ptrs) { return (ptrs->Has(entity) && ...); }, storages_);
            if (matchesAll) {
                cached_.push_back(entity);
            }
        }

        cachedFingerprint_ = fp;
        valid_ = true;
    }

    std::tuple<ComponentStorage<Includes>*...> storages_;

    mutable std::vector<Entity> cached_;
    mutable uint64_t cachedFingerprint_ = 0;
    mutable bool valid_ = false;
};

} // namespace lbx::ecs
