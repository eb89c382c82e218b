#pragma once

/// @file entity_table.hpp
/// @brief Sparse-set table of simulation entities keyed by strong id.
///
/// EntityTable<Id, T> is the authoritative by-value store for one entity
/// kind (players, projectiles, items).  Lookups by id are O(1); iteration
/// walks the packed dense array.  Cross references between entities are
/// stored as ids and resolved through Find() every time they are used, so
/// no entity ever holds a pointer into another table.

#include <algorithm>
#include <cassert>
#include <cstdint>
#include <limits>
#include <type_traits>
#include <utility>
#include <vector>

namespace arena::ecs {

/// Sparse-set entity table.
///
/// Memory layout:
/// @code
///   sparse_[id.value()] -> dense index  (or kInvalidIndex)
///   dense_ [index]      -> entity data
///   ids_   [index]      -> id that owns dense_[index]
/// @endcode
///
/// Erase swaps the last element into the hole, so dense order is not
/// stable.  Code that needs a deterministic order (pickup races, damage
/// application) iterates SortedIds() instead.
///
/// The sparse index is sized by the largest id ever inserted and never
/// shrinks; owners of short-lived entities recycle ids.
///
/// @tparam Id A StrongId instantiation (value() returns an unsigned index).
/// @tparam T  Entity data, stored by value.
template <typename Id, typename T>
class EntityTable {
public:
    static_assert(std::is_move_constructible_v<T>, "Entity type must be move-constructible");

    using id_type = Id;
    using value_type = T;
    using iterator = typename std::vector<T>::iterator;
    using const_iterator = typename std::vector<T>::const_iterator;

    // ── Capacity ────────────────────────────────────────────────────────

    [[nodiscard]] std::size_t Size() const noexcept { return dense_.size(); }
    [[nodiscard]] bool Empty() const noexcept { return dense_.empty(); }

    // ── CRUD ────────────────────────────────────────────────────────────

    /// Store a new entity under @p id, constructed from @p args.
    /// @pre `id.isValid() && !Contains(id)`.
    template <typename... Args>
    T& Emplace(Id id, Args&&... args) {
        assert(id.isValid() && "Cannot store an entity under the invalid id");
        assert(!Contains(id) && "Id already present in table");

        const auto idx = static_cast<uint32_t>(dense_.size());
        ensureSparseSize(id.value());
        sparse_[id.value()] = idx;

        dense_.emplace_back(std::forward<Args>(args)...);
        ids_.push_back(id);
        return dense_.back();
    }

    /// Resolve an id, or nullptr when the entity no longer exists.
    [[nodiscard]] T* Find(Id id) {
        return Contains(id) ? &dense_[sparse_[id.value()]] : nullptr;
    }

    [[nodiscard]] const T* Find(Id id) const {
        return Contains(id) ? &dense_[sparse_[id.value()]] : nullptr;
    }

    [[nodiscard]] bool Contains(Id id) const noexcept {
        auto key = id.value();
        return id.isValid() && key < sparse_.size() && sparse_[key] != kInvalidIndex;
    }

    /// Remove the entity stored under @p id.
    /// @return false if there was nothing to remove.
    bool Erase(Id id) {
        if (!Contains(id)) {
            return false;
        }

        auto idx = sparse_[id.value()];
        auto lastIdx = static_cast<uint32_t>(dense_.size() - 1);

        if (idx != lastIdx) {
            dense_[idx] = std::move(dense_[lastIdx]);
            ids_[idx] = ids_[lastIdx];
            sparse_[ids_[idx].value()] = idx;
        }

        dense_.pop_back();
        ids_.pop_back();
        sparse_[id.value()] = kInvalidIndex;
        return true;
    }

    /// Remove every entity for which `pred(id, entity)` is true.
    /// @return Number of removed entities.
    template <typename Pred>
    std::size_t EraseIf(Pred pred) {
        std::vector<Id> doomed;
        for (std::size_t i = 0; i < dense_.size(); ++i) {
            if (pred(ids_[i], std::as_const(dense_[i]))) {
                doomed.push_back(ids_[i]);
            }
        }
        for (auto id : doomed) {
            Erase(id);
        }
        return doomed.size();
    }

    void Clear() {
        dense_.clear();
        ids_.clear();
        std::fill(sparse_.begin(), sparse_.end(), kInvalidIndex);
    }

    // ── Iteration ───────────────────────────────────────────────────────

    iterator begin() noexcept { return dense_.begin(); }
    iterator end() noexcept { return dense_.end(); }
    [[nodiscard]] const_iterator begin() const noexcept { return dense_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return dense_.end(); }

    /// Id owning the entity at dense position @p index.
    [[nodiscard]] Id IdAt(std::size_t index) const {
        assert(index < ids_.size());
        return ids_[index];
    }

    /// All live ids in ascending order.
    [[nodiscard]] std::vector<Id> SortedIds() const {
        std::vector<Id> sorted(ids_);
        std::sort(sorted.begin(), sorted.end());
        return sorted;
    }

private:
    static constexpr uint32_t kInvalidIndex = std::numeric_limits<uint32_t>::max();

    void ensureSparseSize(typename Id::value_type key) {
        if (key >= sparse_.size()) {
            sparse_.resize(static_cast<std::size_t>(key) + 1, kInvalidIndex);
        }
    }

    std::vector<T> dense_;         ///< Packed entity data.
    std::vector<Id> ids_;          ///< dense index -> owning id.
    std::vector<uint32_t> sparse_; ///< id value   -> dense index.
};

}  // namespace arena::ecs
