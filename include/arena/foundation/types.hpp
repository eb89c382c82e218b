#pragma once

/// @file types.hpp
/// @brief Strong id types for simulation entities.

#include <cstdint>
#include <functional>

namespace arena::foundation {

/// Tag-based strong typedef for type-safe ID values.
///
/// Keeps a projectile id from being passed where a player id is expected
/// while sharing the same underlying representation.  Zero is reserved as
/// the invalid id.
///
/// @tparam Tag A unique tag type to distinguish different ID types.
/// @tparam T The underlying integral type.
template <typename Tag, typename T = uint32_t>
class StrongId {
public:
    using value_type = T;

    constexpr StrongId() = default;
    constexpr explicit StrongId(T value) : value_(value) {}

    [[nodiscard]] constexpr T value() const noexcept { return value_; }
    [[nodiscard]] constexpr bool isValid() const noexcept { return value_ != 0; }

    constexpr auto operator<=>(const StrongId&) const = default;

private:
    T value_ = 0;
};

struct PlayerIdTag {};
struct ProjectileIdTag {};
struct ItemIdTag {};

/// Stable identifier of a player for the lifetime of a World.
using PlayerId = StrongId<PlayerIdTag>;

/// Identifier of an in-flight projectile.  Never reused within a World.
using ProjectileId = StrongId<ProjectileIdTag>;

/// Identifier of a map item spawn.
using ItemId = StrongId<ItemIdTag>;

} // namespace arena::foundation

// Hash support for use in unordered containers.
template <typename Tag, typename T>
struct std::hash<arena::foundation::StrongId<Tag, T>> {
    std::size_t operator()(const arena::foundation::StrongId<Tag, T>& id) const noexcept {
        return std::hash<T>{}(id.value());
    }
};
