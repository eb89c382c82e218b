#pragma once

/// @file item_types.hpp
/// @brief Map item and powerup enumerations.

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

#include "arena/game/weapon_types.hpp"

namespace arena::game {

/// Timed player powerups.
enum class PowerupKind : uint8_t {
    Quad,
    BattleSuit,
    Haste,
    Regeneration,
    Invisibility,
    Flight
};

constexpr std::size_t kPowerupKindCount = 6;

/// Every pickup that can be placed on a map.
enum class ItemKind : uint8_t {
    Health25,
    Health50,
    HealthMega,
    ArmorShard,
    Armor,
    ArmorHeavy,
    Shotgun,
    GrenadeLauncher,
    RocketLauncher,
    LightningGun,
    Railgun,
    Plasmagun,
    BFG,
    Quad,
    Regeneration,
    BattleSuit,
    Flight,
    Haste,
    Invisibility
};

constexpr std::size_t kItemKindCount = 19;

/// Coarse item family; decides respawn time and pickup sound.
enum class ItemCategory : uint8_t {
    Health,
    Armor,
    Weapon,
    Powerup
};

constexpr ItemCategory itemCategory(ItemKind kind) {
    switch (kind) {
        case ItemKind::Health25:
        case ItemKind::Health50:
        case ItemKind::HealthMega:
            return ItemCategory::Health;
        case ItemKind::ArmorShard:
        case ItemKind::Armor:
        case ItemKind::ArmorHeavy:
            return ItemCategory::Armor;
        case ItemKind::Shotgun:
        case ItemKind::GrenadeLauncher:
        case ItemKind::RocketLauncher:
        case ItemKind::LightningGun:
        case ItemKind::Railgun:
        case ItemKind::Plasmagun:
        case ItemKind::BFG:
            return ItemCategory::Weapon;
        case ItemKind::Quad:
        case ItemKind::Regeneration:
        case ItemKind::BattleSuit:
        case ItemKind::Flight:
        case ItemKind::Haste:
        case ItemKind::Invisibility:
            return ItemCategory::Powerup;
    }
    return ItemCategory::Health;
}

/// Weapon granted by a weapon item.
constexpr std::optional<WeaponKind> itemWeapon(ItemKind kind) {
    switch (kind) {
        case ItemKind::Shotgun:         return WeaponKind::Shotgun;
        case ItemKind::GrenadeLauncher: return WeaponKind::GrenadeLauncher;
        case ItemKind::RocketLauncher:  return WeaponKind::RocketLauncher;
        case ItemKind::LightningGun:    return WeaponKind::Lightning;
        case ItemKind::Railgun:         return WeaponKind::Railgun;
        case ItemKind::Plasmagun:       return WeaponKind::Plasmagun;
        case ItemKind::BFG:             return WeaponKind::BFG;
        default:                        return std::nullopt;
    }
}

/// Powerup granted by a powerup item.
constexpr std::optional<PowerupKind> itemPowerup(ItemKind kind) {
    switch (kind) {
        case ItemKind::Quad:         return PowerupKind::Quad;
        case ItemKind::Regeneration: return PowerupKind::Regeneration;
        case ItemKind::BattleSuit:   return PowerupKind::BattleSuit;
        case ItemKind::Flight:       return PowerupKind::Flight;
        case ItemKind::Haste:        return PowerupKind::Haste;
        case ItemKind::Invisibility: return PowerupKind::Invisibility;
        default:                     return std::nullopt;
    }
}

constexpr std::string_view itemKindName(ItemKind kind) {
    constexpr std::array<std::string_view, kItemKindCount> names = {
        "health25", "health50", "mega_health", "armor_shard", "armor", "heavy_armor",
        "shotgun", "grenade_launcher", "rocket_launcher", "lightning_gun", "railgun",
        "plasmagun", "bfg", "quad", "regeneration", "battle_suit", "flight", "haste",
        "invisibility"
    };
    auto idx = static_cast<std::size_t>(kind);
    return idx < kItemKindCount ? names[idx] : "unknown";
}

/// Inverse of itemKindName, used when reading map files.
constexpr std::optional<ItemKind> parseItemKind(std::string_view name) {
    for (std::size_t i = 0; i < kItemKindCount; ++i) {
        auto kind = static_cast<ItemKind>(i);
        if (itemKindName(kind) == name) {
            return kind;
        }
    }
    return std::nullopt;
}

constexpr std::string_view powerupKindName(PowerupKind kind) {
    switch (kind) {
        case PowerupKind::Quad:         return "Quad";
        case PowerupKind::BattleSuit:   return "BattleSuit";
        case PowerupKind::Haste:        return "Haste";
        case PowerupKind::Regeneration: return "Regeneration";
        case PowerupKind::Invisibility: return "Invisibility";
        case PowerupKind::Flight:       return "Flight";
    }
    return "Unknown";
}

}  // namespace arena::game
