/// @file item_system.cpp
/// @brief ItemSystem implementation.

#include "arena/game/item_system.hpp"

#include <algorithm>
#include <string>

#include "arena/foundation/game_logger.hpp"
#include "arena/game/game_constants.hpp"
#include "arena/game/weapon_catalog.hpp"

namespace arena::game {

using foundation::ItemId;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;
using foundation::PlayerId;

namespace {

int32_t healthAmount(ItemKind kind) {
    switch (kind) {
        case ItemKind::Health25:   return 25;
        case ItemKind::Health50:   return 50;
        case ItemKind::HealthMega: return 100;
        default:                   return 0;
    }
}

int32_t armorAmount(ItemKind kind) {
    switch (kind) {
        case ItemKind::ArmorShard: return 5;
        case ItemKind::Armor:      return 50;
        case ItemKind::ArmorHeavy: return 100;
        default:                   return 0;
    }
}

int32_t healthCap(ItemKind kind) {
    return kind == ItemKind::HealthMega ? kMegaHealthCap : kMaxHealth;
}

} // namespace

ItemSystem::ItemSystem(ecs::EntityTable<ItemId, Item>& items,
                       ecs::EntityTable<PlayerId, Player>& players)
    : items_(items), players_(players) {}

ItemStepResult ItemSystem::Execute(float deltaTime, float now) {
    ItemStepResult result;
    updatePowerups(deltaTime, result);
    updateRespawns(now, result);
    resolvePickups(now, result);
    return result;
}

float ItemSystem::RespawnTime(ItemKind kind) {
    switch (itemCategory(kind)) {
        case ItemCategory::Health:  return kRespawnHealthItem;
        case ItemCategory::Armor:   return kRespawnArmorItem;
        case ItemCategory::Weapon:  return kRespawnWeaponItem;
        case ItemCategory::Powerup: return kRespawnPowerupItem;
    }
    return kRespawnHealthItem;
}

bool ItemSystem::WouldAccept(const Player& player, ItemKind kind) {
    switch (itemCategory(kind)) {
        case ItemCategory::Health:
            return player.health < healthCap(kind);
        case ItemCategory::Armor:
            return player.armor < kMaxArmor;
        case ItemCategory::Weapon: {
            auto weapon = itemWeapon(kind);
            return weapon.has_value() &&
                   (!player.weapons.Owns(*weapon) || player.weapons.Ammo(*weapon) < kMaxAmmo);
        }
        case ItemCategory::Powerup:
            // Always taken; refreshes the duration.
            return true;
    }
    return false;
}

PickupResult ItemSystem::TryPickup(Player& player, Item& item, float now) {
    PickupResult result;
    result.kind = item.kind;

    if (!player.IsAlive()) {
        result.outcome = PickupOutcome::PlayerDead;
        return result;
    }
    if (!item.active) {
        result.outcome = PickupOutcome::Inactive;
        return result;
    }
    if (player.position.DistanceTo(item.position) >= kPickupRadius) {
        result.outcome = PickupOutcome::OutOfRange;
        return result;
    }
    if (!WouldAccept(player, item.kind)) {
        result.outcome = PickupOutcome::Refused;
        return result;
    }

    applyItem(player, item.kind);
    item.active = false;
    item.respawnAt = now + RespawnTime(item.kind);
    result.outcome = PickupOutcome::PickedUp;
    return result;
}

void ItemSystem::applyItem(Player& player, ItemKind kind) {
    switch (itemCategory(kind)) {
        case ItemCategory::Health:
            player.health = std::min(player.health + healthAmount(kind), healthCap(kind));
            break;
        case ItemCategory::Armor:
            player.armor = std::min(player.armor + armorAmount(kind), kMaxArmor);
            break;
        case ItemCategory::Weapon:
            if (auto weapon = itemWeapon(kind)) {
                player.weapons.Give(*weapon, WeaponCatalog::StatsFor(*weapon).pickupAmmo);
            }
            break;
        case ItemCategory::Powerup:
            if (auto powerup = itemPowerup(kind)) {
                player.powerups.Grant(*powerup, kPowerupDuration);
            }
            break;
    }
}

// ── Powerup timers ──────────────────────────────────────────────────────

void ItemSystem::updatePowerups(float deltaTime, ItemStepResult& out) {
    for (auto id : players_.SortedIds()) {
        auto* player = players_.Find(id);
        if (player == nullptr || !player->IsAlive()) {
            continue;
        }

        if (player->HasPowerup(PowerupKind::Regeneration)) {
            player->regenAccumulator += deltaTime;
            while (player->regenAccumulator >= 1.0f) {
                player->regenAccumulator -= 1.0f;
                if (player->health < kMaxHealth) {
                    player->health = std::min(player->health + kRegenHealthStep, kMaxHealth);
                } else if (player->health < kMegaHealthCap) {
                    player->health =
                        std::min(player->health + kRegenOverchargeStep, kMegaHealthCap);
                }
            }
        }

        for (std::size_t i = 0; i < kPowerupKindCount; ++i) {
            auto& remaining = player->powerups.remaining[i];
            if (remaining <= 0.0f) {
                continue;
            }
            remaining -= deltaTime;
            if (remaining <= 0.0f) {
                remaining = 0.0f;
                auto kind = static_cast<PowerupKind>(i);
                if (kind == PowerupKind::Regeneration) {
                    player->regenAccumulator = 0.0f;
                }
                out.expired.push_back(PowerupExpiry{id, kind});
            }
        }
    }
}

// ── Item respawns ───────────────────────────────────────────────────────

void ItemSystem::updateRespawns(float now, ItemStepResult& out) {
    for (auto id : items_.SortedIds()) {
        auto* item = items_.Find(id);
        if (item != nullptr && !item->active && now >= item->respawnAt) {
            item->active = true;
            out.respawned.push_back(id);
        }
    }
}

// ── Pickups ─────────────────────────────────────────────────────────────

void ItemSystem::resolvePickups(float now, ItemStepResult& out) {
    const auto itemIds = items_.SortedIds();
    for (auto playerId : players_.SortedIds()) {
        auto* player = players_.Find(playerId);
        if (player == nullptr || !player->IsAlive()) {
            continue;
        }
        for (auto itemId : itemIds) {
            auto* item = items_.Find(itemId);
            if (item == nullptr) {
                continue;
            }
            if (TryPickup(*player, *item, now).Succeeded()) {
                out.pickups.push_back(PickupRecord{playerId, itemId, item->kind, item->position});

                LogContext ctx;
                ctx.playerId = playerId;
                ctx.extra["item"] = std::string(itemKindName(item->kind));
                ARENA_LOG_CTX(LogLevel::Debug, LogCategory::Items, "item picked up", ctx);
            }
        }
    }
}

} // namespace arena::game
