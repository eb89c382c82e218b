/// @file world.cpp
/// @brief World orchestrator: population management and the tick pipeline.

#include "arena/game/world.hpp"

#include <algorithm>
#include <functional>
#include <limits>
#include <string>
#include <utility>

#include "arena/foundation/game_logger.hpp"
#include "arena/game/collision_engine.hpp"
#include "arena/game/combat_resolver.hpp"
#include "arena/game/game_constants.hpp"
#include "arena/game/hitscan_resolver.hpp"
#include "arena/game/item_system.hpp"
#include "arena/game/player_system.hpp"
#include "arena/game/projectile_system.hpp"

namespace arena::game {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::ItemId;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;
using foundation::PlayerId;
using foundation::ProjectileId;

namespace {

AudioEvent audioAt(AudioEventKind kind, const Vector3& position,
                   std::optional<PlayerId> player = std::nullopt) {
    AudioEvent event;
    event.kind = kind;
    event.position = position;
    event.player = player;
    return event;
}

VisualEvent visualAt(VisualEventKind kind, const Vector3& start, float lifetime) {
    VisualEvent event;
    event.kind = kind;
    event.start = start;
    event.end = start;
    event.lifetime = lifetime;
    return event;
}

AudioEventKind pickupSound(ItemKind kind) {
    switch (itemCategory(kind)) {
        case ItemCategory::Health:  return AudioEventKind::ItemPickup;
        case ItemCategory::Armor:   return AudioEventKind::ArmorPickup;
        case ItemCategory::Weapon:  return AudioEventKind::WeaponPickup;
        case ItemCategory::Powerup: return AudioEventKind::PowerupPickup;
    }
    return AudioEventKind::ItemPickup;
}

AwardSettings awardSettings(const SimulationConfig& config) {
    AwardSettings settings;
    settings.excellentWindow = config.excellentWindow;
    settings.accuracyThreshold = config.accuracyThreshold;
    settings.accuracyMinShots = config.accuracyMinShots;
    settings.historyWindow = config.awardHistoryWindow;
    return settings;
}

} // namespace

World::World(SimulationConfig config, MapGeometry map)
    : config_(config),
      map_(std::move(map)),
      awards_(awardSettings(config_)),
      rng_(config_.rngSeed) {
    match_.fragLimit = config_.fragLimit;
    match_.timeLimit = config_.timeLimit;

    for (const auto& placement : map_.items) {
        auto spawned = SpawnItem(placement.kind, placement.position);
        if (!spawned) {
            ARENA_LOG_WARN(LogCategory::World,
                           "skipping map item: " + std::string(spawned.error().message()));
        }
    }

    ARENA_LOG_INFO(LogCategory::World,
                   "world created: " + std::to_string(map_.spawnPoints.size()) +
                       " spawn points, " + std::to_string(items_.Size()) + " items, " +
                       std::to_string(config_.tickRate) + " Hz");
}

// ── Population ──────────────────────────────────────────────────────────

GameResult<PlayerId> World::AddPlayer(std::string name) {
    if (players_.Size() >= config_.maxPlayers) {
        return GameResult<PlayerId>::err(
            GameError(ErrorCode::PlayerLimitReached,
                      "player limit reached (" + std::to_string(config_.maxPlayers) + ")"));
    }
    if (map_.spawnPoints.empty()) {
        return GameResult<PlayerId>::err(
            GameError(ErrorCode::NoSpawnPoints, "map has no spawn points"));
    }

    const PlayerId id(nextPlayerId_++);
    Player player;
    player.id = id;
    player.name = std::move(name);
    const Vector3 spawn = selectSpawnPoint(id);
    PlayerSystem::Spawn(player, spawn, config_.spawnMachineGunAmmo);

    LogContext ctx;
    ctx.playerId = id;
    ctx.extra["name"] = player.name;
    players_.Emplace(id, std::move(player));
    queueTelefragCheck(id, spawn);

    ARENA_LOG_CTX(LogLevel::Info, LogCategory::World, "player joined", ctx);
    return GameResult<PlayerId>::ok(id);
}

GameResult<void> World::RemovePlayer(PlayerId id) {
    if (!players_.Erase(id)) {
        return GameResult<void>::err(
            GameError(ErrorCode::PlayerNotFound, "unknown player", id));
    }
    awards_.Forget(id);
    std::erase_if(pendingTelefrags_,
                  [id](const PendingTelefrag& pending) { return pending.player == id; });

    LogContext ctx;
    ctx.playerId = id;
    ARENA_LOG_CTX(LogLevel::Info, LogCategory::World, "player left", ctx);
    return GameResult<void>::ok();
}

GameResult<ItemId> World::SpawnItem(ItemKind kind, const Vector3& position) {
    if (!position.IsFinite() || !map_.bounds.Contains(position)) {
        return GameResult<ItemId>::err(
            GameError(ErrorCode::InvalidGeometry,
                      std::string(itemKindName(kind)) + " placed outside the bounds"));
    }
    const ItemId id(nextItemId_++);
    Item item;
    item.id = id;
    item.kind = kind;
    item.position = position;
    items_.Emplace(id, item);
    return GameResult<ItemId>::ok(id);
}

// ── Control ─────────────────────────────────────────────────────────────

GameResult<void> World::SetIntent(PlayerId id, const PlayerIntent& intent) {
    auto* player = players_.Find(id);
    if (player == nullptr) {
        return GameResult<void>::err(
            GameError(ErrorCode::PlayerNotFound, "unknown player", id));
    }
    player->intent = intent;
    return GameResult<void>::ok();
}

GameResult<void> World::TeleportPlayer(PlayerId id, const Vector3& destination) {
    auto* player = players_.Find(id);
    if (player == nullptr) {
        return GameResult<void>::err(
            GameError(ErrorCode::PlayerNotFound, "unknown player", id));
    }
    if (!player->IsAlive()) {
        return GameResult<void>::err(
            GameError(ErrorCode::InvalidArgument, "cannot teleport a dead player", id));
    }
    if (!destination.IsFinite() || !map_.bounds.Contains(destination)) {
        return GameResult<void>::err(
            GameError(ErrorCode::InvalidGeometry, "teleport destination outside the bounds"));
    }
    PlayerSystem::Teleport(*player, destination);
    queueTelefragCheck(id, destination);
    return GameResult<void>::ok();
}

void World::queueTelefragCheck(PlayerId id, const Vector3& position) {
    pendingTelefrags_.push_back(PendingTelefrag{id, position});
}

Vector3 World::selectSpawnPoint(PlayerId spawning) const {
    // Furthest from the nearest living opponent; first listed point wins ties.
    std::size_t best = 0;
    float bestDistance = -1.0f;
    for (std::size_t i = 0; i < map_.spawnPoints.size(); ++i) {
        float nearest = std::numeric_limits<float>::max();
        for (const auto& other : players_) {
            if (other.id == spawning || !other.IsAlive()) {
                continue;
            }
            nearest = std::min(nearest, map_.spawnPoints[i].DistanceTo(other.position));
        }
        if (nearest > bestDistance) {
            bestDistance = nearest;
            best = i;
        }
    }
    return map_.spawnPoints[best];
}

// ── Tick ────────────────────────────────────────────────────────────────

GameResult<TickEvents> World::Tick() {
    if (match_.IsOver()) {
        return GameResult<TickEvents>::err(
            GameError(ErrorCode::MatchOver,
                      "match ended: " + std::string(matchEndReasonName(match_.endReason))));
    }

    TickContext ctx;
    ctx.dt = config_.TickInterval();
    ++match_.tick;
    match_.elapsed = static_cast<float>(match_.tick) * ctx.dt;
    ctx.now = match_.elapsed;
    ctx.events.tick = match_.tick;
    ctx.events.time = ctx.now;

    respawnPlayers(ctx);
    applyIntents(ctx);
    fireWeapons(ctx);
    simulateProjectiles(ctx);
    resolveCombat(ctx);
    updateItems(ctx);
    updateAwards(ctx);
    checkMatchEnd(ctx);

    ctx.events.audio = ctx.audio.Drain();
    return GameResult<TickEvents>::ok(std::move(ctx.events));
}

void World::respawnPlayers(TickContext& ctx) {
    for (auto id : players_.SortedIds()) {
        auto* player = players_.Find(id);
        if (player->IsAlive() || ctx.now < player->respawnAt) {
            continue;
        }
        const Vector3 spawn = selectSpawnPoint(id);
        PlayerSystem::Spawn(*player, spawn, config_.spawnMachineGunAmmo);
        queueTelefragCheck(id, spawn);

        ctx.audio.Push(audioAt(AudioEventKind::Respawn, spawn, id));
        auto visual = visualAt(VisualEventKind::Spawn, spawn, 0.0f);
        visual.player = id;
        ctx.events.visual.push_back(visual);

        LogContext log;
        log.playerId = id;
        log.tick = match_.tick;
        ARENA_LOG_CTX(LogLevel::Debug, LogCategory::World, "player respawned", log);
    }
}

void World::applyIntents(TickContext& ctx) {
    PlayerSystem system(players_, map_.bounds);
    auto result = system.Execute(ctx.dt, ctx.now);

    for (const auto& motion : result.events) {
        switch (motion.kind) {
            case PlayerMotionKind::Jump:
                ctx.audio.Push(audioAt(AudioEventKind::PlayerJump, motion.position, motion.player));
                break;
            case PlayerMotionKind::Land:
                ctx.audio.Push(audioAt(AudioEventKind::PlayerLand, motion.position, motion.player));
                break;
            case PlayerMotionKind::WeaponSwitch: {
                auto event = audioAt(AudioEventKind::WeaponSwitch, motion.position, motion.player);
                event.weapon = motion.weapon;
                ctx.audio.Push(event);
                break;
            }
        }
    }
}

void World::fireWeapons(TickContext& ctx) {
    for (auto id : players_.SortedIds()) {
        auto* player = players_.Find(id);
        if (player->IsAlive()) {
            fireWeapon(*player, ctx);
        }
        player->firePressedLastTick = player->intent.fire;
    }
}

std::vector<HitscanTarget> World::hitscanTargets(PlayerId shooter) const {
    std::vector<HitscanTarget> targets;
    targets.reserve(players_.Size());
    for (auto id : players_.SortedIds()) {
        const auto* player = players_.Find(id);
        if (id == shooter || !player->IsAlive()) {
            continue;
        }
        targets.push_back(HitscanTarget{id, player->position, player->IsAirborne()});
    }
    return targets;
}

void World::fireWeapon(Player& player, TickContext& ctx) {
    if (!player.intent.fire) {
        return;
    }

    Vector3 aimDir = player.intent.aim;
    if (aimDir.LengthSquared() < 1e-6f || !aimDir.IsFinite()) {
        aimDir = Vector3{0.0f, 0.0f, 1.0f};
    }
    const WeaponKind weapon = player.heldWeapon;
    const Vector3 eye = player.EyePosition();
    auto outcome = WeaponCatalog::Fire(player, weapon, Ray::Make(eye, aimDir, 0.0f), ctx.now, rng_);

    if (const auto* rejected = std::get_if<NotFired>(&outcome)) {
        if (rejected->reason == FireRejection::NoAmmo && !player.firePressedLastTick) {
            auto event = audioAt(AudioEventKind::NoAmmo, eye, player.id);
            event.weapon = weapon;
            ctx.audio.Push(event);
        }
        return;
    }

    auto fired = audioAt(AudioEventKind::WeaponFire, eye, player.id);
    fired.weapon = weapon;
    fired.quad = player.HasPowerup(PowerupKind::Quad);
    ctx.audio.Push(fired);

    if (const auto* shot = std::get_if<HitscanFire>(&outcome)) {
        const auto targets = hitscanTargets(player.id);
        auto result = HitscanResolver::Resolve(*shot, player.id, weapon, targets, map_.bounds);

        for (const auto& trace : result.traces) {
            switch (weapon) {
                case WeaponKind::Railgun: {
                    auto beam = visualAt(VisualEventKind::RailTrail, eye, kRailTrailLifetime);
                    beam.end = trace.endPoint;
                    beam.player = player.id;
                    ctx.events.visual.push_back(beam);
                    break;
                }
                case WeaponKind::Lightning: {
                    auto beam = visualAt(VisualEventKind::LightningBeam, eye, kLightningBeamLifetime);
                    beam.end = trace.endPoint;
                    beam.player = player.id;
                    ctx.events.visual.push_back(beam);
                    break;
                }
                case WeaponKind::MachineGun:
                case WeaponKind::Shotgun:
                    if (trace.hitGeometry) {
                        ctx.events.visual.push_back(
                            visualAt(VisualEventKind::BulletImpact, trace.endPoint, kImpactLifetime));
                    }
                    break;
                default:
                    break;
            }
        }

        if (!result.events.empty()) {
            ++player.shotsHit;
        }
        ctx.pendingHits.insert(ctx.pendingHits.end(), result.events.begin(), result.events.end());
        return;
    }

    if (const auto* shot = std::get_if<ProjectileFire>(&outcome)) {
        const ProjectileId id = allocateProjectileId();
        ctx.newProjectiles.push_back(ProjectileSystem::Spawn(id, player.id, weapon, *shot, ctx.now));

        LogContext log;
        log.playerId = player.id;
        log.projectileId = id;
        log.tick = match_.tick;
        ARENA_LOG_CTX(LogLevel::Debug, LogCategory::Weapon, "projectile fired", log);
    }
}

ProjectileId World::allocateProjectileId() {
    if (freeProjectileIds_.empty()) {
        return ProjectileId(nextProjectileId_++);
    }
    // Kept sorted descending: the lowest free id is reused first.
    const ProjectileId id = freeProjectileIds_.back();
    freeProjectileIds_.pop_back();
    return id;
}

void World::simulateProjectiles(TickContext& ctx) {
    const auto before = projectiles_.SortedIds();

    ProjectileSystem system(projectiles_, players_, map_.bounds);
    auto result = system.Execute(ctx.dt, ctx.now);

    for (auto id : before) {
        if (!projectiles_.Contains(id)) {
            freeProjectileIds_.push_back(id);
        }
    }
    std::sort(freeProjectileIds_.begin(), freeProjectileIds_.end(), std::greater<>());

    for (const auto& at : result.bounces) {
        ctx.audio.Push(audioAt(AudioEventKind::GrenadeBounce, at));
    }
    for (const auto& at : result.smokePuffs) {
        ctx.events.visual.push_back(visualAt(VisualEventKind::RocketSmoke, at, kSmokePuffLifetime));
    }

    for (const auto& detonation : result.detonations) {
        auto boom = audioAt(AudioEventKind::Explosion, detonation.position);
        boom.weapon = detonation.weapon;
        ctx.audio.Push(boom);
        auto flash = visualAt(VisualEventKind::Explosion, detonation.position, kImpactLifetime);
        flash.radius = detonation.splashRadius;
        ctx.events.visual.push_back(flash);

        bool hitOther = false;
        auto makeEvent = [&](PlayerId victim, int32_t damage, float distance) {
            CombatEvent event;
            event.attacker = detonation.owner;
            event.victim = victim;
            event.rawDamage = damage;
            event.hitPosition = detonation.position;
            event.weapon = detonation.weapon;
            event.flags.splash = true;
            event.distance = distance;
            if (const auto* target = players_.Find(victim)) {
                event.flags.midAir = target->IsAirborne();
            }
            hitOther = hitOther || victim != detonation.owner;
            ctx.pendingHits.push_back(event);
        };

        // The direct victim takes the full base damage.
        if (detonation.directVictim) {
            makeEvent(*detonation.directVictim, detonation.damage, 0.0f);
        }
        for (const auto& target : CollisionEngine::SplashTargets(
                 players_, detonation.position, detonation.splashRadius, detonation.damage)) {
            if (target.player != detonation.directVictim) {
                makeEvent(target.player, target.damage, target.distance);
            }
        }

        if (hitOther) {
            if (auto* owner = players_.Find(detonation.owner)) {
                ++owner->shotsHit;
            }
        }
    }

    for (auto& projectile : ctx.newProjectiles) {
        const auto id = projectile.id;
        projectiles_.Emplace(id, std::move(projectile));
    }
    ctx.newProjectiles.clear();
}

void World::resolveCombat(TickContext& ctx) {
    std::vector<CombatEvent> telefrags;
    for (const auto& pending : pendingTelefrags_) {
        const auto* arriving = players_.Find(pending.player);
        if (arriving == nullptr || !arriving->IsAlive()) {
            continue;
        }
        for (auto id : players_.SortedIds()) {
            const auto* other = players_.Find(id);
            if (id == pending.player || !other->IsAlive()) {
                continue;
            }
            if (CollisionEngine::SpheresOverlap(pending.position, kPlayerRadius,
                                                other->position, kPlayerRadius)) {
                CombatEvent event;
                event.attacker = pending.player;
                event.victim = id;
                event.rawDamage = kTelefragDamage;
                event.hitPosition = pending.position;
                event.flags.telefrag = true;
                telefrags.push_back(event);
                ctx.audio.Push(audioAt(AudioEventKind::Telefrag, pending.position, id));
            }
        }
    }
    pendingTelefrags_.clear();

    for (const auto& event : telefrags) {
        applyHit(event, ctx);
    }
    for (const auto& event : ctx.pendingHits) {
        applyHit(event, ctx);
    }
    ctx.pendingHits.clear();
}

void World::applyHit(const CombatEvent& event, TickContext& ctx) {
    auto* victim = players_.Find(event.victim);
    if (victim == nullptr || !victim->IsAlive()) {
        return;
    }
    Player* attacker = event.attacker ? players_.Find(*event.attacker) : nullptr;

    const auto result = CombatResolver::Resolve(event, attacker, *victim);
    CombatResolver::Apply(result, *victim);
    ctx.events.combat.push_back(event);

    if (attacker != nullptr && attacker != victim && !result.telefrag) {
        auto confirm = audioAt(AudioEventKind::PlayerHit, attacker->position, attacker->id);
        confirm.damage = result.applied;
        ctx.audio.Push(confirm);
    }

    if (!result.killed) {
        auto pain = audioAt(AudioEventKind::PlayerPain, victim->position, victim->id);
        pain.painLevel = painLevelFor(victim->health);
        ctx.audio.Push(pain);
        return;
    }

    const Vector3 deathSpot = victim->position;
    PlayerSystem::Kill(*victim, ctx.now, config_.respawnDelay);

    KillRecord kill;
    if (attacker != nullptr) {
        kill.killer = attacker->id;
    }
    kill.victim = event.victim;
    kill.weapon = event.weapon;
    kill.time = ctx.now;
    kill.gibbed = result.gibbed;
    kill.telefrag = result.telefrag;
    kill.midAir = event.flags.midAir;
    kill.splash = event.flags.splash;
    if (kill.IsFrag()) {
        ++attacker->frags;
    }
    ctx.events.kills.push_back(kill);

    if (result.gibbed) {
        ctx.audio.Push(audioAt(AudioEventKind::PlayerGib, deathSpot, event.victim));
        auto gib = visualAt(VisualEventKind::Gib, deathSpot, kImpactLifetime);
        gib.player = event.victim;
        ctx.events.visual.push_back(gib);
    } else {
        ctx.audio.Push(audioAt(AudioEventKind::PlayerDeath, deathSpot, event.victim));
    }

    LogContext log;
    log.playerId = event.victim;
    log.attackerId = kill.killer;
    log.tick = match_.tick;
    log.extra["damage"] = std::to_string(result.applied);
    log.extra["weapon"] = event.weapon ? std::string(weaponKindName(*event.weapon))
                                       : std::string(result.telefrag ? "telefrag" : "world");
    ARENA_LOG_CTX(LogLevel::Debug, LogCategory::Combat, "player killed", log);
}

void World::updateItems(TickContext& ctx) {
    ItemSystem system(items_, players_);
    auto result = system.Execute(ctx.dt, ctx.now);

    for (const auto& pickup : result.pickups) {
        auto event = audioAt(pickupSound(pickup.kind), pickup.position, pickup.player);
        event.item = pickup.kind;
        event.weapon = itemWeapon(pickup.kind);
        event.powerup = itemPowerup(pickup.kind);
        ctx.audio.Push(event);
    }
    for (auto id : result.respawned) {
        const auto* item = items_.Find(id);
        auto event = audioAt(AudioEventKind::ItemRespawn, item->position);
        event.item = item->kind;
        ctx.audio.Push(event);
        auto visual = visualAt(VisualEventKind::ItemRespawn, item->position, 0.0f);
        visual.item = item->kind;
        ctx.events.visual.push_back(visual);
    }
    for (const auto& expiry : result.expired) {
        const auto* player = players_.Find(expiry.player);
        auto event = audioAt(AudioEventKind::PowerupExpire, player->position, expiry.player);
        event.powerup = expiry.powerup;
        ctx.audio.Push(event);
    }
}

void World::updateAwards(TickContext& ctx) {
    auto granted = awards_.ProcessKills(ctx.events.kills);

    for (auto id : players_.SortedIds()) {
        const auto* player = players_.Find(id);
        if (auto accuracy = awards_.CheckAccuracy(id, player->shotsFired, player->shotsHit, ctx.now)) {
            granted.push_back(*accuracy);
        }
    }
    awards_.Prune(ctx.now);

    for (const auto& award : granted) {
        const auto* player = players_.Find(award.player);
        auto event = audioAt(AudioEventKind::Award,
                             player != nullptr ? player->position : Vector3::Zero(), award.player);
        event.award = award.kind;
        ctx.audio.Push(event);
        ctx.events.awards.push_back(award);
    }
}

void World::checkMatchEnd(TickContext& ctx) {
    int32_t topFrags = 0;
    for (const auto& player : players_) {
        topFrags = std::max(topFrags, player.frags);
    }
    if (!match_.CheckEnd(topFrags)) {
        return;
    }

    ctx.events.matchEnded = true;
    ctx.events.endReason = match_.endReason;

    std::vector<std::pair<PlayerId, int32_t>> deaths;
    for (auto id : players_.SortedIds()) {
        deaths.emplace_back(id, players_.Find(id)->deaths);
    }
    for (const auto& award : awards_.EvaluateMatchEnd(deaths, ctx.now)) {
        auto event = audioAt(AudioEventKind::Award, players_.Find(award.player)->position,
                             award.player);
        event.award = award.kind;
        ctx.audio.Push(event);
        ctx.events.awards.push_back(award);
    }

    ARENA_LOG_INFO(LogCategory::World,
                   "match ended (" + std::string(matchEndReasonName(match_.endReason)) +
                       ") at " + std::to_string(ctx.now) + "s, top frags " +
                       std::to_string(topFrags));
}

} // namespace arena::game
