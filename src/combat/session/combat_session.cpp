/// @file combat_session.cpp
/// @brief CombatSession implementation: initiative, action dispatch,
///        turn advancement and terminal checks.

#include "cce/combat/combat_session.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <sstream>

#include "cce/foundation/game_logger.hpp"

namespace cce::combat {

using cce::foundation::ErrorCode;
using cce::foundation::GameError;
using cce::foundation::GameResult;
using cce::foundation::LogCategory;

std::string_view toString(CombatPhase phase) {
    switch (phase) {
        case CombatPhase::Preparation:   return "preparation";
        case CombatPhase::InProgress:    return "in_progress";
        case CombatPhase::PlayerVictory: return "player_victory";
        case CombatPhase::EnemyVictory:  return "enemy_victory";
        case CombatPhase::Escaped:       return "escaped";
        case CombatPhase::Aborted:       return "aborted";
    }
    return "unknown";
}

std::string_view toString(CombatAction action) {
    switch (action) {
        case CombatAction::Attack:  return "attack";
        case CombatAction::Defend:  return "defend";
        case CombatAction::Escape:  return "escape";
        case CombatAction::Special: return "special";
    }
    return "unknown";
}

CombatSession::CombatSession(WeaponRegistry& registry,
                             ProgressionEngine& progression,
                             foundation::RandomSource& rng,
                             CombatLog& log,
                             Combatant player,
                             std::vector<Combatant> enemies)
    : registry_(registry),
      progression_(progression),
      rng_(rng),
      log_(log),
      balance_(registry.Balance()) {
    player.isPlayer = true;
    participants_.reserve(enemies.size() + 1);
    participants_.push_back(std::move(player));
    for (auto& enemy : enemies) {
        enemy.isPlayer = false;
        participants_.push_back(std::move(enemy));
    }
}

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------

GameResult<void> CombatSession::Start() {
    if (phase_ != CombatPhase::Preparation) {
        return GameResult<void>::err(GameError(
            ErrorCode::InvalidCombatState,
            "cannot start a combat in phase " + std::string(toString(phase_))));
    }
    if (participants_.size() < 2) {
        return GameResult<void>::err(GameError(
            ErrorCode::InvalidCombatState, "combat needs at least one enemy"));
    }

    std::vector<int32_t> scores(participants_.size());
    initiativeScores_.clear();
    for (std::size_t i = 0; i < participants_.size(); ++i) {
        const auto& p = participants_[i];
        scores[i] = p.InitiativeBase() + rng_.uniformInt(1, balance_.initiativeRollMax);
        initiativeScores_[p.id] = scores[i];
    }

    order_.resize(participants_.size());
    std::iota(order_.begin(), order_.end(), std::size_t{0});
    std::stable_sort(order_.begin(), order_.end(),
                     [&scores](std::size_t a, std::size_t b) { return scores[a] > scores[b]; });

    std::ostringstream line;
    line << "Initiative order: ";
    for (std::size_t i = 0; i < order_.size(); ++i) {
        const auto& p = participants_[order_[i]];
        line << (i > 0 ? ", " : "") << p.name << " (" << scores[order_[i]] << ")";
    }
    log_.append(LogCategory::Combat, line.str());

    phase_ = CombatPhase::InProgress;
    turn_ = 1;
    cursor_ = 0;
    log_.append(LogCategory::Combat, "Combat started! Turn " + std::to_string(turn_));

    checkTerminal();
    if (phase_ == CombatPhase::InProgress && !participants_[order_[cursor_]].IsAlive()) {
        advanceTurn();
    } else if (phase_ == CombatPhase::InProgress) {
        log_.append(LogCategory::Combat, "It is " + participants_[order_[cursor_]].name + "'s turn");
    }
    CCE_LOG_INFO(LogCategory::Combat,
                 "combat started with " + std::to_string(participants_.size()) + " participants");
    return GameResult<void>::ok();
}

GameResult<void> CombatSession::NextTurn() {
    if (phase_ != CombatPhase::InProgress) {
        return GameResult<void>::err(GameError(
            ErrorCode::CombatNotInProgress,
            "combat is " + std::string(toString(phase_))));
    }
    advanceTurn();
    return GameResult<void>::ok();
}

GameResult<void> CombatSession::Abort() {
    if (isTerminal(phase_)) {
        return GameResult<void>::err(GameError(
            ErrorCode::InvalidCombatState,
            "combat already ended (" + std::string(toString(phase_)) + ")"));
    }
    phase_ = CombatPhase::Aborted;
    log_.append(LogCategory::Combat, "Combat aborted");
    return GameResult<void>::ok();
}

// ---------------------------------------------------------------------------
// Actions
// ---------------------------------------------------------------------------

GameResult<ActionOutcome> CombatSession::PerformAction(
    const std::string& actorId,
    CombatAction action,
    const std::optional<std::string>& targetId,
    const std::optional<foundation::EffectId>& effectId) {
    using Result = GameResult<ActionOutcome>;

    if (phase_ != CombatPhase::InProgress) {
        return Result::err(GameError(ErrorCode::CombatNotInProgress,
                                     "combat is " + std::string(toString(phase_))));
    }
    auto* actor = FindParticipant(actorId);
    if (actor == nullptr) {
        return Result::err(GameError(ErrorCode::UnknownParticipant,
                                     "unknown participant '" + actorId + "'"));
    }
    if (!actor->IsAlive()) {
        return Result::err(GameError(ErrorCode::NotActorsTurn,
                                     actor->name + " is defeated and cannot act"));
    }
    bool isCurrent = &participants_[order_[cursor_]] == actor;
    if (!isCurrent && action != CombatAction::Defend) {
        return Result::err(GameError(
            ErrorCode::NotActorsTurn,
            "it is " + participants_[order_[cursor_]].name + "'s turn, not " + actor->name + "'s"));
    }

    Result result = Result::err(GameError(ErrorCode::InvalidArgument, "unhandled action"));
    switch (action) {
        case CombatAction::Attack: {
            auto target = opponentTarget(*actor, targetId, true);
            if (target.hasError()) {
                return Result::err(target.error());
            }
            result = attack(*actor, *target.value());
            break;
        }
        case CombatAction::Special: {
            auto target = opponentTarget(*actor, targetId, false);
            if (target.hasError()) {
                return Result::err(target.error());
            }
            result = special(*actor, target.value(), effectId);
            break;
        }
        case CombatAction::Defend:
            result = Result::ok(defend(*actor));
            break;
        case CombatAction::Escape:
            if (!actor->isPlayer) {
                return Result::err(GameError(ErrorCode::InvalidCombatState,
                                             "only the player can escape"));
            }
            result = Result::ok(escape(*actor));
            break;
    }

    if (result.hasError()) {
        log_.append(LogCategory::Combat, std::string(result.error().message()));
        return result;
    }

    if (action != CombatAction::Attack && action != CombatAction::Special) {
        consecutiveHits_[actor->id] = 0;
    }

    log_.append(LogCategory::Combat, result.value().message);
    if (result.value().success && isCurrent && phase_ == CombatPhase::InProgress) {
        advanceTurn();
    } else {
        checkTerminal();
    }
    return result;
}

GameResult<ActionOutcome> CombatSession::attack(Combatant& actor, Combatant& target) {
    auto* weapon = equippedWeapon(actor);
    if (weapon != nullptr) {
        auto ctx = buildContext(actor, &target);
        auto check = registry_.CheckActivation(weapon->Key(), ctx);
        if (check.IsEligible()) {
            auto fired = registry_.Trigger(weapon->Key(), check.eligibleEffects.front(), ctx);
            if (fired.hasError()) {
                log_.append(LogCategory::Combat,
                            "Special effect failed: " + std::string(fired.error().message()));
            } else if (!fired.value().outcome.success) {
                log_.append(LogCategory::Combat,
                            "Special effect failed: " + fired.value().outcome.message);
            } else {
                const auto& effect = fired.value().outcome;
                grantOutcomeExperience(*weapon, effect);
                consecutiveHits_[actor.id] += effect.totalDamage > 0 ? 1 : 0;
                auto outcome = fromEffect(CombatAction::Attack, effect);
                outcome.targetId = target.id;
                outcome.targetHealth = target.health;
                return GameResult<ActionOutcome>::ok(std::move(outcome));
            }
        }
    }
    return GameResult<ActionOutcome>::ok(standardAttack(actor, target));
}

ActionOutcome CombatSession::standardAttack(Combatant& actor, Combatant& target) {
    auto* weapon = equippedWeapon(actor);

    int32_t baseDamage = actor.baseDamage;
    DamageType damageType = actor.damageType;
    double penetration = 0.0;
    double critChance = balance_.criticalChance + actor.ModifierTotal(ModifierKind::Stance);
    double critMultiplier = balance_.criticalMultiplier;
    if (weapon != nullptr) {
        const auto& stats = weapon->effective.stats;
        baseDamage = stats.baseDamage;
        damageType = stats.damageType;
        penetration = stats.armorPenetration;
        critChance += stats.criticalChance;
        critMultiplier += stats.criticalDamage;
    }

    ActionOutcome out;
    out.action = CombatAction::Attack;
    out.targetId = target.id;
    out.critical = rng_.chance(critChance);

    auto resistance = target.Resistance(damageType);
    auto damage = EffectResolver::CalculateDamage(0, 1.0, baseDamage, resistance, penetration);
    if (out.critical) {
        damage = std::max(1, static_cast<int32_t>(std::floor(damage * critMultiplier)));
    }
    if (target.HasModifier(ModifierKind::Defending)) {
        damage = std::max(1, static_cast<int32_t>(std::floor(damage * balance_.defendDamageFactor)));
    }

    bool wasAlive = target.IsAlive();
    out.damage = target.TakeDamage(damage);
    out.killed = wasAlive && !target.IsAlive();
    out.targetHealth = target.health;
    out.success = true;
    consecutiveHits_[actor.id] += 1;

    std::ostringstream msg;
    msg << actor.name << " attacks " << target.name << " for " << out.damage << " damage";
    if (out.critical) {
        msg << " (CRITICAL!)";
    }
    if (resistance > 0.0) {
        msg << " (" << target.name << " resists " << std::lround(resistance * 100) << "% "
            << toString(damageType) << ")";
    }
    if (out.killed) {
        msg << "; " << target.name << " is defeated";
    }
    out.message = msg.str();

    if (weapon != nullptr) {
        weapon->AddCharge(weapon->effective.stats.chargeRate);
        weapon->counters.damageDealt += out.damage;
        if (out.killed) {
            ++weapon->counters.kills;
        }
        if (out.critical) {
            ++weapon->counters.criticalHits;
        }
        progression_.GrantExperience(*weapon, ActionKind::DamageDealt, out.damage);
        if (out.killed) {
            progression_.GrantExperience(*weapon, ActionKind::Kill, balance_.killBaseExperience);
        }
        if (out.critical) {
            progression_.GrantExperience(*weapon, ActionKind::CriticalHit,
                                         balance_.criticalBaseExperience);
        }
    }
    return out;
}

GameResult<ActionOutcome> CombatSession::special(Combatant& actor, Combatant* target,
                                                 const std::optional<foundation::EffectId>& effectId) {
    using Result = GameResult<ActionOutcome>;

    auto* weapon = equippedWeapon(actor);
    if (weapon == nullptr) {
        return Result::err(GameError(ErrorCode::WeaponNotFound,
                                     actor.name + " has no special weapon equipped"));
    }

    auto ctx = buildContext(actor, target);
    foundation::EffectId chosen;
    if (effectId) {
        chosen = *effectId;
    } else {
        auto check = registry_.CheckActivation(weapon->Key(), ctx);
        if (!check.IsEligible()) {
            return Result::err(GameError(ErrorCode::NotEligible,
                                         weapon->effective.name + ": " + check.message));
        }
        chosen = check.eligibleEffects.front();
    }

    auto fired = registry_.Trigger(weapon->Key(), chosen, ctx);
    if (fired.hasError()) {
        return Result::err(fired.error());
    }

    const auto& effect = fired.value().outcome;
    if (effect.success) {
        grantOutcomeExperience(*weapon, effect);
        consecutiveHits_[actor.id] += effect.totalDamage > 0 ? 1 : 0;
    }
    auto outcome = fromEffect(CombatAction::Special, effect);
    if (target != nullptr) {
        outcome.targetId = target->id;
        outcome.targetHealth = target->health;
    }
    return Result::ok(std::move(outcome));
}

ActionOutcome CombatSession::defend(Combatant& actor) {
    auto& mods = actor.modifiers;
    mods.erase(std::remove_if(mods.begin(), mods.end(),
                              [](const TimedModifier& m) { return m.kind == ModifierKind::Defending; }),
               mods.end());

    TimedModifier guard;
    guard.id = "defend";
    guard.kind = ModifierKind::Defending;
    guard.value = balance_.defendDamageFactor;
    guard.startTime = turn_;
    guard.endTime = turn_;
    mods.push_back(std::move(guard));

    ActionOutcome out;
    out.action = CombatAction::Defend;
    out.success = true;
    out.message = actor.name + " takes a defensive stance";
    return out;
}

ActionOutcome CombatSession::escape(Combatant& actor) {
    double chance = balance_.escapeBaseChance;
    if (livingEnemyCount() > balance_.escapeCrowdThreshold) {
        chance -= balance_.escapeCrowdPenalty;
    }

    ActionOutcome out;
    out.action = CombatAction::Escape;
    if (rng_.chance(chance)) {
        phase_ = CombatPhase::Escaped;
        out.success = true;
        out.message = actor.name + " escaped from combat";
    } else {
        out.success = false;
        out.message = actor.name + " failed to escape";
    }
    return out;
}

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

GameResult<Combatant*> CombatSession::opponentTarget(const Combatant& actor,
                                                     const std::optional<std::string>& targetId,
                                                     bool required) {
    using Result = GameResult<Combatant*>;
    if (!targetId) {
        if (required) {
            return Result::err(GameError(ErrorCode::MissingTarget,
                                         actor.name + " needs a target"));
        }
        return Result::ok(nullptr);
    }
    auto* target = FindParticipant(*targetId);
    if (target == nullptr) {
        return Result::err(GameError(ErrorCode::UnknownParticipant,
                                     "unknown participant '" + *targetId + "'"));
    }
    if (target->isPlayer == actor.isPlayer) {
        return Result::err(GameError(ErrorCode::InvalidTarget,
                                     target->name + " is not an opponent of " + actor.name));
    }
    if (!target->IsAlive()) {
        return Result::err(GameError(ErrorCode::InvalidTarget,
                                     target->name + " is already defeated"));
    }
    return Result::ok(target);
}

EffectContext CombatSession::buildContext(Combatant& actor, Combatant* primary) {
    EffectContext ctx;
    ctx.time = turn_;
    ctx.consecutiveHits = consecutiveHits_[actor.id];
    ctx.isCritical = rng_.chance(balance_.criticalChance);
    ctx.minStatusChance = balance_.minStatusChance;
    ctx.actor = &actor;

    auto opponents = livingOpponents(actor);
    ctx.enemyCount = static_cast<int32_t>(opponents.size());
    if (primary != nullptr) {
        ctx.targets.push_back(primary);
    }
    for (auto* candidate : opponents) {
        if (candidate != primary) {
            ctx.targets.push_back(candidate);
        }
    }
    if (!ctx.targets.empty()) {
        const auto& anchor = ctx.targets.front()->id;
        ctx.distances[anchor] = 0.0;
        for (const auto* candidate : ctx.targets) {
            auto it = distances_.find({anchor, candidate->id});
            if (it != distances_.end()) {
                ctx.distances[candidate->id] = it->second;
            }
        }
    }
    return ctx;
}

WeaponInstance* CombatSession::equippedWeapon(const Combatant& actor) {
    if (!actor.isPlayer || !actor.equippedWeapon) {
        return nullptr;
    }
    return registry_.FindInstance(WeaponKey{actor.playerId, *actor.equippedWeapon});
}

std::vector<Combatant*> CombatSession::livingOpponents(const Combatant& actor) {
    std::vector<Combatant*> out;
    for (auto& p : participants_) {
        if (p.isPlayer != actor.isPlayer && p.IsAlive()) {
            out.push_back(&p);
        }
    }
    return out;
}

int32_t CombatSession::livingEnemyCount() const {
    return static_cast<int32_t>(std::count_if(
        participants_.begin(), participants_.end(),
        [](const Combatant& p) { return !p.isPlayer && p.IsAlive(); }));
}

ActionOutcome CombatSession::fromEffect(CombatAction action, const EffectOutcome& effect) {
    ActionOutcome out;
    out.action = action;
    out.success = effect.success;
    out.message = effect.message;
    out.damage = effect.totalDamage;
    out.killed = effect.kills > 0;
    out.effect = effect;
    return out;
}

void CombatSession::grantOutcomeExperience(WeaponInstance& weapon, const EffectOutcome& effect) {
    if (effect.totalDamage > 0) {
        progression_.GrantExperience(weapon, ActionKind::DamageDealt, effect.totalDamage);
    }
    if (effect.kills > 0) {
        progression_.GrantExperience(weapon, ActionKind::Kill,
                                     effect.kills * balance_.killBaseExperience);
    }
}

void CombatSession::SetDistance(const std::string& a, const std::string& b, double distance) {
    distances_[{a, b}] = distance;
    distances_[{b, a}] = distance;
}

std::vector<std::string> CombatSession::InitiativeOrder() const {
    std::vector<std::string> ids;
    ids.reserve(order_.size());
    for (auto index : order_) {
        ids.push_back(participants_[index].id);
    }
    return ids;
}

const Combatant* CombatSession::CurrentActor() const {
    if (phase_ != CombatPhase::InProgress || order_.empty()) {
        return nullptr;
    }
    return &participants_[order_[cursor_]];
}

Combatant* CombatSession::FindParticipant(const std::string& id) {
    auto it = std::find_if(participants_.begin(), participants_.end(),
                           [&id](const Combatant& p) { return p.id == id; });
    return it != participants_.end() ? &*it : nullptr;
}

const Combatant* CombatSession::FindParticipant(const std::string& id) const {
    auto it = std::find_if(participants_.begin(), participants_.end(),
                           [&id](const Combatant& p) { return p.id == id; });
    return it != participants_.end() ? &*it : nullptr;
}

// ---------------------------------------------------------------------------
// Turn flow
// ---------------------------------------------------------------------------

void CombatSession::advanceTurn() {
    for (std::size_t step = 0; step < order_.size(); ++step) {
        cursor_ = (cursor_ + 1) % order_.size();
        if (cursor_ == 0) {
            beginNewTurn();
        }
        if (participants_[order_[cursor_]].IsAlive()) {
            break;
        }
    }

    checkTerminal();
    if (phase_ == CombatPhase::InProgress) {
        log_.append(LogCategory::Combat, "It is " + participants_[order_[cursor_]].name + "'s turn");
    }
}

void CombatSession::beginNewTurn() {
    ++turn_;
    log_.append(LogCategory::Combat, "===== Turn " + std::to_string(turn_) + " =====");

    for (auto& p : participants_) {
        if (!p.IsAlive()) {
            continue;
        }
        for (const auto& [type, status] : p.statuses) {
            if (!isDamageOverTime(type)) {
                continue;
            }
            auto lost = p.TakeDamage(status.strength * balance_.dotDamagePerStrength);
            log_.append(LogCategory::Effect,
                        p.name + " suffers " + std::to_string(lost) + " "
                            + std::string(toString(type)) + " damage");
            if (!p.IsAlive()) {
                log_.append(LogCategory::Combat, p.name + " is defeated");
                break;
            }
        }

        std::vector<std::string> expiring;
        for (const auto& [type, status] : p.statuses) {
            if (status.endTime <= turn_) {
                expiring.emplace_back(toString(type));
            }
        }
        for (const auto& mod : p.modifiers) {
            if (mod.endTime <= turn_) {
                expiring.emplace_back(toString(mod.kind));
            }
        }
        if (p.ExpireTimed(turn_) > 0) {
            std::ostringstream line;
            line << "Expired on " << p.name << ":";
            for (const auto& name : expiring) {
                line << " " << name;
            }
            log_.append(LogCategory::Effect, line.str());
        }
    }

    for (const auto& ended : registry_.Tick(turn_)) {
        log_.append(LogCategory::Effect,
                    "Effect " + ended.snapshot.name + " from " + ended.weaponId + " ended");
    }
}

void CombatSession::checkTerminal() {
    if (phase_ != CombatPhase::InProgress) {
        return;
    }
    if (!participants_.front().IsAlive()) {
        phase_ = CombatPhase::EnemyVictory;
        log_.append(LogCategory::Combat, participants_.front().name + " has been defeated!");
        CCE_LOG_INFO(LogCategory::Combat, "combat ended: enemy victory on turn " + std::to_string(turn_));
        return;
    }
    if (livingEnemyCount() == 0) {
        phase_ = CombatPhase::PlayerVictory;
        log_.append(LogCategory::Combat, "All enemies defeated!");
        CCE_LOG_INFO(LogCategory::Combat, "combat ended: player victory on turn " + std::to_string(turn_));
    }
}

SessionStatus CombatSession::GetStatus() const {
    SessionStatus status;
    status.phase = phase_;
    status.turn = turn_;
    if (const auto* actor = CurrentActor()) {
        status.currentActor = actor->id;
    }
    for (const auto& p : participants_) {
        ParticipantStatus ps;
        ps.id = p.id;
        ps.name = p.name;
        ps.isPlayer = p.isPlayer;
        ps.health = p.health;
        ps.maxHealth = p.maxHealth;
        for (const auto& [type, record] : p.statuses) {
            ps.statuses.push_back(type);
        }
        for (const auto& mod : p.modifiers) {
            ps.modifiers.push_back(mod.kind);
        }
        status.participants.push_back(std::move(ps));
    }
    status.recentLog = log_.tail(balance_.statusLogTail);
    return status;
}

}  // namespace cce::combat
