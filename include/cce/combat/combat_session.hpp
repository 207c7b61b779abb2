#pragma once

/// @file combat_session.hpp
/// @brief Turn-based battle state machine driving weapons, effects and progression.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "cce/combat/balance_config.hpp"
#include "cce/combat/combat_log.hpp"
#include "cce/combat/combatant.hpp"
#include "cce/combat/effect_resolver.hpp"
#include "cce/combat/progression_engine.hpp"
#include "cce/combat/weapon_registry.hpp"
#include "cce/foundation/game_result.hpp"
#include "cce/foundation/random_source.hpp"

namespace cce::combat {

/// Preparation -> InProgress -> one of the terminal phases.
enum class CombatPhase : uint8_t {
    Preparation,
    InProgress,
    PlayerVictory,
    EnemyVictory,
    Escaped,
    Aborted
};

std::string_view toString(CombatPhase phase);

[[nodiscard]] constexpr bool isTerminal(CombatPhase phase) {
    return phase != CombatPhase::Preparation && phase != CombatPhase::InProgress;
}

enum class CombatAction : uint8_t { Attack, Defend, Escape, Special };

std::string_view toString(CombatAction action);

/// What one PerformAction() call did.
struct ActionOutcome {
    CombatAction action = CombatAction::Attack;
    bool success = false;
    std::string message;

    /// Set when a weapon effect resolved the action.
    std::optional<EffectOutcome> effect;

    std::optional<std::string> targetId;
    int32_t damage = 0;
    bool critical = false;
    bool killed = false;
    int32_t targetHealth = 0;
};

struct ParticipantStatus {
    std::string id;
    std::string name;
    bool isPlayer = false;
    int32_t health = 0;
    int32_t maxHealth = 0;
    std::vector<StatusType> statuses;
    std::vector<ModifierKind> modifiers;
};

/// Polled by the battle driver after every call.
struct SessionStatus {
    CombatPhase phase = CombatPhase::Preparation;
    int32_t turn = 0;
    std::optional<std::string> currentActor;
    std::vector<ParticipantStatus> participants;
    std::vector<std::string> recentLog;
};

/// One battle between a player and one or more enemies.
///
/// Turns follow the initiative order computed by Start(). A successful
/// action advances to the next living participant; wrapping past the end of
/// the order starts a new turn, which applies damage over time, expires
/// statuses and modifiers and collects finished active effects. Victory and
/// defeat are evaluated after every advance.
///
/// Example:
/// @code
///   CombatSession session(registry, progression, rng, log, player, {raider});
///   (void)session.Start();
///   auto hit = session.PerformAction("player", CombatAction::Attack, "raider");
///   auto status = session.GetStatus();
/// @endcode
class CombatSession {
public:
    CombatSession(WeaponRegistry& registry,
                  ProgressionEngine& progression,
                  foundation::RandomSource& rng,
                  CombatLog& log,
                  Combatant player,
                  std::vector<Combatant> enemies);

    CombatSession(const CombatSession&) = delete;
    CombatSession& operator=(const CombatSession&) = delete;

    /// Roll initiative and enter InProgress. Valid only from Preparation.
    foundation::GameResult<void> Start();

    /// Perform @p action for @p actorId.
    ///
    /// Only the current actor may act, except Defend which can be issued
    /// reactively at any time. A failed escape returns success == false and
    /// keeps the turn.
    foundation::GameResult<ActionOutcome> PerformAction(
        const std::string& actorId,
        CombatAction action,
        const std::optional<std::string>& targetId = std::nullopt,
        const std::optional<foundation::EffectId>& effectId = std::nullopt);

    /// Pass the current actor's turn.
    foundation::GameResult<void> NextTurn();

    /// Leave Preparation or InProgress for Aborted.
    foundation::GameResult<void> Abort();

    [[nodiscard]] SessionStatus GetStatus() const;

    /// Symmetric distance used for area effect target selection. Pairs
    /// without a distance are out of range of each other.
    void SetDistance(const std::string& a, const std::string& b, double distance);

    [[nodiscard]] CombatPhase Phase() const noexcept { return phase_; }
    [[nodiscard]] int32_t Turn() const noexcept { return turn_; }

    /// Participant ids in initiative order (empty before Start()).
    [[nodiscard]] std::vector<std::string> InitiativeOrder() const;

    [[nodiscard]] const std::map<std::string, int32_t>& InitiativeScores() const noexcept {
        return initiativeScores_;
    }

    [[nodiscard]] const Combatant* CurrentActor() const;

    [[nodiscard]] Combatant* FindParticipant(const std::string& id);
    [[nodiscard]] const Combatant* FindParticipant(const std::string& id) const;

    [[nodiscard]] const Combatant& Player() const { return participants_.front(); }

private:
    foundation::GameResult<ActionOutcome> attack(Combatant& actor, Combatant& target);
    ActionOutcome standardAttack(Combatant& actor, Combatant& target);
    foundation::GameResult<ActionOutcome> special(Combatant& actor, Combatant* target,
                                                  const std::optional<foundation::EffectId>& effectId);
    ActionOutcome defend(Combatant& actor);
    ActionOutcome escape(Combatant& actor);

    /// Resolve and validate @p targetId as a living opponent of @p actor.
    foundation::GameResult<Combatant*> opponentTarget(const Combatant& actor,
                                                      const std::optional<std::string>& targetId,
                                                      bool required);

    [[nodiscard]] EffectContext buildContext(Combatant& actor, Combatant* primary);
    [[nodiscard]] WeaponInstance* equippedWeapon(const Combatant& actor);
    [[nodiscard]] std::vector<Combatant*> livingOpponents(const Combatant& actor);
    [[nodiscard]] int32_t livingEnemyCount() const;

    ActionOutcome fromEffect(CombatAction action, const EffectOutcome& effect);
    void grantOutcomeExperience(WeaponInstance& weapon, const EffectOutcome& effect);

    void advanceTurn();
    void beginNewTurn();
    void checkTerminal();

    WeaponRegistry& registry_;
    ProgressionEngine& progression_;
    foundation::RandomSource& rng_;
    CombatLog& log_;
    BalanceConfig balance_;

    /// Player first, then enemies in input order. Never resized.
    std::vector<Combatant> participants_;
    std::vector<std::size_t> order_;
    std::size_t cursor_ = 0;
    std::map<std::string, int32_t> initiativeScores_;
    std::map<std::string, int32_t> consecutiveHits_;
    std::map<std::pair<std::string, std::string>, double> distances_;

    CombatPhase phase_ = CombatPhase::Preparation;
    int32_t turn_ = 0;
};

}  // namespace cce::combat
