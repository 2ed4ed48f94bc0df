#pragma once

#include "character.h"
#include "random_source.h"

#include <optional>
#include <string>
#include <vector>

enum class CombatState
{
    AwaitingPlayerAction,
    EnemyTurn,
    Won,
    Lost
};

enum class CombatAction
{
    Quick,
    Heavy,
    Consumable,
    Other
};

const char *CombatStateLabel(CombatState state);
const char *CombatActionLabel(CombatAction action);

// One battle between the player and a freshly spawned enemy. The session owns
// the enemy and drops it once the fight is decided.
class CombatSession
{
public:
    CombatSession(Player &player, const EnemyTemplate &enemy, RandomSource &rng);

    // Resolves the player's action and, if the enemy survives, the enemy's
    // reply. Returns false without touching anything when the fight is
    // already decided.
    bool Act(CombatAction action);

    CombatState State() const { return state; }
    bool Finished() const { return state == CombatState::Won || state == CombatState::Lost; }

    // Empty once the fight is decided.
    const std::optional<Enemy> &Opponent() const { return enemy; }
    const std::string &OpponentName() const { return enemyName; }

    // Every line since the fight started.
    const std::vector<std::string> &Log() const { return log; }

private:
    void PlayerTurn(CombatAction action);
    void EnemyTurn();
    void Victory();

    Player &player;
    RandomSource &rng;
    std::optional<Enemy> enemy;
    std::string enemyName;
    CombatState state = CombatState::AwaitingPlayerAction;
    std::vector<std::string> log;
};
