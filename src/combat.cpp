#include "combat.h"

const char *CombatStateLabel(CombatState state)
{
    switch (state)
    {
    case CombatState::AwaitingPlayerAction:
        return "Awaiting action";
    case CombatState::EnemyTurn:
        return "Enemy turn";
    case CombatState::Won:
        return "Won";
    case CombatState::Lost:
        return "Lost";
    default:
        return "Unknown";
    }
}

const char *CombatActionLabel(CombatAction action)
{
    switch (action)
    {
    case CombatAction::Quick:
        return "Quick Attack";
    case CombatAction::Heavy:
        return "Heavy Attack";
    case CombatAction::Consumable:
        return "Use Item";
    default:
        return "Hesitate";
    }
}

CombatSession::CombatSession(Player &player, const EnemyTemplate &enemy, RandomSource &rng)
    : player(player), rng(rng), enemy(std::in_place, enemy), enemyName(enemy.name)
{
    log.push_back("--- " + player.Name() + " vs " + enemyName + " ---");
}

bool CombatSession::Act(CombatAction action)
{
    if (state != CombatState::AwaitingPlayerAction || !enemy || !enemy->IsAlive() || !player.IsAlive())
    {
        return false;
    }

    PlayerTurn(action);
    if (!enemy->IsAlive())
    {
        Victory();
        return true;
    }

    state = CombatState::EnemyTurn;
    EnemyTurn();
    return true;
}

void CombatSession::PlayerTurn(CombatAction action)
{
    const GameConfig &config = player.Config();
    const int attack = player.Attack();

    switch (action)
    {
    case CombatAction::Quick:
    {
        const int rolled = rng.Range(attack - config.quickSpread, attack + config.quickSpread);
        const int dealt = enemy->TakeDamage(rolled);
        log.push_back(player.Name() + " strikes " + enemyName + " for " + std::to_string(dealt) + " damage!");
        break;
    }
    case CombatAction::Heavy:
    {
        if (!rng.Chance(config.heavyHitChance))
        {
            log.push_back(enemyName + " dodged the heavy attack!");
            break;
        }
        // The multiplier is truncated before the spread is applied.
        const int base = static_cast<int>(attack * config.heavyMultiplier);
        const int rolled = rng.Range(base - config.heavySpread, base + config.heavySpread);
        const int dealt = enemy->TakeDamage(rolled);
        log.push_back(player.Name() + " lands a heavy blow on " + enemyName + " for " +
                      std::to_string(dealt) + " damage!");
        break;
    }
    case CombatAction::Consumable:
        log.push_back(player.UseConsumable(config.consumableName));
        break;
    default:
        log.push_back("Invalid action. You lose your turn.");
        break;
    }
}

void CombatSession::EnemyTurn()
{
    const GameConfig &config = player.Config();
    const int attack = enemy->Attack();
    const int rolled = rng.Range(attack - config.enemySpread, attack + config.enemySpread);
    const int taken = player.TakeDamage(rolled);
    log.push_back(enemyName + " attacks " + player.Name() + " for " + std::to_string(taken) + " damage!");

    if (!player.IsAlive())
    {
        log.push_back(player.Name() + " has been defeated! " + enemyName + " wins!");
        state = CombatState::Lost;
        return;
    }

    log.push_back(player.StatusLine() + " | " + enemy->StatusLine() + ". Choose your next move.");
    state = CombatState::AwaitingPlayerAction;
}

void CombatSession::Victory()
{
    log.push_back(enemyName + " has been defeated! " + player.Name() + " wins!");
    const auto lines = player.AddExperience(enemy->ExpReward());
    log.insert(log.end(), lines.begin(), lines.end());
    enemy.reset();
    state = CombatState::Won;
}
