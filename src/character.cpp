#include "character.h"

#include <algorithm>
#include <limits>
#include <utility>

Character::Character(std::string name, int maxHealth, int attack)
    : name(std::move(name)),
      health(std::max(maxHealth, 0)),
      maxHealth(std::max(maxHealth, 0)),
      attack(std::max(attack, 0))
{
}

int Character::TakeDamage(int amount)
{
    const int applied = std::min(std::max(amount, 0), health);
    health -= applied;
    return applied;
}

int Character::Heal(int amount)
{
    const int applied = std::min(std::max(amount, 0), maxHealth - health);
    health += applied;
    return applied;
}

std::string Character::StatusLine() const
{
    return name + ": Health - " + std::to_string(health) + "/" + std::to_string(maxHealth);
}

Enemy::Enemy(const EnemyTemplate &tmpl)
    : Character(tmpl.name, tmpl.health, tmpl.attack),
      expReward(std::max(tmpl.expReward, 0))
{
}

Player::Player(const GameConfig &config)
    : Character(config.playerName, config.playerHealth, config.playerAttack),
      config(config)
{
    AddItem(config.consumableName, config.startingConsumables);
}

int Player::ExpToNextLevel() const
{
    return config.expBase + (level - 1) * config.expPerLevel;
}

std::vector<std::string> Player::AddExperience(int amount)
{
    const int gained = std::max(amount, 0);
    std::vector<std::string> lines;
    // Saturates instead of wrapping on huge awards.
    const int room = std::numeric_limits<int>::max() - experience;
    experience = gained > room ? std::numeric_limits<int>::max() : experience + gained;
    lines.push_back(name + " gains " + std::to_string(gained) + " XP.");

    while (experience >= ExpToNextLevel())
    {
        experience -= ExpToNextLevel();
        ++level;
        ++skillPoints;
        maxHealth += config.levelHealthBonus;
        health = maxHealth;
        attack += config.levelAttackBonus;
        lines.push_back("LEVEL UP! " + name + " reached level " + std::to_string(level) +
                        " (Max HP " + std::to_string(maxHealth) +
                        ", ATK " + std::to_string(attack) + ").");
    }
    return lines;
}

std::string Player::UseConsumable(const std::string &item)
{
    auto it = inventory.find(item);
    if (it == inventory.end() || it->second <= 0)
    {
        return "You have no " + item + " left.";
    }
    if (item != config.consumableName)
    {
        return item + " can't be used.";
    }

    --it->second;
    const int restored = Heal(config.consumableHeal);
    return "You use " + item + " and recover " + std::to_string(restored) + " HP (" +
           std::to_string(it->second) + " left).";
}

void Player::AddItem(const std::string &item, int count)
{
    if (item.empty() || count <= 0)
    {
        return;
    }
    inventory[item] += count;
}

int Player::ItemCount(const std::string &item) const
{
    const auto it = inventory.find(item);
    return it == inventory.end() ? 0 : it->second;
}
