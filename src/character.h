#pragma once

#include "game_config.h"

#include <map>
#include <string>
#include <vector>

class Character
{
public:
    Character(std::string name, int maxHealth, int attack);
    virtual ~Character() = default;

    // Negative amounts count as zero. Both return what actually changed.
    int TakeDamage(int amount);
    int Heal(int amount);

    bool IsAlive() const { return health > 0; }

    const std::string &Name() const { return name; }
    int Health() const { return health; }
    int MaxHealth() const { return maxHealth; }
    int Attack() const { return attack; }

    std::string StatusLine() const;

protected:
    std::string name;
    int health;
    int maxHealth;
    int attack;
};

struct EnemyTemplate
{
    std::string name;
    int health = 1;
    int attack = 0;
    int expReward = 0;
};

class Enemy : public Character
{
public:
    explicit Enemy(const EnemyTemplate &tmpl);

    int ExpReward() const { return expReward; }

private:
    int expReward;
};

class Player : public Character
{
public:
    explicit Player(const GameConfig &config = DefaultConfig());

    int Level() const { return level; }
    int Experience() const { return experience; }
    int SkillPoints() const { return skillPoints; }
    int ExpToNextLevel() const;

    // One line for the gain, then one per level reached.
    std::vector<std::string> AddExperience(int amount);

    std::string UseConsumable(const std::string &item);
    void AddItem(const std::string &item, int count);
    int ItemCount(const std::string &item) const;
    const std::map<std::string, int> &Inventory() const { return inventory; }

    const GameConfig &Config() const { return config; }

private:
    GameConfig config;
    int level = 1;
    int experience = 0;
    int skillPoints = 0;
    std::map<std::string, int> inventory;
};
