#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

struct GameConfig
{
    std::string playerName = "Astronaut";
    int playerHealth = 100;
    int playerAttack = 20;

    std::string consumableName = "Med Gel";
    int startingConsumables = 1;
    int consumableHeal = 30;

    // Inclusive spreads around the attacker's base value.
    int quickSpread = 5;
    int heavySpread = 5;
    int enemySpread = 3;
    double heavyHitChance = 0.6;
    double heavyMultiplier = 1.5;

    int expBase = 20;
    int expPerLevel = 10;
    int levelHealthBonus = 10;
    int levelAttackBonus = 2;

    size_t chronicleLines = 16;

    int screenWidth = 1280;
    int screenHeight = 720;
    std::string windowTitle = "Astrofrog - raylib";

    // 0 seeds from std::random_device.
    uint32_t seed = 0;
};

// Tunables shared by the core when no explicit config is passed.
const GameConfig &DefaultConfig();
