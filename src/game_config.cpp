#include "game_config.h"

const GameConfig &DefaultConfig()
{
    static const GameConfig config{};
    return config;
}
