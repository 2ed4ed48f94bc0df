#pragma once

#include "story.h"

#include <array>
#include <string>
#include <variant>

struct SceneOption
{
    std::string label;
    bool enabled = false;
};

// What the front end draws after every transition. All three slots are always
// present; unused ones are disabled with an empty label.
struct SceneDescriptor
{
    std::string caption;
    std::string narration;
    std::array<SceneOption, kMaxOptions> options{};
};

struct GameOverDescriptor
{
    std::string narration;
};

using Frame = std::variant<SceneDescriptor, GameOverDescriptor>;

inline bool IsGameOver(const Frame &frame)
{
    return std::holds_alternative<GameOverDescriptor>(frame);
}
