#include "story.h"

StoryGraph::StoryGraph(std::vector<StoryNode> nodes, std::string entry)
    : entry(std::move(entry))
{
    for (auto &node : nodes)
    {
        Add(std::move(node));
    }
}

void StoryGraph::Add(StoryNode node)
{
    if (node.id.empty())
    {
        throw ContentError("story node with empty id");
    }
    const std::string id = node.id;
    if (!nodes.emplace(id, std::move(node)).second)
    {
        throw ContentError("duplicate story node '" + id + "'");
    }
}

const StoryNode &StoryGraph::Find(const std::string &id) const
{
    const auto it = nodes.find(id);
    if (it == nodes.end())
    {
        throw UnknownNodeError(id);
    }
    return it->second;
}

bool StoryGraph::Contains(const std::string &id) const
{
    return nodes.find(id) != nodes.end();
}

static void RequireTarget(const StoryGraph &graph, const StoryNode &node, const std::string &target)
{
    if (!graph.Contains(target))
    {
        throw ContentError("node '" + node.id + "' routes to unknown node '" + target + "'");
    }
}

void StoryGraph::Validate() const
{
    if (!Contains(entry))
    {
        throw ContentError("entry node '" + entry + "' is not in the story");
    }

    for (const auto &pair : nodes)
    {
        const StoryNode &node = pair.second;
        if (node.options.empty() || node.options.size() > kMaxOptions)
        {
            throw ContentError("node '" + node.id + "' has " + std::to_string(node.options.size()) +
                               " options, expected 1 to " + std::to_string(kMaxOptions));
        }

        for (const auto &option : node.options)
        {
            if (option.text.empty())
            {
                throw ContentError("node '" + node.id + "' has an option without text");
            }

            if (const auto *story = std::get_if<StoryRoute>(&option.route))
            {
                RequireTarget(*this, node, story->target);
            }
            else if (const auto *battle = std::get_if<BattleRoute>(&option.route))
            {
                RequireTarget(*this, node, battle->returnTarget);
                const EnemyTemplate &enemy = battle->enemy;
                if (enemy.name.empty() || enemy.health <= 0 || enemy.attack < 0 || enemy.expReward < 0)
                {
                    throw ContentError("node '" + node.id + "' spawns an invalid enemy '" + enemy.name + "'");
                }
            }
            else if (std::get<EndRoute>(option.route).ending.empty())
            {
                throw ContentError("node '" + node.id + "' has an ending without text");
            }
        }
    }
}

std::vector<std::string> ApplyEffect(const OneTimeEffect &effect, Player &player)
{
    std::vector<std::string> lines;
    if (!effect.line.empty())
    {
        lines.push_back(effect.line);
    }

    if (effect.heal > 0)
    {
        const int restored = player.Heal(effect.heal);
        lines.push_back("You recover " + std::to_string(restored) + " HP.");
    }

    if (!effect.item.empty() && effect.itemCount > 0)
    {
        player.AddItem(effect.item, effect.itemCount);
        lines.push_back("Found " + std::to_string(effect.itemCount) + "x " + effect.item + ".");
    }

    if (effect.experience > 0)
    {
        const auto gained = player.AddExperience(effect.experience);
        lines.insert(lines.end(), gained.begin(), gained.end());
    }
    return lines;
}
