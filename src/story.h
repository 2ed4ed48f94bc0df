#pragma once

#include "character.h"

#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

class ContentError : public std::runtime_error
{
public:
    explicit ContentError(const std::string &what) : std::runtime_error(what) {}
};

class UnknownNodeError : public ContentError
{
public:
    explicit UnknownNodeError(const std::string &nodeId)
        : ContentError("unknown story node '" + nodeId + "'"), nodeId(nodeId)
    {
    }

    const std::string &NodeId() const { return nodeId; }

private:
    std::string nodeId;
};

struct StoryRoute
{
    std::string target;
};

struct BattleRoute
{
    EnemyTemplate enemy;
    std::string returnTarget;
};

struct EndRoute
{
    std::string ending;
};

using OptionRoute = std::variant<StoryRoute, BattleRoute, EndRoute>;

struct Option
{
    std::string text;
    OptionRoute route;
};

// Passive outcome of the first visit to a node. An empty flag means the node
// has no effect.
struct OneTimeEffect
{
    std::string flag;
    std::string line;
    int heal = 0;
    std::string item;
    int itemCount = 0;
    int experience = 0;
};

struct StoryNode
{
    std::string id;
    std::string caption;
    std::string description;
    std::vector<Option> options;
    OneTimeEffect effect;
};

constexpr size_t kMaxOptions = 3;

class StoryGraph
{
public:
    StoryGraph() = default;
    StoryGraph(std::vector<StoryNode> nodes, std::string entry);

    // Throws ContentError on a duplicate id.
    void Add(StoryNode node);

    // Throws UnknownNodeError.
    const StoryNode &Find(const std::string &id) const;
    bool Contains(const std::string &id) const;

    const std::string &Entry() const { return entry; }
    void SetEntry(std::string id) { entry = std::move(id); }
    size_t Size() const { return nodes.size(); }

    // Checks every cross reference and payload; throws ContentError.
    void Validate() const;

private:
    std::unordered_map<std::string, StoryNode> nodes;
    std::string entry;
};

// Applies the effect's heal, loot and experience to the player and returns the
// narration for it.
std::vector<std::string> ApplyEffect(const OneTimeEffect &effect, Player &player);
