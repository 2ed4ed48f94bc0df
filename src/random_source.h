#pragma once

#include <cstdint>
#include <random>

// Every random decision in the core goes through this interface so combat can
// be replayed from a seed or a scripted sequence.
class RandomSource
{
public:
    virtual ~RandomSource() = default;

    // Uniform integer in [low, high], both ends inclusive.
    virtual int Range(int low, int high) = 0;

    // Uniform real in [0, 1).
    virtual double Unit() = 0;

    bool Chance(double probability)
    {
        return Unit() < probability;
    }
};

class MersenneRandom : public RandomSource
{
public:
    explicit MersenneRandom(uint32_t seed);

    int Range(int low, int high) override;
    double Unit() override;

    uint32_t Seed() const { return seed; }

private:
    uint32_t seed;
    std::mt19937 engine;
};

// Resolves a configured seed of 0 to a fresh nondeterministic one.
uint32_t ResolveSeed(uint32_t configured);
