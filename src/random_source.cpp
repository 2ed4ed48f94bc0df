#include "random_source.h"

#include <utility>

MersenneRandom::MersenneRandom(uint32_t seed)
    : seed(seed), engine(seed)
{
}

int MersenneRandom::Range(int low, int high)
{
    if (high < low)
    {
        std::swap(low, high);
    }
    std::uniform_int_distribution<int> dist(low, high);
    return dist(engine);
}

double MersenneRandom::Unit()
{
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    return dist(engine);
}

uint32_t ResolveSeed(uint32_t configured)
{
    if (configured != 0)
    {
        return configured;
    }
    std::random_device device;
    const uint32_t drawn = device();
    return drawn == 0 ? 1u : drawn;
}
