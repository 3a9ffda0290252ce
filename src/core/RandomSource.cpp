#include "core/RandomSource.hpp"
#include <stdexcept>

namespace blockfall::core {

MersenneRandomSource::MersenneRandomSource()
    : rng_{std::random_device{}()}
{
}

MersenneRandomSource::MersenneRandomSource(std::uint32_t seed)
    : rng_{seed}
{
}

std::size_t MersenneRandomSource::nextIndex(std::size_t count) {
    if (count == 0) {
        throw std::invalid_argument("MersenneRandomSource: count must be positive");
    }
    std::uniform_int_distribution<std::size_t> dist(0, count - 1);
    return dist(rng_);
}

} // namespace blockfall::core
