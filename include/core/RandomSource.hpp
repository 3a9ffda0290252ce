#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <random>

namespace blockfall::core {

// Source of uniform choices for the piece generator.
class IRandomSource {
public:
    virtual ~IRandomSource() = default;

    // Uniform integer in [0, count)
    virtual std::size_t nextIndex(std::size_t count) = 0;
};

using RandomSourcePtr = std::shared_ptr<IRandomSource>;

class MersenneRandomSource : public IRandomSource {
public:
    MersenneRandomSource();                         // seeded from std::random_device
    explicit MersenneRandomSource(std::uint32_t seed);

    std::size_t nextIndex(std::size_t count) override;

private:
    std::mt19937 rng_;
};

} // namespace blockfall::core
