#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <random>

namespace labels
{

// Picks which alternative of a variant is rendered.
class IRandomSource
{
public:
    virtual ~IRandomSource() = default;

    // Uniform index in [0, count). count is never 0.
    virtual std::size_t pick(std::size_t count) = 0;
};

// Mutex-guarded Mersenne Twister. Seed it for reproducible selections in tests.
class MersenneRandomSource : public IRandomSource
{
public:
    MersenneRandomSource();
    explicit MersenneRandomSource(std::uint64_t seed);

    std::size_t pick(std::size_t count) override;

private:
    std::mutex mutex_;
    std::mt19937_64 engine_;
};

// Process-wide source shared by renderers that are not given their own.
std::shared_ptr<IRandomSource> processRandomSource();

} // namespace labels
