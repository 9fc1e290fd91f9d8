#include "RandomSource.hpp"

namespace labels
{

MersenneRandomSource::MersenneRandomSource()
    : engine_(std::random_device{}())
{
}

MersenneRandomSource::MersenneRandomSource(std::uint64_t seed)
    : engine_(seed)
{
}

std::size_t MersenneRandomSource::pick(std::size_t count)
{
    if (count <= 1)
        return 0;
    std::uniform_int_distribution<std::size_t> dist(0, count - 1);
    std::lock_guard<std::mutex> lock(mutex_);
    return dist(engine_);
}

std::shared_ptr<IRandomSource> processRandomSource()
{
    static std::shared_ptr<IRandomSource> source = std::make_shared<MersenneRandomSource>();
    return source;
}

} // namespace labels
