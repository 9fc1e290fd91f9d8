#include "PatternCache.hpp"
#include "PatternParser.hpp"

#include <mutex>

namespace pattern
{

PatternCache::PatternCache(std::size_t capacity)
    : capacity_(capacity)
{
}

std::string PatternCache::makeKey(const std::string& owner, const std::string& pattern)
{
    std::string key;
    key.reserve(owner.size() + pattern.size() + 1);
    key += owner;
    key += '\x1f';
    key += pattern;
    return key;
}

std::shared_ptr<const CompiledPattern> PatternCache::get(const std::string& owner, const std::string& pattern)
{
    const std::string key = makeKey(owner, pattern);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = map_.find(key);
        if (it != map_.end())
        {
            hits_.fetch_add(1, std::memory_order_relaxed);
            items_.splice(items_.begin(), items_, it->second);
            return it->second->compiled;
        }
    }

    misses_.fetch_add(1, std::memory_order_relaxed);
    auto compiled = PatternParser::parse(pattern);

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = map_.find(key);
    if (it != map_.end())
    {
        // Another render compiled it first; keep the single shared instance.
        items_.splice(items_.begin(), items_, it->second);
        return it->second->compiled;
    }
    items_.push_front(Entry{ key, owner, compiled });
    map_[key] = items_.begin();
    trim();
    return compiled;
}

void PatternCache::trim()
{
    while (capacity_ > 0 && items_.size() > capacity_)
    {
        map_.erase(items_.back().key);
        items_.pop_back();
    }
}

std::size_t PatternCache::invalidate(const std::string& owner)
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t removed = 0;
    for (auto it = items_.begin(); it != items_.end();)
    {
        if (it->owner == owner)
        {
            map_.erase(it->key);
            it = items_.erase(it);
            ++removed;
        }
        else
        {
            ++it;
        }
    }
    return removed;
}

void PatternCache::clear()
{
    std::lock_guard<std::mutex> lock(mutex_);
    items_.clear();
    map_.clear();
}

void PatternCache::setCapacity(std::size_t capacity)
{
    std::lock_guard<std::mutex> lock(mutex_);
    capacity_ = capacity;
    trim();
}

std::size_t PatternCache::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
}

std::size_t PatternCache::capacity() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return capacity_;
}

} // namespace pattern
