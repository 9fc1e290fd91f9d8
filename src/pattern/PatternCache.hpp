#pragma once

#include "CompiledPattern.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace pattern
{

/**
 * @brief Thread-safe cache of compiled patterns
 *
 * Entries are keyed by (owner, pattern text). The owner names the label
 * variant a pattern came from. Because the pattern text
 * is part of the key, an edited variant can never be served a stale compiled
 * form; invalidate() only reclaims the old entries.
 *
 * Count-bounded LRU: a hit moves the entry to the front, and inserting into a
 * full cache evicts the least recently used entry. A miss parses outside the
 * lock and inserts once.
 */
class PatternCache
{
public:
    explicit PatternCache(std::size_t capacity = 4096);

    // Throws PatternParseError; a failing pattern is never inserted.
    [[nodiscard]] std::shared_ptr<const CompiledPattern> get(const std::string& owner, const std::string& pattern);

    // Drops every entry of the owner.
    std::size_t invalidate(const std::string& owner);

    void clear();
    void setCapacity(std::size_t capacity);

    std::size_t size() const;
    std::size_t capacity() const;
    std::uint64_t hits() const { return hits_.load(std::memory_order_relaxed); }
    std::uint64_t misses() const { return misses_.load(std::memory_order_relaxed); }

private:
    struct Entry
    {
        std::string key;
        std::string owner;
        std::shared_ptr<const CompiledPattern> compiled;
    };

    static std::string makeKey(const std::string& owner, const std::string& pattern);
    void trim();

    mutable std::mutex mutex_;
    std::list<Entry> items_;
    std::unordered_map<std::string, std::list<Entry>::iterator> map_;
    std::size_t capacity_;
    std::atomic<std::uint64_t> hits_{ 0 };
    std::atomic<std::uint64_t> misses_{ 0 };
};

} // namespace pattern
