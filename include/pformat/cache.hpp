#pragma once

#include <pformat/lang/template.hpp>
#include <pformat/result.hpp>
#include <atomic>
#include <cstddef>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace pformat {

struct CacheStats {
    size_t hits = 0;
    size_t misses = 0;
    size_t entries = 0;
};

// Memoizes parsed templates by their raw text. Lookups take a shared lock;
// a miss parses outside the lock and inserts under an exclusive one. When
// two threads race on the same text the first insert wins and both get an
// equivalent template. Failed parses are not cached.
class TemplateCache {
public:
    // capacity 0 = unbounded; once full, new templates are parsed but not stored
    explicit TemplateCache(const SyntaxOptions& syntax = {}, size_t capacity = 0);

    TemplateCache(const TemplateCache&) = delete;
    TemplateCache& operator=(const TemplateCache&) = delete;

    Result<std::shared_ptr<const Template>> get_or_parse(const std::string& source);

    // Cached entry, or nullptr
    std::shared_ptr<const Template> find(const std::string& source) const;

    void clear();
    CacheStats stats() const;

    const SyntaxOptions& syntax() const { return syntax_; }
    size_t capacity() const { return capacity_; }

private:
    SyntaxOptions syntax_;
    size_t capacity_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<const Template>> entries_;
    std::atomic<size_t> hits_{0};
    std::atomic<size_t> misses_{0};
};

} // namespace pformat
