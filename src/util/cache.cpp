#include <pformat/cache.hpp>
#include <pformat/log.hpp>
#include <mutex>

namespace pformat {

TemplateCache::TemplateCache(const SyntaxOptions& syntax, size_t capacity)
    : syntax_(syntax), capacity_(capacity) {}

std::shared_ptr<const Template> TemplateCache::find(const std::string& source) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = entries_.find(source);
    if (it == entries_.end()) return nullptr;
    return it->second;
}

Result<std::shared_ptr<const Template>> TemplateCache::get_or_parse(const std::string& source) {
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = entries_.find(source);
        if (it != entries_.end()) {
            ++hits_;
            return Result<std::shared_ptr<const Template>>::ok(it->second);
        }
    }

    auto parsed = Template::parse(source, syntax_);
    if (parsed.is_err()) return std::move(parsed).error();
    auto tmpl = std::make_shared<const Template>(std::move(parsed).value());

    ++misses_;
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (capacity_ > 0 && entries_.size() >= capacity_) {
        log::trace("template cache full (%zu entries), not storing '%s'",
                   entries_.size(), source.c_str());
        return Result<std::shared_ptr<const Template>>::ok(std::move(tmpl));
    }
    auto [it, inserted] = entries_.emplace(source, std::move(tmpl));
    if (!inserted) {
        log::trace("template cache race on '%s', keeping first entry", source.c_str());
    }
    return Result<std::shared_ptr<const Template>>::ok(it->second);
}

void TemplateCache::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    entries_.clear();
    hits_ = 0;
    misses_ = 0;
}

CacheStats TemplateCache::stats() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    CacheStats s;
    s.hits = hits_.load();
    s.misses = misses_.load();
    s.entries = entries_.size();
    return s;
}

} // namespace pformat
