/**
 * MAILRLM - Resumable Email Analysis Toolkit
 * Cached Query Implementation
 */

#include "llm/cached_query.hpp"
#include "util/errors.hpp"
#include "util/logger.hpp"

namespace mailrlm::llm {

namespace log_component = util::log_component;

CachedQuery::CachedQuery(cache::QueryCache& cache, QueryFn query, std::string model)
    : cache_(cache)
    , query_(std::move(query))
    , model_(std::move(model)) {
    if (!query_) {
        throw ConfigurationError("a query function is required");
    }
}

std::string CachedQuery::operator()(const std::string& prompt, const std::string& context,
                                    const nlohmann::json& extra) {
    std::string model = model_;
    if (extra.is_object()) {
        auto it = extra.find("model");
        if (it != extra.end() && it->is_string()) {
            model = it->get<std::string>();
        }
    }

    auto key = cache::key_for(prompt, context, model);
    if (auto cached = cache_.get(key)) {
        MAILRLM_LOG_DEBUG(log_component::Llm, "Cache hit {}", key.fragment());
        return *cached;
    }

    auto response = query_(prompt, context);
    ++calls_made_;

    try {
        cache_.set(key, response, estimate_tokens(prompt, context, response), model);
    } catch (const std::exception& e) {
        MAILRLM_LOG_WARN(log_component::Llm, "Cache write for {} failed: {}", key.fragment(), e.what());
    }
    return response;
}

engine::ProcessFn CachedQuery::as_process_fn() {
    return [this](const std::string& prompt, const std::string& context, const nlohmann::json& extra) {
        return (*this)(prompt, context, extra);
    };
}

std::uint64_t CachedQuery::estimate_tokens(const std::string& prompt, const std::string& context,
                                           const std::string& response) {
    auto chars = static_cast<std::uint64_t>(prompt.size() + context.size() + response.size());
    return (chars + 3) / 4;
}

} // namespace mailrlm::llm
