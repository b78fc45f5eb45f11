/**
 * MAILRLM - Resumable Email Analysis Toolkit
 * Cached Query - query cache in front of a model client
 *
 * Looks up key_for(prompt, context, model) before calling out, and
 * stores every fresh response with an estimated token count so later
 * hits can report what they saved.
 */

#ifndef MAILRLM_LLM_CACHED_QUERY_HPP
#define MAILRLM_LLM_CACHED_QUERY_HPP

#include "cache/query_cache.hpp"
#include "engine/resumable_map.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace mailrlm::llm {

/**
 * Underlying query: (prompt, context) -> response text
 */
using QueryFn = std::function<std::string(const std::string& prompt, const std::string& context)>;

class CachedQuery {
public:
    CachedQuery(cache::QueryCache& cache, QueryFn query, std::string model);

    /**
     * Answer from the cache, or query and remember the response
     *
     * @param extra May carry a "model" string overriding the default model
     */
    std::string operator()(const std::string& prompt, const std::string& context,
                           const nlohmann::json& extra = nlohmann::json::object());

    /**
     * Adapter for ResumableMap; the returned function references *this
     */
    engine::ProcessFn as_process_fn();

    /**
     * Calls that reached the underlying query (cache misses)
     */
    std::size_t calls_made() const { return calls_made_; }

    const std::string& model() const { return model_; }

    /**
     * Rough token count: one token per four characters, rounded up
     */
    static std::uint64_t estimate_tokens(const std::string& prompt, const std::string& context,
                                         const std::string& response);

private:
    cache::QueryCache& cache_;
    QueryFn query_;
    std::string model_;
    std::size_t calls_made_{0};
};

} // namespace mailrlm::llm

#endif // MAILRLM_LLM_CACHED_QUERY_HPP
