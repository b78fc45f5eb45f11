/**
 * MAILRLM - Resumable Email Analysis Toolkit
 * Command Client - model queries through an external CLI
 *
 * Runs the configured command with the full prompt appended as the last
 * argument (default: claude --print -p <prompt>) and returns its trimmed
 * stdout. Each query gets a fresh process, so sub-queries never share
 * conversation context.
 */

#ifndef MAILRLM_LLM_COMMAND_CLIENT_HPP
#define MAILRLM_LLM_COMMAND_CLIENT_HPP

#include <chrono>
#include <string>
#include <vector>

namespace mailrlm::llm {

struct CommandClientConfig {
    std::vector<std::string> command{"claude", "--print", "-p"};
    std::chrono::seconds timeout{120};
};

class CommandClient {
public:
    explicit CommandClient(CommandClientConfig config);

    /**
     * Run one query
     *
     * @param prompt Task for the model
     * @param context Optional context data (empty = prompt only)
     * @return Model output with surrounding whitespace removed
     * @throws ProcessingFailure if the command cannot be started, times
     *         out, or exits non-zero
     */
    std::string query(const std::string& prompt, const std::string& context) const;

    /**
     * "Context:\n<context>\n\nTask:\n<prompt>", or the bare prompt
     * when there is no context
     */
    static std::string build_prompt(const std::string& prompt, const std::string& context);

    const CommandClientConfig& config() const { return config_; }

private:
    CommandClientConfig config_;
};

} // namespace mailrlm::llm

#endif // MAILRLM_LLM_COMMAND_CLIENT_HPP
