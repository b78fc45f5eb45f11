/**
 * MAILRLM - Resumable Email Analysis Toolkit
 * Configuration System - Supports JSON file, environment variables, and CLI args
 *
 * Configuration hierarchy (highest precedence first):
 * 1. Command-line arguments
 * 2. Environment variables (MAILRLM_*)
 * 3. Configuration file (JSON)
 * 4. Default values
 */

#ifndef MAILRLM_CONFIG_CONFIG_HPP
#define MAILRLM_CONFIG_CONFIG_HPP

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace mailrlm::config {

/**
 * Query cache configuration
 */
struct CacheSettings {
    bool enabled{true};
    std::string dir;                  // Empty = <tmp>/rlm_cache
    std::uint32_t ttl_hours{24};
};

/**
 * Checkpoint configuration
 */
struct CheckpointSettings {
    std::string path;                 // Empty = no checkpointing
    std::size_t interval{10};
};

/**
 * Model command configuration
 */
struct LlmSettings {
    std::vector<std::string> command{"claude", "--print", "-p"};
    std::string model{"claude-cli"};
    std::uint32_t timeout_seconds{120};
};

/**
 * Email chunking configuration
 */
struct ChunkingSettings {
    std::size_t chunk_size{20};
    std::size_t max_context_chars{4000};
    std::string group_by{"size"};     // size, sender, domain, thread, day, week or month
};

/**
 * Logging configuration
 */
struct LogSettings {
    std::string level{"info"};
    std::string file;
    std::size_t max_file_size_mb{100};
    std::size_t max_files{5};
    bool enable_console{true};
    bool enable_colors{true};
};

/**
 * Complete application configuration
 */
struct Config {
    CacheSettings cache;
    CheckpointSettings checkpoint;
    LlmSettings llm;
    ChunkingSettings chunking;
    LogSettings logging;

    /**
     * Validate configuration and throw if invalid
     * @throws ConfigurationError
     */
    void validate() const;
};

/**
 * Command words and per-invocation inputs that are not configuration
 */
struct Invocation {
    std::vector<std::string> positional;   // e.g. {"cache", "stats"}
    std::optional<std::string> emails_file;
    std::optional<std::string> prompt;
    std::optional<std::string> keyword;    // Keep only emails mentioning this
    std::optional<std::string> sender;     // Keep only emails whose From contains this
};

/**
 * Configuration manager - handles loading and layering
 */
class ConfigManager {
public:
    ConfigManager() = default;

    // Non-copyable
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    /**
     * Parse command-line arguments and load configuration
     *
     * @param argc Argument count
     * @param argv Argument values
     * @return true if configuration loaded successfully, false if --help was requested
     * @throws ConfigurationError on configuration errors
     */
    bool load(int argc, char* argv[]);

    const Config& get_config() const { return config_; }

    const Invocation& get_invocation() const { return invocation_; }

    /**
     * Get the configuration file path (empty if none was given)
     */
    const std::filesystem::path& get_config_path() const { return config_path_; }

    /**
     * Print help message to stdout
     */
    static void print_help(const char* program_name);

private:
    void load_from_file(const std::filesystem::path& path);

    void apply_environment_overrides();

    void apply_cli_overrides(int argc, char* argv[]);

    static std::optional<std::string> get_env(const std::string& name);

    Config config_;
    Invocation invocation_;
    std::filesystem::path config_path_;
};

// JSON serialization support
void to_json(nlohmann::json& j, const CacheSettings& c);
void from_json(const nlohmann::json& j, CacheSettings& c);
void to_json(nlohmann::json& j, const CheckpointSettings& c);
void from_json(const nlohmann::json& j, CheckpointSettings& c);
void to_json(nlohmann::json& j, const LlmSettings& l);
void from_json(const nlohmann::json& j, LlmSettings& l);
void to_json(nlohmann::json& j, const ChunkingSettings& c);
void from_json(const nlohmann::json& j, ChunkingSettings& c);
void to_json(nlohmann::json& j, const LogSettings& l);
void from_json(const nlohmann::json& j, LogSettings& l);
void to_json(nlohmann::json& j, const Config& c);
void from_json(const nlohmann::json& j, Config& c);

} // namespace mailrlm::config

#endif // MAILRLM_CONFIG_CONFIG_HPP
