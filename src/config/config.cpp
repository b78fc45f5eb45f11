/**
 * MAILRLM - Resumable Email Analysis Toolkit
 * Configuration System Implementation
 */

#include "config/config.hpp"
#include "util/errors.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string_view>

namespace mailrlm::config {

namespace log_component = util::log_component;

namespace {

bool parse_bool(const std::string& value) {
    return value == "true" || value == "1" || value == "yes";
}

std::size_t parse_count(const std::string& name, const std::string& value) {
    try {
        std::size_t pos = 0;
        auto parsed = std::stoull(value, &pos);
        if (pos != value.size() || value.starts_with("-")) {
            throw std::invalid_argument(value);
        }
        return static_cast<std::size_t>(parsed);
    } catch (const std::logic_error&) {
        throw ConfigurationError("Invalid " + name + " value: " + value);
    }
}

std::uint32_t parse_u32(const std::string& name, const std::string& value) {
    auto parsed = parse_count(name, value);
    if (parsed > std::numeric_limits<std::uint32_t>::max()) {
        throw ConfigurationError(name + " value out of range: " + value);
    }
    return static_cast<std::uint32_t>(parsed);
}

std::vector<std::string> split_command(const std::string& text) {
    std::vector<std::string> words;
    std::istringstream stream(text);
    std::string word;
    while (stream >> word) {
        words.push_back(word);
    }
    return words;
}

/**
 * Match "--name VALUE" or "--name=VALUE"; advances i past a separate value
 */
std::optional<std::string> take_value(const std::string& arg, std::string_view name,
                                      int& i, int argc, char* argv[]) {
    if (arg == name) {
        if (i + 1 >= argc) {
            throw ConfigurationError("Missing value for " + arg);
        }
        return std::string(argv[++i]);
    }
    if (arg.size() > name.size() && arg.starts_with(name) && arg[name.size()] == '=') {
        return arg.substr(name.size() + 1);
    }
    return std::nullopt;
}

} // namespace

// JSON serialization implementations
void to_json(nlohmann::json& j, const CacheSettings& c) {
    j = nlohmann::json{
        {"enabled", c.enabled},
        {"dir", c.dir},
        {"ttl_hours", c.ttl_hours}
    };
}

void from_json(const nlohmann::json& j, CacheSettings& c) {
    if (j.contains("enabled")) j.at("enabled").get_to(c.enabled);
    if (j.contains("dir")) j.at("dir").get_to(c.dir);
    if (j.contains("ttl_hours")) j.at("ttl_hours").get_to(c.ttl_hours);
}

void to_json(nlohmann::json& j, const CheckpointSettings& c) {
    j = nlohmann::json{
        {"path", c.path},
        {"interval", c.interval}
    };
}

void from_json(const nlohmann::json& j, CheckpointSettings& c) {
    if (j.contains("path")) j.at("path").get_to(c.path);
    if (j.contains("interval")) j.at("interval").get_to(c.interval);
}

void to_json(nlohmann::json& j, const LlmSettings& l) {
    j = nlohmann::json{
        {"command", l.command},
        {"model", l.model},
        {"timeout_seconds", l.timeout_seconds}
    };
}

void from_json(const nlohmann::json& j, LlmSettings& l) {
    if (j.contains("command")) j.at("command").get_to(l.command);
    if (j.contains("model")) j.at("model").get_to(l.model);
    if (j.contains("timeout_seconds")) j.at("timeout_seconds").get_to(l.timeout_seconds);
}

void to_json(nlohmann::json& j, const ChunkingSettings& c) {
    j = nlohmann::json{
        {"chunk_size", c.chunk_size},
        {"max_context_chars", c.max_context_chars},
        {"group_by", c.group_by}
    };
}

void from_json(const nlohmann::json& j, ChunkingSettings& c) {
    if (j.contains("chunk_size")) j.at("chunk_size").get_to(c.chunk_size);
    if (j.contains("max_context_chars")) j.at("max_context_chars").get_to(c.max_context_chars);
    if (j.contains("group_by")) j.at("group_by").get_to(c.group_by);
}

void to_json(nlohmann::json& j, const LogSettings& l) {
    j = nlohmann::json{
        {"level", l.level},
        {"file", l.file},
        {"max_file_size_mb", l.max_file_size_mb},
        {"max_files", l.max_files},
        {"enable_console", l.enable_console},
        {"enable_colors", l.enable_colors}
    };
}

void from_json(const nlohmann::json& j, LogSettings& l) {
    if (j.contains("level")) j.at("level").get_to(l.level);
    if (j.contains("file")) j.at("file").get_to(l.file);
    if (j.contains("max_file_size_mb")) j.at("max_file_size_mb").get_to(l.max_file_size_mb);
    if (j.contains("max_files")) j.at("max_files").get_to(l.max_files);
    if (j.contains("enable_console")) j.at("enable_console").get_to(l.enable_console);
    if (j.contains("enable_colors")) j.at("enable_colors").get_to(l.enable_colors);
}

void to_json(nlohmann::json& j, const Config& c) {
    j = nlohmann::json{
        {"cache", c.cache},
        {"checkpoint", c.checkpoint},
        {"llm", c.llm},
        {"chunking", c.chunking},
        {"logging", c.logging}
    };
}

void from_json(const nlohmann::json& j, Config& c) {
    if (j.contains("cache")) j.at("cache").get_to(c.cache);
    if (j.contains("checkpoint")) j.at("checkpoint").get_to(c.checkpoint);
    if (j.contains("llm")) j.at("llm").get_to(c.llm);
    if (j.contains("chunking")) j.at("chunking").get_to(c.chunking);
    if (j.contains("logging")) j.at("logging").get_to(c.logging);
}

// Config validation
void Config::validate() const {
    if (cache.enabled && cache.ttl_hours == 0) {
        throw ConfigurationError("cache.ttl_hours must be non-zero when cache is enabled");
    }

    if (checkpoint.interval == 0) {
        throw ConfigurationError("checkpoint.interval must be non-zero");
    }

    if (llm.command.empty() || llm.command.front().empty()) {
        throw ConfigurationError("llm.command cannot be empty");
    }
    if (llm.model.empty()) {
        throw ConfigurationError("llm.model cannot be empty");
    }
    if (llm.timeout_seconds == 0) {
        throw ConfigurationError("llm.timeout_seconds must be non-zero");
    }

    if (chunking.chunk_size == 0) {
        throw ConfigurationError("chunking.chunk_size must be non-zero");
    }
    if (chunking.max_context_chars == 0) {
        throw ConfigurationError("chunking.max_context_chars must be non-zero");
    }
    static constexpr std::string_view kGroupings[] = {
        "size", "sender", "domain", "thread", "day", "week", "month"};
    if (std::find(std::begin(kGroupings), std::end(kGroupings), chunking.group_by) == std::end(kGroupings)) {
        throw ConfigurationError("chunking.group_by is not a valid grouping: " + chunking.group_by);
    }

    if (!util::Logger::parse_level(logging.level)) {
        throw ConfigurationError("logging.level is not a valid level: " + logging.level);
    }
    if (!logging.file.empty() && (logging.max_file_size_mb == 0 || logging.max_files == 0)) {
        throw ConfigurationError("logging.max_file_size_mb and logging.max_files must be non-zero");
    }
}

// ConfigManager implementation
bool ConfigManager::load(int argc, char* argv[]) {
    // Start with defaults
    config_ = Config{};
    invocation_ = Invocation{};
    config_path_.clear();

    // First pass: look for --help or --config
    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);

        if (arg == "--help" || arg == "-h") {
            print_help(argv[0]);
            return false;
        }

        if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            config_path_ = argv[++i];
        } else if (arg.starts_with("--config=")) {
            config_path_ = arg.substr(9);
        } else if (arg.starts_with("-c=")) {
            config_path_ = arg.substr(3);
        }
    }

    // Load from config file if specified
    if (!config_path_.empty()) {
        load_from_file(config_path_);
    }

    // Apply environment variable overrides
    apply_environment_overrides();

    // Apply CLI overrides (highest precedence)
    apply_cli_overrides(argc, argv);

    // Validate final configuration
    config_.validate();

    return true;
}

void ConfigManager::print_help(const char* program_name) {
    std::cout << "MAILRLM - Resumable Email Analysis Toolkit\n"
              << "\n"
              << "Usage: " << program_name << " [OPTIONS] COMMAND [ARGS]\n"
              << "\n"
              << "Commands:\n"
              << "  run                     Analyze an email dump chunk by chunk\n"
              << "  cache stats             Show query cache statistics\n"
              << "  cache clear             Remove every cached query result\n"
              << "  cache cleanup           Remove expired cache entries\n"
              << "  checkpoint info PATH    Show checkpoint progress\n"
              << "  checkpoint clear PATH   Delete a checkpoint\n"
              << "  senders [N]             List the N most frequent senders (default: 10)\n"
              << "\n"
              << "Options:\n"
              << "  -h, --help              Show this help message and exit\n"
              << "  -c, --config FILE       Path to JSON configuration file\n"
              << "  --log-level LEVEL       Log level (trace/debug/info/warn/error/critical/off)\n"
              << "  --emails FILE           Email dump to analyze (run)\n"
              << "  --prompt TEXT           Task applied to every chunk (run)\n"
              << "  --keyword TEXT          Keep emails mentioning TEXT (run, senders)\n"
              << "  --from TEXT             Keep emails whose sender contains TEXT (run, senders)\n"
              << "  --chunk-size N          Emails per chunk (default: 20)\n"
              << "  --group-by KIND         size, sender, domain, thread, day, week or month\n"
              << "  --checkpoint PATH       Checkpoint file; enables resume\n"
              << "  --interval N            Chunks between checkpoints (default: 10)\n"
              << "  --model NAME            Model name recorded in cache keys\n"
              << "  --no-cache              Bypass the query cache\n"
              << "\n"
              << "Environment Variables:\n"
              << "  MAILRLM_CONFIG              Path to configuration file\n"
              << "  MAILRLM_CACHE_ENABLED       Enable/disable cache (true/false)\n"
              << "  MAILRLM_CACHE_DIR           Cache directory\n"
              << "  MAILRLM_CACHE_TTL_HOURS     Cache TTL in hours\n"
              << "  MAILRLM_CHECKPOINT_PATH     Checkpoint file\n"
              << "  MAILRLM_CHECKPOINT_INTERVAL Chunks between checkpoints\n"
              << "  MAILRLM_LLM_COMMAND         Model command (space separated)\n"
              << "  MAILRLM_MODEL               Model name\n"
              << "  MAILRLM_LLM_TIMEOUT         Model command timeout in seconds\n"
              << "  MAILRLM_CHUNK_SIZE          Emails per chunk\n"
              << "  MAILRLM_GROUP_BY            Chunk grouping\n"
              << "  MAILRLM_LOG_LEVEL           Log level\n"
              << "  MAILRLM_LOG_FILE            Log file path (stderr if not set)\n"
              << "\n"
              << "Configuration Precedence (highest to lowest):\n"
              << "  1. Command-line arguments\n"
              << "  2. Environment variables\n"
              << "  3. Configuration file\n"
              << "  4. Default values\n"
              << "\n"
              << "Configuration File Format (JSON):\n"
              << "  {\n"
              << "    \"cache\": {\"enabled\": true, \"dir\": \"\", \"ttl_hours\": 24},\n"
              << "    \"checkpoint\": {\"path\": \"\", \"interval\": 10},\n"
              << "    \"llm\": {\n"
              << "      \"command\": [\"claude\", \"--print\", \"-p\"],\n"
              << "      \"model\": \"claude-cli\",\n"
              << "      \"timeout_seconds\": 120\n"
              << "    },\n"
              << "    \"chunking\": {\"chunk_size\": 20, \"max_context_chars\": 4000,\n"
              << "                 \"group_by\": \"size\"},\n"
              << "    \"logging\": {\n"
              << "      \"level\": \"info\",\n"
              << "      \"file\": \"\",\n"
              << "      \"max_file_size_mb\": 100,\n"
              << "      \"max_files\": 5,\n"
              << "      \"enable_console\": true,\n"
              << "      \"enable_colors\": true\n"
              << "    }\n"
              << "  }\n";
}

void ConfigManager::load_from_file(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        throw ConfigurationError("file not found: " + path.string());
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigurationError("cannot open file: " + path.string());
    }

    try {
        nlohmann::json j = nlohmann::json::parse(file);
        config_ = j.get<Config>();
        MAILRLM_LOG_DEBUG(log_component::Config, "Loaded configuration from {}", path.string());
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationError("invalid JSON in " + path.string() + ": " + e.what());
    }
}

void ConfigManager::apply_environment_overrides() {
    // Check for config file path from environment
    if (config_path_.empty()) {
        if (auto env = get_env("MAILRLM_CONFIG")) {
            config_path_ = *env;
            if (!config_path_.empty()) {
                load_from_file(config_path_);
            }
        }
    }

    // Cache settings
    if (auto env = get_env("MAILRLM_CACHE_ENABLED")) {
        config_.cache.enabled = parse_bool(*env);
    }
    if (auto env = get_env("MAILRLM_CACHE_DIR")) {
        config_.cache.dir = *env;
    }
    if (auto env = get_env("MAILRLM_CACHE_TTL_HOURS")) {
        config_.cache.ttl_hours = parse_u32("MAILRLM_CACHE_TTL_HOURS", *env);
    }

    // Checkpoint settings
    if (auto env = get_env("MAILRLM_CHECKPOINT_PATH")) {
        config_.checkpoint.path = *env;
    }
    if (auto env = get_env("MAILRLM_CHECKPOINT_INTERVAL")) {
        config_.checkpoint.interval = parse_count("MAILRLM_CHECKPOINT_INTERVAL", *env);
    }

    // Model settings
    if (auto env = get_env("MAILRLM_LLM_COMMAND")) {
        config_.llm.command = split_command(*env);
    }
    if (auto env = get_env("MAILRLM_MODEL")) {
        config_.llm.model = *env;
    }
    if (auto env = get_env("MAILRLM_LLM_TIMEOUT")) {
        config_.llm.timeout_seconds = parse_u32("MAILRLM_LLM_TIMEOUT", *env);
    }

    // Chunking settings
    if (auto env = get_env("MAILRLM_CHUNK_SIZE")) {
        config_.chunking.chunk_size = parse_count("MAILRLM_CHUNK_SIZE", *env);
    }
    if (auto env = get_env("MAILRLM_GROUP_BY")) {
        config_.chunking.group_by = *env;
    }

    // Logging settings
    if (auto env = get_env("MAILRLM_LOG_LEVEL")) {
        config_.logging.level = *env;
    }
    if (auto env = get_env("MAILRLM_LOG_FILE")) {
        config_.logging.file = *env;
    }
}

void ConfigManager::apply_cli_overrides(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);

        // Skip already processed args
        if (arg == "--config" || arg == "-c") { ++i; continue; }
        if (arg.starts_with("--config=") || arg.starts_with("-c=")) continue;

        if (auto v = take_value(arg, "--log-level", i, argc, argv)) {
            config_.logging.level = *v;
        } else if (auto v = take_value(arg, "--chunk-size", i, argc, argv)) {
            config_.chunking.chunk_size = parse_count("--chunk-size", *v);
        } else if (auto v = take_value(arg, "--group-by", i, argc, argv)) {
            config_.chunking.group_by = *v;
        } else if (auto v = take_value(arg, "--checkpoint", i, argc, argv)) {
            config_.checkpoint.path = *v;
        } else if (auto v = take_value(arg, "--interval", i, argc, argv)) {
            config_.checkpoint.interval = parse_count("--interval", *v);
        } else if (auto v = take_value(arg, "--model", i, argc, argv)) {
            config_.llm.model = *v;
        } else if (arg == "--no-cache") {
            config_.cache.enabled = false;
        } else if (auto v = take_value(arg, "--emails", i, argc, argv)) {
            invocation_.emails_file = *v;
        } else if (auto v = take_value(arg, "--prompt", i, argc, argv)) {
            invocation_.prompt = *v;
        } else if (auto v = take_value(arg, "--keyword", i, argc, argv)) {
            invocation_.keyword = *v;
        } else if (auto v = take_value(arg, "--from", i, argc, argv)) {
            invocation_.sender = *v;
        } else if (arg.starts_with("-") && arg != "-") {
            throw ConfigurationError("Unknown option: " + arg);
        } else {
            invocation_.positional.push_back(arg);
        }
    }
}

std::optional<std::string> ConfigManager::get_env(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value) {
        return std::string(value);
    }
    return std::nullopt;
}

} // namespace mailrlm::config
