#include <cadence/config.hpp>
#include <cstdlib>
#include <exception>
#include <string>
#include <string_view>

namespace cadence
{

namespace
{

const char* env_value(const char* name)
{
    const char* value = std::getenv(name);
    return (value && value[0] != '\0') ? value : nullptr;
}

bool parse_float(const char* text, float& out)
{
    try
    {
        size_t consumed = 0;
        float  value    = std::stof(text, &consumed);
        if (consumed != std::string(text).size())
            return false;
        out = value;
        return true;
    }
    catch (const std::exception&)
    {
        return false;
    }
}

// "name=level[,name=level...]"; malformed entries are skipped with a warning.
void parse_category_levels(std::string_view text, EngineConfig& config)
{
    while (!text.empty())
    {
        size_t           comma = text.find(',');
        std::string_view entry = text.substr(0, comma);
        text                   = comma == std::string_view::npos ? std::string_view{} : text.substr(comma + 1);

        if (entry.empty())
            continue;

        size_t eq = entry.find('=');
        if (eq == std::string_view::npos || eq == 0)
        {
            CADENCE_LOG_WARN("config", "ignoring log category entry '{}'", entry);
            continue;
        }

        auto level = Logger::parse_level(entry.substr(eq + 1));
        if (!level)
        {
            CADENCE_LOG_WARN("config", "unknown level in log category entry '{}'", entry);
            continue;
        }
        config.category_levels.emplace_back(std::string(entry.substr(0, eq)), *level);
    }
}

}   // anonymous namespace

EngineConfig EngineConfig::from_env()
{
    return from_env(EngineConfig{});
}

EngineConfig EngineConfig::from_env(const EngineConfig& base)
{
    EngineConfig config = base;

    if (const char* level = env_value("CADENCE_LOG_LEVEL"))
    {
        if (auto parsed = Logger::parse_level(level))
            config.log_level = *parsed;
        else
            CADENCE_LOG_WARN("config", "unknown CADENCE_LOG_LEVEL '{}', keeping default", level);
    }

    if (const char* categories = env_value("CADENCE_LOG_CATEGORIES"))
        parse_category_levels(categories, config);

    if (const char* file = env_value("CADENCE_LOG_FILE"))
        config.log_file = file;

    if (const char* fps = env_value("CADENCE_TARGET_FPS"))
    {
        float value = 0.0f;
        if (parse_float(fps, value) && value >= 0.0f)
            config.target_fps = value;
        else
            CADENCE_LOG_WARN("config", "ignoring CADENCE_TARGET_FPS '{}'", fps);
    }

    if (const char* dt = env_value("CADENCE_FIXED_DT"))
    {
        float value = 0.0f;
        if (parse_float(dt, value) && value > 0.0f)
            config.fixed_timestep = value;
        else
            CADENCE_LOG_WARN("config", "ignoring CADENCE_FIXED_DT '{}'", dt);
    }

    return config;
}

void apply_logging(const EngineConfig& config)
{
    auto& logger = Logger::instance();
    logger.clear_sinks();
    logger.set_level(config.log_level);
    logger.clear_category_levels();
    for (const auto& [category, level] : config.category_levels)
        logger.set_category_level(category, level);

    if (config.log_to_console)
        logger.add_sink(sinks::console_sink());
    if (!config.log_file.empty())
        logger.add_sink(sinks::file_sink(config.log_file));

    CADENCE_LOG_DEBUG("config",
                      "logging at {}{}",
                      Logger::level_to_string(config.log_level),
                      config.log_file.empty() ? std::string() : " to " + config.log_file);
}

}   // namespace cadence
