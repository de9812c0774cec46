#ifndef IMGRELAY_CONFIG_HPP
#define IMGRELAY_CONFIG_HPP

#include <json/json.h>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>

namespace imgrelay {

enum class OutputFormat {
    None,   // no conversion; in codec requests: keep the source format
    Jpeg,
    Webp
};

// "JPEG" / "WEBP" in any case, surrounding whitespace ignored. Anything else is None.
OutputFormat parseOutputFormat(const std::string& value);
const char* toString(OutputFormat format);

struct ProcessingSettings {
    int maxWidth = 1920;
    int maxHeight = 1080;
    int maxNarrowSide = 0; // 0: narrow side strategy disabled
    int jpegQuality = 90;
    int webpQuality = 85;
    OutputFormat convertToFormat = OutputFormat::None;
};

struct Config {
    ProcessingSettings processing;
    bool normalizeExtensions = true;
    std::size_t uploadMaxSize = 100 << 20;
    std::string forwardDestination = "https://httpbin.org/anything";
    std::string fileUploadField = "assetData";
    std::string listenPath = "/api/assets";
};

using EnvLookup = std::function<std::optional<std::string>(const std::string& name)>;

/**
 * @brief Builds the configuration from the custom_config section of the Drogon config
 *        file, then applies environment overrides. Invalid values are logged and ignored.
 * @param custom The "imgrelay" object of custom_config (may be null).
 * @param env Environment lookup, returns std::nullopt for unset variables.
 */
Config configFromSources(const Json::Value& custom, const EnvLookup& env);

// Reads drogon::app().getCustomConfig()["imgrelay"] and the process environment.
Config loadConfig();

void logConfig(const Config& config);

}

#endif // IMGRELAY_CONFIG_HPP
