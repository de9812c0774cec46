#include <support/config.hpp>
#include <drogon/drogon.h>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <vector>

namespace imgrelay {

static std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\n\r");
    return s.substr(start, end - start + 1);
}

static bool parseInteger(const std::string& text, long long& out) {
    if (text.empty()) return false;
    const char* first = text.data();
    const char* last = first + text.size();
    auto [ptr, ec] = std::from_chars(first, last, out);
    return ec == std::errc() && ptr == last;
}

OutputFormat parseOutputFormat(const std::string& value) {
    std::string normalized = trim(value);
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (normalized == "JPEG") return OutputFormat::Jpeg;
    if (normalized == "WEBP") return OutputFormat::Webp;
    return OutputFormat::None;
}

const char* toString(OutputFormat format) {
    switch (format) {
        case OutputFormat::Jpeg: return "JPEG";
        case OutputFormat::Webp: return "WEBP";
        case OutputFormat::None: break;
    }
    return "";
}

namespace {

using Applier = void (*)(const std::string& key, const std::string& text, Config& config);

struct Setting {
    const char* fileKey;
    const char* envKey;
    Applier apply;
};

void applyBoundedInt(const std::string& key, const std::string& text, int& target, long long minValue, long long maxValue) {
    long long n = 0;
    if (parseInteger(text, n) && n >= minValue && n <= maxValue) {
        target = static_cast<int>(n);
        return;
    }
    LOG_WARN << "Invalid " << key << "=\"" << text << "\", using " << target;
}

void applyString(const std::string& key, const std::string& text, std::string& target) {
    if (text.empty()) {
        LOG_WARN << "Invalid " << key << "=\"\", using \"" << target << "\"";
        return;
    }
    target = text;
}

constexpr long long kIntMax = 1LL << 30;

const std::vector<Setting>& settingsTable() {
    static const std::vector<Setting> table = {
        {"img_max_width", "IMG_MAX_WIDTH", [](const std::string& key, const std::string& text, Config& c) {
            applyBoundedInt(key, text, c.processing.maxWidth, 1, kIntMax);
        }},
        {"img_max_height", "IMG_MAX_HEIGHT", [](const std::string& key, const std::string& text, Config& c) {
            applyBoundedInt(key, text, c.processing.maxHeight, 1, kIntMax);
        }},
        {"img_max_narrow_side", "IMG_MAX_NARROW_SIDE", [](const std::string& key, const std::string& text, Config& c) {
            applyBoundedInt(key, text, c.processing.maxNarrowSide, 0, kIntMax);
        }},
        {"jpeg_quality", "JPEG_QUALITY", [](const std::string& key, const std::string& text, Config& c) {
            applyBoundedInt(key, text, c.processing.jpegQuality, 1, 100);
        }},
        {"webp_quality", "WEBP_QUALITY", [](const std::string& key, const std::string& text, Config& c) {
            applyBoundedInt(key, text, c.processing.webpQuality, 1, 100);
        }},
        {"normalize_extensions", "NORMALIZE_EXTENSIONS", [](const std::string& key, const std::string& text, Config& c) {
            if (text == "0" || text == "1") {
                c.normalizeExtensions = (text == "1");
                return;
            }
            LOG_WARN << "Invalid " << key << "=\"" << text << "\", using " << (c.normalizeExtensions ? "1" : "0");
        }},
        {"convert_to_format", "CONVERT_TO_FORMAT", [](const std::string& key, const std::string& text, Config& c) {
            OutputFormat format = parseOutputFormat(text);
            if (format == OutputFormat::None && !trim(text).empty()) {
                LOG_WARN << "Invalid " << key << "=\"" << text
                         << "\", format conversion disabled (valid values: \"\", \"JPEG\", \"WEBP\")";
            }
            c.processing.convertToFormat = format;
        }},
        {"upload_max_size", "UPLOAD_MAX_SIZE", [](const std::string& key, const std::string& text, Config& c) {
            long long n = 0;
            if (parseInteger(text, n) && n > 0) {
                c.uploadMaxSize = static_cast<std::size_t>(n);
                return;
            }
            LOG_WARN << "Invalid " << key << "=\"" << text << "\", using " << c.uploadMaxSize;
        }},
        {"forward_destination", "FORWARD_DESTINATION", [](const std::string& key, const std::string& text, Config& c) {
            applyString(key, text, c.forwardDestination);
        }},
        {"file_upload_field", "FILE_UPLOAD_FIELD", [](const std::string& key, const std::string& text, Config& c) {
            applyString(key, text, c.fileUploadField);
        }},
        {"listen_path", "LISTEN_PATH", [](const std::string& key, const std::string& text, Config& c) {
            applyString(key, text, c.listenPath);
        }},
    };
    return table;
}

std::optional<std::string> scalarText(const Json::Value& value) {
    if (value.isBool()) return std::string(value.asBool() ? "1" : "0");
    if (value.isIntegral()) return std::to_string(value.asInt64());
    if (value.isString()) return value.asString();
    return std::nullopt;
}

}

Config configFromSources(const Json::Value& custom, const EnvLookup& env) {
    Config config;
    for (const auto& setting : settingsTable()) {
        if (custom.isObject() && custom.isMember(setting.fileKey)) {
            auto text = scalarText(custom[setting.fileKey]);
            if (text) {
                setting.apply(setting.fileKey, *text, config);
            } else {
                LOG_WARN << "Ignoring non-scalar custom_config value for " << setting.fileKey;
            }
        }
        if (env) {
            auto text = env(setting.envKey);
            if (text && !text->empty()) {
                setting.apply(setting.envKey, *text, config);
            }
        }
    }
    return config;
}

Config loadConfig() {
    const auto& custom = drogon::app().getCustomConfig()["imgrelay"];
    return configFromSources(custom, [](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (!value) return std::nullopt;
        return std::string(value);
    });
}

void logConfig(const Config& config) {
    LOG_INFO << "IMG_MAX_WIDTH: " << config.processing.maxWidth;
    LOG_INFO << "IMG_MAX_HEIGHT: " << config.processing.maxHeight;
    LOG_INFO << "IMG_MAX_NARROW_SIDE: " << config.processing.maxNarrowSide;
    LOG_INFO << "JPEG_QUALITY: " << config.processing.jpegQuality;
    LOG_INFO << "WEBP_QUALITY: " << config.processing.webpQuality;
    LOG_INFO << "CONVERT_TO_FORMAT: \"" << toString(config.processing.convertToFormat) << "\"";
    LOG_INFO << "NORMALIZE_EXTENSIONS: " << (config.normalizeExtensions ? 1 : 0);
    LOG_INFO << "UPLOAD_MAX_SIZE: " << config.uploadMaxSize;
    LOG_INFO << "FORWARD_DESTINATION: " << config.forwardDestination;
    LOG_INFO << "FILE_UPLOAD_FIELD: " << config.fileUploadField;
    LOG_INFO << "LISTEN_PATH: " << config.listenPath;
}

}
