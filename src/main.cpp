#include <controllers/proxy.hpp>
#include <support/config.hpp>
#include <support/image_codec.hpp>
#include <drogon/drogon.h>
#include <filesystem>
#include <iostream>
#include <yaml-cpp/yaml.h>

namespace fs = std::filesystem;

// Looks in the working directory, then in its parent, which becomes the working directory.
static std::string locateConfigFile() {
    static const char* const candidates[] = {"config.json", "config.yaml"};
    for (const char* name : candidates) {
        if (fs::exists(name)) return name;
    }
    for (const char* name : candidates) {
        if (fs::exists(fs::path("..") / name)) {
            fs::current_path("..");
            return name;
        }
    }
    return "";
}

static void applyShutdownOptions(const std::string& path) {
    if (!fs::exists(path)) return;
    try {
        YAML::Node options = YAML::LoadFile(path)["shutdown_options"];
        if (options && options["log_cleanup"] && options["log_cleanup"].as<bool>()) {
            std::cout << "Cleaning up log directory" << std::endl;
            fs::remove_all("logs");
            fs::create_directory("logs");
        }
    } catch (const std::exception& e) {
        std::cerr << "Failed to parse " << path << ": " << e.what() << std::endl;
    }
}

int main() {
    std::string configPath = locateConfigFile();
    if (configPath.empty()) {
        LOG_ERROR << "Could not find config.yaml or config.json";
        return 1;
    }

    if (!fs::exists("logs")) {
        fs::create_directory("logs");
        LOG_INFO << "Created log directory";
    }

    try {
        drogon::app().loadConfigFile(configPath);
        LOG_INFO << "Loaded config file from: " << fs::absolute(configPath).string();
    } catch (const std::exception& e) {
        LOG_ERROR << "Failed to load config file: " << e.what();
        return 1;
    }

    imgrelay::Config config = imgrelay::loadConfig();
    imgrelay::logConfig(config);
    drogon::app().setClientMaxBodySize(config.uploadMaxSize);

    auto proxy = std::make_shared<imgrelay::ProxyController>(
        config, std::make_shared<imgrelay::image::NativeImageCodec>());
    proxy->registerRoutes();

    drogon::app().run();

    applyShutdownOptions("shutdown_options.yaml");
    return 0;
}
