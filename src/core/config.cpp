#include "core/config.hpp"

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace {

// A plain file or directory name that resolves directly below the installer
bool is_plain_name(const std::string& name) {
    if (name.empty() || name == "." || name == "..") return false;
    if (name.find_first_of("/\\:") != std::string::npos) return false;
    fs::path p(name);
    return !p.is_absolute() && !p.has_parent_path();
}

// Restores the default for a path-valued key that could escape the installer dir
void keep_plain_name(std::string& value, const std::string& fallback,
                     const char* key, const std::string& file) {
    if (is_plain_name(value)) return;
    spdlog::warn("config {}: {} '{}' rejected", file, key, value);
    value = fallback;
}

}  // namespace

Config::Config(std::string dir) : dir_(std::move(dir)) {}

Config::~Config() = default;

std::string Config::path() const {
    return (fs::path(dir_) / kFileName).string();
}

bool Config::load() {
    std::string file = path();
    std::error_code ec;
    if (dir_.empty() || !fs::exists(file, ec)) {
        return false;
    }

    AppConfig loaded;
    try {
        YAML::Node root = YAML::LoadFile(file);

        // Application section
        if (auto app = root["application"]) {
            loaded.app_name = app["name"].as<std::string>(loaded.app_name);
            loaded.app_repo = app["repo"].as<std::string>(loaded.app_repo);
            loaded.install_dir = app["install_dir"].as<std::string>(loaded.install_dir);
            loaded.release_url = app["release_url"].as<std::string>(loaded.release_url);

            if (auto assets = app["assets"]) {
                loaded.asset_windows = assets["windows"].as<std::string>(loaded.asset_windows);
                loaded.asset_linux = assets["linux"].as<std::string>(loaded.asset_linux);
                loaded.asset_darwin = assets["darwin"].as<std::string>(loaded.asset_darwin);
            }
            if (auto entries = app["entry_points"]) {
                loaded.entry_windows = entries["windows"].as<std::string>(loaded.entry_windows);
                loaded.entry_posix = entries["posix"].as<std::string>(loaded.entry_posix);
            }
        }

        // Network section
        if (auto net = root["network"]) {
            loaded.connect_timeout_s = net["connect_timeout_s"].as<int>(loaded.connect_timeout_s);
            loaded.read_timeout_s = net["read_timeout_s"].as<int>(loaded.read_timeout_s);
            loaded.fetch_release_info = net["fetch_release_info"].as<bool>(loaded.fetch_release_info);
        }

        // Display section
        if (auto display = root["display"]) {
            loaded.language = display["language"].as<std::string>(loaded.language);
            loaded.frame_width = display["frame_width"].as<int>(loaded.frame_width);
        }

        // Logging section
        if (auto logging = root["logging"]) {
            loaded.log_file = logging["file"].as<std::string>(loaded.log_file);
            loaded.log_level = logging["level"].as<std::string>(loaded.log_level);
        }
    } catch (const YAML::Exception& e) {
        spdlog::warn("config {} ignored: {}", file, e.what());
        return false;
    }

    // Everything the installer writes or runs stays directly below its directory
    const AppConfig defaults;
    keep_plain_name(loaded.install_dir, defaults.install_dir, "install_dir", file);
    keep_plain_name(loaded.asset_windows, defaults.asset_windows, "assets.windows", file);
    keep_plain_name(loaded.asset_linux, defaults.asset_linux, "assets.linux", file);
    keep_plain_name(loaded.asset_darwin, defaults.asset_darwin, "assets.darwin", file);
    keep_plain_name(loaded.entry_windows, defaults.entry_windows, "entry_points.windows", file);
    keep_plain_name(loaded.entry_posix, defaults.entry_posix, "entry_points.posix", file);
    keep_plain_name(loaded.log_file, defaults.log_file, "logging.file", file);
    if (loaded.frame_width < 20) loaded.frame_width = 20;
    if (loaded.connect_timeout_s <= 0) loaded.connect_timeout_s = AppConfig{}.connect_timeout_s;
    if (loaded.read_timeout_s <= 0) loaded.read_timeout_s = AppConfig{}.read_timeout_s;

    config_ = std::move(loaded);
    return true;
}

std::string Config::to_yaml() const {
    YAML::Emitter out;
    out << YAML::BeginMap;

    // Application section
    out << YAML::Key << "application" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "name" << YAML::Value << config_.app_name;
    out << YAML::Key << "repo" << YAML::Value << config_.app_repo;
    out << YAML::Key << "install_dir" << YAML::Value << config_.install_dir;
    out << YAML::Key << "release_url" << YAML::Value << config_.release_url;
    out << YAML::Key << "assets" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "windows" << YAML::Value << config_.asset_windows;
    out << YAML::Key << "linux" << YAML::Value << config_.asset_linux;
    out << YAML::Key << "darwin" << YAML::Value << config_.asset_darwin;
    out << YAML::EndMap;
    out << YAML::Key << "entry_points" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "windows" << YAML::Value << config_.entry_windows;
    out << YAML::Key << "posix" << YAML::Value << config_.entry_posix;
    out << YAML::EndMap;
    out << YAML::EndMap;

    // Network section
    out << YAML::Key << "network" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "connect_timeout_s" << YAML::Value << config_.connect_timeout_s;
    out << YAML::Key << "read_timeout_s" << YAML::Value << config_.read_timeout_s;
    out << YAML::Key << "fetch_release_info" << YAML::Value << config_.fetch_release_info;
    out << YAML::EndMap;

    // Display section
    out << YAML::Key << "display" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "language" << YAML::Value << config_.language;
    out << YAML::Key << "frame_width" << YAML::Value << config_.frame_width;
    out << YAML::EndMap;

    // Logging section
    out << YAML::Key << "logging" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "file" << YAML::Value << config_.log_file;
    out << YAML::Key << "level" << YAML::Value << config_.log_level;
    out << YAML::EndMap;

    out << YAML::EndMap;
    return std::string(out.c_str()) + "\n";
}

bool Config::save() const {
    if (dir_.empty()) return false;

    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec) return false;

    std::ofstream fout(path());
    if (!fout.is_open()) return false;
    fout << to_yaml();
    return fout.good();
}

AppConfig& Config::data() { return config_; }
const AppConfig& Config::data() const { return config_; }
