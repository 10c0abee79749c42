#include "deployment_config.hpp"

#include <fstream>
#include <iostream>

namespace {
bool read_string(const nlohmann::json& json, const char* key, std::string& target,
                 std::string& error) {
    auto it = json.find(key);
    if (it == json.end()) {
        return true;
    }
    if (!it->is_string()) {
        error = std::string("'") + key + "' must be a string";
        return false;
    }
    target = it->get<std::string>();
    return true;
}
} // namespace

std::filesystem::path deployment_config::source_answer_file() const {
    return std::filesystem::path(media_root) / deployment_folder / "Installer" / "unattended.xml";
}

std::filesystem::path deployment_config::copy_script_file() const {
    return std::filesystem::path(media_root) / deployment_folder / "Installer" / "Functions" /
           "CopySpecialize.ps1";
}

std::filesystem::path deployment_config::output_answer_file() const {
    return std::filesystem::path(runtime_drive) / "Temp" / "unattended.xml";
}

std::string deployment_config::second_stage_script() const {
    std::string root = second_stage_root;
    while (!root.empty() && (root.back() == '\\' || root.back() == '/')) {
        root.pop_back();
    }
    return root + "\\" + deployment_folder + "\\Specialize.ps1";
}

nlohmann::json deployment_config::to_json() const {
    return {
        {"deployment_folder", deployment_folder},
        {"media_root", media_root},
        {"runtime_drive", runtime_drive},
        {"runtime_answer_file", runtime_answer_file},
        {"second_stage_root", second_stage_root},
    };
}

bool deployment_config_loader::load(const std::filesystem::path& config_path,
                                    deployment_config& config) {
    std::ifstream file(config_path);
    if (!file.is_open()) {
        set_error("Failed to open configuration file: " + config_path.string());
        return false;
    }

    nlohmann::json json;
    try {
        json = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        set_error("Failed to parse configuration file " + config_path.string() + ": " + e.what());
        return false;
    }

    if (!from_json(json, config)) {
        return false;
    }

    std::cout << "[Config] Loaded " << config_path << std::endl;
    return true;
}

bool deployment_config_loader::from_json(const nlohmann::json& json, deployment_config& config) {
    if (!json.is_object()) {
        set_error("Configuration must be a JSON object");
        return false;
    }

    deployment_config parsed = config;
    std::string error;
    if (!read_string(json, "deployment_folder", parsed.deployment_folder, error) ||
        !read_string(json, "media_root", parsed.media_root, error) ||
        !read_string(json, "runtime_drive", parsed.runtime_drive, error) ||
        !read_string(json, "runtime_answer_file", parsed.runtime_answer_file, error) ||
        !read_string(json, "second_stage_root", parsed.second_stage_root, error)) {
        set_error("Invalid configuration: " + error);
        return false;
    }

    if (!validate(parsed)) {
        return false;
    }

    config = parsed;
    return true;
}

bool deployment_config_loader::validate(const deployment_config& config) {
    if (config.deployment_folder.empty()) {
        set_error("Deployment folder cannot be empty");
        return false;
    }

    // The folder name ends up inside a quoted PowerShell command line.
    if (config.deployment_folder.find_first_of("\\/'\"`$;") != std::string::npos) {
        set_error("Deployment folder contains invalid characters: " + config.deployment_folder);
        return false;
    }

    if (config.media_root.empty()) {
        set_error("Media root cannot be empty");
        return false;
    }

    if (config.runtime_drive.empty()) {
        set_error("Runtime drive cannot be empty");
        return false;
    }

    if (config.runtime_answer_file.empty() ||
        config.runtime_answer_file.find('\'') != std::string::npos) {
        set_error("Runtime answer file path is empty or contains a single quote");
        return false;
    }

    if (config.second_stage_root.empty() ||
        config.second_stage_root.find('"') != std::string::npos) {
        set_error("Second-stage root is empty or contains a double quote");
        return false;
    }

    return true;
}

std::string deployment_config_loader::get_last_error() const {
    return m_last_error;
}

void deployment_config_loader::set_error(const std::string& error) {
    m_last_error = error;
    std::cerr << "[Config] Error: " << error << std::endl;
}
