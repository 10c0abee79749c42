#pragma once

#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>

struct deployment_config {
    // Folder on the installation media and under the second-stage root.
    std::string deployment_folder = "EDS";

    // Mount point of the installation media.
    std::string media_root = ".";

    // Drive the setup environment runs from; output goes to <drive>/Temp.
    std::string runtime_drive = "/";

    // Windows paths, used only inside generated command lines.
    std::string runtime_answer_file = "C:\\Windows\\Panther\\unattend.xml";
    std::string second_stage_root = "C:\\Windows\\Setup";

    std::filesystem::path source_answer_file() const;
    std::filesystem::path copy_script_file() const;
    std::filesystem::path output_answer_file() const;
    std::string second_stage_script() const;

    nlohmann::json to_json() const;
};

class deployment_config_loader {
public:
    // Reads a JSON object; keys that are absent keep their defaults.
    bool load(const std::filesystem::path& config_path, deployment_config& config);
    bool from_json(const nlohmann::json& json, deployment_config& config);

    bool validate(const deployment_config& config);

    std::string get_last_error() const;

private:
    std::string m_last_error;

    void set_error(const std::string& error);
};
