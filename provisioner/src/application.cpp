#include "application.hpp"

#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

#include "util/encoding_utils.hpp"

namespace {
constexpr int EXIT_OK = 0;
constexpr int EXIT_FAILED = 1;
constexpr int EXIT_USAGE = 2;

bool parse_command(const std::string& name, application_command& command) {
    if (name == "prepare") {
        command = application_command::prepare;
    } else if (name == "device-name") {
        command = application_command::device_name;
    } else if (name == "local-account") {
        command = application_command::local_account;
    } else if (name == "user-input") {
        command = application_command::user_input;
    } else if (name == "show-config") {
        command = application_command::show_config;
    } else {
        return false;
    }
    return true;
}
} // namespace

bool application::parse_command_line(const std::vector<std::string>& args, command_line& result,
                                     std::string& error) {
    result = command_line();

    // Leading options
    size_t index = 0;
    while (index < args.size() && args[index].rfind("--", 0) == 0) {
        if (args[index] == "--config") {
            if (index + 1 >= args.size() || args[index + 1].empty() ||
                args[index + 1].rfind("--", 0) == 0) {
                error = "Missing value for --config";
                return false;
            }
            result.config_path = args[index + 1];
            index += 2;
        } else if (args[index] == "--help") {
            result.show_help = true;
            return true;
        } else {
            error = "Unknown option: " + args[index];
            return false;
        }
    }

    if (index >= args.size()) {
        error = "Missing command";
        return false;
    }
    if (!parse_command(args[index], result.command)) {
        error = "Unknown command: " + args[index];
        return false;
    }
    result.command_args.assign(args.begin() + static_cast<long>(index) + 1, args.end());
    return true;
}

int application::run(int argc, char** argv) {
    const char* program = argc > 0 ? argv[0] : "unattend-provisioner";
    std::vector<std::string> args(argv + (argc > 0 ? 1 : 0), argv + argc);

    command_line parsed;
    std::string usage_error;
    if (!parse_command_line(args, parsed, usage_error)) {
        std::cerr << "[Provisioner] " << usage_error << std::endl;
        print_usage(program);
        return EXIT_USAGE;
    }
    if (parsed.show_help) {
        print_usage(program);
        return EXIT_OK;
    }

    if (!parsed.config_path.empty()) {
        deployment_config_loader loader;
        if (!loader.load(parsed.config_path, m_config)) {
            return EXIT_FAILED;
        }
    }

    const std::vector<std::string>& command_args = parsed.command_args;
    switch (parsed.command) {
    case application_command::prepare:
        return run_prepare();
    case application_command::device_name:
        return run_device_name(command_args);
    case application_command::local_account:
        return run_local_account(command_args);
    case application_command::user_input:
        return run_user_input(command_args);
    case application_command::show_config:
        return run_show_config();
    }
    return EXIT_USAGE;
}

int application::run_prepare() {
    std::cout << "[Provisioner] Preparing answer file for '" << m_config.deployment_folder << "'"
              << std::endl;

    unattend_error_info error;
    std::unique_ptr<answer_file> file = answer_file::load_or_create(
        m_config.source_answer_file(), m_config.output_answer_file(), error);
    if (!file) {
        std::cerr << "[Provisioner] " << error.message << std::endl;
        return EXIT_FAILED;
    }

    // device-name runs later against this file and refuses to create the
    // component on its own.
    file->find_or_create_component(passes::SPECIALIZE, components::SHELL_SETUP);

    unattend_manager manager(m_config);
    if (!manager.inject_bootstrap(*file, m_config.deployment_folder)) {
        std::cerr << "[Provisioner] Failed to inject bootstrap: "
                  << manager.get_last_error().message << std::endl;
        return EXIT_FAILED;
    }

    std::cout << "[Provisioner] Answer file written to " << file->target_path() << std::endl;
    return EXIT_OK;
}

std::unique_ptr<answer_file> application::open_runtime_file() {
    unattend_error_info error;
    std::unique_ptr<answer_file> file = answer_file::open(m_config.output_answer_file(), error);
    if (!file) {
        std::cerr << "[Provisioner] " << error.message << std::endl;
    }
    return file;
}

int application::run_device_name(const std::vector<std::string>& args) {
    if (args.size() != 1) {
        std::cerr << "[Provisioner] device-name expects exactly one name" << std::endl;
        return EXIT_USAGE;
    }

    std::unique_ptr<answer_file> file = open_runtime_file();
    if (!file) {
        return EXIT_FAILED;
    }

    unattend_manager manager(m_config);
    return manager.set_device_name(*file, args[0]) ? EXIT_OK : EXIT_FAILED;
}

int application::run_local_account(const std::vector<std::string>& args) {
    std::string username;
    std::string encoded_password;

    if (args.size() == 2) {
        username = args[0];
        encoded_password = args[1];
    } else if (args.size() == 3 && args[1] == "--plain") {
        username = args[0];
        encoded_password = encoding_utils::encode_unattend_password(args[2]);
    } else {
        std::cerr << "[Provisioner] local-account expects <username> <encoded-password> or "
                     "<username> --plain <password>"
                  << std::endl;
        return EXIT_USAGE;
    }

    std::unique_ptr<answer_file> file = open_runtime_file();
    if (!file) {
        return EXIT_FAILED;
    }

    unattend_manager manager(m_config);
    return manager.set_local_account(*file, username, encoded_password) ? EXIT_OK : EXIT_FAILED;
}

int application::run_user_input(const std::vector<std::string>& args) {
    unattend_manager::user_input fields;
    if (!parse_user_input(args, fields)) {
        return EXIT_USAGE;
    }

    std::unique_ptr<answer_file> file = open_runtime_file();
    if (!file) {
        return EXIT_FAILED;
    }

    unattend_manager manager(m_config);
    return manager.set_user_input(*file, fields) ? EXIT_OK : EXIT_FAILED;
}

int application::run_show_config() {
    nlohmann::json json = m_config.to_json();
    json["source_answer_file"] = m_config.source_answer_file().string();
    json["copy_script_file"] = m_config.copy_script_file().string();
    json["output_answer_file"] = m_config.output_answer_file().string();
    json["second_stage_script"] = m_config.second_stage_script();
    std::cout << json.dump(4) << std::endl;
    return EXIT_OK;
}

bool application::parse_user_input(const std::vector<std::string>& args,
                                   unattend_manager::user_input& fields) {
    if (args.empty()) {
        std::cerr << "[Provisioner] user-input expects a JSON file or key=value pairs" << std::endl;
        return false;
    }

    // A single argument without '=' names a JSON file holding a flat object.
    if (args.size() == 1 && args[0].find('=') == std::string::npos) {
        std::ifstream input(args[0]);
        if (!input.is_open()) {
            std::cerr << "[Provisioner] Failed to open user input file: " << args[0] << std::endl;
            return false;
        }

        nlohmann::json json;
        try {
            json = nlohmann::json::parse(input);
        } catch (const nlohmann::json::parse_error& e) {
            std::cerr << "[Provisioner] Failed to parse user input JSON: " << e.what()
                      << std::endl;
            return false;
        }

        if (!json.is_object()) {
            std::cerr << "[Provisioner] User input JSON must be an object" << std::endl;
            return false;
        }

        for (auto it = json.begin(); it != json.end(); ++it) {
            if (it.value().is_string()) {
                fields[it.key()] = it.value().get<std::string>();
            } else if (it.value().is_primitive() && !it.value().is_null()) {
                fields[it.key()] = it.value().dump();
            } else {
                std::cerr << "[Provisioner] User input '" << it.key()
                          << "' must be a string, number or boolean" << std::endl;
                return false;
            }
        }
        return true;
    }

    for (const auto& arg : args) {
        size_t separator = arg.find('=');
        if (separator == std::string::npos || separator == 0) {
            std::cerr << "[Provisioner] Expected key=value, got: " << arg << std::endl;
            return false;
        }
        fields[arg.substr(0, separator)] = arg.substr(separator + 1);
    }
    return true;
}

void application::print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [--config <file>] <command> [args]\n"
              << "\n"
              << "Commands:\n"
              << "  prepare                                 inject the bootstrap into the media "
                 "answer file\n"
              << "  device-name <name>                      set the computer name\n"
              << "  local-account <user> <base64>           create or update an administrator\n"
              << "  local-account <user> --plain <password> same, encoding the password\n"
              << "  user-input <file.json>                  store user input from a JSON object\n"
              << "  user-input <key=value>...               store user input pairs\n"
              << "  show-config                             print the effective configuration"
              << std::endl;
}
