#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "deployment_config.hpp"
#include "unattend_manager.hpp"

enum class application_command {
    prepare,
    device_name,
    local_account,
    user_input,
    show_config,
};

// Leading options and the command word, split from the command's own arguments.
struct command_line {
    std::string config_path;
    bool show_help = false;
    application_command command = application_command::show_config;
    std::vector<std::string> command_args;
};

class application {
public:
    static application& instance() {
        static application app;
        return app;
    }

    // Exit codes: 0 success, 1 operation failed, 2 usage error.
    int run(int argc, char** argv);

    // Parses args (argv without the program name). On a usage error returns
    // false and describes it in error.
    static bool parse_command_line(const std::vector<std::string>& args, command_line& result,
                                   std::string& error);

    // Remove copy/move constructors
    application(const application&) = delete;
    application& operator=(const application&) = delete;
    application(application&&) = delete;
    application& operator=(application&&) = delete;

private:
    application() = default;
    ~application() = default;

    deployment_config m_config;

    int run_prepare();
    int run_device_name(const std::vector<std::string>& args);
    int run_local_account(const std::vector<std::string>& args);
    int run_user_input(const std::vector<std::string>& args);
    int run_show_config();

    // Opens the runtime answer file every post-preparation command works on.
    std::unique_ptr<answer_file> open_runtime_file();

    bool parse_user_input(const std::vector<std::string>& args,
                          unattend_manager::user_input& fields);

    static void print_usage(const char* program);
};
