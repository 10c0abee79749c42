#pragma once

#include <map>
#include <set>
#include <string>

#include "answer_file.hpp"
#include "deployment_config.hpp"
#include "unattend_error.hpp"

// Mutations applied to an answer file during media preparation and later
// provisioning. Every successful call ends with the file saved to its
// target path; a failed call reports why through get_last_error().
class unattend_manager {
public:
    using user_input = std::map<std::string, std::string>;

    explicit unattend_manager(deployment_config config = deployment_config());
    ~unattend_manager() = default;

    // Embeds the copy script and appends the specialize bootstrap command
    // and the first-logon second-stage command.
    bool inject_bootstrap(answer_file& file, const std::string& deployment_folder);

    // Replaces the embedded copy script with script_text.
    bool set_copy_script(answer_file& file, const std::string& script_text);

    // Upserts each field under the UserInput block. Denylisted keys are
    // dropped before anything is written.
    bool set_user_input(answer_file& file, const user_input& fields);

    // Requires the specialize shell-setup component to already exist.
    bool set_device_name(answer_file& file, const std::string& device_name);

    // Creates or updates the local administrator account named username.
    // encoded_password is stored as given, with PlainText false.
    bool set_local_account(answer_file& file, const std::string& username,
                           const std::string& encoded_password);

    // Keys never persisted from user input.
    static const std::set<std::string>& redacted_user_input_keys();
    static user_input redact_user_input(const user_input& fields);

    // Commands as they are written into the answer file.
    std::string specialize_command(const std::string& deployment_folder) const;
    std::string first_logon_command(const std::string& deployment_folder) const;

    const deployment_config& config() const {
        return m_config;
    }

    const unattend_error_info& get_last_error() const;

private:
    deployment_config m_config;
    unattend_error_info m_last_error;

    void set_error(unattend_error code, const std::string& message);
    bool persist(answer_file& file);

    xmlNodePtr extension_block(answer_file& file);
    void write_copy_script(answer_file& file, const std::string& script_text);
    bool read_copy_script(const std::filesystem::path& path, std::string& script_text);
};
