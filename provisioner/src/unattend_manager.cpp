#include "unattend_manager.hpp"

#include <fstream>
#include <iostream>
#include <iterator>
#include <system_error>
#include <utility>
#include <libxml/tree.h>

#include "command_list.hpp"
#include "templates/bootstrap_command_template.hpp"

namespace {
constexpr const char* EXTENSION_BLOCK = "Extension";
constexpr const char* COPY_SCRIPT = "CopyScript";
constexpr const char* USER_INPUT = "UserInput";
constexpr const char* ADMINISTRATORS_GROUP = "Administrators";

std::string replace_string(std::string str, const std::string& from, const std::string& to) {
    size_t start_pos = 0;
    while ((start_pos = str.find(from, start_pos)) != std::string::npos) {
        str.replace(start_pos, from.length(), to);
        start_pos += to.length();
    }
    return str;
}

bool is_valid_element_name(const std::string& name) {
    if (name.empty()) {
        return false;
    }
    return xmlValidateNCName(reinterpret_cast<const xmlChar*>(name.c_str()), 0) == 0;
}
} // namespace

unattend_manager::unattend_manager(deployment_config config) : m_config(std::move(config)) {}

const std::set<std::string>& unattend_manager::redacted_user_input_keys() {
    static const std::set<std::string> keys = {"localPassword"};
    return keys;
}

unattend_manager::user_input unattend_manager::redact_user_input(const user_input& fields) {
    user_input redacted = fields;
    for (const auto& key : redacted_user_input_keys()) {
        redacted.erase(key);
    }
    return redacted;
}

std::string unattend_manager::specialize_command(const std::string& deployment_folder) const {
    std::string command = templates::SPECIALIZE_BOOTSTRAP_TEMPLATE;
    command = replace_string(command, "{{ANSWER_FILE}}", m_config.runtime_answer_file);
    command = replace_string(command, "{{EXTENSION_NAMESPACE}}", namespaces::EXTENSION);
    command = replace_string(command, "{{DEPLOYMENT_FOLDER}}", deployment_folder);
    return command;
}

std::string unattend_manager::first_logon_command(const std::string& deployment_folder) const {
    deployment_config config = m_config;
    config.deployment_folder = deployment_folder;
    return replace_string(templates::FIRST_LOGON_TEMPLATE, "{{SECOND_STAGE_SCRIPT}}",
                          config.second_stage_script());
}

bool unattend_manager::inject_bootstrap(answer_file& file, const std::string& deployment_folder) {
    m_last_error.clear();

    deployment_config config = m_config;
    config.deployment_folder = deployment_folder;

    deployment_config_loader validator;
    if (!validator.validate(config)) {
        set_error(unattend_error::invalid_argument, validator.get_last_error());
        return false;
    }

    // Nothing may be written unless the payload is available; a bootstrap
    // command pointing at an empty script would silently do nothing.
    std::string script_text;
    if (!read_copy_script(config.copy_script_file(), script_text)) {
        return false;
    }

    std::string bootstrap = specialize_command(deployment_folder);
    if (bootstrap.size() > templates::MAX_COMMAND_PATH_LENGTH) {
        set_error(unattend_error::invalid_argument,
                  "Bootstrap command is " + std::to_string(bootstrap.size()) +
                      " characters, Setup accepts at most " +
                      std::to_string(templates::MAX_COMMAND_PATH_LENGTH));
        return false;
    }

    // Both lists must have room for another Order before anything is written.
    const std::pair<xmlNodePtr, const char*> lists[] = {
        {file.find_child(file.find_component(passes::SPECIALIZE, components::DEPLOYMENT),
                         "RunSynchronous"),
         "RunSynchronous"},
        {file.find_child(file.find_component(passes::OOBE_SYSTEM, components::SHELL_SETUP),
                         "FirstLogonCommands"),
         "FirstLogonCommands"},
    };
    for (const auto& list : lists) {
        if (command_list::next_order(file, list.first) == 0) {
            set_error(unattend_error::malformed_document,
                      std::string(list.second) + " has no Order left for another command");
            return false;
        }
    }

    write_copy_script(file, script_text);

    xmlNodePtr deployment =
        file.find_or_create_component(passes::SPECIALIZE, components::DEPLOYMENT);
    xmlNodePtr run_synchronous = file.find_or_create_child(deployment, "RunSynchronous");
    if (!command_list::append_command(
            file, run_synchronous,
            {"RunSynchronousCommand", "Path", bootstrap,
             replace_string(templates::SPECIALIZE_BOOTSTRAP_DESCRIPTION, "{{DEPLOYMENT_FOLDER}}",
                            deployment_folder)})) {
        set_error(unattend_error::malformed_document, "Failed to append RunSynchronousCommand");
        return false;
    }

    xmlNodePtr shell_setup =
        file.find_or_create_component(passes::OOBE_SYSTEM, components::SHELL_SETUP);
    xmlNodePtr first_logon = file.find_or_create_child(shell_setup, "FirstLogonCommands");
    if (!command_list::append_command(
            file, first_logon,
            {"SynchronousCommand", "CommandLine", first_logon_command(deployment_folder),
             replace_string(templates::FIRST_LOGON_DESCRIPTION, "{{DEPLOYMENT_FOLDER}}",
                            deployment_folder)})) {
        set_error(unattend_error::malformed_document, "Failed to append SynchronousCommand");
        return false;
    }

    std::cout << "[Unattend] Injected bootstrap for '" << deployment_folder << "'" << std::endl;
    return persist(file);
}

bool unattend_manager::set_copy_script(answer_file& file, const std::string& script_text) {
    m_last_error.clear();
    if (!answer_file::is_valid_text(script_text)) {
        set_error(unattend_error::invalid_argument,
                  "Copy script is not UTF-8 text that XML can carry");
        return false;
    }
    write_copy_script(file, script_text);
    return persist(file);
}

bool unattend_manager::set_user_input(answer_file& file, const user_input& fields) {
    m_last_error.clear();

    user_input accepted = redact_user_input(fields);
    if (accepted.size() != fields.size()) {
        std::cout << "[Unattend] Dropped " << fields.size() - accepted.size()
                  << " redacted user input field(s)" << std::endl;
    }

    for (const auto& field : accepted) {
        if (!is_valid_element_name(field.first)) {
            set_error(unattend_error::invalid_argument,
                      "User input key is not a valid element name: '" + field.first + "'");
            return false;
        }
        if (!answer_file::is_valid_text(field.second)) {
            set_error(unattend_error::invalid_argument,
                      "User input value for '" + field.first +
                          "' is not UTF-8 text that XML can carry");
            return false;
        }
    }

    xmlNodePtr block = file.find_or_create_child(extension_block(file), USER_INPUT,
                                                 xml_namespace::extension);

    // A denylisted value authored into the file by other means goes too.
    for (const auto& key : redacted_user_input_keys()) {
        xmlNodePtr stale = file.find_child(block, key, xml_namespace::extension);
        if (stale) {
            xmlUnlinkNode(stale);
            xmlFreeNode(stale);
        }
    }

    for (const auto& field : accepted) {
        xmlNodePtr value =
            file.set_child_text(block, field.first, field.second, xml_namespace::extension);
        xmlNodeSetSpacePreserve(value, 1);
    }

    std::cout << "[Unattend] Stored " << accepted.size() << " user input field(s)" << std::endl;
    return persist(file);
}

bool unattend_manager::set_device_name(answer_file& file, const std::string& device_name) {
    m_last_error.clear();

    if (device_name.empty()) {
        set_error(unattend_error::invalid_argument, "Device name cannot be empty");
        return false;
    }
    if (!answer_file::is_valid_text(device_name)) {
        set_error(unattend_error::invalid_argument, "Device name is not valid UTF-8 text");
        return false;
    }

    xmlNodePtr shell_setup = file.find_component(passes::SPECIALIZE, components::SHELL_SETUP);
    if (!shell_setup) {
        set_error(unattend_error::structural_not_found,
                  std::string("No ") + components::SHELL_SETUP + " component in the " +
                      passes::SPECIALIZE + " pass");
        return false;
    }

    if (device_name.size() > 15) {
        std::cout << "[Unattend] Warning: device name '" << device_name
                  << "' is longer than 15 characters, Setup will truncate it" << std::endl;
    }

    file.set_child_text(shell_setup, "ComputerName", device_name);

    std::cout << "[Unattend] Device name set to '" << device_name << "'" << std::endl;
    return persist(file);
}

bool unattend_manager::set_local_account(answer_file& file, const std::string& username,
                                         const std::string& encoded_password) {
    m_last_error.clear();

    if (username.empty()) {
        set_error(unattend_error::invalid_argument, "Username cannot be empty");
        return false;
    }
    if (!answer_file::is_valid_text(username) || !answer_file::is_valid_text(encoded_password)) {
        set_error(unattend_error::invalid_argument,
                  "Username and password must be UTF-8 text that XML can carry");
        return false;
    }

    xmlNodePtr shell_setup =
        file.find_or_create_component(passes::OOBE_SYSTEM, components::SHELL_SETUP);
    xmlNodePtr local_accounts =
        file.find_or_create_path(shell_setup, {"UserAccounts", "LocalAccounts"});

    xmlNodePtr account = nullptr;
    for (xmlNodePtr child = local_accounts->children; child; child = child->next) {
        if (answer_file::is_element(child, "LocalAccount", xml_namespace::unattend) &&
            answer_file::text_of(file.find_child(child, "Name")) == username) {
            account = child;
            break;
        }
    }

    if (account) {
        xmlNodePtr password = file.find_or_create_child(account, "Password");
        file.set_child_text(password, "Value", encoded_password);
        file.set_child_text(password, "PlainText", "false");
        std::cout << "[Unattend] Updated password for local account '" << username << "'"
                  << std::endl;
        return persist(file);
    }

    account = file.append_child(local_accounts, "LocalAccount");
    file.set_attribute(account, xml_namespace::wcm, "action", "add");

    xmlNodePtr password = file.append_child(account, "Password");
    file.set_child_text(password, "Value", encoded_password);
    file.set_child_text(password, "PlainText", "false");
    file.set_child_text(account, "DisplayName", username);
    file.set_child_text(account, "Group", ADMINISTRATORS_GROUP);
    file.set_child_text(account, "Name", username);

    std::cout << "[Unattend] Created local account '" << username << "'" << std::endl;
    return persist(file);
}

const unattend_error_info& unattend_manager::get_last_error() const {
    return m_last_error;
}

void unattend_manager::set_error(unattend_error code, const std::string& message) {
    m_last_error.set(code, message);
    std::cerr << "[Unattend] Error (" << to_string(code) << "): " << message << std::endl;
}

bool unattend_manager::persist(answer_file& file) {
    unattend_error_info error;
    if (!file.save(error)) {
        set_error(error.code, error.message);
        return false;
    }
    return true;
}

xmlNodePtr unattend_manager::extension_block(answer_file& file) {
    return file.find_or_create_child(file.root(), EXTENSION_BLOCK, xml_namespace::extension);
}

void unattend_manager::write_copy_script(answer_file& file, const std::string& script_text) {
    xmlNodePtr script =
        file.set_child_text(extension_block(file), COPY_SCRIPT, script_text,
                            xml_namespace::extension);
    xmlNodeSetSpacePreserve(script, 1);
    std::cout << "[Unattend] Embedded copy script (" << script_text.size() << " bytes)"
              << std::endl;
}

bool unattend_manager::read_copy_script(const std::filesystem::path& path,
                                        std::string& script_text) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        set_error(unattend_error::source_unreadable, "Copy script not found: " + path.string());
        return false;
    }

    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        set_error(unattend_error::source_unreadable, "Failed to open copy script: " + path.string());
        return false;
    }

    script_text.assign(std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>());
    if (input.bad()) {
        set_error(unattend_error::source_unreadable, "Failed to read copy script: " + path.string());
        return false;
    }

    // Windows editors often save scripts with a byte-order mark; the XML
    // text node must not carry it.
    if (script_text.compare(0, 3, "\xEF\xBB\xBF") == 0) {
        script_text.erase(0, 3);
    }

    if (script_text.find_first_not_of(" \t\r\n") == std::string::npos) {
        set_error(unattend_error::source_unreadable, "Copy script is empty: " + path.string());
        return false;
    }

    // The script is embedded verbatim, so it must already be UTF-8; a script
    // saved as Windows-1252 or UTF-16 would make the saved file unreadable.
    if (!answer_file::is_valid_text(script_text)) {
        set_error(unattend_error::source_unreadable,
                  "Copy script is not UTF-8 text: " + path.string());
        return false;
    }
    return true;
}
