#include "command_list.hpp"

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <iostream>

namespace command_list {

bool parse_order(const std::string& text, int& order) {
    size_t start = text.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return false;
    }
    size_t end = text.find_last_not_of(" \t\r\n");
    std::string trimmed = text.substr(start, end - start + 1);

    errno = 0;
    char* parse_end = nullptr;
    long value = std::strtol(trimmed.c_str(), &parse_end, 10);
    if (errno == ERANGE || parse_end != trimmed.c_str() + trimmed.size()) {
        return false;
    }
    if (value < INT_MIN || value > INT_MAX) {
        return false;
    }

    order = static_cast<int>(value);
    return true;
}

int next_order(const answer_file& file, xmlNodePtr list_node) {
    int max_order = 0;
    if (!list_node) {
        return 1;
    }

    for (xmlNodePtr child = list_node->children; child; child = child->next) {
        if (child->type != XML_ELEMENT_NODE) {
            continue;
        }
        xmlNodePtr order_node = file.find_child(child, "Order");
        if (!order_node) {
            continue;
        }

        int order = 0;
        if (!parse_order(answer_file::text_of(order_node), order)) {
            std::cerr << "[Command List] Ignoring malformed Order value '"
                      << answer_file::text_of(order_node) << "'" << std::endl;
            continue;
        }
        if (order > max_order) {
            max_order = order;
        }
    }

    if (max_order == INT_MAX) {
        std::cerr << "[Command List] Order " << max_order << " is already the largest possible"
                  << std::endl;
        return 0;
    }
    return max_order + 1;
}

xmlNodePtr append_command(answer_file& file, xmlNodePtr list_node, const command_entry& entry) {
    int order = next_order(file, list_node);
    if (order == 0) {
        return nullptr;
    }

    xmlNodePtr command = file.append_child(list_node, entry.entry_name);
    file.set_attribute(command, xml_namespace::wcm, "action", "add");
    file.set_child_text(command, "Order", std::to_string(order));
    file.set_child_text(command, entry.command_field, entry.command);
    if (!entry.description.empty()) {
        file.set_child_text(command, "Description", entry.description);
    }

    std::cout << "[Command List] Appended " << entry.entry_name << " with Order " << order
              << std::endl;
    return command;
}

} // namespace command_list
