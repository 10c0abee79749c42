#pragma once

#include <string>
#include <libxml/tree.h>

#include "answer_file.hpp"

// Ordered command lists such as RunSynchronous and FirstLogonCommands.
// Orders are 1-based and only ever grow; entries are appended, never
// reordered or removed.
namespace command_list {

struct command_entry {
    std::string entry_name;    // RunSynchronousCommand, SynchronousCommand
    std::string command_field; // Path, CommandLine
    std::string command;
    std::string description;
};

// Highest Order among the direct children of list_node plus one. Missing
// or unparsable Order values count as 0. Returns 0 when the highest Order
// is already INT_MAX and no larger value exists.
int next_order(const answer_file& file, xmlNodePtr list_node);

// Parses an Order value; returns false for anything but a plain integer.
bool parse_order(const std::string& text, int& order);

// Appends entry to list_node under the next free Order and returns it.
// Returns nullptr, leaving the list untouched, when next_order() is 0.
xmlNodePtr append_command(answer_file& file, xmlNodePtr list_node, const command_entry& entry);

} // namespace command_list
