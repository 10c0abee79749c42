#pragma once

#include <string>

enum class unattend_error {
    none,
    structural_not_found,
    source_unreadable,
    serialization_failure,
    malformed_document,
    invalid_argument,
};

struct unattend_error_info {
    unattend_error code = unattend_error::none;
    std::string message;

    void set(unattend_error error_code, const std::string& error_message) {
        code = error_code;
        message = error_message;
    }

    void clear() {
        code = unattend_error::none;
        message.clear();
    }

    explicit operator bool() const {
        return code != unattend_error::none;
    }
};

inline const char* to_string(unattend_error error) {
    switch (error) {
    case unattend_error::none:
        return "none";
    case unattend_error::structural_not_found:
        return "structural_not_found";
    case unattend_error::source_unreadable:
        return "source_unreadable";
    case unattend_error::serialization_failure:
        return "serialization_failure";
    case unattend_error::malformed_document:
        return "malformed_document";
    case unattend_error::invalid_argument:
        return "invalid_argument";
    }
    return "unknown";
}
