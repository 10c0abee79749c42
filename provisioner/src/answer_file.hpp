#pragma once

#include <filesystem>
#include <initializer_list>
#include <memory>
#include <string>
#include <libxml/tree.h>

#include "unattend_error.hpp"
#include "util/xml_ptr.hpp"

enum class xml_namespace {
    unattend,
    wcm,
    extension,
};

namespace namespaces {
constexpr const char* UNATTEND = "urn:schemas-microsoft-com:unattend";
constexpr const char* WCM = "http://schemas.microsoft.com/WMIConfig/2002/State";
constexpr const char* EXTENSION = "urn:eds:unattend:extension";

constexpr const char* WCM_PREFIX = "wcm";
constexpr const char* EXTENSION_PREFIX = "eds";

const char* uri(xml_namespace ns);
} // namespace namespaces

namespace passes {
constexpr const char* SPECIALIZE = "specialize";
constexpr const char* OOBE_SYSTEM = "oobeSystem";
} // namespace passes

namespace components {
constexpr const char* SHELL_SETUP = "Microsoft-Windows-Shell-Setup";
constexpr const char* DEPLOYMENT = "Microsoft-Windows-Deployment";
} // namespace components

// In-memory answer file bound to the path it is persisted to.
class answer_file {
public:
    answer_file(const answer_file&) = delete;
    answer_file& operator=(const answer_file&) = delete;

    answer_file(answer_file&&) noexcept = default;
    answer_file& operator=(answer_file&&) noexcept = default;

    ~answer_file() = default;

    // Reads source_path if it exists, otherwise synthesizes an empty
    // document. The returned handle saves to target_path.
    static std::unique_ptr<answer_file> load_or_create(const std::filesystem::path& source_path,
                                                       const std::filesystem::path& target_path,
                                                       unattend_error_info& error);

    // Same as load_or_create(path, path, error).
    static std::unique_ptr<answer_file> open(const std::filesystem::path& path,
                                             unattend_error_info& error);

    xmlDocPtr document() const {
        return m_document.get();
    }

    xmlNodePtr root() const;

    const std::filesystem::path& target_path() const {
        return m_target_path;
    }

    // Lookup primitives. Matching is by local name and namespace URI only;
    // an element with the right name under another namespace is ignored.
    xmlNodePtr find_child(xmlNodePtr parent, const std::string& local_name,
                          xml_namespace ns = xml_namespace::unattend) const;
    xmlNodePtr find_or_create_child(xmlNodePtr parent, const std::string& local_name,
                                    xml_namespace ns = xml_namespace::unattend);

    xmlNodePtr find_pass(const std::string& pass) const;
    xmlNodePtr find_or_create_pass(const std::string& pass);

    xmlNodePtr find_component(const std::string& pass, const std::string& component) const;
    xmlNodePtr find_or_create_component(const std::string& pass, const std::string& component);

    // Walks local_path from parent, creating every missing element.
    xmlNodePtr find_or_create_path(xmlNodePtr parent, std::initializer_list<const char*> local_path,
                                   xml_namespace ns = xml_namespace::unattend);

    // Always appends a new element, even if a sibling with the same name exists.
    xmlNodePtr append_child(xmlNodePtr parent, const std::string& local_name,
                            xml_namespace ns = xml_namespace::unattend);

    void set_attribute(xmlNodePtr node, const std::string& name, const std::string& value);
    void set_attribute(xmlNodePtr node, xml_namespace ns, const std::string& name,
                       const std::string& value);
    std::string attribute(xmlNodePtr node, const std::string& name) const;

    static std::string text_of(xmlNodePtr node);

    // True if value is well-formed UTF-8 made only of characters XML 1.0
    // allows in text. set_text() does not check; callers validate first.
    static bool is_valid_text(const std::string& value);
    static void set_text(xmlNodePtr node, const std::string& value);

    // Upserts a child element and sets its text.
    xmlNodePtr set_child_text(xmlNodePtr parent, const std::string& local_name,
                              const std::string& value,
                              xml_namespace ns = xml_namespace::unattend);

    static bool is_element(xmlNodePtr node, const std::string& local_name, xml_namespace ns);

    // Serializes as UTF-8 without byte-order mark, indented, with an XML
    // declaration. The target is replaced atomically.
    bool save(unattend_error_info& error) const;

    // Serialized form, as save() would write it.
    std::string to_string() const;

private:
    using document_ptr = xml_ptr::document;

    answer_file(document_ptr document, std::filesystem::path target_path);

    document_ptr m_document;
    std::filesystem::path m_target_path;

    static document_ptr create_document();
    void ensure_root();
    xmlNsPtr namespace_for(xml_namespace ns);
};
