#include "answer_file.hpp"

#include <fstream>
#include <iostream>
#include <iterator>
#include <system_error>
#include <unistd.h>
#include <libxml/parser.h>
#include <libxml/xmlerror.h>
#include <libxml/xmlstring.h>

namespace {
constexpr const char* ROOT_ELEMENT = "unattend";

const xmlChar* to_xml(const std::string& str) {
    return reinterpret_cast<const xmlChar*>(str.c_str());
}

const xmlChar* to_xml(const char* str) {
    return reinterpret_cast<const xmlChar*>(str);
}

const char* prefix_for(xml_namespace ns) {
    switch (ns) {
    case xml_namespace::unattend:
        return nullptr;
    case xml_namespace::wcm:
        return namespaces::WCM_PREFIX;
    case xml_namespace::extension:
        return namespaces::EXTENSION_PREFIX;
    }
    return nullptr;
}

bool is_blank(const std::string& content) {
    size_t start = 0;
    // A lone UTF-8 byte-order mark counts as empty.
    if (content.compare(0, 3, "\xEF\xBB\xBF") == 0) {
        start = 3;
    }
    return content.find_first_not_of(" \t\r\n", start) == std::string::npos;
}

std::string last_libxml_error() {
    const xmlError* error = xmlGetLastError();
    if (!error || !error->message) {
        return "unknown parser error";
    }
    std::string message = error->message;
    while (!message.empty() && (message.back() == '\n' || message.back() == '\r')) {
        message.pop_back();
    }
    return message + " (line " + std::to_string(error->line) + ")";
}

// Declares href on node, falling back to a numbered prefix when the
// preferred one is already bound to something else.
xmlNsPtr declare_namespace(xmlNodePtr node, const char* href, const char* prefix) {
    xmlNsPtr ns = xmlNewNs(node, to_xml(href), to_xml(prefix));
    if (ns) {
        return ns;
    }

    std::string base = prefix ? prefix : "ns";
    for (int i = 1; i < 100; i++) {
        std::string candidate = base + std::to_string(i);
        ns = xmlNewNs(node, to_xml(href), to_xml(candidate));
        if (ns) {
            return ns;
        }
    }
    return nullptr;
}
} // namespace

const char* namespaces::uri(xml_namespace ns) {
    switch (ns) {
    case xml_namespace::unattend:
        return UNATTEND;
    case xml_namespace::wcm:
        return WCM;
    case xml_namespace::extension:
        return EXTENSION;
    }
    return UNATTEND;
}

answer_file::answer_file(document_ptr document, std::filesystem::path target_path)
    : m_document(std::move(document)), m_target_path(std::move(target_path)) {}

std::unique_ptr<answer_file> answer_file::load_or_create(const std::filesystem::path& source_path,
                                                         const std::filesystem::path& target_path,
                                                         unattend_error_info& error) {
    error.clear();

    std::error_code ec;
    if (!std::filesystem::exists(source_path, ec)) {
        std::cout << "[Answer File] No answer file at " << source_path
                  << ", creating a new document" << std::endl;
        std::unique_ptr<answer_file> file(new answer_file(create_document(), target_path));
        file->ensure_root();
        return file;
    }

    std::ifstream input(source_path, std::ios::binary);
    if (!input.is_open()) {
        error.set(unattend_error::source_unreadable,
                  "Failed to open answer file: " + source_path.string());
        return nullptr;
    }
    std::string content((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
    if (input.bad()) {
        error.set(unattend_error::source_unreadable,
                  "Failed to read answer file: " + source_path.string());
        return nullptr;
    }

    if (is_blank(content)) {
        std::cout << "[Answer File] " << source_path
                  << " is empty, synthesizing the root element" << std::endl;
        std::unique_ptr<answer_file> file(new answer_file(create_document(), target_path));
        file->ensure_root();
        return file;
    }

    xmlResetLastError();
    xmlDocPtr doc = xmlReadMemory(content.data(), static_cast<int>(content.size()),
                                  source_path.string().c_str(), nullptr,
                                  XML_PARSE_NOBLANKS | XML_PARSE_NONET);
    if (!doc) {
        error.set(unattend_error::malformed_document,
                  "Failed to parse " + source_path.string() + ": " + last_libxml_error());
        return nullptr;
    }

    std::unique_ptr<answer_file> file(new answer_file(document_ptr(doc), target_path));

    // Declaring the setup namespace on a foreign or unqualified root would
    // silently move its existing children into that namespace on reload.
    xmlNodePtr root_node = file->root();
    if (root_node && !is_element(root_node, ROOT_ELEMENT, xml_namespace::unattend)) {
        std::string found = reinterpret_cast<const char*>(root_node->name);
        if (root_node->ns && root_node->ns->href) {
            found = "{" + std::string(reinterpret_cast<const char*>(root_node->ns->href)) + "}" +
                    found;
        }
        error.set(unattend_error::malformed_document,
                  "Root element of " + source_path.string() + " is " + found + ", expected {" +
                      namespaces::UNATTEND + "}" + ROOT_ELEMENT);
        return nullptr;
    }
    file->ensure_root();

    std::cout << "[Answer File] Loaded " << source_path << std::endl;
    return file;
}

std::unique_ptr<answer_file> answer_file::open(const std::filesystem::path& path,
                                               unattend_error_info& error) {
    return load_or_create(path, path, error);
}

answer_file::document_ptr answer_file::create_document() {
    return document_ptr(xmlNewDoc(to_xml("1.0")));
}

void answer_file::ensure_root() {
    xmlNodePtr root = xmlDocGetRootElement(m_document.get());
    if (!root) {
        root = xmlNewDocNode(m_document.get(), nullptr, to_xml(ROOT_ELEMENT), nullptr);
        xmlDocSetRootElement(m_document.get(), root);
        xmlNsPtr ns = xmlNewNs(root, to_xml(namespaces::UNATTEND), nullptr);
        xmlSetNs(root, ns);
    }

    // Every later lookup expects the three namespaces to be in scope at the root.
    const xml_namespace required[] = {xml_namespace::unattend, xml_namespace::wcm,
                                      xml_namespace::extension};
    for (xml_namespace ns : required) {
        if (!xmlSearchNsByHref(m_document.get(), root, to_xml(namespaces::uri(ns)))) {
            declare_namespace(root, namespaces::uri(ns), prefix_for(ns));
        }
    }
}

xmlNodePtr answer_file::root() const {
    return xmlDocGetRootElement(m_document.get());
}

xmlNsPtr answer_file::namespace_for(xml_namespace ns) {
    return xmlSearchNsByHref(m_document.get(), root(), to_xml(namespaces::uri(ns)));
}

bool answer_file::is_element(xmlNodePtr node, const std::string& local_name, xml_namespace ns) {
    return node && node->type == XML_ELEMENT_NODE && node->ns && node->ns->href &&
           xmlStrEqual(node->name, to_xml(local_name)) &&
           xmlStrEqual(node->ns->href, to_xml(namespaces::uri(ns)));
}

xmlNodePtr answer_file::find_child(xmlNodePtr parent, const std::string& local_name,
                                   xml_namespace ns) const {
    if (!parent) {
        return nullptr;
    }
    for (xmlNodePtr child = parent->children; child; child = child->next) {
        if (is_element(child, local_name, ns)) {
            return child;
        }
    }
    return nullptr;
}

xmlNodePtr answer_file::append_child(xmlNodePtr parent, const std::string& local_name,
                                     xml_namespace ns) {
    // Prefer a declaration already in scope at the parent, so a subtree that
    // rebinds a prefix still gets the right namespace.
    xmlNsPtr ns_ptr = xmlSearchNsByHref(m_document.get(), parent, to_xml(namespaces::uri(ns)));
    if (!ns_ptr && parent == root()) {
        ensure_root();
        ns_ptr = namespace_for(ns);
    }

    xmlNodePtr node = xmlNewDocNode(m_document.get(), ns_ptr, to_xml(local_name), nullptr);
    xmlAddChild(parent, node);

    if (!ns_ptr) {
        ns_ptr = declare_namespace(node, namespaces::uri(ns), prefix_for(ns));
        xmlSetNs(node, ns_ptr);
    }
    return node;
}

xmlNodePtr answer_file::find_or_create_child(xmlNodePtr parent, const std::string& local_name,
                                             xml_namespace ns) {
    xmlNodePtr node = find_child(parent, local_name, ns);
    if (node) {
        return node;
    }
    return append_child(parent, local_name, ns);
}

xmlNodePtr answer_file::find_or_create_path(xmlNodePtr parent,
                                            std::initializer_list<const char*> local_path,
                                            xml_namespace ns) {
    xmlNodePtr node = parent;
    for (const char* name : local_path) {
        node = find_or_create_child(node, name, ns);
    }
    return node;
}

std::string answer_file::attribute(xmlNodePtr node, const std::string& name) const {
    if (!node) {
        return "";
    }
    return xml_ptr::take(xmlGetNoNsProp(node, to_xml(name)));
}

void answer_file::set_attribute(xmlNodePtr node, const std::string& name,
                                const std::string& value) {
    xmlSetProp(node, to_xml(name), to_xml(value));
}

void answer_file::set_attribute(xmlNodePtr node, xml_namespace ns, const std::string& name,
                                const std::string& value) {
    xmlNsPtr ns_ptr = xmlSearchNsByHref(m_document.get(), node, to_xml(namespaces::uri(ns)));
    if (!ns_ptr) {
        ns_ptr = declare_namespace(node, namespaces::uri(ns), prefix_for(ns));
    }
    xmlSetNsProp(node, ns_ptr, to_xml(name), to_xml(value));
}

xmlNodePtr answer_file::find_pass(const std::string& pass) const {
    xmlNodePtr root_node = root();
    if (!root_node) {
        return nullptr;
    }
    for (xmlNodePtr child = root_node->children; child; child = child->next) {
        if (is_element(child, "settings", xml_namespace::unattend) &&
            attribute(child, "pass") == pass) {
            return child;
        }
    }
    return nullptr;
}

xmlNodePtr answer_file::find_or_create_pass(const std::string& pass) {
    xmlNodePtr settings = find_pass(pass);
    if (settings) {
        return settings;
    }

    settings = append_child(root(), "settings");
    set_attribute(settings, "pass", pass);
    std::cout << "[Answer File] Created pass '" << pass << "'" << std::endl;
    return settings;
}

xmlNodePtr answer_file::find_component(const std::string& pass,
                                       const std::string& component) const {
    xmlNodePtr settings = find_pass(pass);
    if (!settings) {
        return nullptr;
    }
    for (xmlNodePtr child = settings->children; child; child = child->next) {
        if (is_element(child, "component", xml_namespace::unattend) &&
            attribute(child, "name") == component) {
            return child;
        }
    }
    return nullptr;
}

xmlNodePtr answer_file::find_or_create_component(const std::string& pass,
                                                 const std::string& component) {
    xmlNodePtr node = find_component(pass, component);
    if (node) {
        return node;
    }

    xmlNodePtr settings = find_or_create_pass(pass);
    node = append_child(settings, "component");
    set_attribute(node, "name", component);
    set_attribute(node, "processorArchitecture", "amd64");
    set_attribute(node, "publicKeyToken", "31bf3856ad364e35");
    set_attribute(node, "language", "neutral");
    set_attribute(node, "versionScope", "nonSxS");

    std::cout << "[Answer File] Created component '" << component << "' in pass '" << pass << "'"
              << std::endl;
    return node;
}

std::string answer_file::text_of(xmlNodePtr node) {
    if (!node) {
        return "";
    }
    return xml_ptr::take(xmlNodeGetContent(node));
}

bool answer_file::is_valid_text(const std::string& value) {
    const unsigned char* cursor = reinterpret_cast<const unsigned char*>(value.data());
    size_t remaining = value.size();
    while (remaining > 0) {
        int length = remaining > 4 ? 4 : static_cast<int>(remaining);
        int code_point = xmlGetUTF8Char(cursor, &length);
        if (code_point < 0 || length <= 0) {
            return false;
        }
        // XML 1.0 Char production.
        bool is_char = code_point == 0x9 || code_point == 0xA || code_point == 0xD ||
                       (code_point >= 0x20 && code_point <= 0xD7FF) ||
                       (code_point >= 0xE000 && code_point <= 0xFFFD) ||
                       (code_point >= 0x10000 && code_point <= 0x10FFFF);
        if (!is_char) {
            return false;
        }
        cursor += length;
        remaining -= static_cast<size_t>(length);
    }
    return true;
}

void answer_file::set_text(xmlNodePtr node, const std::string& value) {
    // Drop existing children, then add the value as a literal text node so
    // that '&' and '<' are escaped on output rather than parsed as markup.
    xmlNodePtr child = node->children;
    while (child) {
        xmlNodePtr next = child->next;
        xmlUnlinkNode(child);
        xmlFreeNode(child);
        child = next;
    }

    if (!value.empty()) {
        xmlNodePtr text = xmlNewDocTextLen(node->doc, to_xml(value), static_cast<int>(value.size()));
        xmlAddChild(node, text);
    }
}

xmlNodePtr answer_file::set_child_text(xmlNodePtr parent, const std::string& local_name,
                                       const std::string& value, xml_namespace ns) {
    xmlNodePtr node = find_or_create_child(parent, local_name, ns);
    set_text(node, value);
    return node;
}

std::string answer_file::to_string() const {
    xmlChar* buffer = nullptr;
    int size = 0;
    xmlDocDumpFormatMemoryEnc(m_document.get(), &buffer, &size, "UTF-8", 1);
    return xml_ptr::take(buffer, size);
}

bool answer_file::save(unattend_error_info& error) const {
    error.clear();

    std::string content = to_string();
    if (content.empty()) {
        error.set(unattend_error::serialization_failure, "Failed to serialize answer file");
        return false;
    }

    std::error_code ec;
    std::filesystem::path parent = m_target_path.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            error.set(unattend_error::serialization_failure,
                      "Failed to create directory " + parent.string() + ": " + ec.message());
            return false;
        }
    }

    // Write next to the target and rename over it, so readers only ever see
    // the previous or the new complete document.
    std::filesystem::path temp_path = m_target_path;
    temp_path += ".tmp" + std::to_string(getpid());

    {
        std::ofstream output(temp_path, std::ios::binary | std::ios::trunc);
        if (!output.is_open()) {
            error.set(unattend_error::serialization_failure,
                      "Failed to open " + temp_path.string() + " for writing");
            return false;
        }
        output.write(content.data(), static_cast<std::streamsize>(content.size()));
        output.close();
        if (output.fail()) {
            std::filesystem::remove(temp_path, ec);
            error.set(unattend_error::serialization_failure,
                      "Failed to write " + temp_path.string());
            return false;
        }
    }

    std::filesystem::rename(temp_path, m_target_path, ec);
    if (ec) {
        std::error_code remove_ec;
        std::filesystem::remove(temp_path, remove_ec);
        error.set(unattend_error::serialization_failure,
                  "Failed to replace " + m_target_path.string() + ": " + ec.message());
        return false;
    }

    std::cout << "[Answer File] Saved " << m_target_path << std::endl;
    return true;
}
