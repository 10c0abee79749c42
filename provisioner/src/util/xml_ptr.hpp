#pragma once

#include <memory>
#include <string>
#include <libxml/tree.h>
#include <libxml/xmlmemory.h>
#include <libxml/xpath.h>

// Owning handles for the libxml2 objects this project allocates. Each one
// pairs a libxml2 type with the function that releases it.
namespace xml_ptr {

struct document_deleter {
    void operator()(xmlDocPtr doc) const {
        xmlFreeDoc(doc);
    }
};

struct string_deleter {
    void operator()(xmlChar* str) const {
        xmlFree(str);
    }
};

struct xpath_context_deleter {
    void operator()(xmlXPathContextPtr context) const {
        xmlXPathFreeContext(context);
    }
};

struct xpath_object_deleter {
    void operator()(xmlXPathObjectPtr object) const {
        xmlXPathFreeObject(object);
    }
};

using document = std::unique_ptr<xmlDoc, document_deleter>;
using chars = std::unique_ptr<xmlChar, string_deleter>;
using xpath_context = std::unique_ptr<xmlXPathContext, xpath_context_deleter>;
using xpath_object = std::unique_ptr<xmlXPathObject, xpath_object_deleter>;

// Copies a libxml2-allocated string out and releases it. nullptr becomes "".
inline std::string take(xmlChar* str) {
    chars owned(str);
    if (!owned) {
        return "";
    }
    return reinterpret_cast<const char*>(owned.get());
}

// Same as take(), but keeps embedded bytes up to size.
inline std::string take(xmlChar* str, int size) {
    chars owned(str);
    if (!owned || size <= 0) {
        return "";
    }
    return std::string(reinterpret_cast<const char*>(owned.get()), static_cast<size_t>(size));
}

} // namespace xml_ptr
