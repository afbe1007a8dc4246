// SPDX-License-Identifier: MIT

#pragma once

#include <cstddef>
#include <expected>
#include <memory>
#include <string_view>
#include <type_traits>

#include <expat.h>

#include "sheetload/error.hpp"

namespace sheetload {

// Callbacks for XmlParser. Element and attribute names are passed without
// their namespace prefix ("x:row" arrives as "row").
class XmlHandler {
public:
    virtual ~XmlHandler() = default;

    virtual void on_start(std::string_view name, const XML_Char** attrs) = 0;
    virtual void on_end(std::string_view name) = 0;
    virtual void on_text(std::string_view) {}
};

// Drop a "prefix:" from a qualified name.
inline std::string_view local_name(std::string_view qname) {
    auto colon = qname.find(':');
    return colon == std::string_view::npos ? qname : qname.substr(colon + 1);
}

// Attribute value by local name, or nullptr.
const XML_Char* find_attr(const XML_Char** attrs, std::string_view name);

// Incremental expat parser; documents may be fed in arbitrary chunks.
class XmlParser {
public:
    explicit XmlParser(XmlHandler& handler);

    // Feed the next chunk. @p final marks the end of the document.
    // @return CorruptFile on malformed XML.
    std::expected<void, Error> feed(const char* data, std::size_t size, bool final);

    // Parse a complete in-memory document.
    std::expected<void, Error> parse(std::string_view document) {
        return feed(document.data(), document.size(), true);
    }

private:
    struct ParserDeleter {
        void operator()(XML_Parser p) const { XML_ParserFree(p); }
    };

    XmlHandler& handler_;
    std::unique_ptr<std::remove_pointer_t<XML_Parser>, ParserDeleter> parser_;
};

}  // namespace sheetload
