// SPDX-License-Identifier: MIT

#include "sheetload/xml_parser.hpp"

#include <fmt/format.h>

#include <new>

namespace sheetload {

namespace {

void XMLCALL start_element(void* user, const XML_Char* name, const XML_Char** attrs) {
    static_cast<XmlHandler*>(user)->on_start(local_name(name), attrs);
}

void XMLCALL end_element(void* user, const XML_Char* name) {
    static_cast<XmlHandler*>(user)->on_end(local_name(name));
}

void XMLCALL character_data(void* user, const XML_Char* s, int len) {
    static_cast<XmlHandler*>(user)->on_text(
        std::string_view(s, static_cast<std::size_t>(len)));
}

}  // namespace

const XML_Char* find_attr(const XML_Char** attrs, std::string_view name) {
    for (std::size_t i = 0; attrs[i] != nullptr; i += 2) {
        if (local_name(attrs[i]) == name) {
            return attrs[i + 1];
        }
    }
    return nullptr;
}

XmlParser::XmlParser(XmlHandler& handler)
    : handler_(handler)
    , parser_(XML_ParserCreate(nullptr)) {
    if (!parser_) {
        throw std::bad_alloc();
    }
    XML_SetUserData(parser_.get(), &handler_);
    XML_SetElementHandler(parser_.get(), start_element, end_element);
    XML_SetCharacterDataHandler(parser_.get(), character_data);
}

std::expected<void, Error> XmlParser::feed(const char* data, std::size_t size, bool final) {
    if (XML_Parse(parser_.get(), data, static_cast<int>(size), final ? 1 : 0) ==
        XML_STATUS_ERROR) {
        return std::unexpected(Error{ErrorCode::CorruptFile, fmt::format(
            "Malformed XML at line {}: {}",
            XML_GetCurrentLineNumber(parser_.get()),
            XML_ErrorString(XML_GetErrorCode(parser_.get())))});
    }
    return {};
}

}  // namespace sheetload
