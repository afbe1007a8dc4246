// SPDX-License-Identifier: MIT

// include/sheetload/json_reader.hpp
#pragma once

#include <concepts>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

#include <rapidjson/error/en.h>
#include <rapidjson/memorystream.h>
#include <rapidjson/reader.h>

namespace sheetload {

// Builder concept - types that can incrementally build a result from JSON events
template <typename B>
concept JsonBuilder = requires(B& b, std::string_view sv, int64_t i, uint64_t u,
                               double d, bool bl) {
    typename B::Result;
    { b.on_key(sv) } -> std::same_as<void>;
    { b.on_string(sv) } -> std::same_as<void>;
    { b.on_int(i) } -> std::same_as<void>;
    { b.on_uint(u) } -> std::same_as<void>;
    { b.on_double(d) } -> std::same_as<void>;
    { b.on_bool(bl) } -> std::same_as<void>;
    { b.on_null() } -> std::same_as<void>;
    { b.on_start_object() } -> std::same_as<void>;
    { b.on_end_object() } -> std::same_as<void>;
    { b.on_start_array() } -> std::same_as<void>;
    { b.on_end_array() } -> std::same_as<void>;
    { b.build() } -> std::same_as<std::expected<typename B::Result, std::string>>;
};

namespace detail {

// RapidJSON SAX handler that forwards to Builder
template <JsonBuilder Builder>
struct SaxHandler : public rapidjson::BaseReaderHandler<rapidjson::UTF8<>, SaxHandler<Builder>> {
    Builder& builder;

    explicit SaxHandler(Builder& b) : builder(b) {}

    bool Null() {
        builder.on_null();
        return true;
    }
    bool Bool(bool b) {
        builder.on_bool(b);
        return true;
    }
    bool Int(int i) {
        builder.on_int(static_cast<int64_t>(i));
        return true;
    }
    bool Uint(unsigned u) {
        builder.on_uint(static_cast<uint64_t>(u));
        return true;
    }
    bool Int64(int64_t i) {
        builder.on_int(i);
        return true;
    }
    bool Uint64(uint64_t u) {
        builder.on_uint(u);
        return true;
    }
    bool Double(double d) {
        builder.on_double(d);
        return true;
    }
    bool String(const char* str, rapidjson::SizeType length, bool /*copy*/) {
        builder.on_string(std::string_view(str, length));
        return true;
    }
    bool Key(const char* str, rapidjson::SizeType length, bool /*copy*/) {
        builder.on_key(std::string_view(str, length));
        return true;
    }
    bool StartObject() {
        builder.on_start_object();
        return true;
    }
    bool EndObject(rapidjson::SizeType /*memberCount*/) {
        builder.on_end_object();
        return true;
    }
    bool StartArray() {
        builder.on_start_array();
        return true;
    }
    bool EndArray(rapidjson::SizeType /*elementCount*/) {
        builder.on_end_array();
        return true;
    }
};

}  // namespace detail

// Parse a complete JSON document, feeding events to @p builder.
template <JsonBuilder Builder>
std::expected<typename Builder::Result, std::string> parse_json(std::string_view json,
                                                                Builder& builder) {
    detail::SaxHandler<Builder> handler(builder);
    rapidjson::Reader reader;
    rapidjson::MemoryStream stream(json.data(), json.size());

    auto result = reader.Parse(stream, handler);
    if (result.IsError()) {
        return std::unexpected(std::string("Parse error at offset ") +
                               std::to_string(result.Offset()) + ": " +
                               rapidjson::GetParseError_En(result.Code()));
    }
    return builder.build();
}

}  // namespace sheetload
