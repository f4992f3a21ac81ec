#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "roomsync/core/protocol/codec/result.hpp"
#include "lcr/optional.hpp"

#include "simdjson.h"

/*
================================================================================
JSON Decoding Helpers (Low-Level Primitives)
================================================================================

Low-level helpers used by the wire decoder to extract primitive JSON values from
simdjson DOM elements.

Responsibilities:
  • Enforce basic JSON structural rules (object presence, type correctness)
  • Parse primitive field types (bool, integer, double, string)
  • Provide strict optional-field handling semantics

Helpers return Result::Ok or Result::InvalidSchema. They never interpret values
semantically, never log and never throw. Domain validation (non-empty ids,
known enum names) belongs to the decoder.

================================================================================
*/


namespace roomsync::core::protocol::codec::helper {

// ============================================================================
// ROOT TYPE
// ============================================================================

[[nodiscard]]
inline Result require_object(const simdjson::dom::element& root) noexcept {
    return (root.type() == simdjson::dom::element_type::OBJECT) ? Result::Ok : Result::InvalidSchema;
}

// ------------------------------------------------------------
// REQUIRED OBJECT FIELD
// ------------------------------------------------------------
[[nodiscard]]
inline Result parse_object_required(const simdjson::dom::element& parent, const char* key, simdjson::dom::element& out) noexcept {
    if (require_object(parent) != Result::Ok) {
        return Result::InvalidSchema;
    }
    auto field = parent[key];
    if (field.error()) {
        return Result::InvalidSchema;
    }
    out = field.value_unsafe();
    return require_object(out);
}

// ------------------------------------------------------------
// REQUIRED ARRAY FIELD
// ------------------------------------------------------------
[[nodiscard]]
inline Result parse_array_required(const simdjson::dom::element& parent, const char* key, simdjson::dom::array& out) noexcept {
    if (require_object(parent) != Result::Ok) {
        return Result::InvalidSchema;
    }
    auto field = parent[key];
    if (field.error()) {
        return Result::InvalidSchema;
    }
    if (field.get(out)) {
        return Result::InvalidSchema;
    }
    return Result::Ok;
}

// ============================================================================
// REQUIRED FIELD PARSERS
// ============================================================================

[[nodiscard]]
inline Result parse_bool_required(const simdjson::dom::element& obj, const char* key, bool& out) noexcept {
    if (require_object(obj) != Result::Ok) {
        return Result::InvalidSchema;
    }
    auto field = obj[key];
    if (field.error()) {
        return Result::InvalidSchema;
    }
    if (field.get(out)) {
        return Result::InvalidSchema;
    }
    return Result::Ok;
}

[[nodiscard]]
inline Result parse_uint64_required(const simdjson::dom::element& obj, const char* key, std::uint64_t& out) noexcept {
    if (require_object(obj) != Result::Ok) {
        return Result::InvalidSchema;
    }
    auto field = obj[key];
    if (field.error()) {
        return Result::InvalidSchema;
    }
    if (field.get(out)) {
        return Result::InvalidSchema;
    }
    return Result::Ok;
}

// Integers are accepted and widened
[[nodiscard]]
inline Result parse_double_required(const simdjson::dom::element& obj, const char* key, double& out) noexcept {
    if (require_object(obj) != Result::Ok) {
        return Result::InvalidSchema;
    }
    auto field = obj[key];
    if (field.error()) {
        return Result::InvalidSchema;
    }
    if (field.get(out)) {
        return Result::InvalidSchema;
    }
    return Result::Ok;
}

[[nodiscard]]
inline Result parse_string_required(const simdjson::dom::element& obj, const char* key, std::string& out) noexcept {
    if (require_object(obj) != Result::Ok) {
        return Result::InvalidSchema;
    }
    auto field = obj[key];
    if (field.error()) {
        return Result::InvalidSchema;
    }
    std::string_view sv;
    if (field.get(sv)) {
        return Result::InvalidSchema;
    }
    out.assign(sv.data(), sv.size());
    return Result::Ok;
}

// ============================================================================
// OPTIONAL FIELD PARSERS
// ============================================================================
// Absent and JSON null are both treated as "not present".

[[nodiscard]]
inline Result parse_string_optional(const simdjson::dom::element& obj, const char* key, lcr::optional<std::string>& out) noexcept {
    out.reset();
    if (require_object(obj) != Result::Ok) {
        return Result::InvalidSchema;
    }
    auto field = obj[key];
    if (field.error()) {
        return Result::Ok;
    }
    simdjson::dom::element el = field.value_unsafe();
    if (el.is_null()) {
        return Result::Ok;
    }
    std::string_view sv;
    if (el.get(sv)) {
        return Result::InvalidSchema;
    }
    out = std::string(sv);
    return Result::Ok;
}

[[nodiscard]]
inline Result parse_bool_optional(const simdjson::dom::element& obj, const char* key, lcr::optional<bool>& out) noexcept {
    out.reset();
    if (require_object(obj) != Result::Ok) {
        return Result::InvalidSchema;
    }
    auto field = obj[key];
    if (field.error()) {
        return Result::Ok;
    }
    simdjson::dom::element el = field.value_unsafe();
    if (el.is_null()) {
        return Result::Ok;
    }
    bool tmp{};
    if (el.get(tmp)) {
        return Result::InvalidSchema;
    }
    out = tmp;
    return Result::Ok;
}

[[nodiscard]]
inline Result parse_double_optional(const simdjson::dom::element& obj, const char* key, lcr::optional<double>& out) noexcept {
    out.reset();
    if (require_object(obj) != Result::Ok) {
        return Result::InvalidSchema;
    }
    auto field = obj[key];
    if (field.error()) {
        return Result::Ok;
    }
    simdjson::dom::element el = field.value_unsafe();
    if (el.is_null()) {
        return Result::Ok;
    }
    double tmp{};
    if (el.get(tmp)) {
        return Result::InvalidSchema;
    }
    out = tmp;
    return Result::Ok;
}

} // namespace roomsync::core::protocol::codec::helper
