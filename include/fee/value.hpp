// Typed values produced by argument reduction and returned by verb actions.
#pragma once
#include "fee/diagnostics.hpp"
#include "fee/ir.hpp"
#include "fee/predicate.hpp"
#include "fee/selector.hpp"
#include <cstdint>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace fee {

struct Value;

struct ValueList {
    std::vector<Value> items;
};

using ValueData = std::variant<std::monostate, int64_t, std::string, GlyphSelector, GlyphSet, Predicate,
                               ValueRecord, std::vector<LanguageSystem>, std::vector<RoutinePtr>, ValueList>;

struct Value {
    ValueData data;
    SourceLocation location;

    Value() = default;
    template<typename T, typename = std::enable_if_t<!std::is_same_v<std::decay_t<T>, Value>>>
    Value(T&& v, SourceLocation at = {}) : data(std::forward<T>(v)), location(std::move(at)) {}

    template<typename T> bool is() const { return std::holds_alternative<T>(data); }
    bool empty() const { return is<std::monostate>(); }

    // Typed access; a mismatch is a syntax error at the value's location.
    template<typename T> const T& as() const {
        if(auto p = std::get_if<T>(&data)) return *p;
        throw syntax_error(make_error(codes::syntax, std::string("Unexpected ") + kind() + " argument", location));
    }
    const char* kind() const;
};

using ArgList = std::vector<Value>;

// A variable binding: integer or value record.
using VariableValue = std::variant<int64_t, ValueRecord>;

} // namespace fee
