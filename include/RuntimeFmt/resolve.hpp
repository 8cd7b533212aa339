#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

#include <fmt/format.h>

#include "capabilities.hpp"
#include "codegen.hpp"
#include "errors.hpp"
#include "format_args.hpp"
#include "formatter.hpp"

namespace RuntimeFmt {

// A field reference as written in a template: `{0}` or `{name}`.
// Names are not copied; the template text must outlive the reference.
// A negative index is kept as written so it can be reported, it never wraps.
class FieldRef {
    struct NegativeIndex {
        std::intmax_t value;
    };
    std::variant<std::size_t, std::string_view, NegativeIndex> m_ref;

public:
    template<class I>
        requires std::integral<I> &&
                 (!std::same_as<std::remove_cv_t<I>, bool>) &&
                 (!capability_checks::CharacterLike<I>)
    constexpr FieldRef(I index): m_ref(static_cast<std::size_t>(index)) {
        if constexpr (std::is_signed_v<I>) {
            if(index < 0) {
                m_ref = NegativeIndex{static_cast<std::intmax_t>(index)};
            }
        }
    }
    constexpr FieldRef(std::string_view name): m_ref(name) {}
    constexpr FieldRef(const char * name): m_ref(std::string_view(name)) {}

    constexpr bool is_name() const {
        return std::holds_alternative<std::string_view>(m_ref);
    }
    constexpr bool is_negative() const {
        return std::holds_alternative<NegativeIndex>(m_ref);
    }
    constexpr std::string_view name() const {
        return std::get<std::string_view>(m_ref);
    }
    constexpr std::size_t index() const {
        return std::get<std::size_t>(m_ref);
    }
    constexpr std::intmax_t negative_index() const {
        return std::get<NegativeIndex>(m_ref).value;
    }
};


template<class T>
class ResolveResult {
    std::optional<T> m_value;
    ResolveError m_error = ResolveError::none;
    FieldRef m_field;
    CapabilityKind m_capability = CapabilityKind::display;
    std::string_view m_token;

public:
    constexpr ResolveResult(T value, FieldRef field, CapabilityKind capability = CapabilityKind::display):
        m_value(value), m_field(field), m_capability(capability)
    {}
    constexpr ResolveResult(ResolveError err, FieldRef field,
                            CapabilityKind capability = CapabilityKind::display,
                            std::string_view token = {}):
        m_error(err), m_field(field), m_capability(capability), m_token(token)
    {}

    constexpr operator bool() const {
        return m_error == ResolveError::none;
    }
    constexpr const T & value() const {
        return *m_value;
    }
    constexpr ResolveError error() const {
        return m_error;
    }
    constexpr const FieldRef & field() const {
        return m_field;
    }
    constexpr CapabilityKind capability() const {
        return m_capability;
    }
    // Only set for ResolveError::unknown_capability_token.
    constexpr std::string_view token() const {
        return m_token;
    }
};


/// Maps a field reference to a confirmed-valid index.
template<class This, class Args = FormatArgs<This>>
    requires FormatArgsLike<Args, This>
constexpr ResolveResult<std::size_t> resolve_field(FieldRef ref) {
    if(ref.is_name()) {
        if(auto index = Args::validate_name(ref.name())) {
            return {*index, ref};
        }
        return {ResolveError::unknown_field_name, ref};
    }
    if(ref.is_negative()) {
        return {ResolveError::negative_field_index, ref};
    }
    if(!Args::validate_index(ref.index())) {
        return {ResolveError::field_index_out_of_range, ref};
    }
    return {ref.index(), ref};
}

template<class This, class Args = FormatArgs<This>>
    requires FormatArgsLike<Args, This>
constexpr ResolveResult<FormatFn<This>> resolve_formatter(FieldRef ref, CapabilityKind kind) {
    auto field = resolve_field<This, Args>(ref);
    if(!field) {
        return {field.error(), ref, kind};
    }
    if(auto fn = Args::get_child(kind, field.value())) {
        return {*fn, ref, kind};
    }
    return {ResolveError::capability_not_supported, ref, kind};
}

template<class This, class Args = FormatArgs<This>>
    requires FormatArgsLike<Args, This>
constexpr ResolveResult<FormatFn<This>> resolve_formatter(FieldRef ref, std::string_view token) {
    auto kind = capability_from_token(token);
    if(!kind) {
        return {ResolveError::unknown_capability_token, ref, CapabilityKind::display, token};
    }
    return resolve_formatter<This, Args>(ref, *kind);
}

/// Resolves a field used as a dynamic width or precision.
template<class This, class Args = FormatArgs<This>>
    requires FormatArgsLike<Args, This>
constexpr ResolveResult<UsizeFn<This>> resolve_count(FieldRef ref) {
    auto field = resolve_field<This, Args>(ref);
    if(!field) {
        return {field.error(), ref};
    }
    if(auto fn = Args::as_usize(field.value())) {
        return {*fn, ref};
    }
    return {ResolveError::not_an_index_value, ref};
}


template<class This>
FormatResult format_field(const This & obj, FormatFn<This> fn, fmt::memory_buffer & out, const FormatSpec & spec = {}) {
    Formatter f(out, spec);
    return fn(obj, f);
}

// Convenience for callers that want the text directly; nullopt on failure.
template<class This>
std::optional<std::string> format_field(const This & obj, FormatFn<This> fn, const FormatSpec & spec = {}) {
    fmt::memory_buffer out;
    if(!format_field(obj, fn, out, spec)) {
        return std::nullopt;
    }
    return fmt::to_string(out);
}


namespace resolve_detail {

inline std::string describe_field(const FieldRef & ref) {
    if(ref.is_name()) {
        return fmt::format("`{}`", ref.name());
    }
    if(ref.is_negative()) {
        return fmt::format("{}", ref.negative_index());
    }
    return fmt::format("{}", ref.index());
}

} // namespace resolve_detail

template<class T>
std::string ResolveResultToString(const ResolveResult<T> & res) {
    using resolve_detail::describe_field;
    switch(res.error()) {
    case ResolveError::none:
        return "no error";
    case ResolveError::unknown_field_name:
        return fmt::format("unknown field {}", describe_field(res.field()));
    case ResolveError::field_index_out_of_range:
        return fmt::format("field index {} is out of range", res.field().index());
    case ResolveError::negative_field_index:
        return fmt::format("field index {} is negative", res.field().negative_index());
    case ResolveError::unknown_capability_token:
        return fmt::format("unknown format type `{}` for field {}", res.token(), describe_field(res.field()));
    case ResolveError::capability_not_supported:
        return fmt::format("field {} does not support {} representation",
                           describe_field(res.field()), capability_description(res.capability()));
    case ResolveError::not_an_index_value:
        return fmt::format("field {} cannot supply a width or precision", describe_field(res.field()));
    }
    return std::string(error_to_string(res.error()));
}

} // namespace RuntimeFmt
