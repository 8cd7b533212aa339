#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>
#include <type_traits>
#include <utility>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "errors.hpp"
#include "formatter.hpp"

namespace RuntimeFmt {

// Representation kinds a field may be rendered with. The set is closed.
enum class CapabilityKind : std::uint8_t {
    display,
    debug,
    lower_exp,
    upper_exp,
    octal,
    pointer,
    binary,
    lower_hex,
    upper_hex
};

inline constexpr std::size_t capability_count = 9;

constexpr std::optional<CapabilityKind> capability_from_token(std::string_view token) {
    if(token.empty()) return CapabilityKind::display;
    if(token.size() != 1) return std::nullopt;
    switch(token[0]) {
    case '?': return CapabilityKind::debug;
    case 'x': return CapabilityKind::lower_hex;
    case 'X': return CapabilityKind::upper_hex;
    case 'o': return CapabilityKind::octal;
    case 'b': return CapabilityKind::binary;
    case 'p': return CapabilityKind::pointer;
    case 'e': return CapabilityKind::lower_exp;
    case 'E': return CapabilityKind::upper_exp;
    }
    return std::nullopt;
}

constexpr std::string_view capability_token(CapabilityKind k) {
    switch(k) {
    case CapabilityKind::display  : return ""; break;
    case CapabilityKind::debug    : return "?"; break;
    case CapabilityKind::lower_exp: return "e"; break;
    case CapabilityKind::upper_exp: return "E"; break;
    case CapabilityKind::octal    : return "o"; break;
    case CapabilityKind::pointer  : return "p"; break;
    case CapabilityKind::binary   : return "b"; break;
    case CapabilityKind::lower_hex: return "x"; break;
    case CapabilityKind::upper_hex: return "X"; break;
    }
    return "";
}

constexpr std::string_view capability_description(CapabilityKind k) {
    switch(k) {
    case CapabilityKind::display  : return "human-readable"; break;
    case CapabilityKind::debug    : return "debug"; break;
    case CapabilityKind::lower_exp: return "lowercase exponential"; break;
    case CapabilityKind::upper_exp: return "uppercase exponential"; break;
    case CapabilityKind::octal    : return "octal"; break;
    case CapabilityKind::pointer  : return "pointer"; break;
    case CapabilityKind::binary   : return "binary"; break;
    case CapabilityKind::lower_hex: return "lowercase hexadecimal"; break;
    case CapabilityKind::upper_hex: return "uppercase hexadecimal"; break;
    }
    return "N/A";
}


namespace capability_checks {

template<class T, template<class...> class Template>
struct is_specialization_of : std::false_type {};

template<template<class...> class Template, class... Args>
struct is_specialization_of<Template<Args...>, Template> : std::true_type {};

template<class T, template<class...> class Template>
constexpr bool is_specialization_of_v =
    is_specialization_of<std::remove_cv_t<T>, Template>::value;

template<class T>
concept CharacterLike =
    std::same_as<std::remove_cv_t<T>, char>     ||
    std::same_as<std::remove_cv_t<T>, wchar_t>  ||
    std::same_as<std::remove_cv_t<T>, char8_t>  ||
    std::same_as<std::remove_cv_t<T>, char16_t> ||
    std::same_as<std::remove_cv_t<T>, char32_t>;

template<class T>
concept StringLike = std::convertible_to<const T &, std::string_view>;

template<class T>
concept FmtFormattable = fmt::is_formattable<T, char>::value;

template<class T>
concept RangeOrTupleLike = fmt::is_range<T, char>::value || fmt::is_tuple_like<T>::value;

template<class T>
concept RawPointerLike =
    std::is_null_pointer_v<T> ||
    (std::is_pointer_v<T> &&
     (std::is_object_v<std::remove_pointer_t<T>> || std::is_void_v<std::remove_pointer_t<T>>) &&
     !std::is_volatile_v<std::remove_pointer_t<T>>);

template<class T>
concept SmartPointerLike =
    is_specialization_of_v<T, std::unique_ptr> ||
    is_specialization_of_v<T, std::shared_ptr>;

template<class T>
concept PointerLike = RawPointerLike<T> || SmartPointerLike<T>;

// Scalars with a textual form; a C string is text, any other pointer is not.
template<class T>
concept HumanReadable =
    FmtFormattable<T> &&
    !RangeOrTupleLike<T> &&
    (!RawPointerLike<T> || StringLike<T>);

template<class T>
concept DebugFormattable = FmtFormattable<T>;

template<class T>
concept IntegerNumber =
    std::integral<T> &&
    !std::same_as<std::remove_cv_t<T>, bool> &&
    !CharacterLike<T>;

template<class T>
concept FloatingNumber = std::floating_point<T>;

} // namespace capability_checks


template<class Cap, class T>
struct CapabilityImpl;

namespace capability {

template<CapabilityKind K>
struct Tag {
    static constexpr CapabilityKind kind = K;

    template<class T>
    static constexpr bool allowed() {
        return CapabilityImpl<Tag, std::remove_cv_t<T>>::allowed;
    }

    // Precondition: allowed<T>().
    template<class T>
    static FormatResult perform(const T & value, Formatter & f) {
        return CapabilityImpl<Tag, std::remove_cv_t<T>>::perform(value, f);
    }
};

using Display  = Tag<CapabilityKind::display>;
using Debug    = Tag<CapabilityKind::debug>;
using LowerExp = Tag<CapabilityKind::lower_exp>;
using UpperExp = Tag<CapabilityKind::upper_exp>;
using Octal    = Tag<CapabilityKind::octal>;
using Pointer  = Tag<CapabilityKind::pointer>;
using Binary   = Tag<CapabilityKind::binary>;
using LowerHex = Tag<CapabilityKind::lower_hex>;
using UpperHex = Tag<CapabilityKind::upper_hex>;

} // namespace capability

template<class Cap>
concept FormatCapability = requires {
    { Cap::kind } -> std::convertible_to<CapabilityKind>;
} && std::same_as<Cap, capability::Tag<Cap::kind>>;


// Generic fallback: the capability does not apply to T. Constrained partial
// specializations below take over for types that support the representation,
// and users may add explicit specializations for their own types.
template<class Cap, class T>
struct CapabilityImpl {
    static constexpr bool allowed = false;

    [[noreturn]] static FormatResult perform(const T &, Formatter &) {
        detail::contract_violation(fmt::format(
            "{} representation performed on a type that does not support it",
            capability_description(Cap::kind)));
    }
};

namespace detail {

template<char Presentation>
struct RenderWith {
    static constexpr bool allowed = true;

    template<class T>
    static FormatResult perform(const T & value, Formatter & f) {
        return f.write_value(value, Presentation);
    }
};

template<class T>
const void * pointer_address(const T & p) {
    if constexpr (std::is_null_pointer_v<T>) {
        return nullptr;
    } else if constexpr (std::is_pointer_v<T>) {
        return static_cast<const void *>(p);
    } else {
        return static_cast<const void *>(p.get());
    }
}

// A null C string is still a value of its field type; it renders as this
// token instead of being dereferenced.
inline constexpr std::string_view null_text = "(null)";

template<class T>
constexpr bool is_null_text(const T & value) {
    if constexpr (std::is_pointer_v<T>) {
        return value == nullptr;
    } else {
        return false;
    }
}

} // namespace detail

template<class T>
    requires capability_checks::HumanReadable<T>
struct CapabilityImpl<capability::Display, T> {
    static constexpr bool allowed = true;

    static FormatResult perform(const T & value, Formatter & f) {
        if(detail::is_null_text(value)) {
            return f.write_value(detail::null_text, '\0');
        }
        return f.write_value(value, '\0');
    }
};

template<class T>
    requires capability_checks::DebugFormattable<T>
struct CapabilityImpl<capability::Debug, T> {
    static constexpr bool allowed = true;

    static FormatResult perform(const T & value, Formatter & f) {
        if constexpr (capability_checks::CharacterLike<T>) {
            return f.write_value(value, '?');
        } else if constexpr (capability_checks::StringLike<T>) {
            if(detail::is_null_text(value)) {
                return f.write_value(detail::null_text, '\0');
            }
            return f.write_value(std::string_view(value), '?');
        } else {
            return f.write_value(value, '\0');
        }
    }
};

template<class T>
    requires capability_checks::FloatingNumber<T>
struct CapabilityImpl<capability::LowerExp, T> : detail::RenderWith<'e'> {};

template<class T>
    requires capability_checks::FloatingNumber<T>
struct CapabilityImpl<capability::UpperExp, T> : detail::RenderWith<'E'> {};

template<class T>
    requires capability_checks::IntegerNumber<T>
struct CapabilityImpl<capability::Octal, T> : detail::RenderWith<'o'> {};

template<class T>
    requires capability_checks::IntegerNumber<T>
struct CapabilityImpl<capability::Binary, T> : detail::RenderWith<'b'> {};

template<class T>
    requires capability_checks::IntegerNumber<T>
struct CapabilityImpl<capability::LowerHex, T> : detail::RenderWith<'x'> {};

template<class T>
    requires capability_checks::IntegerNumber<T>
struct CapabilityImpl<capability::UpperHex, T> : detail::RenderWith<'X'> {};

template<class T>
    requires capability_checks::PointerLike<T>
struct CapabilityImpl<capability::Pointer, T> {
    static constexpr bool allowed = true;

    static FormatResult perform(const T & value, Formatter & f) {
        return f.write_value(detail::pointer_address(value), 'p');
    }
};


template<std::size_t I>
using CapabilityByIndex = capability::Tag<static_cast<CapabilityKind>(I)>;

constexpr std::size_t capability_index(CapabilityKind k) {
    return static_cast<std::size_t>(k);
}

// Calls fn(Cap{}) with the tag matching a kind known only at run time.
template<class Fn>
constexpr decltype(auto) visit_capability(CapabilityKind k, Fn && fn) {
    switch(k) {
    case CapabilityKind::display  : return std::forward<Fn>(fn)(capability::Display{});
    case CapabilityKind::debug    : return std::forward<Fn>(fn)(capability::Debug{});
    case CapabilityKind::lower_exp: return std::forward<Fn>(fn)(capability::LowerExp{});
    case CapabilityKind::upper_exp: return std::forward<Fn>(fn)(capability::UpperExp{});
    case CapabilityKind::octal    : return std::forward<Fn>(fn)(capability::Octal{});
    case CapabilityKind::pointer  : return std::forward<Fn>(fn)(capability::Pointer{});
    case CapabilityKind::binary   : return std::forward<Fn>(fn)(capability::Binary{});
    case CapabilityKind::lower_hex: return std::forward<Fn>(fn)(capability::LowerHex{});
    case CapabilityKind::upper_hex: return std::forward<Fn>(fn)(capability::UpperHex{});
    }
    detail::contract_violation("capability kind outside the closed set");
}

} // namespace RuntimeFmt
