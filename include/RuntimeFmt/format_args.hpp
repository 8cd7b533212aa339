#pragma once

#include <algorithm>
#include <array>
#include <concepts>
#include <cstddef>
#include <optional>
#include <string_view>
#include <utility>

#include <fmt/format.h>

#include "accessor.hpp"
#include "capabilities.hpp"
#include "codegen.hpp"
#include "errors.hpp"
#include "struct_introspection.hpp"

namespace RuntimeFmt {

// What a template interpreter may rely on for a container type `This`.
// Indices passed to get_child/as_usize must have been confirmed by
// validate_index or produced by validate_name; anything else is fatal.
template<class D, class This>
concept FormatArgsLike = requires(std::string_view name, std::size_t index, CapabilityKind kind) {
    { D::validate_name(name) } -> std::same_as<std::optional<std::size_t>>;
    { D::validate_index(index) } -> std::same_as<bool>;
    { D::template get_child<capability::Display>(index) } -> std::same_as<std::optional<FormatFn<This>>>;
    { D::get_child(kind, index) } -> std::same_as<std::optional<FormatFn<This>>>;
    { D::as_usize(index) } -> std::same_as<std::optional<UsizeFn<This>>>;
};


namespace format_args_detail {

struct NameEntry {
    std::string_view name;
    std::size_t index;
};

template<class This>
inline constexpr std::size_t fieldCount = introspection::structureElementsCount<This>;

template<class This>
inline constexpr std::array<NameEntry, fieldCount<This>> namesInOrder =
    []<std::size_t... I>(std::index_sequence<I...>) consteval {
        return std::array<NameEntry, sizeof...(I)>{
            NameEntry{introspection::structureElementNameByIndex<I, This>, I}...
        };
    }(std::make_index_sequence<fieldCount<This>>{});

template<class This>
inline constexpr std::array<NameEntry, fieldCount<This>> namesSorted = []() consteval {
    auto sorted = namesInOrder<This>;
    std::ranges::sort(sorted, {}, &NameEntry::name);
    return sorted;
}();

template<class This>
inline constexpr bool namesAreUnique =
    std::ranges::adjacent_find(namesSorted<This>, {}, &NameEntry::name) == namesSorted<This>.end();

template<class Cap, class This>
consteval std::array<std::optional<FormatFn<This>>, fieldCount<This>> formatterRow() {
    return []<std::size_t... I>(std::index_sequence<I...>) {
        return std::array<std::optional<FormatFn<This>>, sizeof...(I)>{
            get_formatter<Cap, This>(FieldAccessor<This, I>{})...
        };
    }(std::make_index_sequence<fieldCount<This>>{});
}

// formatters[capability_index(kind)][field]
template<class This>
inline constexpr auto formatters =
    []<std::size_t... C>(std::index_sequence<C...>) consteval {
        return std::array<std::array<std::optional<FormatFn<This>>, fieldCount<This>>, sizeof...(C)>{
            formatterRow<CapabilityByIndex<C>, This>()...
        };
    }(std::make_index_sequence<capability_count>{});

template<class This>
inline constexpr std::array<std::optional<UsizeFn<This>>, fieldCount<This>> usizeReaders =
    []<std::size_t... I>(std::index_sequence<I...>) consteval {
        return std::array<std::optional<UsizeFn<This>>, sizeof...(I)>{
            get_as_usize<This>(FieldAccessor<This, I>{})...
        };
    }(std::make_index_sequence<fieldCount<This>>{});

} // namespace format_args_detail


/// Descriptor of `This` generated from its introspected fields.
///
/// Every table is a compile-time constant: building happens during template
/// instantiation and the result is shared read-only by all callers.
/// Specialize for a type to supply a hand-written descriptor instead; it then
/// has to satisfy FormatArgsLike.
template<class This>
struct FormatArgs {
    static_assert(introspection::Introspectable<This>,
                  "[[[ RuntimeFmt ]]] FormatArgs needs an aggregate or a StructMeta specialization");
    static_assert(format_args_detail::namesAreUnique<This>,
                  "[[[ RuntimeFmt ]]] field names must be unique");

    static constexpr std::size_t field_count = format_args_detail::fieldCount<This>;

    static constexpr std::optional<std::size_t> validate_name(std::string_view name) {
        const auto & sorted = format_args_detail::namesSorted<This>;
        auto it = std::ranges::lower_bound(sorted, name, {}, &format_args_detail::NameEntry::name);
        if(it == sorted.end() || it->name != name) {
            return std::nullopt;
        }
        return it->index;
    }

    static constexpr bool validate_index(std::size_t index) {
        return index < field_count;
    }

    template<class Cap>
        requires FormatCapability<Cap>
    static constexpr std::optional<FormatFn<This>> get_child(std::size_t index) {
        require_valid_index(index, "get_child");
        return format_args_detail::formatters<This>[capability_index(Cap::kind)][index];
    }

    static constexpr std::optional<FormatFn<This>> get_child(CapabilityKind kind, std::size_t index) {
        require_valid_index(index, "get_child");
        if(capability_index(kind) >= capability_count) {
            detail::contract_violation("get_child: capability kind outside the closed set");
        }
        return format_args_detail::formatters<This>[capability_index(kind)][index];
    }

    static constexpr std::optional<UsizeFn<This>> as_usize(std::size_t index) {
        require_valid_index(index, "as_usize");
        return format_args_detail::usizeReaders<This>[index];
    }

    static constexpr std::string_view field_name(std::size_t index) {
        require_valid_index(index, "field_name");
        return format_args_detail::namesInOrder<This>[index].name;
    }

private:
    static constexpr void require_valid_index(std::size_t index, std::string_view operation) {
        if(!validate_index(index)) {
            detail::contract_violation(fmt::format(
                "{}: field index {} is out of range ({} fields)", operation, index, field_count));
        }
    }
};

} // namespace RuntimeFmt
