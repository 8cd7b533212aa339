#pragma once

#include <cstddef>
#include <functional>
#include <optional>

#include "accessor.hpp"
#include "capabilities.hpp"
#include "formatter.hpp"

namespace RuntimeFmt {

// Renders one field of `This` with one capability.
template<class This>
using FormatFn = FormatResult (*)(const This &, Formatter &);

// Reads one `std::size_t` field of `This`; used for dynamic width/precision.
template<class This>
using UsizeFn = const std::size_t & (*)(const This &);


namespace detail {

template<class Cap, class This, class Value, class Mapper>
FormatResult format_through(const This & self, Formatter & f) {
    const Mapper mapper{};
    return Cap::template perform<Value>(std::invoke(mapper, self), f);
}

template<class This, class Value, class Mapper>
constexpr const Value & project_through(const This & self) {
    const Mapper mapper{};
    return std::invoke(mapper, self);
}

template<class Value>
struct UsizeNarrowing {
    template<class This>
    static constexpr std::optional<UsizeFn<This>> convert(const Value & (*)(const This &)) {
        return std::nullopt;
    }
};

template<>
struct UsizeNarrowing<std::size_t> {
    template<class This>
    static constexpr std::optional<UsizeFn<This>> convert(UsizeFn<This> fn) {
        return fn;
    }
};

} // namespace detail


/// Binds capability `Cap` to the field selected by `Mapper`.
///
/// Returns a formatter only when the field's type supports `Cap`; otherwise
/// nothing, and `Cap::perform` is never instantiated for that type. The
/// formatter's output is exactly what `Cap::perform` writes for the field.
template<class Cap, class This, class Mapper>
    requires FormatCapability<Cap> && StatelessAccessor<Mapper, This>
constexpr std::optional<FormatFn<This>> get_formatter(Mapper) {
    using Value = projected_value_t<Mapper, This>;
    if constexpr (Cap::template allowed<Value>()) {
        return &detail::format_through<Cap, This, Value, Mapper>;
    } else {
        return std::nullopt;
    }
}

/// Narrows the field selected by `Mapper` to a `std::size_t` reader.
///
/// Only an exact `std::size_t` field qualifies; other integer types, whatever
/// their width, yield nothing.
template<class This, class Mapper>
    requires StatelessAccessor<Mapper, This>
constexpr std::optional<UsizeFn<This>> get_as_usize(Mapper) {
    using Value = projected_value_t<Mapper, This>;
    return detail::UsizeNarrowing<Value>::template convert<This>(
        &detail::project_through<This, Value, Mapper>);
}

} // namespace RuntimeFmt
