#pragma once

#include <concepts>
#include <cstddef>
#include <functional>
#include <type_traits>

#include "struct_introspection.hpp"

namespace RuntimeFmt {

// A projection from `const This&` to one of its fields, returned by reference.
template<class M, class This>
concept Projection =
    std::invocable<const M &, const This &> &&
    std::is_lvalue_reference_v<std::invoke_result_t<const M &, const This &>>;

template<class M, class This>
    requires Projection<M, This>
using projected_value_t = std::remove_cvref_t<std::invoke_result_t<const M &, const This &>>;

// Accessors carry no per-instance data: the dispatcher rebuilds them from
// nothing at call time, so any captured state would be silently lost.
// Captureless lambdas and the accessors below qualify; capturing lambdas,
// function pointers and stateful functors do not.
template<class M, class This>
concept StatelessAccessor =
    Projection<M, This> &&
    std::is_empty_v<M> &&
    std::default_initializable<M>;


template<class This, std::size_t I>
struct FieldAccessor {
    constexpr const auto & operator()(const This & s) const {
        return introspection::getStructElementByIndex<I>(s);
    }
};

template<auto MPtr>
struct MemberAccessor;

template<typename C, typename T, T C::*MPtr>
struct MemberAccessor<MPtr> {
    constexpr const T & operator()(const C & c) const {
        return c.*MPtr;
    }
};

} // namespace RuntimeFmt
