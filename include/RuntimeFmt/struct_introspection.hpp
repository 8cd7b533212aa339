#pragma once

#include <cstddef>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <pfr/tuple_size.hpp>
#include <pfr/core.hpp>
#include <pfr/core_name.hpp>

namespace RuntimeFmt {

template <typename CharT, std::size_t N> struct FieldName
{
    constexpr FieldName(const CharT (&str)[N+1]) {
        for(std::size_t i = 0; i < N+1; i ++) {
            m_data[i] = str[i];
        }
    }
    CharT m_data[N+1];
    static constexpr std::size_t Length = N;
    constexpr std::string_view toStringView() const {
        return {&m_data[0], &m_data[Length]};
    }
};
template <typename CharT, std::size_t N>
FieldName(const CharT (&str)[N])->FieldName<CharT, N-1>;


// External field list for types PFR cannot see through (or whose formatting
// names differ from member names). Only listed members become fields.
template <class T>
struct StructMeta {

};

template <auto MPtr, FieldName name>
struct Field;

template <typename C, typename T, T C::*MPtr, FieldName name>
struct Field<MPtr, name>{
    using ClassT = C;
    using ValueT = T;
    static constexpr FieldName Name  = name;
    static constexpr  T C::* MemberP = MPtr;
};

template <class ... F>
struct StructFields{
    using FieldsTuple = std::tuple<F...>;
};


namespace introspection {

namespace detail {

template<class T>
struct IntrospectionImpl {
    using StructT = std::remove_cv_t<T>;

    template<std::size_t Index>
    static constexpr const auto & getStructElementByIndex(const StructT & s) {
        return pfr::get<Index>(s);
    }

    static constexpr std::size_t structureElementsCount = pfr::tuple_size_v<StructT>;

    template<std::size_t Index>
    using structureElementTypeByIndex = pfr::tuple_element_t<Index, StructT>;

    template<std::size_t Index>
    static constexpr std::string_view structureElementNameByIndex = pfr::get_name<Index, StructT>();
};

template<class T>
struct is_fields_pack : std::false_type {};

template<class... F>
struct is_fields_pack<StructFields<F...>> : std::true_type {};

template<class T>
inline constexpr bool is_fields_pack_v = is_fields_pack<T>::value;


template<class T, class = void>
struct has_struct_meta_specialization_impl : std::false_type {};

template<class T>
struct has_struct_meta_specialization_impl<T,
                                          std::void_t<typename StructMeta<T>::Fields>
                                          > : std::bool_constant<
                                                  is_fields_pack_v<typename StructMeta<T>::Fields>
                                                  > {};

template<class T>
inline constexpr bool has_struct_meta_specialization =
    has_struct_meta_specialization_impl<T>::value;


template <class T>
requires (has_struct_meta_specialization<T>)
struct IntrospectionImpl<T> {
    using Fields = typename StructMeta<T>::Fields::FieldsTuple;
    static constexpr std::size_t structureElementsCount = std::tuple_size_v<Fields>;

    template<std::size_t Index, class StructT>
    static constexpr const auto & getStructElementByIndex(const StructT & s) {
        using F = std::tuple_element_t<Index, Fields>;
        return s.*(F::MemberP);
    }

    template<std::size_t Index>
    using structureElementTypeByIndex = typename std::tuple_element_t<Index, Fields>::ValueT;

    template<std::size_t Index>
    static constexpr std::string_view structureElementNameByIndex =
        std::tuple_element_t<Index, Fields>::Name.toStringView();
};

} // namespace detail


template<class StructT>
concept Introspectable =
    detail::has_struct_meta_specialization<std::remove_cv_t<StructT>> ||
    (std::is_aggregate_v<std::remove_cv_t<StructT>> && !std::is_array_v<std::remove_cv_t<StructT>>);

template<std::size_t Index, class StructT>
constexpr const auto & getStructElementByIndex(const StructT & s) {
    using Impl = detail::IntrospectionImpl<std::remove_cv_t<StructT>>;
    return Impl::template getStructElementByIndex<Index>(s);
}

template<class StructT>
inline constexpr std::size_t structureElementsCount = detail::IntrospectionImpl<std::remove_cv_t<StructT>>::structureElementsCount;

template<std::size_t Index, class StructT>
using structureElementTypeByIndex = typename detail::IntrospectionImpl<std::remove_cv_t<StructT>>::template structureElementTypeByIndex<Index>;

template<std::size_t Index, class StructT>
inline constexpr std::string_view structureElementNameByIndex = detail::IntrospectionImpl<std::remove_cv_t<StructT>>::template structureElementNameByIndex<Index>;

} // namespace introspection
} // namespace RuntimeFmt
