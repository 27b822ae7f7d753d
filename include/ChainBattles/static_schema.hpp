#pragma once
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <type_traits>

#include "options.hpp"
#include "struct_introspection.hpp"

namespace ChainBattles {

namespace static_schema {

namespace detail {
template<class T>
struct always_false : std::false_type {};
}

using options::detail::annotation_meta_getter;

template<class Field>
using AnnotatedValue = typename annotation_meta_getter<Field>::value_t;

template<class T, template<class...> class Template>
struct is_specialization_of : std::false_type {};

template<template<class...> class Template, class... Args>
struct is_specialization_of<Template<Args...>, Template> : std::true_type {};

/* ######## Bool type detection ######## */
template<class C>
concept JsonBool = std::same_as<AnnotatedValue<C>, bool>;

/* ######## Number type detection ######## */
// Stats are counters: only integers are modelled, no floating point.
template<class C>
concept JsonNumber = !JsonBool<C> && std::is_integral_v<AnnotatedValue<C>>;

/* ######## String type detection ######## */
template<class C>
concept JsonString =
    std::same_as<AnnotatedValue<C>, std::string>      ||
    std::same_as<AnnotatedValue<C>, std::string_view>;

/* ######## Object type detection ######## */
template<typename T>
struct is_json_object {
    static constexpr bool value = [] {
        using U = AnnotatedValue<T>;
        if constexpr (JsonBool<T> || JsonString<T> || JsonNumber<T>) {
            return false;
        } else if constexpr (std::ranges::range<U>) {
            return false;
        } else if constexpr (is_specialization_of<U, std::optional>::value) {
            return false;
        } else if constexpr (!std::is_class_v<U> || !std::is_aggregate_v<U>) {
            return false;
        } else {
            return true;
        }
    }();
};

template<class C>
concept JsonObject = is_json_object<C>::value;

template<class T> struct is_json_serializable_value;

template<class T>
struct is_json_serializable_array {
    static constexpr bool value = []{
        using U = AnnotatedValue<T>;
        if constexpr (JsonString<T> || JsonBool<T> || JsonNumber<T>) {
            return false;
        } else if constexpr (std::ranges::input_range<const U>) {
            return is_json_serializable_value<std::ranges::range_value_t<const U>>::value;
        } else {
            return false;
        }
    }();
};

template<class C>
concept JsonSerializableArray = is_json_serializable_array<C>::value;

template<class T>
struct is_non_null_json_serializable_value {
    static constexpr bool value =
        JsonBool<T> || JsonNumber<T> || JsonString<T> ||
        is_json_object<T>::value || is_json_serializable_array<T>::value;
};

template<class Field>
struct is_nullable_json_serializable_value {
    static constexpr bool value = []{
        using AV = AnnotatedValue<Field>;
        if constexpr (is_specialization_of<AV, std::optional>::value) {
            return is_non_null_json_serializable_value<typename AV::value_type>::value;
        } else {
            return false;
        }
    }();
};

template<class Field>
concept JsonNullableSerializableValue = is_nullable_json_serializable_value<Field>::value;

template<class Field>
concept JsonNonNullableSerializableValue = is_non_null_json_serializable_value<Field>::value;

template<class T>
struct is_json_serializable_value {
    static constexpr bool value = is_non_null_json_serializable_value<T>::value
                                  || is_nullable_json_serializable_value<T>::value;
};

template<class C>
concept JsonSerializableValue = !std::is_pointer_v<std::remove_cvref_t<C>> && is_json_serializable_value<C>::value;

/* ######## Generic data access ######## */

template <JsonNullableSerializableValue Field>
constexpr bool isNull(const Field &f) {
    return !annotation_meta_getter<Field>::getRef(f).has_value();
}

// Must be called only after isNull() returned false.
template<JsonNullableSerializableValue Field>
constexpr decltype(auto) getRef(const Field & f) {
    using S = annotation_meta_getter<Field>;
    return (*S::getRef(f));
}

template<JsonNonNullableSerializableValue Field>
constexpr decltype(auto) getRef(const Field & f) {
    using S = annotation_meta_getter<Field>;
    return (S::getRef(f));
}

} // namespace static_schema

} // namespace ChainBattles
