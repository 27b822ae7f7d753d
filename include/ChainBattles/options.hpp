#pragma once
#include <cstdint>
#include <optional>
#include <string_view>
#include <type_traits>

#include "annotated.hpp"
#include "const_string.hpp"

namespace ChainBattles {

namespace options {

namespace detail {
struct not_json_tag{};
struct key_tag{};
struct skip_nulls_tag{};
}

// Field is kept in the model but never written.
struct not_json {
    using tag = detail::not_json_tag;
    static constexpr std::string_view to_string() {
        return "not_json";
    }
};

// JSON key differs from the C++ member name.
template<ConstString Desc>
struct key {
    static_assert(Desc.check(), "[[[ ChainBattles ]]] key contains characters that need escaping");
    using tag = detail::key_tag;
    static constexpr auto desc = Desc;
    static constexpr std::string_view to_string() {
        return "key";
    }
};

// Disengaged optionals are omitted instead of written as null.
struct skip_nulls {
    using tag = detail::skip_nulls_tag;
    static constexpr std::string_view to_string() {
        return "skip_nulls";
    }
};

namespace detail {

template<class Opt, class Tag, class = void>
struct option_matches_tag : std::false_type {};

template<class Opt, class Tag>
struct option_matches_tag<Opt, Tag, std::void_t<typename Opt::tag>>
    : std::bool_constant<std::is_same_v<typename Opt::tag, Tag>> {};

template<class Tag, class... Opts>
struct find_option_by_tag;

template<class Tag>
struct find_option_by_tag<Tag> {
    using type = void;
};

template<class Tag, class First, class... Rest>
struct find_option_by_tag<Tag, First, Rest...> {
    using type = std::conditional_t<
        option_matches_tag<First, Tag>::value,
        First,
        typename find_option_by_tag<Tag, Rest...>::type
        >;
};

struct no_options {
    template<class Tag>
    static constexpr bool has_option = false;

    template<class Tag>
    using get_option = void;
};

template<class OptPack> struct field_options;
template<class... Opts>
struct field_options<OptionsPack<Opts...>> {
    template<class Tag>
    using get_option = typename find_option_by_tag<Tag, Opts...>::type;

    template<class Tag>
    static constexpr bool has_option = !std::is_void_v<get_option<Tag>>;
};

template<class Field>
struct annotation_meta {
    using value_t = Field;
    using options = no_options;
    static constexpr decltype(auto) getRef(Field & f) {
        return (f);
    }
    static constexpr decltype(auto) getRef(const Field & f) {
        return (f);
    }
};

template<class T, class... Opts>
struct annotation_meta<std::optional<Annotated<T, Opts...>>> {
    static_assert(!sizeof(T), "[[[ ChainBattles ]]] Use Annotated<std::optional<T>, ...> instead of std::optional<Annotated<T, ...>>");
};

template<class T, class... Opts>
struct annotation_meta<Annotated<T, Opts...>> {
    using value_t = T;
    using options = field_options<OptionsPack<Opts...>>;

    static constexpr decltype(auto) getRef(Annotated<T, Opts...> & f) {
        return (f.value);
    }
    static constexpr decltype(auto) getRef(const Annotated<T, Opts...> & f) {
        return (f.value);
    }
};

template<class Field>
struct annotation_meta_getter : annotation_meta<std::remove_cvref_t<Field>> {};

} // namespace detail

} // namespace options

} // namespace ChainBattles
