#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>

namespace ChainBattles {

namespace writer {

template<typename R>
concept WriterLike = requires(R writer,
                              R& mutable_writer,
                              const bool& bool_ref,
                              const std::uint64_t& uint_ref,
                              const char* char_ptr,
                              std::size_t size,
                              typename R::ArrayFrame & arrFrameRef,
                              typename R::MapFrame & mapFrameRef
                             ) {

    typename R::iterator_type;
    typename R::ArrayFrame;
    typename R::MapFrame;
    typename R::error_type;

    { writer.current() } -> std::same_as<typename R::iterator_type>;
    { writer.getError() } -> std::same_as<typename R::error_type>;

    { mutable_writer.write_array_begin(arrFrameRef) } -> std::same_as<bool>;
    { mutable_writer.write_map_begin(mapFrameRef) } -> std::same_as<bool>;

    { mutable_writer.advance_after_value(arrFrameRef) } -> std::same_as<bool>;
    { mutable_writer.advance_after_value(mapFrameRef) } -> std::same_as<bool>;
    { mutable_writer.move_to_value(mapFrameRef) } -> std::same_as<bool>;

    { mutable_writer.write_array_end(arrFrameRef) } -> std::same_as<bool>;
    { mutable_writer.write_map_end(mapFrameRef) } -> std::same_as<bool>;

    { mutable_writer.write_null() } -> std::same_as<bool>;
    { mutable_writer.write_bool(bool_ref) } -> std::same_as<bool>;
    { mutable_writer.write_number(uint_ref) } -> std::same_as<bool>;
    { mutable_writer.write_string(char_ptr, size) } -> std::same_as<bool>;
};

} // namespace writer

} // namespace ChainBattles
