#pragma once

#include <iterator>
#include <string>

namespace ChainBattles {

// Iterator you can write chars through: *it = c; ++it
template <class It>
concept CharOutputIterator =
    std::output_iterator<It, char>;

// Matching "end" for an output iterator: it == end
template <class Sent, class It>
concept CharSentinelForOut =
    std::sentinel_for<Sent, It>;

namespace io_details {

// End marker for std::string back inserters: a string never runs out of room.
struct limitless_sentinel {};

constexpr bool operator==(const std::back_insert_iterator<std::string>&,
                          const limitless_sentinel&) noexcept {
    return false;
}

constexpr bool operator==(const limitless_sentinel&,
                          const std::back_insert_iterator<std::string>&) noexcept {
    return false;
}

} // namespace io_details

} // namespace ChainBattles
