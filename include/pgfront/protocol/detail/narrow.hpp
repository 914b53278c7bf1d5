//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGFRONT_PROTOCOL_DETAIL_NARROW_HPP
#define PGFRONT_PROTOCOL_DETAIL_NARROW_HPP

#include <boost/system/error_code.hpp>

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <limits>

#include "pgfront/client_errc.hpp"

namespace pgfront::protocol::detail {

// Converts a size or count into the integer type the protocol uses to transmit it.
// to is only written on success.
template <std::integral Int>
boost::system::error_code narrow(std::size_t value, Int& to) noexcept
{
    static_assert(sizeof(Int) <= sizeof(std::size_t));
    if (value > static_cast<std::size_t>((std::numeric_limits<Int>::max)()))
        return client_errc::value_too_big;
    to = static_cast<Int>(value);
    return {};
}

// Counts of format codes, parameters and type OIDs
using count_type = std::uint16_t;

// Lengths of parameter values and messages
using length_type = std::int32_t;

}  // namespace pgfront::protocol::detail

#endif
