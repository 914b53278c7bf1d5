//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGFRONT_PROTOCOL_COMMON_HPP
#define PGFRONT_PROTOCOL_COMMON_HPP

#include <cstdint>
#include <optional>
#include <span>

namespace pgfront {
namespace protocol {

enum class format_code : std::int16_t
{
    text = 0,
    binary = 1,
};

enum class portal_or_statement : unsigned char
{
    statement = 'S',
    portal = 'P',
};

// The object ID of a type. Assigned by the server's type catalog, opaque to us.
using oid_t = std::uint32_t;

// A parameter value, already encoded in text or binary format.
// An empty optional represents a NULL value.
using parameter_value = std::optional<std::span<const unsigned char>>;

}  // namespace protocol
}  // namespace pgfront

#endif
