//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGFRONT_CLIENT_ERRC_HPP
#define PGFRONT_CLIENT_ERRC_HPP

#include <boost/system/error_code.hpp>

#include <iosfwd>
#include <type_traits>

namespace pgfront {

// Errors generated by the library while serializing frontend messages
enum class client_errc : int
{
    // A string field contains a NULL character, which can't be represented in the protocol
    embedded_null = 1,

    // A count or length doesn't fit in the integer type the protocol uses to transmit it
    value_too_big,
};

const boost::system::error_category& get_client_category() noexcept;

inline boost::system::error_code make_error_code(client_errc c) noexcept
{
    return boost::system::error_code(static_cast<int>(c), get_client_category());
}

const char* to_string(client_errc c) noexcept;
std::ostream& operator<<(std::ostream& os, client_errc c);

}  // namespace pgfront

namespace boost {
namespace system {

template <>
struct is_error_code_enum<::pgfront::client_errc> : std::true_type
{
};

}  // namespace system
}  // namespace boost

#endif
