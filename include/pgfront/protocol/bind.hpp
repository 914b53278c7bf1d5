//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGFRONT_PROTOCOL_BIND_HPP
#define PGFRONT_PROTOCOL_BIND_HPP

#include <boost/system/error_code.hpp>

#include <span>
#include <string_view>
#include <vector>

#include "pgfront/protocol/common.hpp"

namespace pgfront {
namespace protocol {

// Binds parameters to a prepared statement, creating a portal
struct bind
{
    static constexpr unsigned char message_type = static_cast<unsigned char>('B');

    // The name of the destination portal (an empty string selects the unnamed portal).
    std::string_view portal_name;

    // The name of the source prepared statement (an empty string selects the unnamed prepared statement).
    std::string_view statement_name;

    // The parameter format codes. Can be empty to indicate that there are no parameters or that the
    // parameters all use the default format (text); or one, in which case the specified format code is
    // applied to all parameters; or it can equal the actual number of parameters.
    std::span<const format_code> parameter_fmt_codes;

    // The parameter values, in the format indicated by the associated format code.
    // An empty optional represents a NULL parameter value.
    std::span<const parameter_value> parameters;

    // The result-column format codes. Same rules as parameter_fmt_codes, applied to the result columns.
    std::span<const format_code> result_fmt_codes;
};
boost::system::error_code serialize(const bind& msg, std::vector<unsigned char>& to);

}  // namespace protocol
}  // namespace pgfront

#endif
