//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGFRONT_PROTOCOL_CLOSE_HPP
#define PGFRONT_PROTOCOL_CLOSE_HPP

#include <boost/system/error_code.hpp>

#include <string_view>
#include <vector>

#include "pgfront/protocol/common.hpp"

namespace pgfront {
namespace protocol {

// Requests to close a prepared statement or portal
struct close
{
    static constexpr unsigned char message_type = static_cast<unsigned char>('C');

    // Whether to close a prepared statement or a portal
    portal_or_statement type;

    // The name of the prepared statement or portal to close (an empty string selects the unnamed prepared
    // statement or portal).
    std::string_view name;
};
boost::system::error_code serialize(const close& msg, std::vector<unsigned char>& to);

}  // namespace protocol
}  // namespace pgfront

#endif
