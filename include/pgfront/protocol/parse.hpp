//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGFRONT_PROTOCOL_PARSE_HPP
#define PGFRONT_PROTOCOL_PARSE_HPP

#include <boost/system/error_code.hpp>

#include <span>
#include <string_view>
#include <vector>

#include "pgfront/protocol/common.hpp"

namespace pgfront {
namespace protocol {

// Named parse_t because parse is a common function name
struct parse_t
{
    static constexpr unsigned char message_type = static_cast<unsigned char>('P');

    // The name of the destination prepared statement (an empty string selects the unnamed prepared
    // statement).
    std::string_view statement_name;

    // The query string to be parsed.
    std::string_view query;

    // Expected parameter data types, as OIDs. A zero OID leaves the type unspecified.
    // There may be fewer OIDs than parameters in the query.
    std::span<const oid_t> parameter_type_oids;
};
boost::system::error_code serialize(const parse_t& msg, std::vector<unsigned char>& to);

}  // namespace protocol
}  // namespace pgfront

#endif
