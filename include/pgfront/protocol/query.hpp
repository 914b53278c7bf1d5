//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGFRONT_PROTOCOL_QUERY_HPP
#define PGFRONT_PROTOCOL_QUERY_HPP

#include <boost/system/error_code.hpp>

#include <string_view>
#include <vector>

namespace pgfront {
namespace protocol {

// A simple query
struct query
{
    static constexpr unsigned char message_type = static_cast<unsigned char>('Q');

    // The query string itself.
    std::string_view query;
};
boost::system::error_code serialize(query msg, std::vector<unsigned char>& to);

}  // namespace protocol
}  // namespace pgfront

#endif
