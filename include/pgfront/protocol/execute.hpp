//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGFRONT_PROTOCOL_EXECUTE_HPP
#define PGFRONT_PROTOCOL_EXECUTE_HPP

#include <boost/system/error_code.hpp>

#include <cstdint>
#include <string_view>
#include <vector>

namespace pgfront {
namespace protocol {

struct execute
{
    static constexpr unsigned char message_type = static_cast<unsigned char>('E');

    // The name of the portal to execute (an empty string selects the unnamed portal).
    std::string_view portal_name;

    // Maximum number of rows to return, if portal contains a query that returns rows (ignored otherwise).
    // Zero denotes “no limit”.
    std::int32_t max_num_rows;
};
boost::system::error_code serialize(const execute& msg, std::vector<unsigned char>& to);

}  // namespace protocol
}  // namespace pgfront

#endif
