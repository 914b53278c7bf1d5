//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGFRONT_PROTOCOL_COPY_HPP
#define PGFRONT_PROTOCOL_COPY_HPP

// Messages sent by the client during COPY FROM STDIN

#include <boost/system/error_code.hpp>

#include <span>
#include <string_view>
#include <vector>

namespace pgfront {
namespace protocol {

struct copy_data
{
    static constexpr unsigned char message_type = static_cast<unsigned char>('d');

    // Data that forms part of a COPY data stream. Messages need not
    // correspond to individual rows.
    std::span<const unsigned char> data;
};
boost::system::error_code serialize(const copy_data& msg, std::vector<unsigned char>& to);

struct copy_done
{
    static constexpr unsigned char message_type = static_cast<unsigned char>('c');
};
boost::system::error_code serialize(copy_done, std::vector<unsigned char>& to);

struct copy_fail
{
    static constexpr unsigned char message_type = static_cast<unsigned char>('f');

    // An error message to report as the cause of failure.
    std::string_view error_message;
};
boost::system::error_code serialize(const copy_fail& msg, std::vector<unsigned char>& to);

}  // namespace protocol
}  // namespace pgfront

#endif
