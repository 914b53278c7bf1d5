//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGFRONT_PROTOCOL_CANCEL_REQUEST_HPP
#define PGFRONT_PROTOCOL_CANCEL_REQUEST_HPP

#include <boost/system/error_code.hpp>

#include <cstdint>
#include <vector>

namespace pgfront {
namespace protocol {

// Sent over a new connection to cancel a query running in another one.
// Doesn't have a message type byte. The process ID and secret key are
// obtained from the BackendKeyData message sent at startup.
struct cancel_request
{
    // Identifies the message as a cancel request, in the place where
    // a startup message carries the protocol version
    static constexpr std::int32_t request_code = 80877102;

    // The process ID of the target backend.
    std::int32_t process_id;

    // The secret key for the target backend.
    std::int32_t secret_key;
};
boost::system::error_code serialize(const cancel_request& msg, std::vector<unsigned char>& to);

}  // namespace protocol
}  // namespace pgfront

#endif
