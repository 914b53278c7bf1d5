//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGFRONT_PROTOCOL_FRONTEND_MESSAGE_HPP
#define PGFRONT_PROTOCOL_FRONTEND_MESSAGE_HPP

#include <boost/system/error_code.hpp>
#include <boost/variant2/variant.hpp>

#include <vector>

#include "pgfront/protocol/bind.hpp"
#include "pgfront/protocol/cancel_request.hpp"
#include "pgfront/protocol/close.hpp"
#include "pgfront/protocol/copy.hpp"
#include "pgfront/protocol/describe.hpp"
#include "pgfront/protocol/execute.hpp"
#include "pgfront/protocol/flush.hpp"
#include "pgfront/protocol/parse.hpp"
#include "pgfront/protocol/query.hpp"
#include "pgfront/protocol/sync.hpp"
#include "pgfront/protocol/terminate.hpp"

namespace pgfront {
namespace protocol {

// Any message that a client may send to the server. This includes CancelRequest,
// which is sent over a new connection. Startup and authentication messages are not included.
using frontend_message = boost::variant2::variant<
    bind,
    cancel_request,
    close,
    copy_data,
    copy_done,
    copy_fail,
    describe,
    execute,
    flush,
    parse_t,
    query,
    sync,
    terminate>;

// Appends the serialized message to the end of the buffer.
// On error, the buffer is left as it was before the call.
boost::system::error_code serialize(const frontend_message& msg, std::vector<unsigned char>& to);

}  // namespace protocol
}  // namespace pgfront

#endif
