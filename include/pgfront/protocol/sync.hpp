//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGFRONT_PROTOCOL_SYNC_HPP
#define PGFRONT_PROTOCOL_SYNC_HPP

#include <boost/system/error_code.hpp>

#include <vector>

namespace pgfront {
namespace protocol {

// Closes the current extended query pipeline step. The server will answer with ReadyForQuery.
struct sync
{
    static constexpr unsigned char message_type = static_cast<unsigned char>('S');
};
boost::system::error_code serialize(sync, std::vector<unsigned char>& to);

}  // namespace protocol
}  // namespace pgfront

#endif
