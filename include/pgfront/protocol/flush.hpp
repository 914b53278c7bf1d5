//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGFRONT_PROTOCOL_FLUSH_HPP
#define PGFRONT_PROTOCOL_FLUSH_HPP

#include <boost/system/error_code.hpp>

#include <vector>

namespace pgfront {
namespace protocol {

// Asks the server to deliver any pending output, without ending the pipeline
struct flush
{
    static constexpr unsigned char message_type = static_cast<unsigned char>('H');
};
boost::system::error_code serialize(flush, std::vector<unsigned char>& to);

}  // namespace protocol
}  // namespace pgfront

#endif
