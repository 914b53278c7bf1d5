//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGFRONT_PROTOCOL_TERMINATE_HPP
#define PGFRONT_PROTOCOL_TERMINATE_HPP

#include <boost/system/error_code.hpp>

#include <vector>

namespace pgfront {
namespace protocol {

struct terminate
{
    static constexpr unsigned char message_type = static_cast<unsigned char>('X');
};
boost::system::error_code serialize(terminate, std::vector<unsigned char>& to);

}  // namespace protocol
}  // namespace pgfront

#endif
