//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/system/error_code.hpp>

#include <ostream>
#include <string>

#include "pgfront/client_errc.hpp"

namespace {

class client_category final : public boost::system::error_category
{
public:
    const char* name() const noexcept override { return "pgfront.client"; }

    std::string message(int ev) const override { return pgfront::to_string(static_cast<pgfront::client_errc>(ev)); }
};

}  // namespace

const boost::system::error_category& pgfront::get_client_category() noexcept
{
    static const client_category res;
    return res;
}

const char* pgfront::to_string(client_errc c) noexcept
{
    switch (c)
    {
    case client_errc::embedded_null: return "A string field contains a NULL character, which is not allowed";
    case client_errc::value_too_big:
        return "A count or length is too big to be transmitted using the PostgreSQL protocol";
    default: return "<unknown pgfront client error>";
    }
}

std::ostream& pgfront::operator<<(std::ostream& os, client_errc c) { return os << to_string(c); }
