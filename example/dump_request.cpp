//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

// Builds a request pipeline and prints the frames it would send to the server

#include <boost/endian/conversion.hpp>
#include <boost/system/system_error.hpp>

#include <cstddef>
#include <cstdint>
#include <exception>
#include <iomanip>
#include <iostream>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "pgfront/protocol/cancel_request.hpp"
#include "pgfront/protocol/common.hpp"
#include "pgfront/request.hpp"

using namespace pgfront;

static std::span<const unsigned char> to_bytes(std::string_view s)
{
    return {reinterpret_cast<const unsigned char*>(s.data()), s.size()};
}

static void print_frame(std::string_view name, std::span<const unsigned char> frame)
{
    std::cout << std::left << std::setw(16) << name << std::right << std::hex << std::setfill('0');
    for (unsigned char c : frame)
        std::cout << ' ' << std::setw(2) << static_cast<unsigned>(c);
    std::cout << std::dec << std::setfill(' ') << '\n';
}

// Splits the payload into frames. All messages in a request have a type byte
static void print_request(const request& req)
{
    auto payload = req.payload();
    std::size_t offset = 0u;
    for (auto type : req.messages())
    {
        auto length = boost::endian::load_big_s32(payload.data() + offset + 1u);
        auto frame_size = static_cast<std::size_t>(length) + 1u;
        print_frame(to_string(type), payload.subspan(offset, frame_size));
        offset += frame_size;
    }
}

int main()
{
    try
    {
        // A simple query
        request req;
        req.add_simple_query("SELECT 1");
        print_request(req);

        // Prepared statements, with a NULL parameter
        req.clear();
        const protocol::oid_t oids[] = {25u, 23u};
        const protocol::parameter_value params[] = {to_bytes("hello"), std::nullopt};
        req.add_prepare("SELECT $1, $2", "my_stmt", oids).add_execute("my_stmt", params);
        print_request(req);

        // Cancel requests are sent on their own connection, and don't have a type byte
        std::vector<unsigned char> cancel;
        auto ec = protocol::serialize(protocol::cancel_request{.process_id = 1234, .secret_key = 5678}, cancel);
        if (ec)
            throw boost::system::system_error(ec);
        print_frame("cancel_request", cancel);

        // Strings can't contain NULL characters. The request is left untouched
        try
        {
            req.add_simple_query(std::string_view("SELECT\0 1", 9));
        }
        catch (const boost::system::system_error& err)
        {
            std::cout << "Rejected query: " << err.code().message() << '\n';
        }
        print_request(req);
    }
    catch (const boost::system::system_error& err)
    {
        std::cerr << "Error: " << err.code().message() << '\n';
        return 1;
    }
    catch (const std::exception& err)
    {
        std::cerr << "Error: " << err.what() << '\n';
        return 1;
    }
}
