//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/core/lightweight_test.hpp>
#include <boost/system/error_code.hpp>

#include <cstddef>
#include <cstdint>
#include <limits>

#include "pgfront/client_errc.hpp"
#include "pgfront/protocol/detail/narrow.hpp"

using namespace pgfront;
using boost::system::error_code;
using protocol::detail::narrow;

namespace {

void test_count_success()
{
    std::uint16_t to = 42;

    BOOST_TEST_EQ(narrow(0u, to), error_code());
    BOOST_TEST_EQ(to, 0u);

    BOOST_TEST_EQ(narrow(1u, to), error_code());
    BOOST_TEST_EQ(to, 1u);

    BOOST_TEST_EQ(narrow(65535u, to), error_code());
    BOOST_TEST_EQ(to, 65535u);
}

void test_count_overflow()
{
    std::uint16_t to = 42;

    BOOST_TEST_EQ(narrow(65536u, to), error_code(client_errc::value_too_big));
    BOOST_TEST_EQ(to, 42u);  // not modified

    BOOST_TEST_EQ(narrow((std::numeric_limits<std::size_t>::max)(), to), error_code(client_errc::value_too_big));
    BOOST_TEST_EQ(to, 42u);
}

void test_length_success()
{
    std::int32_t to = -1;

    BOOST_TEST_EQ(narrow(0u, to), error_code());
    BOOST_TEST_EQ(to, 0);

    BOOST_TEST_EQ(narrow(2147483647u, to), error_code());
    BOOST_TEST_EQ(to, 2147483647);
}

void test_length_overflow()
{
    std::int32_t to = -1;

    // One more than INT32_MAX
    BOOST_TEST_EQ(narrow(2147483648u, to), error_code(client_errc::value_too_big));
    BOOST_TEST_EQ(to, -1);

    // Values that would wrap around to a valid int32 when truncated
    BOOST_TEST_EQ(narrow(std::size_t(0x100000010u), to), error_code(client_errc::value_too_big));
    BOOST_TEST_EQ(to, -1);
}

}  // namespace

int main()
{
    test_count_success();
    test_count_overflow();
    test_length_success();
    test_length_overflow();

    return boost::report_errors();
}
