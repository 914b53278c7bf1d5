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
#include <span>
#include <string_view>
#include <vector>

#include "pgfront/client_errc.hpp"
#include "pgfront/protocol/detail/serialization_context.hpp"
#include "test_utils.hpp"

using namespace pgfront;
using namespace pgfront::test;
using namespace std::string_view_literals;
using boost::system::error_code;
using protocol::detail::serialization_context;
using protocol::detail::serialize_guard;

namespace {

// --- Integers
void test_add_integral_big_endian()
{
    std::vector<unsigned char> buff;
    serialization_context ctx(buff);

    ctx.add_integral(std::int16_t(0x0102));
    ctx.add_integral(std::uint16_t(0xfffe));
    ctx.add_integral(std::int32_t(-1));
    ctx.add_integral(std::uint32_t(0x0a0b0c0d));

    const unsigned char expected[] = {0x01, 0x02, 0xff, 0xfe, 0xff, 0xff, 0xff, 0xff, 0x0a, 0x0b, 0x0c, 0x0d};
    PGFRONT_TEST_CONT_EQ(buff, expected);
}

// --- Strings
void test_add_string_success()
{
    std::vector<unsigned char> buff;
    serialization_context ctx(buff);

    BOOST_TEST_EQ(ctx.add_string("SELECT 1"), error_code());

    const unsigned char expected[] = {'S', 'E', 'L', 'E', 'C', 'T', ' ', '1', 0x00};
    PGFRONT_TEST_CONT_EQ(buff, expected);
}

void test_add_string_empty()
{
    std::vector<unsigned char> buff;
    serialization_context ctx(buff);

    BOOST_TEST_EQ(ctx.add_string(""), error_code());

    const unsigned char expected[] = {0x00};
    PGFRONT_TEST_CONT_EQ(buff, expected);
}

// Non-ASCII text is written verbatim
void test_add_string_utf8()
{
    std::vector<unsigned char> buff;
    serialization_context ctx(buff);

    BOOST_TEST_EQ(ctx.add_string("h\xc3\xa9llo"), error_code());

    const unsigned char expected[] = {'h', 0xc3, 0xa9, 'l', 'l', 'o', 0x00};
    PGFRONT_TEST_CONT_EQ(buff, expected);
}

// Strings with NULL characters can't be represented, regardless of the position.
// The buffer is not modified
void test_add_string_embedded_null()
{
    for (auto s : {"\0"sv, "\0abc"sv, "ab\0c"sv, "abc\0"sv})
    {
        auto buff = to_bytes("prev");
        serialization_context ctx(buff);

        BOOST_TEST_EQ(ctx.add_string(s), error_code(client_errc::embedded_null));
        PGFRONT_TEST_CONT_EQ(buff, to_bytes("prev"));
    }
}

// --- Counts and sized bytes
void test_add_count()
{
    std::vector<unsigned char> buff;
    serialization_context ctx(buff);

    BOOST_TEST_EQ(ctx.add_count(0u), error_code());
    BOOST_TEST_EQ(ctx.add_count(65535u), error_code());

    const unsigned char expected[] = {0x00, 0x00, 0xff, 0xff};
    PGFRONT_TEST_CONT_EQ(buff, expected);
}

void test_add_count_overflow()
{
    std::vector<unsigned char> buff;
    serialization_context ctx(buff);

    BOOST_TEST_EQ(ctx.add_count(65536u), error_code(client_errc::value_too_big));
    BOOST_TEST(buff.empty());
}

void test_add_sized_bytes()
{
    std::vector<unsigned char> buff;
    serialization_context ctx(buff);

    BOOST_TEST_EQ(ctx.add_sized_bytes(to_span("abc")), error_code());
    BOOST_TEST_EQ(ctx.add_sized_bytes({}), error_code());

    const unsigned char expected[] = {0x00, 0x00, 0x00, 0x03, 'a', 'b', 'c', 0x00, 0x00, 0x00, 0x00};
    PGFRONT_TEST_CONT_EQ(buff, expected);
}

// Lengths are checked before reading any byte, so the span may be larger than its storage
void test_add_sized_bytes_overflow()
{
    std::vector<unsigned char> buff{0xaa};
    serialization_context ctx(buff);
    const unsigned char dummy[1]{};

    BOOST_TEST_EQ(
        ctx.add_sized_bytes(std::span<const unsigned char>(dummy, 2147483648u)),
        error_code(client_errc::value_too_big)
    );
    const unsigned char expected[] = {0xaa};
    PGFRONT_TEST_CONT_EQ(buff, expected);
}

// --- Frames
void test_add_frame_length()
{
    std::vector<unsigned char> buff;
    serialization_context ctx(buff);

    auto ec = ctx.add_frame([](serialization_context& c) {
        c.add_byte(0xab);
        c.add_integral(std::int32_t(1));
        return error_code();
    });

    // The length includes itself
    BOOST_TEST_EQ(ec, error_code());
    const unsigned char expected[] = {0x00, 0x00, 0x00, 0x09, 0xab, 0x00, 0x00, 0x00, 0x01};
    PGFRONT_TEST_CONT_EQ(buff, expected);
}

void test_add_frame_empty_payload()
{
    std::vector<unsigned char> buff;
    serialization_context ctx(buff);

    BOOST_TEST_EQ(ctx.add_frame([](serialization_context&) { return error_code(); }), error_code());

    const unsigned char expected[] = {0x00, 0x00, 0x00, 0x04};
    PGFRONT_TEST_CONT_EQ(buff, expected);
}

// The length is relative to where the frame starts, not to the start of the buffer
void test_add_message_existing_contents()
{
    auto buff = to_bytes("abc");
    serialization_context ctx(buff);

    auto ec = ctx.add_message('Q', [](serialization_context& c) { return c.add_string("x"); });

    BOOST_TEST_EQ(ec, error_code());
    const unsigned char expected[] = {'a', 'b', 'c', 'Q', 0x00, 0x00, 0x00, 0x06, 'x', 0x00};
    PGFRONT_TEST_CONT_EQ(buff, expected);
    BOOST_TEST_EQ(frame_length(buff, true, 3u), 6);
}

// Errors in the payload function are propagated as-is. The frame writer doesn't
// clean up the partial message
void test_add_message_payload_error()
{
    std::vector<unsigned char> buff;
    serialization_context ctx(buff);

    auto ec = ctx.add_message('P', [](serialization_context& c) {
        c.add_byte(0x01);
        return error_code(client_errc::value_too_big);
    });

    BOOST_TEST_EQ(ec, error_code(client_errc::value_too_big));
    const unsigned char expected[] = {'P', 0x00, 0x00, 0x00, 0x00, 0x01};
    PGFRONT_TEST_CONT_EQ(buff, expected);
}

void test_begin_end_frame()
{
    std::vector<unsigned char> buff{0xff};
    serialization_context ctx(buff);

    auto offset = ctx.begin_frame();
    BOOST_TEST_EQ(offset, 1u);
    ctx.add_bytes(to_span("hello"));
    BOOST_TEST_EQ(ctx.end_frame(offset), error_code());

    const unsigned char expected[] = {0xff, 0x00, 0x00, 0x00, 0x09, 'h', 'e', 'l', 'l', 'o'};
    PGFRONT_TEST_CONT_EQ(buff, expected);
}

void test_add_empty_message()
{
    std::vector<unsigned char> buff;
    serialization_context ctx(buff);

    BOOST_TEST_EQ(ctx.add_empty_message('S'), error_code());

    const unsigned char expected[] = {'S', 0x00, 0x00, 0x00, 0x04};
    PGFRONT_TEST_CONT_EQ(buff, expected);
}

// --- Guard
void test_guard_error()
{
    auto buff = to_bytes("abc");
    {
        serialize_guard guard(buff);
        buff.push_back('d');
        BOOST_TEST_EQ(guard.complete(client_errc::embedded_null), error_code(client_errc::embedded_null));
    }
    PGFRONT_TEST_CONT_EQ(buff, to_bytes("abc"));
}

void test_guard_success()
{
    auto buff = to_bytes("abc");
    {
        serialize_guard guard(buff);
        buff.push_back('d');
        BOOST_TEST_EQ(guard.complete(error_code()), error_code());
    }
    PGFRONT_TEST_CONT_EQ(buff, to_bytes("abcd"));
}

// If complete() is never called (e.g. an exception was thrown), the buffer is restored
void test_guard_not_completed()
{
    auto buff = to_bytes("abc");
    {
        serialize_guard guard(buff);
        buff.push_back('d');
    }
    PGFRONT_TEST_CONT_EQ(buff, to_bytes("abc"));
}

}  // namespace

int main()
{
    test_add_integral_big_endian();

    test_add_string_success();
    test_add_string_empty();
    test_add_string_utf8();
    test_add_string_embedded_null();

    test_add_count();
    test_add_count_overflow();
    test_add_sized_bytes();
    test_add_sized_bytes_overflow();

    test_add_frame_length();
    test_add_frame_empty_payload();
    test_add_message_existing_contents();
    test_add_message_payload_error();
    test_begin_end_frame();
    test_add_empty_message();

    test_guard_error();
    test_guard_success();
    test_guard_not_completed();

    return boost::report_errors();
}
