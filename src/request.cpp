//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>
#include <boost/throw_exception.hpp>

#include <cstddef>
#include <ostream>
#include <span>

#include "pgfront/protocol/common.hpp"
#include "pgfront/request.hpp"

using namespace pgfront;

namespace {

protocol::format_code to_format_code(request::param_format fmt)
{
    return fmt == request::param_format::binary ? protocol::format_code::binary : protocol::format_code::text;
}

}  // namespace

// Operations adding several messages must undo the ones that succeeded
// if a later one fails
struct pgfront::request::rollback_guard
{
    request& self;
    std::size_t buffer_size;
    std::size_t types_size;
    bool committed{false};

    explicit rollback_guard(request& r) noexcept
        : self(r), buffer_size(r.buffer_.size()), types_size(r.types_.size())
    {
    }

    rollback_guard(const rollback_guard&) = delete;
    rollback_guard& operator=(const rollback_guard&) = delete;

    ~rollback_guard()
    {
        if (!committed)
        {
            self.buffer_.resize(buffer_size);
            self.types_.resize(types_size);
        }
    }
};

void pgfront::request::check(boost::system::error_code ec)
{
    if (ec)
        BOOST_THROW_EXCEPTION(boost::system::system_error(ec));
}

request& pgfront::request::add_query(
    std::string_view q,
    std::span<const protocol::parameter_value> params,
    param_format fmt,
    protocol::format_code result_codes,
    std::int32_t max_num_rows
)
{
    rollback_guard guard{*this};

    // Unnamed statement and portal
    add(protocol::parse_t{.statement_name = {}, .query = q, .parameter_type_oids = {}});
    add_bind({}, params, fmt, {}, result_codes);
    add(protocol::describe{protocol::portal_or_statement::portal, {}});
    add(protocol::execute{{}, max_num_rows});
    maybe_add_sync();

    guard.committed = true;
    return *this;
}

request& pgfront::request::add_prepare(
    std::string_view query,
    std::string_view statement_name,
    std::span<const protocol::oid_t> parameter_type_oids
)
{
    rollback_guard guard{*this};
    add(protocol::parse_t{
        .statement_name = statement_name,
        .query = query,
        .parameter_type_oids = parameter_type_oids,
    });
    maybe_add_sync();
    guard.committed = true;
    return *this;
}

request& pgfront::request::add_execute(
    std::string_view statement_name,
    std::span<const protocol::parameter_value> params,
    param_format fmt,
    protocol::format_code result_codes,
    std::int32_t max_num_rows
)
{
    rollback_guard guard{*this};

    // Bind to the unnamed portal and run it
    add_bind(statement_name, params, fmt, {}, result_codes);
    add(protocol::describe{protocol::portal_or_statement::portal, {}});
    add(protocol::execute{{}, max_num_rows});
    maybe_add_sync();

    guard.committed = true;
    return *this;
}

request& pgfront::request::add_describe_statement(std::string_view statement_name)
{
    rollback_guard guard{*this};
    add(protocol::describe{protocol::portal_or_statement::statement, statement_name});
    maybe_add_sync();
    guard.committed = true;
    return *this;
}

request& pgfront::request::add_describe_portal(std::string_view portal_name)
{
    rollback_guard guard{*this};
    add(protocol::describe{protocol::portal_or_statement::portal, portal_name});
    maybe_add_sync();
    guard.committed = true;
    return *this;
}

request& pgfront::request::add_close_statement(std::string_view statement_name)
{
    rollback_guard guard{*this};
    add(protocol::close{protocol::portal_or_statement::statement, statement_name});
    maybe_add_sync();
    guard.committed = true;
    return *this;
}

request& pgfront::request::add_close_portal(std::string_view portal_name)
{
    rollback_guard guard{*this};
    add(protocol::close{protocol::portal_or_statement::portal, portal_name});
    maybe_add_sync();
    guard.committed = true;
    return *this;
}

request& pgfront::request::add_bind(
    std::string_view statement_name,
    std::span<const protocol::parameter_value> params,
    param_format fmt,
    std::string_view portal_name,
    protocol::format_code result_fmt_codes
)
{
    // A single format code applies to all parameters and columns
    const protocol::format_code param_codes[] = {to_format_code(fmt)};
    const protocol::format_code result_codes[] = {result_fmt_codes};

    return add(protocol::bind{
        .portal_name = portal_name,
        .statement_name = statement_name,
        .parameter_fmt_codes = param_codes,
        .parameters = params,
        .result_fmt_codes = result_codes,
    });
}

const char* pgfront::to_string(request_message_type t) noexcept
{
    switch (t)
    {
    case request_message_type::bind: return "bind";
    case request_message_type::close: return "close";
    case request_message_type::copy_data: return "copy_data";
    case request_message_type::copy_done: return "copy_done";
    case request_message_type::copy_fail: return "copy_fail";
    case request_message_type::describe: return "describe";
    case request_message_type::execute: return "execute";
    case request_message_type::flush: return "flush";
    case request_message_type::parse: return "parse";
    case request_message_type::query: return "query";
    case request_message_type::sync: return "sync";
    case request_message_type::terminate: return "terminate";
    default: return "<unknown request_message_type>";
    }
}

std::ostream& pgfront::operator<<(std::ostream& os, request_message_type t) { return os << to_string(t); }
