//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/system/error_code.hpp>
#include <boost/variant2/variant.hpp>

#include <cstdint>
#include <span>
#include <vector>

#include "pgfront/protocol/bind.hpp"
#include "pgfront/protocol/cancel_request.hpp"
#include "pgfront/protocol/close.hpp"
#include "pgfront/protocol/common.hpp"
#include "pgfront/protocol/copy.hpp"
#include "pgfront/protocol/describe.hpp"
#include "pgfront/protocol/detail/serialization_context.hpp"
#include "pgfront/protocol/execute.hpp"
#include "pgfront/protocol/flush.hpp"
#include "pgfront/protocol/frontend_message.hpp"
#include "pgfront/protocol/parse.hpp"
#include "pgfront/protocol/query.hpp"
#include "pgfront/protocol/sync.hpp"
#include "pgfront/protocol/terminate.hpp"

using namespace pgfront::protocol;
using boost::system::error_code;
using detail::serialization_context;

namespace {

error_code serialize_fmt_codes(std::span<const format_code> codes, serialization_context& ctx)
{
    // Size check goes first, so nothing is written on error
    auto ec = ctx.add_count(codes.size());
    if (ec)
        return ec;
    for (auto c : codes)
        ctx.add_integral(static_cast<std::int16_t>(c));
    return {};
}

error_code serialize_params(std::span<const parameter_value> params, serialization_context& ctx)
{
    auto ec = ctx.add_count(params.size());
    if (ec)
        return ec;

    for (const auto& param : params)
    {
        if (!param.has_value())
        {
            // NULLs are represented as a -1 length, without value bytes
            ctx.add_integral(static_cast<std::int32_t>(-1));
        }
        else
        {
            ec = ctx.add_sized_bytes(*param);
            if (ec)
                return ec;
        }
    }

    return {};
}

// Messages composed of a portal_or_statement byte and a name
error_code serialize_portal_or_statement(
    unsigned char message_type,
    portal_or_statement type,
    std::string_view name,
    std::vector<unsigned char>& to
)
{
    detail::serialize_guard guard(to);
    serialization_context ctx(to);
    return guard.complete(ctx.add_message(message_type, [&](serialization_context& ctx) {
        ctx.add_byte(static_cast<unsigned char>(type));
        return ctx.add_string(name);
    }));
}

// For messages that only have a header
error_code serialize_header_only(unsigned char message_type, std::vector<unsigned char>& to)
{
    detail::serialize_guard guard(to);
    serialization_context ctx(to);
    return guard.complete(ctx.add_empty_message(message_type));
}

}  // namespace

error_code pgfront::protocol::serialize(const bind& msg, std::vector<unsigned char>& to)
{
    detail::serialize_guard guard(to);
    serialization_context ctx(to);

    return guard.complete(ctx.add_message(bind::message_type, [&msg](serialization_context& ctx) {
        // Portal and statement name
        auto ec = ctx.add_string(msg.portal_name);
        if (ec)
            return ec;
        ec = ctx.add_string(msg.statement_name);
        if (ec)
            return ec;

        // Parameter format codes
        ec = serialize_fmt_codes(msg.parameter_fmt_codes, ctx);
        if (ec)
            return ec;

        // Parameter values
        ec = serialize_params(msg.parameters, ctx);
        if (ec)
            return ec;

        // Result format codes
        return serialize_fmt_codes(msg.result_fmt_codes, ctx);
    }));
}

error_code pgfront::protocol::serialize(const cancel_request& msg, std::vector<unsigned char>& to)
{
    detail::serialize_guard guard(to);
    serialization_context ctx(to);

    // The message has no type code. The request code goes where the protocol version would
    return guard.complete(ctx.add_frame([&msg](serialization_context& ctx) {
        ctx.add_integral(cancel_request::request_code);
        ctx.add_integral(msg.process_id);
        ctx.add_integral(msg.secret_key);
        return error_code();
    }));
}

error_code pgfront::protocol::serialize(const close& msg, std::vector<unsigned char>& to)
{
    return serialize_portal_or_statement(close::message_type, msg.type, msg.name, to);
}

error_code pgfront::protocol::serialize(const copy_data& msg, std::vector<unsigned char>& to)
{
    detail::serialize_guard guard(to);
    serialization_context ctx(to);

    // Contents are opaque. The length check happens when computing the frame length
    return guard.complete(ctx.add_message(copy_data::message_type, [&msg](serialization_context& ctx) {
        ctx.add_bytes(msg.data);
        return error_code();
    }));
}

error_code pgfront::protocol::serialize(copy_done, std::vector<unsigned char>& to)
{
    return serialize_header_only(copy_done::message_type, to);
}

error_code pgfront::protocol::serialize(const copy_fail& msg, std::vector<unsigned char>& to)
{
    detail::serialize_guard guard(to);
    serialization_context ctx(to);
    return guard.complete(ctx.add_message(copy_fail::message_type, [&msg](serialization_context& ctx) {
        return ctx.add_string(msg.error_message);
    }));
}

error_code pgfront::protocol::serialize(const describe& msg, std::vector<unsigned char>& to)
{
    return serialize_portal_or_statement(describe::message_type, msg.type, msg.name, to);
}

error_code pgfront::protocol::serialize(const execute& msg, std::vector<unsigned char>& to)
{
    detail::serialize_guard guard(to);
    serialization_context ctx(to);

    return guard.complete(ctx.add_message(execute::message_type, [&msg](serialization_context& ctx) {
        auto ec = ctx.add_string(msg.portal_name);
        if (ec)
            return ec;
        ctx.add_integral(msg.max_num_rows);
        return error_code();
    }));
}

error_code pgfront::protocol::serialize(flush, std::vector<unsigned char>& to)
{
    return serialize_header_only(flush::message_type, to);
}

error_code pgfront::protocol::serialize(const parse_t& msg, std::vector<unsigned char>& to)
{
    detail::serialize_guard guard(to);
    serialization_context ctx(to);

    return guard.complete(ctx.add_message(parse_t::message_type, [&msg](serialization_context& ctx) {
        // Fixed fields
        auto ec = ctx.add_string(msg.statement_name);
        if (ec)
            return ec;
        ec = ctx.add_string(msg.query);
        if (ec)
            return ec;

        // Parameter types
        ec = ctx.add_count(msg.parameter_type_oids.size());
        if (ec)
            return ec;
        for (oid_t type_oid : msg.parameter_type_oids)
            ctx.add_integral(type_oid);

        return error_code();
    }));
}

error_code pgfront::protocol::serialize(query msg, std::vector<unsigned char>& to)
{
    detail::serialize_guard guard(to);
    serialization_context ctx(to);
    return guard.complete(ctx.add_message(query::message_type, [msg](serialization_context& ctx) {
        return ctx.add_string(msg.query);
    }));
}

error_code pgfront::protocol::serialize(sync, std::vector<unsigned char>& to)
{
    return serialize_header_only(sync::message_type, to);
}

error_code pgfront::protocol::serialize(terminate, std::vector<unsigned char>& to)
{
    return serialize_header_only(terminate::message_type, to);
}

error_code pgfront::protocol::serialize(const frontend_message& msg, std::vector<unsigned char>& to)
{
    return boost::variant2::visit([&to](const auto& m) { return serialize(m, to); }, msg);
}
