//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGFRONT_REQUEST_HPP
#define PGFRONT_REQUEST_HPP

#include <boost/system/error_code.hpp>

#include <cstdint>
#include <initializer_list>
#include <iosfwd>
#include <span>
#include <string_view>
#include <vector>

#include "pgfront/protocol/bind.hpp"
#include "pgfront/protocol/close.hpp"
#include "pgfront/protocol/common.hpp"
#include "pgfront/protocol/copy.hpp"
#include "pgfront/protocol/describe.hpp"
#include "pgfront/protocol/execute.hpp"
#include "pgfront/protocol/flush.hpp"
#include "pgfront/protocol/parse.hpp"
#include "pgfront/protocol/query.hpp"
#include "pgfront/protocol/sync.hpp"
#include "pgfront/protocol/terminate.hpp"

namespace pgfront {

enum class request_message_type
{
    bind,
    close,
    copy_data,
    copy_done,
    copy_fail,
    describe,
    execute,
    flush,
    parse,
    query,
    sync,
    terminate,
};

const char* to_string(request_message_type t) noexcept;
std::ostream& operator<<(std::ostream& os, request_message_type t);

// A pipeline of frontend messages, serialized as they are added.
// Operations that fail throw boost::system::system_error and leave
// the request as it was before the call.
class request
{
    std::vector<unsigned char> buffer_;
    std::vector<request_message_type> types_;
    bool autosync_;

    void check(boost::system::error_code ec);

    template <class T>
    request& add_advanced_impl(const T& value, request_message_type type)
    {
        types_.reserve(types_.size() + 1u);  // strong guarantee
        check(protocol::serialize(value, buffer_));
        types_.push_back(type);
        return *this;
    }

    void maybe_add_sync()
    {
        if (autosync_)
            add(protocol::sync{});
    }

    struct rollback_guard;

public:
    enum class param_format
    {
        text,    // Send all params as text
        binary,  // Send all params as binary
    };

    // When autosync is enabled, sync messages are added automatically.
    // You may disable autosync and add syncs manually to achieve certain
    // pipeline patterns. This is an advanced feature, don't use it if you
    // don't know what a sync message is.
    request(bool autosync = true) noexcept : autosync_(autosync) {}

    bool autosync() const { return autosync_; }
    void set_autosync(bool value) { autosync_ = value; }

    // Returns the serialized payload
    std::span<const unsigned char> payload() const { return buffer_; }
    std::span<const request_message_type> messages() const { return types_; }

    // Removes all messages. Keeps the allocated memory and the autosync setting
    void clear() noexcept
    {
        buffer_.clear();
        types_.clear();
    }

    // Adds a simple query (PQsendQuery). Simple queries don't need a sync
    request& add_simple_query(std::string_view q) { return add(protocol::query{q}); }

    // Adds a query with parameters using the extended protocol (PQsendQueryParams)
    request& add_query(
        std::string_view q,
        std::initializer_list<protocol::parameter_value> params = {},
        param_format fmt = param_format::text,
        protocol::format_code result_codes = protocol::format_code::text,
        std::int32_t max_num_rows = 0
    )
    {
        return add_query(
            q,
            std::span<const protocol::parameter_value>(params),
            fmt,
            result_codes,
            max_num_rows
        );
    }

    request& add_query(
        std::string_view q,
        std::span<const protocol::parameter_value> params,
        param_format fmt = param_format::text,
        protocol::format_code result_codes = protocol::format_code::text,
        std::int32_t max_num_rows = 0
    );

    // Prepares a named statement (PQsendPrepare)
    request& add_prepare(
        std::string_view query,
        std::string_view statement_name,
        std::span<const protocol::oid_t> parameter_type_oids = {}
    );

    // Executes a named prepared statement (PQsendQueryPrepared)
    // Parameter format defaults to text because binary requires sending
    // type OIDs in prepare, and we're not sure if the user did it
    request& add_execute(
        std::string_view statement_name,
        std::initializer_list<protocol::parameter_value> params,
        param_format fmt = param_format::text,
        protocol::format_code result_codes = protocol::format_code::text,
        std::int32_t max_num_rows = 0
    )
    {
        return add_execute(
            statement_name,
            std::span<const protocol::parameter_value>(params),
            fmt,
            result_codes,
            max_num_rows
        );
    }

    request& add_execute(
        std::string_view statement_name,
        std::span<const protocol::parameter_value> params,
        param_format fmt = param_format::text,
        protocol::format_code result_codes = protocol::format_code::text,
        std::int32_t max_num_rows = 0
    );

    // Describes a named prepared statement (PQsendDescribePrepared)
    request& add_describe_statement(std::string_view statement_name);

    // Describes a named portal (PQsendDescribePortal)
    request& add_describe_portal(std::string_view portal_name);

    // Closes a named prepared statement (PQsendClosePrepared)
    request& add_close_statement(std::string_view statement_name);

    // Closes a named portal (PQsendClosePortal)
    request& add_close_portal(std::string_view portal_name);

    // COPY FROM STDIN. These are never followed by a sync.
    request& add_copy_data(std::span<const unsigned char> data) { return add(protocol::copy_data{data}); }
    request& add_copy_done() { return add(protocol::copy_done{}); }
    request& add_copy_fail(std::string_view error_message) { return add(protocol::copy_fail{error_message}); }

    // Low level
    request& add_bind(
        std::string_view statement_name,
        std::initializer_list<protocol::parameter_value> params,
        param_format fmt = param_format::text,
        std::string_view portal_name = {},
        protocol::format_code result_fmt_codes = protocol::format_code::text
    )
    {
        return add_bind(
            statement_name,
            std::span<const protocol::parameter_value>(params),
            fmt,
            portal_name,
            result_fmt_codes
        );
    }

    request& add_bind(
        std::string_view statement_name,
        std::span<const protocol::parameter_value> params,
        param_format fmt = param_format::text,
        std::string_view portal_name = {},
        protocol::format_code result_fmt_codes = protocol::format_code::text
    );

    request& add(const protocol::bind& value) { return add_advanced_impl(value, request_message_type::bind); }

    request& add(const protocol::close& value)
    {
        return add_advanced_impl(value, request_message_type::close);
    }

    request& add(const protocol::copy_data& value)
    {
        return add_advanced_impl(value, request_message_type::copy_data);
    }

    request& add(protocol::copy_done value)
    {
        return add_advanced_impl(value, request_message_type::copy_done);
    }

    request& add(const protocol::copy_fail& value)
    {
        return add_advanced_impl(value, request_message_type::copy_fail);
    }

    request& add(const protocol::describe& value)
    {
        return add_advanced_impl(value, request_message_type::describe);
    }

    request& add(const protocol::execute& value)
    {
        return add_advanced_impl(value, request_message_type::execute);
    }

    request& add(protocol::flush value) { return add_advanced_impl(value, request_message_type::flush); }

    request& add(const protocol::parse_t& value)
    {
        return add_advanced_impl(value, request_message_type::parse);
    }

    request& add(protocol::query value) { return add_advanced_impl(value, request_message_type::query); }

    request& add(protocol::sync value) { return add_advanced_impl(value, request_message_type::sync); }

    request& add(protocol::terminate value)
    {
        return add_advanced_impl(value, request_message_type::terminate);
    }
};

}  // namespace pgfront

#endif
