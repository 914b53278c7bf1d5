//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGFRONT_PROTOCOL_DETAIL_SERIALIZATION_CONTEXT_HPP
#define PGFRONT_PROTOCOL_DETAIL_SERIALIZATION_CONTEXT_HPP

#include <boost/assert.hpp>
#include <boost/endian/conversion.hpp>
#include <boost/system/error_code.hpp>

#include <array>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

#include "pgfront/client_errc.hpp"
#include "pgfront/protocol/detail/narrow.hpp"

namespace pgfront::protocol::detail {

// Appends protocol primitives to a caller-owned buffer.
// None of the operations remove bytes, so a failed frame leaves
// a partial message at the end of the buffer. See serialize_guard.
class serialization_context
{
    std::vector<unsigned char>& buffer_;

public:
    explicit serialization_context(std::vector<unsigned char>& buff) noexcept : buffer_(buff) {}

    std::vector<unsigned char>& buffer() noexcept { return buffer_; }

    void add_byte(unsigned char byte) { buffer_.push_back(byte); }

    void add_bytes(std::span<const unsigned char> contents)
    {
        buffer_.insert(buffer_.end(), contents.begin(), contents.end());
    }

    // Big endian
    template <std::integral IntType>
    void add_integral(IntType value)
    {
        unsigned char buff[sizeof(IntType)];
        boost::endian::endian_store<IntType, sizeof(IntType), boost::endian::order::big>(buff, value);
        add_bytes(buff);
    }

    // NULL-terminated string. Strings containing NULLs can't be represented.
    // Nothing is written on error.
    boost::system::error_code add_string(std::string_view s)
    {
        if (s.find('\0') != std::string_view::npos)
            return client_errc::embedded_null;
        add_bytes({reinterpret_cast<const unsigned char*>(s.data()), s.size()});
        add_byte(0);
        return {};
    }

    // Writes the number of elements in a collection as an unsigned 16-bit integer
    boost::system::error_code add_count(std::size_t num_elements)
    {
        count_type value{};
        auto ec = narrow(num_elements, value);
        if (ec)
            return ec;
        add_integral(value);
        return {};
    }

    // Length-prefixed byte string, as used by parameter values
    boost::system::error_code add_sized_bytes(std::span<const unsigned char> contents)
    {
        length_type len{};
        auto ec = narrow(contents.size(), len);
        if (ec)
            return ec;
        add_integral(len);
        add_bytes(contents);
        return {};
    }

    // Two-phase framing. begin_frame reserves space for the length and returns
    // its offset. end_frame computes the length of everything written since
    // (including the length field itself) and writes it.
    std::size_t begin_frame()
    {
        std::size_t offset = buffer_.size();
        add_bytes(std::array<unsigned char, 4>{});
        return offset;
    }

    boost::system::error_code end_frame(std::size_t length_offset)
    {
        BOOST_ASSERT(buffer_.size() >= length_offset + 4u);
        length_type len{};
        auto ec = narrow(buffer_.size() - length_offset, len);
        if (ec)
            return ec;
        boost::endian::store_big_s32(buffer_.data() + length_offset, len);
        return {};
    }

    // Writes a length-prefixed frame whose payload is written by fn,
    // which must have signature error_code(serialization_context&)
    template <class PayloadFn>
    boost::system::error_code add_frame(PayloadFn&& fn)
    {
        auto offset = begin_frame();
        auto ec = fn(*this);
        if (ec)
            return ec;
        return end_frame(offset);
    }

    // Same as add_frame, but preceded by a message type byte
    template <class PayloadFn>
    boost::system::error_code add_message(unsigned char message_type, PayloadFn&& fn)
    {
        add_byte(message_type);
        return add_frame(static_cast<PayloadFn&&>(fn));
    }

    // For messages that only have a header
    boost::system::error_code add_empty_message(unsigned char message_type)
    {
        return add_message(message_type, [](serialization_context&) { return boost::system::error_code(); });
    }
};

// Restores the buffer to its original size unless the serialization succeeded.
// Used by the public serialize functions so that a failed message doesn't leave
// garbage at the end of the buffer. Also covers exceptions thrown by the buffer.
class serialize_guard
{
    std::vector<unsigned char>& buffer_;
    std::size_t initial_size_;
    bool committed_{false};

public:
    explicit serialize_guard(std::vector<unsigned char>& buff) noexcept
        : buffer_(buff), initial_size_(buff.size())
    {
    }

    serialize_guard(const serialize_guard&) = delete;
    serialize_guard& operator=(const serialize_guard&) = delete;

    ~serialize_guard()
    {
        if (!committed_)
            buffer_.resize(initial_size_);
    }

    boost::system::error_code complete(boost::system::error_code ec) noexcept
    {
        if (!ec)
            committed_ = true;
        return ec;
    }
};

}  // namespace pgfront::protocol::detail

#endif
