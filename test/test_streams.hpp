#pragma once

#include <boost/test/unit_test.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/system/error_code.hpp>
#include <beast/core/streambuf.hpp>
#include <silicium/memory_range.hpp>
#include <silicium/error_or.hpp>
#include <functional>
#include <string>

namespace trickle
{
    namespace test
    {
        // An AsyncReadStream whose reads are completed by calling `respond`.
        struct async_read_dummy_stream
        {
            std::function<void(Si::error_or<Si::memory_range>)> respond;
            std::size_t last_read_capacity = 0;
            std::size_t reads = 0;

            template <class MutableBufferSequence, class Handler>
            void async_read_some(MutableBufferSequence const &buffers, Handler &&handler)
            {
                BOOST_REQUIRE(!respond);
                last_read_capacity = boost::asio::buffer_size(buffers);
                ++reads;
                respond = [ buffers, handler = std::forward<Handler>(handler) ](
                    Si::error_or<Si::memory_range> response) mutable
                {
                    if (response.is_error())
                    {
                        handler(response.error(), 0);
                    }
                    else
                    {
                        std::size_t const bytes = boost::asio::buffer_copy(
                            buffers, boost::asio::buffer(response.get().begin(), response.get().size()));
                        BOOST_REQUIRE_EQUAL(static_cast<size_t>(response.get().size()), bytes);
                        handler(boost::system::error_code(), bytes);
                    }
                };
            }
        };

        inline void fill(::beast::streambuf &buffer, std::string const &content)
        {
            buffer.commit(boost::asio::buffer_copy(buffer.prepare(content.size()), boost::asio::buffer(content)));
        }

        inline std::string buffered_text(::beast::streambuf const &buffer)
        {
            std::string result;
            for (auto const &piece : buffer.data())
            {
                char const *const data = boost::asio::buffer_cast<char const *>(piece);
                result.append(data, boost::asio::buffer_size(piece));
            }
            return result;
        }
    }
}
