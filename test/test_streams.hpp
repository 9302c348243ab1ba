#pragma once

#include <nibble/source.hpp>
#include <boost/test/unit_test.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/system/error_code.hpp>
#include <silicium/memory_range.hpp>
#include <silicium/error_or.hpp>
#include <algorithm>
#include <functional>
#include <vector>

namespace nibble
{
    // Completes every async_read_some when the test calls respond.
    struct async_read_dummy_stream
    {
        std::function<void(Si::error_or<Si::memory_range>)> respond;

        template <class MutableBufferSequence, class ReadHandler>
        void async_read_some(MutableBufferSequence const &buffers, ReadHandler handler)
        {
            BOOST_REQUIRE(!respond);
            respond = [ buffers, handler = std::move(handler) ](Si::error_or<Si::memory_range> response) mutable
            {
                if (response.is_error())
                {
                    std::move(handler)(response.error(), 0);
                }
                else
                {
                    std::size_t const bytes = boost::asio::buffer_copy(
                        buffers, boost::asio::buffer(response.get().begin(), response.get().size()));
                    BOOST_REQUIRE_EQUAL(static_cast<size_t>(response.get().size()), bytes);
                    std::move(handler)({}, bytes);
                }
            };
        }
    };

    // Hands out prepared chunks to parse_feed, then empty chunks forever.
    template <class Input>
    struct chunk_feeder
    {
        std::vector<chunk_of<Input>> chunks;
        std::size_t next;
        std::size_t calls;

        explicit chunk_feeder(std::vector<chunk_of<Input>> chunks)
            : chunks(std::move(chunks))
            , next(0)
            , calls(0)
        {
        }

        chunk_of<Input> operator()()
        {
            ++calls;
            if (next == chunks.size())
            {
                return chunk_of<Input>();
            }
            return chunks[next++];
        }
    };

    template <class Input>
    std::vector<Input> split_into_chunks(Input const &whole, std::size_t const chunk_size)
    {
        BOOST_REQUIRE(chunk_size > 0);
        std::vector<Input> chunks;
        for (std::size_t i = 0; i < whole.size(); i += chunk_size)
        {
            std::size_t const length = (std::min)(chunk_size, whole.size() - i);
            chunks.emplace_back(whole.begin() + i, whole.begin() + i + length);
        }
        return chunks;
    }
}
