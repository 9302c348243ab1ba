#pragma once

#include <nibble/parse.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/handler_invoke_hook.hpp>
#include <boost/system/error_code.hpp>
#include <silicium/error_or.hpp>
#include <silicium/exchange.hpp>
#include <array>
#include <cstdint>
#include <functional>
#include <memory>

namespace nibble
{
    // Drives a parser with the bytes of an AsyncReadStream. Every suspension
    // of the parser becomes one async_read_some. The end of the stream is the
    // end of the input.
    template <class AsyncReadStream, class Input, class T, class ResultHandler, std::size_t ReadSize = 512>
    struct parse_operation
    {
        explicit parse_operation(AsyncReadStream &input, ResultHandler on_result)
            : m_input(input)
            , m_receive_buffer(std::make_shared<std::array<std::uint8_t, ReadSize>>())
            , m_on_result(std::move(on_result))
            , m_end_of_input(false)
        {
        }

        template <bool IsSurelyCalledInHandlerContext>
        void continue_with(result<Input, T> current) &&
        {
            parse_more<Input, T> *const more = try_get_more<Input, T>(current);
            if (!more)
            {
                deliver<IsSurelyCalledInHandlerContext>(std::move(current));
                return;
            }
            if (m_end_of_input)
            {
                deliver<IsSurelyCalledInHandlerContext>(
                    result<Input, T>(parse_failed<Input>{errors::incomplete_at_eof()}));
                return;
            }
            m_resume = std::move(more->resume);
            std::move(*this).receive();
        }

        void operator()(boost::system::error_code const ec, std::size_t const read)
        {
            if (ec == boost::asio::error::eof)
            {
                m_end_of_input = true;
                auto resume = Si::exchange(m_resume, nullptr);
                std::move(*this).template continue_with<true>(resume(chunk_of<Input>()));
                return;
            }
            if (!!ec)
            {
                // No asio_handler_invoke because we assume that this method gets called only in the correct
                // context.
                m_on_result(Si::error_or<result<Input, T>>(ec));
                return;
            }
            if (read == 0)
            {
                std::move(*this).receive();
                return;
            }
            std::uint8_t const *const data = m_receive_buffer->data();
            auto resume = Si::exchange(m_resume, nullptr);
            std::move(*this).template continue_with<true>(resume(chunk_of<Input>(data, data + read)));
        }

        template <class Function>
        friend void asio_handler_invoke(Function &&f, parse_operation *operation)
        {
            using boost::asio::asio_handler_invoke;
            asio_handler_invoke(f, &operation->m_on_result);
        }

    private:
        AsyncReadStream &m_input;
        std::shared_ptr<std::array<std::uint8_t, ReadSize>> m_receive_buffer;
        std::function<result<Input, T>(chunk_of<Input>)> m_resume;
        ResultHandler m_on_result;
        bool m_end_of_input;

        void receive() &&
        {
            auto const receive_buffer = boost::asio::buffer(*m_receive_buffer);
            m_input.async_read_some(receive_buffer, std::move(*this));
        }

        template <bool IsSurelyCalledInHandlerContext>
        void deliver(result<Input, T> parsed)
        {
            Si::error_or<result<Input, T>> outcome(std::move(parsed));
            if (IsSurelyCalledInHandlerContext)
            {
                m_on_result(std::move(outcome));
            }
            else
            {
                using boost::asio::asio_handler_invoke;
                asio_handler_invoke(std::bind(std::ref(m_on_result), std::move(outcome)), &m_on_result);
            }
        }
    };

    // on_result is called with Si::error_or<result<Input, T>>. A result
    // passed to it is never parse_more.
    template <class Input, class AsyncReadStream, class T, class ResultHandler>
    void begin_parse_value(AsyncReadStream &input, parser<Input, T> const &root, ResultHandler &&on_result)
    {
        parse_operation<AsyncReadStream, Input, T, typename std::decay<ResultHandler>::type> operation(
            input, std::forward<ResultHandler>(on_result));
        std::move(operation).template continue_with<false>(nibble::parse(root, Input()));
    }
}
