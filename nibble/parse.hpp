#pragma once

#include <nibble/parser.hpp>
#include <silicium/config.hpp>
#include <silicium/error_or.hpp>
#include <silicium/optional.hpp>
#include <cassert>
#include <memory>

namespace nibble
{
    namespace detail
    {
        template <class Input>
        step<Input> stop_with_failure(buffer<Input> const &, std::size_t, more_data, parse_error<Input> error)
        {
            return parse_failed<Input>{std::move(error)};
        }

        // Converts the internal step into what the caller sees. The value of
        // a successful parse is delivered through value_slot.
        template <class Input, class T>
        result<Input, T> publish(step<Input> current, std::shared_ptr<Si::optional<T>> const &value_slot)
        {
            return Si::visit<result<Input, T>>(
                current,
                [](parse_failed<Input> &failed) -> result<Input, T>
                {
                    return std::move(failed);
                },
                [&value_slot](finished<Input> &done) -> result<Input, T>
                {
                    assert(*value_slot);
                    return parse_ok<Input, T>{std::move(done.leftover), std::move(**value_slot)};
                },
                [&value_slot](suspended<Input> &more) -> result<Input, T>
                {
                    auto resume = std::move(more.resume);
                    auto const slot = value_slot;
                    return parse_more<Input, T>{[resume, slot](chunk_of<Input> chunk)
                                                {
                                                    assert(resume);
                                                    return publish<Input, T>(resume(std::move(chunk)), slot);
                                                }};
                },
                [](advanced<Input> &) -> result<Input, T>
                {
                    // loops consume their own iterations
                    SILICIUM_UNREACHABLE();
                });
        }
    }

    // Runs the parser on the input. The result may ask for more input.
    template <class Input, class T>
    result<Input, T> parse(parser<Input, T> const &root, typename parser<Input, T>::input_type input)
    {
        auto const value_slot = std::make_shared<Si::optional<T>>();
        buffer<Input> const initial(std::move(input));
        return detail::publish<Input, T>(
            root(initial, 0, more_data::may_arrive, detail::stop_with_failure<Input>,
                 [value_slot](buffer<Input> const &input, std::size_t const offset, more_data, T value)
                     -> detail::step<Input>
                 {
                     *value_slot = std::move(value);
                     return detail::finished<Input>{input.rest(offset)};
                 }),
            value_slot);
    }

    // Calls feeder for every chunk the parser asks for. The feeder returns an
    // empty chunk when the input has ended.
    template <class Feeder, class Input, class T>
    result<Input, T> parse_feed(Feeder &&feeder, parser<Input, T> const &root,
                                typename parser<Input, T>::input_type input)
    {
        result<Input, T> current = parse(root, std::move(input));
        while (parse_more<Input, T> *const more = try_get_more<Input, T>(current))
        {
            auto resume = std::move(more->resume);
            current = resume(feeder());
        }
        return current;
    }

    // Like parse_feed, but the feeder returns Si::error_or<chunk>. The first
    // error stops the parse.
    template <class Feeder, class Input, class T>
    Si::error_or<result<Input, T>> parse_feed_checked(Feeder &&feeder, parser<Input, T> const &root,
                                                      typename parser<Input, T>::input_type input)
    {
        result<Input, T> current = parse(root, std::move(input));
        while (parse_more<Input, T> *const more = try_get_more<Input, T>(current))
        {
            Si::error_or<chunk_of<Input>> next = feeder();
            if (next.is_error())
            {
                return next.error();
            }
            auto resume = std::move(more->resume);
            current = resume(std::move(next.get()));
        }
        return std::move(current);
    }

    // Parses input without waiting for more. A parser that is still
    // incomplete after being told that the input has ended fails with
    // incomplete_at_eof.
    template <class Input, class T>
    result<Input, T> parse_only(parser<Input, T> const &root, typename parser<Input, T>::input_type input)
    {
        result<Input, T> current = parse(root, std::move(input));
        if (parse_more<Input, T> *const more = try_get_more<Input, T>(current))
        {
            auto resume = std::move(more->resume);
            current = resume(chunk_of<Input>());
            if (try_get_more<Input, T>(current))
            {
                return parse_failed<Input>{errors::incomplete_at_eof()};
            }
        }
        return current;
    }
}
