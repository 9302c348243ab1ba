#pragma once

#include <nibble/parser.hpp>
#include <nibble/source/text.hpp>
#include <silicium/variant.hpp>
#include <string>

namespace nibble
{
    namespace detail
    {
        template <class Input>
        struct any_element_parser
        {
            typedef element_of<Input> result_type;

            step<Input> operator()(buffer<Input> const &input, std::size_t const offset, more_data const more,
                                   failure<Input> const &on_failure,
                                   success<Input, result_type> const &on_success) const
            {
                Si::optional<result_type> const element = input.element_at(offset);
                if (element)
                {
                    return on_success(input, offset + 1, more, *element);
                }
                if (more == more_data::may_arrive)
                {
                    return retry_with_more_input<Input, result_type>(*this, input, offset, on_failure, on_success);
                }
                return on_failure(input, offset, more, errors::not_enough{1});
            }
        };

        template <class Input>
        struct element_parser
        {
            typedef Si::unit result_type;

            element_of<Input> expected;

            step<Input> operator()(buffer<Input> const &input, std::size_t const offset, more_data const more,
                                   failure<Input> const &on_failure,
                                   success<Input, result_type> const &on_success) const
            {
                Si::optional<element_of<Input>> const element = input.element_at(offset);
                if (!element)
                {
                    if (more == more_data::may_arrive)
                    {
                        return retry_with_more_input<Input, result_type>(*this, input, offset, on_failure,
                                                                         on_success);
                    }
                    return on_failure(input, offset, more, errors::not_enough{1});
                }
                if (!(*element == expected))
                {
                    return on_failure(input, offset, more,
                                      errors::expected_element<element_of<Input>>{expected, *element});
                }
                return on_success(input, offset + 1, more, Si::unit());
            }
        };

        template <class Input>
        struct satisfy_parser
        {
            typedef element_of<Input> result_type;

            std::function<bool(element_of<Input> const &)> predicate;
            Si::optional<std::string> description;

            step<Input> operator()(buffer<Input> const &input, std::size_t const offset, more_data const more,
                                   failure<Input> const &on_failure,
                                   success<Input, result_type> const &on_success) const
            {
                Si::optional<result_type> const element = input.element_at(offset);
                if (!element)
                {
                    if (more == more_data::may_arrive)
                    {
                        return retry_with_more_input<Input, result_type>(*this, input, offset, on_failure,
                                                                         on_success);
                    }
                    return on_failure(input, offset, more, errors::not_enough{1});
                }
                if (!predicate(*element))
                {
                    return on_failure(input, offset, more, errors::predicate_failed{description});
                }
                return on_success(input, offset + 1, more, *element);
            }
        };

        // Matches what the buffer has of the expected chunk and continues
        // with the remainder once the next chunk arrives.
        template <class Input>
        struct elements_parser
        {
            typedef Si::unit result_type;
            typedef source_traits<Input> traits;

            chunk_of<Input> expected;

            step<Input> operator()(buffer<Input> const &input, std::size_t const offset, more_data const more,
                                   failure<Input> const &on_failure,
                                   success<Input, result_type> const &on_success) const
            {
                std::size_t const expected_length = traits::chunk_length(expected);
                if (expected_length == 0)
                {
                    return on_success(input, offset, more, Si::unit());
                }
                std::size_t const available = input.size() - offset;
                if (available == 0)
                {
                    if (more == more_data::may_arrive)
                    {
                        return retry_with_more_input<Input, result_type>(*this, input, offset, on_failure,
                                                                         on_success);
                    }
                    return on_failure(input, offset, more, errors::not_enough{expected_length});
                }
                if (available >= expected_length)
                {
                    chunk_of<Input> received = input.subrange(offset, expected_length);
                    if (received == expected)
                    {
                        return on_success(input, offset + expected_length, more, Si::unit());
                    }
                    return on_failure(input, offset, more,
                                      errors::expected_chunk<chunk_of<Input>>{expected, std::move(received)});
                }
                chunk_of<Input> received = input.subrange(offset, available);
                std::pair<chunk_of<Input>, chunk_of<Input>> split = traits::split_at(expected, available);
                if (!(received == split.first))
                {
                    return on_failure(input, offset, more, errors::expected_chunk<chunk_of<Input>>{
                                                               std::move(split.first), std::move(received)});
                }
                elements_parser<Input> const remainder{std::move(split.second)};
                return remainder(input, offset + available, more, on_failure, on_success);
            }
        };
    }

    template <class Input>
    parser<Input, element_of<Input>> any_element()
    {
        return make_parser<Input, element_of<Input>>(detail::any_element_parser<Input>());
    }

    template <class Input>
    parser<Input, Si::unit> element(element_of<Input> expected)
    {
        return make_parser<Input, Si::unit>(detail::element_parser<Input>{std::move(expected)});
    }

    template <class Input, class Predicate>
    parser<Input, element_of<Input>> satisfy(Predicate &&predicate,
                                             Si::optional<std::string> description = Si::none)
    {
        return make_parser<Input, element_of<Input>>(detail::satisfy_parser<Input>{
            std::forward<Predicate>(predicate), std::move(description)});
    }

    template <class Input>
    parser<Input, Si::unit> elements(chunk_of<Input> expected)
    {
        return make_parser<Input, Si::unit>(detail::elements_parser<Input>{std::move(expected)});
    }

    inline parser<std::string, Si::unit> string(std::string expected)
    {
        return elements<std::string>(std::move(expected));
    }
}
