#pragma once

#include <nibble/parser.hpp>
#include <silicium/variant.hpp>
#include <functional>

namespace nibble
{
    template <class Input>
    using element_predicate = std::function<bool(element_of<Input> const &)>;

    namespace detail
    {
        // Retries from the same offset until the buffer holds count elements,
        // so refills never nest continuations.
        template <class Input>
        struct take_parser
        {
            typedef chunk_of<Input> result_type;

            std::size_t count;

            step<Input> operator()(buffer<Input> const &input, std::size_t const offset, more_data const more,
                                   failure<Input> const &on_failure,
                                   success<Input, result_type> const &on_success) const
            {
                std::size_t const available = input.size() - offset;
                if (count <= available)
                {
                    return on_success(input, offset + count, more, input.subrange(offset, count));
                }
                if (more == more_data::may_arrive)
                {
                    return retry_with_more_input<Input, result_type>(*this, input, offset, on_failure, on_success);
                }
                return on_failure(input, offset, more, errors::not_enough{count - available});
            }
        };

        template <class Input>
        struct skip_parser
        {
            typedef Si::unit result_type;

            std::size_t count;

            step<Input> operator()(buffer<Input> const &input, std::size_t const offset, more_data const more,
                                   failure<Input> const &on_failure,
                                   success<Input, result_type> const &on_success) const
            {
                std::size_t const available = input.size() - offset;
                if (count <= available)
                {
                    return on_success(input, offset + count, more, Si::unit());
                }
                if (more == more_data::may_arrive)
                {
                    return retry_with_more_input<Input, result_type>(*this, input, offset, on_failure, on_success);
                }
                return on_failure(input, offset, more, errors::not_enough{count - available});
            }
        };

        // A match that reaches the end of the buffer may continue in the
        // next chunk. The scan resumes where it stopped while the value
        // always starts at the original offset.
        template <class Input>
        struct take_while_parser
        {
            typedef chunk_of<Input> result_type;

            element_predicate<Input> predicate;

            step<Input> operator()(buffer<Input> const &input, std::size_t const offset, more_data const more,
                                   failure<Input> const &on_failure,
                                   success<Input, result_type> const &on_success) const
            {
                return scan(input, offset, offset, more, on_failure, on_success);
            }

            step<Input> scan(buffer<Input> const &input, std::size_t const start, std::size_t const scanned,
                             more_data const more, failure<Input> const &on_failure,
                             success<Input, result_type> const &on_success) const
            {
                std::size_t const end = input.span_prefix(scanned, predicate).second;
                if ((more == more_data::no_more) || !input.at_end(end))
                {
                    return on_success(input, end, more, input.subrange(start, end - start));
                }
                take_while_parser const self = *this;
                return demand_input(input, more_data::may_arrive,
                                    [self, start, end, on_failure, on_success](buffer<Input> const &extended,
                                                                               more_data const now)
                                    {
                                        return self.scan(extended, start, end, now, on_failure, on_success);
                                    });
            }
        };

        template <class Input>
        struct skip_while_parser
        {
            typedef Si::unit result_type;

            element_predicate<Input> predicate;

            step<Input> operator()(buffer<Input> const &input, std::size_t const offset, more_data const more,
                                   failure<Input> const &on_failure,
                                   success<Input, result_type> const &on_success) const
            {
                std::size_t const end = input.span_prefix(offset, predicate).second;
                if ((more == more_data::no_more) || !input.at_end(end))
                {
                    return on_success(input, end, more, Si::unit());
                }
                return retry_with_more_input<Input, result_type>(*this, input, end, on_failure, on_success);
            }
        };

        template <class Input>
        struct take_all_parser
        {
            typedef chunk_of<Input> result_type;

            step<Input> operator()(buffer<Input> const &input, std::size_t const offset, more_data const more,
                                   failure<Input> const &on_failure,
                                   success<Input, result_type> const &on_success) const
            {
                if (more == more_data::no_more)
                {
                    return on_success(input, input.size(), more, input.rest(offset));
                }
                return retry_with_more_input<Input, result_type>(*this, input, offset, on_failure, on_success);
            }
        };

        template <class Input>
        struct skip_all_parser
        {
            typedef Si::unit result_type;

            step<Input> operator()(buffer<Input> const &input, std::size_t const offset, more_data const more,
                                   failure<Input> const &on_failure,
                                   success<Input, result_type> const &on_success) const
            {
                if (more == more_data::no_more)
                {
                    return on_success(input, input.size(), more, Si::unit());
                }
                return retry_with_more_input<Input, result_type>(*this, input, offset, on_failure, on_success);
            }
        };
    }

    template <class Input>
    parser<Input, chunk_of<Input>> take(std::size_t const count)
    {
        return make_parser<Input, chunk_of<Input>>(detail::take_parser<Input>{count});
    }

    template <class Input>
    parser<Input, Si::unit> skip(std::size_t const count)
    {
        return make_parser<Input, Si::unit>(detail::skip_parser<Input>{count});
    }

    template <class Input>
    parser<Input, chunk_of<Input>> take_while(element_predicate<Input> predicate)
    {
        return make_parser<Input, chunk_of<Input>>(detail::take_while_parser<Input>{std::move(predicate)});
    }

    template <class Input>
    parser<Input, Si::unit> skip_while(element_predicate<Input> predicate)
    {
        return make_parser<Input, Si::unit>(detail::skip_while_parser<Input>{std::move(predicate)});
    }

    // Consumes everything up to the end of the input, which may be far
    // behind the end of the current buffer.
    template <class Input>
    parser<Input, chunk_of<Input>> take_all()
    {
        return make_parser<Input, chunk_of<Input>>(detail::take_all_parser<Input>());
    }

    template <class Input>
    parser<Input, Si::unit> skip_all()
    {
        return make_parser<Input, Si::unit>(detail::skip_all_parser<Input>());
    }
}
