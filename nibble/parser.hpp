#pragma once

#include <nibble/buffer.hpp>
#include <nibble/result.hpp>
#include <silicium/variant.hpp>
#include <functional>
#include <type_traits>
#include <utility>

namespace nibble
{
    namespace detail
    {
        // The parse reached its final success continuation. The value itself
        // travels outside of the step, see parse().
        template <class Input>
        struct finished
        {
            chunk_of<Input> leftover;
        };

        // An iteration of a loop combinator completed without suspending. Its
        // outcome waits in the slot of the loop, which runs the next
        // iteration from its own frame.
        template <class Input>
        struct advanced
        {
        };

        template <class Input>
        struct suspended;

        template <class Input>
        using step = Si::variant<parse_failed<Input>, finished<Input>, suspended<Input>, advanced<Input>>;

        template <class Input>
        struct suspended
        {
            std::function<step<Input>(chunk_of<Input>)> resume;
        };
    }

    template <class Input>
    using failure =
        std::function<detail::step<Input>(buffer<Input> const &, std::size_t, more_data, parse_error<Input>)>;

    template <class Input, class T>
    using success = std::function<detail::step<Input>(buffer<Input> const &, std::size_t, more_data, T)>;

    // A parser is run with the buffer, the offset to start at, whether more
    // input may follow the buffer and two continuations. It finishes by
    // calling exactly one of the continuations, or by suspending until the
    // next chunk arrives.
    template <class Input, class T>
    struct parser
    {
        typedef Input input_type;
        typedef T result_type;
        typedef std::function<detail::step<Input>(buffer<Input> const &, std::size_t, more_data,
                                                  failure<Input> const &, success<Input, T> const &)>
            function_type;

        explicit parser(function_type run)
            : m_run(std::move(run))
        {
        }

        detail::step<Input> operator()(buffer<Input> const &input, std::size_t const offset, more_data const more,
                                       failure<Input> const &on_failure, success<Input, T> const &on_success) const
        {
            return m_run(input, offset, more, on_failure, on_success);
        }

    private:
        function_type m_run;
    };

    template <class Input, class T, class Function>
    parser<Input, T> make_parser(Function &&run)
    {
        return parser<Input, T>(typename parser<Input, T>::function_type(std::forward<Function>(run)));
    }

    namespace detail
    {
        // Asks the driver for the next chunk. An empty chunk means that no
        // more input will arrive.
        template <class Input, class Continue>
        step<Input> demand_input(buffer<Input> const &input, more_data const more, Continue continue_)
        {
            return suspended<Input>{[input, more, continue_](chunk_of<Input> chunk) -> step<Input>
                                    {
                                        if (input.is_empty_chunk(chunk))
                                        {
                                            return continue_(input, more_data::no_more);
                                        }
                                        return continue_(input.append(chunk), more);
                                    }};
        }

        // Runs a primitive again with more input. Callers have checked that
        // more may arrive.
        template <class Input, class T, class Primitive>
        step<Input> retry_with_more_input(Primitive const &primitive, buffer<Input> const &input,
                                          std::size_t const offset, failure<Input> const &on_failure,
                                          success<Input, T> const &on_success)
        {
            return demand_input(input, more_data::may_arrive,
                                [primitive, offset, on_failure, on_success](buffer<Input> const &extended,
                                                                             more_data const more)
                                {
                                    return primitive(extended, offset, more, on_failure, on_success);
                                });
        }

        // Sequencing asks for input before running the next parser when the
        // previous one stopped exactly at the end of the buffer.
        template <class Input, class T>
        step<Input> run_with_input(parser<Input, T> const &next, buffer<Input> const &input,
                                   std::size_t const offset, more_data const more,
                                   failure<Input> const &on_failure, success<Input, T> const &on_success)
        {
            if ((more == more_data::no_more) || !input.at_end(offset))
            {
                return next(input, offset, more, on_failure, on_success);
            }
            return demand_input(input, more,
                                [next, offset, on_failure, on_success](buffer<Input> const &extended,
                                                                       more_data const now)
                                {
                                    return next(extended, offset, now, on_failure, on_success);
                                });
        }
    }

    template <class Input, class T>
    parser<Input, typename std::decay<T>::type> pure(T &&value)
    {
        typedef typename std::decay<T>::type value_type;
        return make_parser<Input, value_type>(
            [value = std::forward<T>(value)](buffer<Input> const &input, std::size_t const offset,
                                             more_data const more, failure<Input> const &,
                                             success<Input, value_type> const &on_success)
            {
                return on_success(input, offset, more, value);
            });
    }

    template <class Input, class T>
    parser<Input, T> fail_with(parse_error<Input> error)
    {
        return make_parser<Input, T>([error](buffer<Input> const &input, std::size_t const offset,
                                             more_data const more, failure<Input> const &on_failure,
                                             success<Input, T> const &)
                                     {
                                         return on_failure(input, offset, more, error);
                                     });
    }

    template <class Input, class T, class Transformation>
    auto map(parser<Input, T> original, Transformation transform)
        -> parser<Input, decltype(transform(std::declval<T>()))>
    {
        typedef decltype(transform(std::declval<T>())) transformed;
        return make_parser<Input, transformed>(
            [original, transform](buffer<Input> const &input, std::size_t const offset, more_data const more,
                                  failure<Input> const &on_failure, success<Input, transformed> const &on_success)
            {
                return original(input, offset, more, on_failure,
                                [transform, on_success](buffer<Input> const &input, std::size_t const offset,
                                                        more_data const more, T value)
                                {
                                    return on_success(input, offset, more, transform(std::move(value)));
                                });
            });
    }

    // Runs first, then the parser that make_next returns for its value.
    template <class Input, class T, class MakeNext>
    auto bind(parser<Input, T> first, MakeNext make_next)
        -> parser<Input, typename decltype(make_next(std::declval<T>()))::result_type>
    {
        typedef typename decltype(make_next(std::declval<T>()))::result_type next_result;
        return make_parser<Input, next_result>(
            [first, make_next](buffer<Input> const &input, std::size_t const offset, more_data const more,
                               failure<Input> const &on_failure, success<Input, next_result> const &on_success)
            {
                return first(input, offset, more, on_failure,
                             [make_next, on_failure, on_success](buffer<Input> const &input,
                                                                 std::size_t const offset, more_data const more,
                                                                 T value)
                             {
                                 return detail::run_with_input(make_next(std::move(value)), input, offset, more,
                                                               on_failure, on_success);
                             });
            });
    }

    // Runs first and second, keeping the value of second.
    template <class Input, class T, class U>
    parser<Input, U> then(parser<Input, T> first, parser<Input, U> second)
    {
        return nibble::bind(std::move(first), [second](T const &)
                    {
                        return second;
                    });
    }

    // Runs first and second, keeping the value of first.
    template <class Input, class T, class U>
    parser<Input, T> before(parser<Input, T> first, parser<Input, U> second)
    {
        return nibble::bind(std::move(first), [second](T value)
                    {
                        return nibble::map(second, [value](U const &)
                                           {
                                               return value;
                                           });
                    });
    }

    // Runs first. If it fails, second runs from where first started.
    template <class Input, class T>
    parser<Input, T> or_else(parser<Input, T> first, parser<Input, T> second)
    {
        return make_parser<Input, T>(
            [first, second](buffer<Input> const &input, std::size_t const offset, more_data const more,
                            failure<Input> const &on_failure, success<Input, T> const &on_success)
            {
                return first(input, offset, more,
                             [second, offset, on_failure, on_success](buffer<Input> const &input, std::size_t,
                                                                      more_data const more, parse_error<Input>)
                             {
                                 return second(input, offset, more, on_failure, on_success);
                             },
                             on_success);
            });
    }

    template <class Input, class T>
    parser<Input, T> operator|(parser<Input, T> first, parser<Input, T> second)
    {
        return nibble::or_else(std::move(first), std::move(second));
    }
}
