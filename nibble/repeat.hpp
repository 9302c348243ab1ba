#pragma once

#include <nibble/count.hpp>
#include <nibble/parser.hpp>
#include <silicium/optional.hpp>
#include <silicium/variant.hpp>
#include <cassert>
#include <memory>
#include <vector>

namespace nibble
{
    // Never fails. When the parser fails, the result is none and the offset
    // is where the parser started.
    template <class Input, class T>
    parser<Input, Si::optional<T>> optional(parser<Input, T> original)
    {
        return nibble::or_else(nibble::map(std::move(original),
                                           [](T value)
                                           {
                                               return Si::optional<T>(std::move(value));
                                           }),
                               pure<Input>(Si::optional<T>()));
    }

    namespace detail
    {
        template <class Input, class T>
        struct iteration_outcome
        {
            buffer<Input> input;
            std::size_t offset;
            more_data more;

            // none when the element failed
            Si::optional<T> value;
        };

        template <class Input, class T>
        using outcome_slot = std::shared_ptr<Si::optional<iteration_outcome<Input, T>>>;

        // Runs one iteration of a loop. Both continuations only record the
        // outcome, so the stack unwinds back to the loop after every element.
        template <class Input, class T>
        step<Input> run_iteration(parser<Input, T> const &element, buffer<Input> const &input,
                                  std::size_t const offset, more_data const more, outcome_slot<Input, T> const &slot)
        {
            return element(input, offset, more,
                           [slot](buffer<Input> const &input, std::size_t const offset, more_data const more,
                                  parse_error<Input>) -> step<Input>
                           {
                               *slot = Si::optional<iteration_outcome<Input, T>>(
                                   iteration_outcome<Input, T>{input, offset, more, Si::optional<T>()});
                               return advanced<Input>();
                           },
                           [slot](buffer<Input> const &input, std::size_t const offset, more_data const more,
                                  T value) -> step<Input>
                           {
                               *slot = Si::optional<iteration_outcome<Input, T>>(iteration_outcome<Input, T>{
                                   input, offset, more, Si::optional<T>(std::move(value))});
                               return advanced<Input>();
                           });
        }

        template <class Input, class T>
        iteration_outcome<Input, T> take_outcome(outcome_slot<Input, T> const &slot)
        {
            assert(*slot);
            iteration_outcome<Input, T> outcome = std::move(**slot);
            *slot = Si::optional<iteration_outcome<Input, T>>();
            return outcome;
        }

        // Returns none when the iteration completed. A suspended element
        // re-enters the loop through resume_loop once the chunk arrives.
        template <class Input, class ResumeLoop>
        Si::optional<step<Input>> leave_loop(step<Input> &current, ResumeLoop const &resume_loop)
        {
            typedef Si::optional<step<Input>> leaving;
            return Si::visit<leaving>(current,
                                   [](parse_failed<Input> &failed)
                                   {
                                       return leaving(step<Input>(std::move(failed)));
                                   },
                                   [](finished<Input> &done)
                                   {
                                       return leaving(step<Input>(std::move(done)));
                                   },
                                   [&resume_loop](suspended<Input> &more)
                                   {
                                       auto resume = std::move(more.resume);
                                       return leaving(step<Input>(
                                           suspended<Input>{[resume, resume_loop](chunk_of<Input> chunk)
                                                            {
                                                                return resume_loop(resume(std::move(chunk)));
                                                            }}));
                                   },
                                   [](advanced<Input> &)
                                   {
                                       return leaving();
                                   });
        }

        // A parser calls either its failure or its success continuation, so
        // one loop object serves all iterations of a run.
        template <class Input, class T>
        struct many_loop
        {
            parser<Input, T> element;
            success<Input, std::vector<T>> on_success;
            outcome_slot<Input, T> slot;
            std::vector<T> collected;

            static step<Input> proceed(std::shared_ptr<many_loop> const self, step<Input> current, std::size_t start)
            {
                for (;;)
                {
                    Si::optional<step<Input>> left = leave_loop<Input>(current, [self, start](step<Input> next)
                                                                       {
                                                                           return proceed(self, std::move(next), start);
                                                                       });
                    if (left)
                    {
                        return std::move(*left);
                    }
                    iteration_outcome<Input, T> outcome = take_outcome<Input, T>(self->slot);
                    if (!outcome.value)
                    {
                        return self->on_success(outcome.input, start, outcome.more, std::move(self->collected));
                    }
                    self->collected.emplace_back(std::move(*outcome.value));
                    if (outcome.offset == start)
                    {
                        // no progress, repeating would never end
                        return self->on_success(outcome.input, start, outcome.more, std::move(self->collected));
                    }
                    start = outcome.offset;
                    if ((outcome.more == more_data::may_arrive) && outcome.input.at_end(start))
                    {
                        return demand_input(outcome.input, outcome.more,
                                            [self, start](buffer<Input> const &extended, more_data const now)
                                            {
                                                return proceed(self, run_iteration<Input, T>(self->element, extended,
                                                                                              start, now, self->slot),
                                                               start);
                                            });
                    }
                    current = run_iteration<Input, T>(self->element, outcome.input, start, outcome.more, self->slot);
                }
            }
        };

        template <class Input, class T>
        struct repeat_loop
        {
            parser<Input, T> element;
            failure<Input> on_failure;
            success<Input, std::vector<T>> on_success;
            outcome_slot<Input, T> slot;
            range remaining;
            std::vector<T> collected;

            static step<Input> start_iteration(std::shared_ptr<repeat_loop> const self, buffer<Input> const &input,
                                               std::size_t const start, more_data const more)
            {
                if (should_stop(self->remaining))
                {
                    return self->on_success(input, start, more, std::move(self->collected));
                }
                return proceed(self, run_iteration<Input, T>(self->element, input, start, more, self->slot), start);
            }

            static step<Input> proceed(std::shared_ptr<repeat_loop> const self, step<Input> current,
                                       std::size_t start)
            {
                for (;;)
                {
                    Si::optional<step<Input>> left = leave_loop<Input>(current, [self, start](step<Input> next)
                                                                       {
                                                                           return proceed(self, std::move(next), start);
                                                                       });
                    if (left)
                    {
                        return std::move(*left);
                    }
                    iteration_outcome<Input, T> outcome = take_outcome<Input, T>(self->slot);
                    if (!outcome.value)
                    {
                        if (can_stop(self->remaining))
                        {
                            return self->on_success(outcome.input, start, outcome.more, std::move(self->collected));
                        }
                        return self->on_failure(outcome.input, start, outcome.more,
                                                errors::range_unmet{self->remaining});
                    }
                    self->collected.emplace_back(std::move(*outcome.value));
                    self->remaining = decrement(self->remaining);
                    start = outcome.offset;
                    if ((outcome.more == more_data::may_arrive) && outcome.input.at_end(start))
                    {
                        return demand_input(outcome.input, outcome.more,
                                            [self, start](buffer<Input> const &extended, more_data const now)
                                            {
                                                return start_iteration(self, extended, start, now);
                                            });
                    }
                    if (should_stop(self->remaining))
                    {
                        return self->on_success(outcome.input, start, outcome.more, std::move(self->collected));
                    }
                    current = run_iteration<Input, T>(self->element, outcome.input, start, outcome.more, self->slot);
                }
            }
        };
    }

    // Runs the parser until it fails and collects the values in order.
    template <class Input, class T>
    parser<Input, std::vector<T>> many(parser<Input, T> element)
    {
        return make_parser<Input, std::vector<T>>(
            [element](buffer<Input> const &input, std::size_t const offset, more_data const more,
                      failure<Input> const &, success<Input, std::vector<T>> const &on_success)
            {
                typedef detail::many_loop<Input, T> loop_type;
                auto const loop = std::make_shared<loop_type>(
                    loop_type{element, on_success,
                              std::make_shared<Si::optional<detail::iteration_outcome<Input, T>>>(),
                              std::vector<T>()});
                return loop_type::proceed(
                    loop, detail::run_iteration<Input, T>(element, input, offset, more, loop->slot), offset);
            });
    }

    template <class Input, class T>
    parser<Input, std::vector<T>> some(parser<Input, T> element)
    {
        return nibble::bind(element, [element](T first)
                            {
                                return nibble::map(nibble::many(element), [first](std::vector<T> rest)
                                                   {
                                                       rest.insert(rest.begin(), first);
                                                       return rest;
                                                   });
                            });
    }

    // Runs the parser as often as the range demands. Stops early when the
    // parser fails and the range allows to stop.
    //
    // repeat(exactly(make_count(4)), octet) parses exactly four octets,
    // repeat(between(counts::never(), make_count(8)), group) up to eight groups.
    template <class Input, class T>
    parser<Input, std::vector<T>> repeat(range const &how_often, parser<Input, T> element)
    {
        return make_parser<Input, std::vector<T>>(
            [how_often, element](buffer<Input> const &input, std::size_t const offset, more_data const more,
                                 failure<Input> const &on_failure, success<Input, std::vector<T>> const &on_success)
            {
                typedef detail::repeat_loop<Input, T> loop_type;
                auto const loop = std::make_shared<loop_type>(
                    loop_type{element, on_failure, on_success,
                              std::make_shared<Si::optional<detail::iteration_outcome<Input, T>>>(), how_often,
                              std::vector<T>()});
                return loop_type::start_iteration(loop, input, offset, more);
            });
    }
}
