#pragma once

#include <nibble/parse_error.hpp>
#include <silicium/variant.hpp>
#include <functional>
#include <string>

namespace nibble
{
    template <class Input>
    struct parse_failed
    {
        parse_error<Input> error;
    };

    template <class Input, class T>
    struct parse_ok
    {
        chunk_of<Input> leftover;
        T value;
    };

    template <class Input, class T>
    struct parse_more;

    template <class Input, class T>
    using result = Si::variant<parse_failed<Input>, parse_ok<Input, T>, parse_more<Input, T>>;

    // The parser ran out of input. resume has to be called exactly once with
    // the next chunk. An empty chunk tells the parser that nothing follows.
    template <class Input, class T>
    struct parse_more
    {
        std::function<result<Input, T>(chunk_of<Input>)> resume;
    };

    template <class Input, class T>
    parse_ok<Input, T> const *try_get_ok(result<Input, T> const &parsed)
    {
        return Si::visit<parse_ok<Input, T> const *>(parsed,
                                                     [](parse_failed<Input> const &) -> parse_ok<Input, T> const *
                                                     {
                                                         return nullptr;
                                                     },
                                                     [](parse_ok<Input, T> const &ok)
                                                     {
                                                         return &ok;
                                                     },
                                                     [](parse_more<Input, T> const &) -> parse_ok<Input, T> const *
                                                     {
                                                         return nullptr;
                                                     });
    }

    template <class Input, class T>
    parse_failed<Input> const *try_get_failed(result<Input, T> const &parsed)
    {
        return Si::visit<parse_failed<Input> const *>(parsed,
                                                      [](parse_failed<Input> const &failed)
                                                      {
                                                          return &failed;
                                                      },
                                                      [](parse_ok<Input, T> const &) -> parse_failed<Input> const *
                                                      {
                                                          return nullptr;
                                                      },
                                                      [](parse_more<Input, T> const &) -> parse_failed<Input> const *
                                                      {
                                                          return nullptr;
                                                      });
    }

    template <class Input, class T>
    parse_more<Input, T> *try_get_more(result<Input, T> &parsed)
    {
        return Si::visit<parse_more<Input, T> *>(parsed,
                                                 [](parse_failed<Input> &) -> parse_more<Input, T> *
                                                 {
                                                     return nullptr;
                                                 },
                                                 [](parse_ok<Input, T> &) -> parse_more<Input, T> *
                                                 {
                                                     return nullptr;
                                                 },
                                                 [](parse_more<Input, T> &more)
                                                 {
                                                     return &more;
                                                 });
    }

    template <class Input, class T, class Transformation>
    auto map_result(result<Input, T> parsed, Transformation transform)
        -> result<Input, decltype(transform(std::declval<T>()))>
    {
        typedef decltype(transform(std::declval<T>())) transformed;
        return Si::visit<result<Input, transformed>>(
            parsed,
            [](parse_failed<Input> &failed) -> result<Input, transformed>
            {
                return std::move(failed);
            },
            [&transform](parse_ok<Input, T> &ok) -> result<Input, transformed>
            {
                return parse_ok<Input, transformed>{std::move(ok.leftover), transform(std::move(ok.value))};
            },
            [&transform](parse_more<Input, T> &more) -> result<Input, transformed>
            {
                auto resume = std::move(more.resume);
                return parse_more<Input, transformed>{
                    [resume, transform](chunk_of<Input> chunk)
                    {
                        return map_result<Input, T>(resume(std::move(chunk)), transform);
                    }};
            });
    }

    template <class Input, class T>
    std::string describe(result<Input, T> const &parsed)
    {
        return Si::visit<std::string>(parsed,
                                      [](parse_failed<Input> const &failed)
                                      {
                                          return "parser failed: " + describe(failed.error);
                                      },
                                      [](parse_ok<Input, T> const &)
                                      {
                                          return std::string("parser succeeded");
                                      },
                                      [](parse_more<Input, T> const &)
                                      {
                                          return std::string("parser incomplete: needs more input");
                                      });
    }
}
