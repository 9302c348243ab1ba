#pragma once

#include <nibble/parser.hpp>
#include <tuple>

namespace nibble
{
    template <class Input>
    parser<Input, std::tuple<>> tuple_of()
    {
        return pure<Input>(std::tuple<>());
    }

    template <class Input, class Head>
    parser<Input, std::tuple<Head>> tuple_of(parser<Input, Head> head)
    {
        return nibble::map(std::move(head), [](Head value)
                           {
                               return std::tuple<Head>(std::move(value));
                           });
    }

    // Runs the parsers one after another and collects their values.
    template <class Input, class Head, class Second, class... Tail>
    parser<Input, std::tuple<Head, Second, Tail...>> tuple_of(parser<Input, Head> head, parser<Input, Second> second,
                                                              parser<Input, Tail>... tail)
    {
        return nibble::bind(std::move(head), [second, tail...](Head value)
                            {
                                return nibble::map(nibble::tuple_of(second, tail...),
                                                   [value](std::tuple<Second, Tail...> rest)
                                                   {
                                                       return std::tuple_cat(std::tuple<Head>(value), std::move(rest));
                                                   });
                            });
    }
}
