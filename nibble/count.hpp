#pragma once

#include <silicium/variant.hpp>
#include <cstddef>
#include <string>

namespace nibble
{
    namespace counts
    {
        struct never
        {
        };

        struct once
        {
        };

        struct twice
        {
        };

        struct other
        {
            std::size_t times;
        };
    }

    typedef Si::variant<counts::never, counts::once, counts::twice, counts::other> count;

    inline count make_count(std::size_t const times)
    {
        switch (times)
        {
        case 0:
            return counts::never();
        case 1:
            return counts::once();
        case 2:
            return counts::twice();
        default:
            return counts::other{times};
        }
    }

    inline std::size_t to_integer(count const &value)
    {
        return Si::visit<std::size_t>(value,
                                      [](counts::never)
                                      {
                                          return std::size_t(0);
                                      },
                                      [](counts::once)
                                      {
                                          return std::size_t(1);
                                      },
                                      [](counts::twice)
                                      {
                                          return std::size_t(2);
                                      },
                                      [](counts::other const &other)
                                      {
                                          return other.times;
                                      });
    }

    // Saturates at never.
    inline count pred(count const &value)
    {
        std::size_t const times = to_integer(value);
        return make_count((times == 0) ? 0 : (times - 1));
    }

    inline count succ(count const &value)
    {
        return make_count(to_integer(value) + 1);
    }

    inline std::string describe(count const &value)
    {
        return Si::visit<std::string>(value,
                                      [](counts::never)
                                      {
                                          return std::string("Never");
                                      },
                                      [](counts::once)
                                      {
                                          return std::string("Once");
                                      },
                                      [](counts::twice)
                                      {
                                          return std::string("Twice");
                                      },
                                      [](counts::other const &other)
                                      {
                                          return "Other " + std::to_string(other.times);
                                      });
    }

    namespace ranges
    {
        struct exactly
        {
            count times;
        };

        struct between
        {
            count minimum;
            count maximum;
        };
    }

    // How often repeat() runs its parser.
    typedef Si::variant<ranges::exactly, ranges::between> range;

    inline range exactly(count times)
    {
        return ranges::exactly{std::move(times)};
    }

    inline range between(count minimum, count maximum)
    {
        return ranges::between{std::move(minimum), std::move(maximum)};
    }

    inline bool should_stop(range const &value)
    {
        return Si::visit<bool>(value,
                               [](ranges::exactly const &exactly)
                               {
                                   return to_integer(exactly.times) == 0;
                               },
                               [](ranges::between const &between)
                               {
                                   return to_integer(between.maximum) == 0;
                               });
    }

    inline bool can_stop(range const &value)
    {
        return Si::visit<bool>(value,
                               [](ranges::exactly const &exactly)
                               {
                                   return to_integer(exactly.times) == 0;
                               },
                               [](ranges::between const &between)
                               {
                                   return to_integer(between.minimum) == 0;
                               });
    }

    inline range decrement(range const &value)
    {
        return Si::visit<range>(value,
                                [](ranges::exactly const &exactly) -> range
                                {
                                    return ranges::exactly{pred(exactly.times)};
                                },
                                [](ranges::between const &between) -> range
                                {
                                    return ranges::between{pred(between.minimum), pred(between.maximum)};
                                });
    }

    inline std::string describe(range const &value)
    {
        return Si::visit<std::string>(value,
                                      [](ranges::exactly const &exactly)
                                      {
                                          return "Exactly " + describe(exactly.times);
                                      },
                                      [](ranges::between const &between)
                                      {
                                          return "Between " + describe(between.minimum) + " " +
                                                 describe(between.maximum);
                                      });
    }
}
