#pragma once

#include <nibble/count.hpp>
#include <nibble/source.hpp>
#include <silicium/optional.hpp>
#include <silicium/variant.hpp>
#include <boost/system/error_code.hpp>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>

namespace nibble
{
    namespace errors
    {
        struct not_enough
        {
            std::size_t missing;
        };

        struct incomplete_at_eof
        {
        };

        template <class Element>
        struct expected_element
        {
            Element expected;
            Element received;
        };

        template <class Chunk>
        struct expected_chunk
        {
            Chunk expected;
            Chunk received;
        };

        struct predicate_failed
        {
            Si::optional<std::string> description;
        };

        struct range_unmet
        {
            range remaining;
        };

        struct invalid
        {
            std::string reason;
        };
    }

    template <class Input>
    struct parse_error
    {
        typedef Si::variant<errors::not_enough, errors::incomplete_at_eof, errors::expected_element<element_of<Input>>,
                            errors::expected_chunk<chunk_of<Input>>, errors::predicate_failed, errors::range_unmet,
                            errors::invalid>
            reason_type;

        reason_type reason;

        parse_error(errors::not_enough reason)
            : reason(std::move(reason))
        {
        }

        parse_error(errors::incomplete_at_eof reason)
            : reason(std::move(reason))
        {
        }

        parse_error(errors::expected_element<element_of<Input>> reason)
            : reason(std::move(reason))
        {
        }

        parse_error(errors::expected_chunk<chunk_of<Input>> reason)
            : reason(std::move(reason))
        {
        }

        parse_error(errors::predicate_failed reason)
            : reason(std::move(reason))
        {
        }

        parse_error(errors::range_unmet reason)
            : reason(std::move(reason))
        {
        }

        parse_error(errors::invalid reason)
            : reason(std::move(reason))
        {
        }
    };

    enum class parse_errc
    {
        not_enough = 1,
        incomplete_at_eof,
        expected_element,
        expected_chunk,
        predicate_failed,
        range_unmet,
        invalid
    };

    struct parse_error_category_impl : boost::system::error_category
    {
        const char *name() const BOOST_SYSTEM_NOEXCEPT override
        {
            return "nibble.parse";
        }

        std::string message(int code) const override
        {
            switch (static_cast<parse_errc>(code))
            {
            case parse_errc::not_enough:
                return "not enough input";
            case parse_errc::incomplete_at_eof:
                return "input ended while the parser still needed data";
            case parse_errc::expected_element:
                return "unexpected element";
            case parse_errc::expected_chunk:
                return "unexpected sequence";
            case parse_errc::predicate_failed:
                return "element did not satisfy the predicate";
            case parse_errc::range_unmet:
                return "not enough repetitions";
            case parse_errc::invalid:
                return "invalid input";
            }
            return "unknown parse error";
        }
    };

    inline boost::system::error_category const &parse_error_category()
    {
        static parse_error_category_impl const category;
        return category;
    }

    inline boost::system::error_code make_error_code(parse_errc const code)
    {
        return boost::system::error_code(static_cast<int>(code), parse_error_category());
    }

    template <class Input>
    boost::system::error_code to_error_code(parse_error<Input> const &error)
    {
        return make_error_code(Si::visit<parse_errc>(error.reason,
                                                     [](errors::not_enough const &)
                                                     {
                                                         return parse_errc::not_enough;
                                                     },
                                                     [](errors::incomplete_at_eof const &)
                                                     {
                                                         return parse_errc::incomplete_at_eof;
                                                     },
                                                     [](errors::expected_element<element_of<Input>> const &)
                                                     {
                                                         return parse_errc::expected_element;
                                                     },
                                                     [](errors::expected_chunk<chunk_of<Input>> const &)
                                                     {
                                                         return parse_errc::expected_chunk;
                                                     },
                                                     [](errors::predicate_failed const &)
                                                     {
                                                         return parse_errc::predicate_failed;
                                                     },
                                                     [](errors::range_unmet const &)
                                                     {
                                                         return parse_errc::range_unmet;
                                                     },
                                                     [](errors::invalid const &)
                                                     {
                                                         return parse_errc::invalid;
                                                     }));
    }

    namespace detail
    {
        enum class element_style
        {
            character,
            number,
            streamed
        };

        template <class Element>
        void print_element(std::ostream &out, Element const &element,
                           std::integral_constant<element_style, element_style::character>)
        {
            out << '\'' << static_cast<char>(element) << '\'';
        }

        template <class Element>
        void print_element(std::ostream &out, Element const &element,
                           std::integral_constant<element_style, element_style::number>)
        {
            out << +element;
        }

        template <class Element>
        void print_element(std::ostream &out, Element const &element,
                           std::integral_constant<element_style, element_style::streamed>)
        {
            out << element;
        }

        template <class Element>
        void print_element(std::ostream &out, Element const &element)
        {
            constexpr element_style style =
                (std::is_same<Element, char>::value || std::is_same<Element, signed char>::value)
                    ? element_style::character
                    : (std::is_arithmetic<Element>::value ? element_style::number : element_style::streamed);
            print_element(out, element, std::integral_constant<element_style, style>());
        }

        template <class Char, class CharTraits, class Allocator>
        void print_chunk(std::ostream &out, std::basic_string<Char, CharTraits, Allocator> const &chunk)
        {
            out << '"';
            for (Char const c : chunk)
            {
                out << static_cast<char>(c);
            }
            out << '"';
        }

        template <class Chunk>
        void print_chunk(std::ostream &out, Chunk const &chunk)
        {
            out << '{';
            bool first = true;
            for (auto const &element : chunk)
            {
                if (first)
                {
                    first = false;
                }
                else
                {
                    out << ", ";
                }
                print_element(out, element);
            }
            out << '}';
        }
    }

    template <class Input>
    std::string describe(parse_error<Input> const &error)
    {
        std::ostringstream out;
        Si::visit<void>(error.reason,
                        [&out](errors::not_enough const &not_enough)
                        {
                            out << "not enough input: missing " << not_enough.missing << " element(s)";
                        },
                        [&out](errors::incomplete_at_eof const &)
                        {
                            out << "input ended while the parser still needed data";
                        },
                        [&out](errors::expected_element<element_of<Input>> const &expected)
                        {
                            out << "expected ";
                            detail::print_element(out, expected.expected);
                            out << " but received ";
                            detail::print_element(out, expected.received);
                        },
                        [&out](errors::expected_chunk<chunk_of<Input>> const &expected)
                        {
                            out << "expected ";
                            detail::print_chunk(out, expected.expected);
                            out << " but received ";
                            detail::print_chunk(out, expected.received);
                        },
                        [&out](errors::predicate_failed const &failed)
                        {
                            out << "element did not satisfy the predicate";
                            if (failed.description)
                            {
                                out << ": " << *failed.description;
                            }
                        },
                        [&out](errors::range_unmet const &unmet)
                        {
                            out << "not enough repetitions: still " << describe(unmet.remaining);
                        },
                        [&out](errors::invalid const &invalid)
                        {
                            out << "invalid input: " << invalid.reason;
                        });
        return out.str();
    }
}

namespace boost
{
    namespace system
    {
        template <>
        struct is_error_code_enum<nibble::parse_errc> : std::true_type
        {
        };
    }
}
