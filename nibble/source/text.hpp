#pragma once

#include <nibble/source.hpp>
#include <silicium/optional.hpp>
#include <algorithm>
#include <cassert>
#include <string>
#include <utility>

namespace nibble
{
    template <class Char, class CharTraits, class Allocator>
    struct source_traits<std::basic_string<Char, CharTraits, Allocator>>
    {
        typedef std::basic_string<Char, CharTraits, Allocator> input_type;
        typedef Char element_type;
        typedef input_type chunk_type;

        static std::size_t length(input_type const &input)
        {
            return input.size();
        }

        static Si::optional<element_type> element_at(input_type const &input, std::size_t const offset)
        {
            if (offset >= input.size())
            {
                return Si::none;
            }
            return input[offset];
        }

        static bool is_empty_chunk(input_type const &, chunk_type const &chunk)
        {
            return chunk.empty();
        }

        static void append(input_type &input, chunk_type const &chunk)
        {
            input += chunk;
        }

        static chunk_type subrange(input_type const &input, std::size_t const offset, std::size_t const count)
        {
            assert(offset <= input.size());
            assert(count <= (input.size() - offset));
            return input.substr(offset, count);
        }

        template <class Predicate>
        static std::pair<chunk_type, std::size_t> span_prefix(input_type const &input, std::size_t const offset,
                                                              Predicate const &predicate)
        {
            assert(offset <= input.size());
            auto const begin = input.begin() + offset;
            auto const end = std::find_if_not(begin, input.end(), predicate);
            return std::make_pair(chunk_type(begin, end), offset + static_cast<std::size_t>(end - begin));
        }

        static std::size_t chunk_length(chunk_type const &chunk)
        {
            return chunk.size();
        }

        static chunk_type concat(chunk_type front, chunk_type const &back)
        {
            front += back;
            return front;
        }

        static std::pair<chunk_type, chunk_type> split_at(chunk_type const &chunk, std::size_t const count)
        {
            std::size_t const head = (std::min)(count, chunk.size());
            return std::make_pair(chunk.substr(0, head), chunk.substr(head));
        }
    };
}
