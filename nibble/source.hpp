#pragma once

#include <cstddef>

namespace nibble
{
    // Specialized for every input representation a parser can run on.
    //
    // A specialization provides:
    //   element_type, chunk_type
    //   static std::size_t length(Input const &)
    //   static Si::optional<element_type> element_at(Input const &, std::size_t offset)
    //   static bool is_empty_chunk(Input const &, chunk_type const &)
    //   static void append(Input &, chunk_type const &)
    //   static chunk_type subrange(Input const &, std::size_t offset, std::size_t count)
    //   static std::pair<chunk_type, std::size_t> span_prefix(Input const &, std::size_t offset, Predicate const &)
    //   static std::size_t chunk_length(chunk_type const &)
    //   static chunk_type concat(chunk_type, chunk_type const &)
    //   static std::pair<chunk_type, chunk_type> split_at(chunk_type const &, std::size_t count)
    //
    // Input has to be constructible from chunk_type.
    template <class Input>
    struct source_traits;

    template <class Input>
    using element_of = typename source_traits<Input>::element_type;

    template <class Input>
    using chunk_of = typename source_traits<Input>::chunk_type;

    enum class more_data
    {
        may_arrive,
        no_more
    };
}
