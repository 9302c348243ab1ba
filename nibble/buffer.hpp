#pragma once

#include <nibble/source.hpp>
#include <silicium/optional.hpp>
#include <cassert>
#include <memory>
#include <utility>

namespace nibble
{
    // The input accumulated during one parse.
    //
    // A buffer is a length snapshot over append-only storage that is shared
    // between snapshots. Appending never changes what an existing buffer
    // exposes, so a backtracking parser can always re-read from any offset
    // below its own size().
    template <class Input>
    struct buffer
    {
        typedef source_traits<Input> traits;
        typedef typename traits::element_type element_type;
        typedef typename traits::chunk_type chunk_type;

        explicit buffer(Input initial)
            : m_storage(std::make_shared<Input>(std::move(initial)))
            , m_length(traits::length(*m_storage))
        {
        }

        std::size_t size() const
        {
            return m_length;
        }

        bool at_end(std::size_t const offset) const
        {
            assert(offset <= m_length);
            return offset == m_length;
        }

        Si::optional<element_type> element_at(std::size_t const offset) const
        {
            if (offset >= m_length)
            {
                return Si::none;
            }
            return traits::element_at(*m_storage, offset);
        }

        bool is_empty_chunk(chunk_type const &chunk) const
        {
            return traits::is_empty_chunk(*m_storage, chunk);
        }

        buffer append(chunk_type const &chunk) const
        {
            if (traits::length(*m_storage) == m_length)
            {
                traits::append(*m_storage, chunk);
                return buffer(m_storage, traits::length(*m_storage));
            }
            // Someone else already appended behind this snapshot.
            auto diverged = std::make_shared<Input>(traits::subrange(*m_storage, 0, m_length));
            traits::append(*diverged, chunk);
            std::size_t const length = traits::length(*diverged);
            return buffer(std::move(diverged), length);
        }

        chunk_type subrange(std::size_t const offset, std::size_t const count) const
        {
            assert(offset <= m_length);
            assert(count <= (m_length - offset));
            return traits::subrange(*m_storage, offset, count);
        }

        chunk_type rest(std::size_t const offset) const
        {
            return subrange(offset, m_length - offset);
        }

        template <class Predicate>
        std::pair<chunk_type, std::size_t> span_prefix(std::size_t const offset, Predicate const &predicate) const
        {
            assert(offset <= m_length);
            std::pair<chunk_type, std::size_t> matched = traits::span_prefix(*m_storage, offset, predicate);
            if (matched.second > m_length)
            {
                matched.first = traits::subrange(*m_storage, offset, m_length - offset);
                matched.second = m_length;
            }
            return matched;
        }

    private:
        std::shared_ptr<Input> m_storage;
        std::size_t m_length;

        buffer(std::shared_ptr<Input> storage, std::size_t const length)
            : m_storage(std::move(storage))
            , m_length(length)
        {
        }
    };
}
