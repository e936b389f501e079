#pragma once

#include <algorithm>
#include <cassert>
#include <cstdint>
#include <memory>
#include <utility>
#include <vector>

namespace trickle
{
    namespace detail
    {
        template <class Token>
        struct arena
        {
            // absolute stream position of tokens[0]
            std::uint64_t origin;
            std::vector<Token> tokens;
        };
    }

    // An immutable view of a range of input tokens. Views share an append-only
    // arena: appending to a view that ends where the arena ends grows the arena
    // in place, which no other view can observe because every view remembers
    // its own end. Appending anywhere else copies, and so does appending to
    // the only view of an arena that is mostly dropped tokens.
    //
    // Every token has an absolute stream position that is stable across
    // copies. Pointers returned by begin() and end() are invalidated by the
    // next append to the shared arena.
    template <class Token>
    struct token_buffer
    {
        typedef Token value_type;
        typedef Token const *const_iterator;
        typedef const_iterator iterator;

        token_buffer()
            : m_begin(0)
            , m_end(0)
        {
        }

        explicit token_buffer(std::vector<Token> tokens, std::uint64_t origin = 0)
            : m_arena(std::make_shared<detail::arena<Token>>(detail::arena<Token>{origin, std::move(tokens)}))
            , m_begin(0)
            , m_end(m_arena->tokens.size())
        {
        }

        std::size_t size() const
        {
            return m_end - m_begin;
        }

        bool empty() const
        {
            return m_begin == m_end;
        }

        const_iterator begin() const
        {
            return m_arena ? (m_arena->tokens.data() + m_begin) : nullptr;
        }

        const_iterator end() const
        {
            return m_arena ? (m_arena->tokens.data() + m_end) : nullptr;
        }

        Token const &front() const
        {
            assert(!empty());
            return m_arena->tokens[m_begin];
        }

        Token const &operator[](std::size_t const index) const
        {
            assert(index < size());
            return m_arena->tokens[m_begin + index];
        }

        std::uint64_t position() const
        {
            return m_arena ? (m_arena->origin + m_begin) : 0;
        }

        std::uint64_t end_position() const
        {
            return m_arena ? (m_arena->origin + m_end) : 0;
        }

        token_buffer take(std::size_t const count) const
        {
            return token_buffer(m_arena, m_begin, m_begin + (std::min)(count, size()));
        }

        token_buffer drop(std::size_t const count) const
        {
            return token_buffer(m_arena, m_begin + (std::min)(count, size()), m_end);
        }

        template <class Predicate>
        std::pair<token_buffer, token_buffer> span(Predicate &&matches) const
        {
            std::size_t const matching = static_cast<std::size_t>(std::find_if_not(begin(), end(), matches) - begin());
            return std::make_pair(take(matching), drop(matching));
        }

        token_buffer append(std::vector<Token> chunk) const
        {
            if (chunk.empty())
            {
                return *this;
            }
            if (!m_arena)
            {
                return token_buffer(std::move(chunk), 0);
            }
            // A sole owner that has dropped at least as much as it still holds
            // moves to a fresh arena, so the dropped prefix is released once
            // this view goes away.
            bool const compact = (m_arena.use_count() == 1) && (m_begin > 0) && (m_begin >= size());
            if ((m_end == m_arena->tokens.size()) && !compact)
            {
                m_arena->tokens.insert(m_arena->tokens.end(), std::make_move_iterator(chunk.begin()),
                                       std::make_move_iterator(chunk.end()));
                return token_buffer(m_arena, m_begin, m_arena->tokens.size());
            }
            std::vector<Token> copied;
            copied.reserve(size() + chunk.size());
            copied.assign(begin(), end());
            copied.insert(copied.end(), std::make_move_iterator(chunk.begin()), std::make_move_iterator(chunk.end()));
            return token_buffer(std::move(copied), position());
        }

        // The tokens of this view's arena from the absolute position `since` up
        // to the end of this view, including tokens this view has already
        // dropped as long as the arena still holds them.
        token_buffer stream_since(std::uint64_t const since) const
        {
            if (!m_arena)
            {
                return *this;
            }
            std::size_t const first = (since <= m_arena->origin)
                                          ? 0
                                          : static_cast<std::size_t>((std::min)(
                                                since - m_arena->origin, static_cast<std::uint64_t>(m_end)));
            return token_buffer(m_arena, first, m_end);
        }

        // `added` must begin at the absolute position where this view ends
        token_buffer extended_with(token_buffer const &added) const
        {
            if (added.empty())
            {
                return *this;
            }
            if (m_arena && (m_arena == added.m_arena) && (m_end == added.m_begin))
            {
                return token_buffer(m_arena, m_begin, added.m_end);
            }
            return append(added.to_vector());
        }

        std::vector<Token> to_vector() const
        {
            return std::vector<Token>(begin(), end());
        }

    private:
        std::shared_ptr<detail::arena<Token>> m_arena;
        std::size_t m_begin;
        std::size_t m_end;

        token_buffer(std::shared_ptr<detail::arena<Token>> arena, std::size_t begin, std::size_t end)
            : m_arena(std::move(arena))
            , m_begin(begin)
            , m_end(end)
        {
        }
    };

    template <class Token>
    bool operator==(token_buffer<Token> const &left, token_buffer<Token> const &right)
    {
        return std::equal(left.begin(), left.end(), right.begin(), right.end());
    }

    template <class Token>
    bool operator!=(token_buffer<Token> const &left, token_buffer<Token> const &right)
    {
        return !(left == right);
    }
}
