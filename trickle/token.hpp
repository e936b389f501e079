#pragma once

#include <trickle/primitives.hpp>
#include <string>

namespace trickle
{
    template <class Token, class Predicate>
    parser<Token, Token> satisfy(Predicate matches)
    {
        return bind(ensure<Token>(1), [matches](token_buffer<Token> const &input) -> parser<Token, Token>
                    {
                        Token const item = input.front();
                        if (matches(item))
                        {
                            return then(put<Token>(input.drop(1)), always<Token>(item));
                        }
                        return fail_with<Token, Token>("satisfy?");
                    });
    }

    template <class Token, class Predicate>
    parser<Token, Si::unit> skip(Predicate matches)
    {
        return bind(ensure<Token>(1), [matches](token_buffer<Token> const &input) -> parser<Token, Si::unit>
                    {
                        if (matches(input.front()))
                        {
                            return put<Token>(input.drop(1));
                        }
                        return fail_with<Token, Si::unit>("skip");
                    });
    }

    // Matches `count` tokens if `matches` accepts them as a whole. The
    // predicate receives a token_buffer<Token>. Nothing is consumed on failure.
    template <class Token, class Predicate>
    parser<Token, std::vector<Token>> take_with(std::size_t const count, Predicate matches)
    {
        return bind(ensure<Token>(count), [count, matches](token_buffer<Token> const &input)
                                              -> parser<Token, std::vector<Token>>
                    {
                        token_buffer<Token> const head = input.take(count);
                        if (matches(head))
                        {
                            return then(put<Token>(input.drop(count)), always<Token>(head.to_vector()));
                        }
                        return fail_with<Token, std::vector<Token>>("take-with");
                    });
    }

    template <class Token>
    parser<Token, std::vector<Token>> take(std::size_t const count)
    {
        return take_with<Token>(count, [](token_buffer<Token> const &)
                                {
                                    return true;
                                });
    }

    // Consumes nothing unless the whole of `expected` matches, even if the
    // input ends in the middle of a partial match.
    template <class CharT>
    parser<CharT, std::basic_string<CharT>> string(std::basic_string<CharT> expected)
    {
        std::size_t const length = expected.size();
        return map(take_with<CharT>(length,
                                    [expected](token_buffer<CharT> const &head)
                                    {
                                        return std::equal(head.begin(), head.end(), expected.begin(), expected.end());
                                    }),
                   [](std::vector<CharT> const &matched)
                   {
                       return std::basic_string<CharT>(matched.begin(), matched.end());
                   });
    }

    template <class CharT>
    parser<CharT, std::basic_string<CharT>> string(CharT const *expected)
    {
        return string(std::basic_string<CharT>(expected));
    }
}
