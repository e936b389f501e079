#pragma once

#include <trickle/token.hpp>

// The scanning parsers keep going across chunk boundaries: whenever a match
// runs up to the end of the buffered input they ask want_input() whether the
// run continues in a chunk that has not arrived yet.
//
// skip_while, take_while, take_till and take_rest never fail. Their type says
// so, which keeps them out of many() and friends.

namespace trickle
{
    template <class Token, class Predicate>
    parser<Token, Si::unit, never_fails> skip_while(Predicate matches)
    {
        typedef parser<Token, Si::unit, never_fails> result_parser;
        return bind(get<Token>(), [matches](token_buffer<Token> const &input) -> result_parser
                    {
                        token_buffer<Token> const rest = input.span(matches).second;
                        return bind(put<Token>(rest), [matches, rest](Si::unit) -> result_parser
                                    {
                                        if (!rest.empty())
                                        {
                                            return always<Token>(Si::unit());
                                        }
                                        return bind(want_input<Token>(),
                                                    [matches](bool const available) -> result_parser
                                                    {
                                                        if (available)
                                                        {
                                                            return skip_while<Token>(matches);
                                                        }
                                                        return always<Token>(Si::unit());
                                                    });
                                    });
                    });
    }

    namespace detail
    {
        template <class Token>
        using fragment_list = persistent_list<token_buffer<Token>>;

        template <class Token, class Predicate>
        parser<Token, fragment_list<Token>, never_fails> take_while_loop(Predicate matches,
                                                                         fragment_list<Token> fragments)
        {
            typedef parser<Token, fragment_list<Token>, never_fails> loop_parser;
            return bind(get<Token>(), [matches, fragments](token_buffer<Token> const &input) -> loop_parser
                        {
                            std::pair<token_buffer<Token>, token_buffer<Token>> const split = input.span(matches);
                            fragment_list<Token> const collected =
                                split.first.empty() ? fragments : fragments.push_front(split.first);
                            token_buffer<Token> const rest = split.second;
                            return bind(put<Token>(rest), [matches, collected, rest](Si::unit) -> loop_parser
                                        {
                                            if (!rest.empty())
                                            {
                                                return always<Token>(collected);
                                            }
                                            return bind(want_input<Token>(),
                                                        [matches, collected](bool const available) -> loop_parser
                                                        {
                                                            if (available)
                                                            {
                                                                return take_while_loop<Token>(matches, collected);
                                                            }
                                                            return always<Token>(collected);
                                                        });
                                        });
                        });
        }

        template <class Token>
        std::vector<Token> concatenate(fragment_list<Token> const &fragments)
        {
            std::vector<token_buffer<Token>> const ordered = fragments.oldest_first();
            std::size_t total = 0;
            for (token_buffer<Token> const &fragment : ordered)
            {
                total += fragment.size();
            }
            std::vector<Token> result;
            result.reserve(total);
            for (token_buffer<Token> const &fragment : ordered)
            {
                result.insert(result.end(), fragment.begin(), fragment.end());
            }
            return result;
        }
    }

    // Matches as long as `matches` holds and returns the consumed tokens,
    // possibly none.
    //
    // Never fails, so do not repeat it with many(); the type system refuses.
    template <class Token, class Predicate>
    parser<Token, std::vector<Token>, never_fails> take_while(Predicate matches)
    {
        return map(detail::take_while_loop<Token>(std::move(matches), detail::fragment_list<Token>()),
                   [](detail::fragment_list<Token> const &fragments)
                   {
                       return detail::concatenate<Token>(fragments);
                   });
    }

    // Matches until `matches` holds for the first time.
    template <class Token, class Predicate>
    parser<Token, std::vector<Token>, never_fails> take_till(Predicate matches)
    {
        return take_while<Token>([matches](Token const &item)
                                 {
                                     return !matches(item);
                                 });
    }

    // Like take_while, but at least one token has to match.
    template <class Token, class Predicate>
    parser<Token, std::vector<Token>> take_while1(Predicate matches)
    {
        typedef parser<Token, std::vector<Token>> result_parser;
        parser<Token, token_buffer<Token>> const non_empty_input =
            bind(get<Token>(), [](token_buffer<Token> const &buffered) -> parser<Token, token_buffer<Token>>
                 {
                     if (buffered.empty())
                     {
                         return then(demand_input<Token>(), get<Token>());
                     }
                     return always<Token>(buffered);
                 });
        return bind(non_empty_input, [matches](token_buffer<Token> const &input) -> result_parser
                    {
                        std::pair<token_buffer<Token>, token_buffer<Token>> const split = input.span(matches);
                        if (split.first.empty())
                        {
                            return fail_with<Token, std::vector<Token>>("take-while1");
                        }
                        std::vector<Token> prefix = split.first.to_vector();
                        if (!split.second.empty())
                        {
                            return then(put<Token>(split.second), always<Token>(std::move(prefix)));
                        }
                        return then(put<Token>(split.second),
                                    map(take_while<Token>(matches), [prefix](std::vector<Token> const &continued)
                                        {
                                            std::vector<Token> result = prefix;
                                            result.insert(result.end(), continued.begin(), continued.end());
                                            return result;
                                        }));
                    });
    }

    namespace detail
    {
        template <class Token>
        parser<Token, fragment_list<Token>, never_fails> take_rest_loop(fragment_list<Token> chunks)
        {
            typedef parser<Token, fragment_list<Token>, never_fails> loop_parser;
            return bind(want_input<Token>(), [chunks](bool const available) -> loop_parser
                        {
                            if (!available)
                            {
                                return always<Token>(chunks);
                            }
                            return bind(get<Token>(), [chunks](token_buffer<Token> const &input) -> loop_parser
                                        {
                                            return then(put<Token>(input.drop(input.size())),
                                                        take_rest_loop<Token>(chunks.push_front(input)));
                                        });
                        });
        }
    }

    // Drains the input including every chunk that is still going to arrive.
    // Each element of the result is what was buffered at one step of the
    // loop, in delivery order; their concatenation is the whole rest.
    template <class Token>
    parser<Token, std::vector<std::vector<Token>>, never_fails> take_rest()
    {
        return map(detail::take_rest_loop<Token>(detail::fragment_list<Token>()),
                   [](detail::fragment_list<Token> const &chunks)
                   {
                       std::vector<std::vector<Token>> result;
                       for (token_buffer<Token> const &chunk : chunks.oldest_first())
                       {
                           result.emplace_back(chunk.to_vector());
                       }
                       return result;
                   });
    }
}
