#pragma once

#include <trickle/combinators.hpp>

namespace trickle
{
    template <class Token>
    parser<Token, token_buffer<Token>, never_fails> get()
    {
        return parser<Token, token_buffer<Token>, never_fails>(
            [](prompt<Token> const &, input_state<Token> input, failure_handler<Token>,
               success_handler<Token, token_buffer<Token>> on_success)
            {
                token_buffer<Token> const remaining = input.remaining;
                return detail::succeed_later(on_success, std::move(input), remaining);
            });
    }

    // Whatever was remaining before is discarded.
    template <class Token>
    parser<Token, Si::unit, never_fails> put(token_buffer<Token> remaining)
    {
        return parser<Token, Si::unit, never_fails>(
            [remaining](prompt<Token> const &, input_state<Token> input, failure_handler<Token>,
                        success_handler<Token, Si::unit> on_success)
            {
                return detail::succeed_later(on_success, input_state<Token>{remaining, input.more}, Si::unit());
            });
    }

    namespace detail
    {
        template <class Token>
        step not_enough_input(failure_handler<Token> const &on_failure, input_state<Token> remaining)
        {
            return fail_later(on_failure, std::move(remaining), context_stack{"demand-input"}, "not enough input");
        }
    }

    // Asks the prompt callback for another chunk. Fails when the stream is or
    // becomes complete.
    template <class Token>
    parser<Token, Si::unit> demand_input()
    {
        return parser<Token, Si::unit>([](prompt<Token> const &prompt_, input_state<Token> input,
                                          failure_handler<Token> on_failure,
                                          success_handler<Token, Si::unit> on_success)
                                       {
                                           if (input.more == more_input::complete)
                                           {
                                               return detail::not_enough_input(on_failure, std::move(input));
                                           }
                                           token_buffer<Token> remaining = input.remaining;
                                           return prompt_(prompt_request<Token>(
                                               std::move(input),
                                               [remaining, on_failure]()
                                               {
                                                   return detail::not_enough_input(
                                                       on_failure, input_state<Token>{remaining, more_input::complete});
                                               },
                                               [remaining, on_success](std::vector<Token> chunk,
                                                                       more_input const more) mutable
                                               {
                                                   token_buffer<Token> const grown = std::move(remaining);
                                                   return detail::succeed_later(
                                                       on_success,
                                                       input_state<Token>{grown.append(std::move(chunk)), more},
                                                       Si::unit());
                                               }));
                                       });
    }

    // Tells whether any input is available now or on demand, without
    // consuming anything.
    template <class Token>
    parser<Token, bool, never_fails> want_input()
    {
        return parser<Token, bool, never_fails>(
            [](prompt<Token> const &prompt_, input_state<Token> input, failure_handler<Token>,
               success_handler<Token, bool> on_success)
            {
                if (!input.remaining.empty())
                {
                    return detail::succeed_later(on_success, std::move(input), true);
                }
                if (input.more == more_input::complete)
                {
                    return detail::succeed_later(on_success, std::move(input), false);
                }
                token_buffer<Token> remaining = input.remaining;
                return prompt_(prompt_request<Token>(
                    std::move(input),
                    [remaining, on_success]()
                    {
                        return detail::succeed_later(on_success, input_state<Token>{remaining, more_input::complete},
                                                     false);
                    },
                    [remaining, on_success](std::vector<Token> chunk, more_input const more) mutable
                    {
                        token_buffer<Token> const grown = std::move(remaining);
                        return detail::succeed_later(
                            on_success, input_state<Token>{grown.append(std::move(chunk)), more}, true);
                    }));
            });
    }

    // Succeeds with the remaining input once at least `count` tokens are
    // buffered, demanding more input as often as necessary.
    template <class Token>
    parser<Token, token_buffer<Token>> ensure(std::size_t const count)
    {
        return parser<Token, token_buffer<Token>>(
            [count](prompt<Token> const &prompt_, input_state<Token> input, failure_handler<Token> on_failure,
                    success_handler<Token, token_buffer<Token>> on_success)
            {
                if (input.remaining.size() >= count)
                {
                    token_buffer<Token> const remaining = input.remaining;
                    return detail::succeed_later(on_success, std::move(input), remaining);
                }
                return then(demand_input<Token>(), ensure<Token>(count))
                    .run(prompt_, std::move(input), on_failure, on_success);
            });
    }
}
