#pragma once

#include <trickle/primitives.hpp>

namespace trickle
{
    // Succeeds only when the stream is finally exhausted and consumes nothing
    // either way. With nothing buffered on an incomplete stream the answer
    // depends on whether another chunk arrives, so demand_input() is used as a
    // probe with its outcome inverted. A chunk pulled by the probe stays
    // visible to whatever runs next.
    template <class Token>
    parser<Token, Si::unit> end_of_input()
    {
        return parser<Token, Si::unit>(
            [](prompt<Token> const &prompt_, input_state<Token> input, failure_handler<Token> on_failure,
               success_handler<Token, Si::unit> on_success)
            {
                if (!input.remaining.empty())
                {
                    return detail::fail_later(on_failure, std::move(input), context_stack(), "end-of-input");
                }
                if (input.more == more_input::complete)
                {
                    return detail::succeed_later(on_success, std::move(input), Si::unit());
                }
                input_state<Token> const before = input;
                return demand_input<Token>().run(
                    prompt_, std::move(input), failure_handler<Token>([before, on_success](failure<Token> probed)
                                                                      {
                                                                          return detail::succeed_later(
                                                                              on_success,
                                                                              add_stream(before, probed.remaining),
                                                                              Si::unit());
                                                                      }),
                    success_handler<Token, Si::unit>([before, on_failure](input_state<Token> probed, Si::unit)
                                                     {
                                                         return detail::fail_later(on_failure,
                                                                                   add_stream(before, probed),
                                                                                   context_stack(), "end-of-input");
                                                     }));
            });
    }

    // true iff no more input is known to exist; never fails
    template <class Token>
    parser<Token, bool, never_fails> at_end()
    {
        return map(want_input<Token>(), [](bool const available)
                   {
                       return !available;
                   });
    }
}
