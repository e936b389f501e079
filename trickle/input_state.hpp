#pragma once

#include <trickle/token_buffer.hpp>
#include <silicium/config.hpp>
#include <ostream>

namespace trickle
{
    enum class more_input
    {
        complete,
        incomplete
    };

    // complete wins: a stream that has been declared finished never reopens
    inline more_input combine(more_input const first, more_input const second)
    {
        return ((first == more_input::complete) || (second == more_input::complete)) ? more_input::complete
                                                                                    : more_input::incomplete;
    }

    inline std::ostream &operator<<(std::ostream &out, more_input const more)
    {
        switch (more)
        {
        case more_input::complete:
            return out << "complete";
        case more_input::incomplete:
            return out << "incomplete";
        }
        SILICIUM_UNREACHABLE();
    }

    template <class Token>
    struct input_state
    {
        token_buffer<Token> remaining;
        more_input more;
    };

    template <class Token>
    input_state<Token> make_input_state(std::vector<Token> input, more_input const more)
    {
        return input_state<Token>{token_buffer<Token>(std::move(input)), more};
    }

    // The state `before` followed by every token that was delivered while the
    // computation went from `before` to `after`. Used to continue from an
    // earlier snapshot without losing chunks that were pulled in the meantime.
    template <class Token>
    input_state<Token> add_stream(input_state<Token> const &before, input_state<Token> const &after)
    {
        return input_state<Token>{
            before.remaining.extended_with(after.remaining.stream_since(before.remaining.end_position())),
            combine(before.more, after.more)};
    }
}
