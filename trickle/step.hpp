#pragma once

#include <silicium/exchange.hpp>
#include <functional>

namespace trickle
{
    // One bounce of the trampoline. An empty `resume` means there is nothing
    // left to run: either a top-level handler has been reached or the
    // computation is waiting for a prompt callback to answer.
    struct step
    {
        std::function<step()> resume;
    };

    inline step finished()
    {
        return step();
    }

    template <class Thunk>
    step defer(Thunk &&thunk)
    {
        step result;
        result.resume = std::forward<Thunk>(thunk);
        return result;
    }

    inline void bounce(step current)
    {
        while (current.resume)
        {
            current = Si::exchange(current.resume, nullptr)();
        }
    }
}
