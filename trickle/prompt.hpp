#pragma once

#include <trickle/outcome.hpp>
#include <boost/throw_exception.hpp>
#include <stdexcept>

namespace trickle
{
    // Handed to the prompt callback when a parser needs more input than is
    // buffered. Exactly one of supply() and end_of_stream() has to be called,
    // exactly once, either before the callback returns or at any later time.
    // Copies share the answered state. Answering releases the state.
    template <class Token>
    struct prompt_request
    {
        typedef std::function<step()> end_of_stream_function;
        typedef std::function<step(std::vector<Token>, more_input)> supply_function;

        prompt_request(input_state<Token> state, end_of_stream_function end_of_stream, supply_function supply)
            : m_continuations(
                  std::make_shared<continuations>(std::move(state), std::move(end_of_stream), std::move(supply)))
        {
        }

        // the input as of the request, empty once the request is answered
        input_state<Token> const &state() const
        {
            return m_continuations->state;
        }

        bool answered() const
        {
            return m_continuations->answered;
        }

        // Appends a non-empty chunk to the input. Passing more_input::complete
        // declares it the last chunk of the stream.
        step supply(std::vector<Token> chunk, more_input const more = more_input::incomplete) const
        {
            if (chunk.empty())
            {
                if (more == more_input::complete)
                {
                    return end_of_stream();
                }
                boost::throw_exception(std::invalid_argument("A supplied chunk must contain at least one token"));
            }
            mark_answered();
            supply_function supply_ = std::move(m_continuations->supply);
            m_continuations->end_of_stream = nullptr;
            return supply_(std::move(chunk), more);
        }

        step end_of_stream() const
        {
            mark_answered();
            end_of_stream_function end_of_stream_ = std::move(m_continuations->end_of_stream);
            m_continuations->supply = nullptr;
            return end_of_stream_();
        }

    private:
        struct continuations
        {
            input_state<Token> state;
            end_of_stream_function end_of_stream;
            supply_function supply;
            bool answered;

            continuations(input_state<Token> state, end_of_stream_function end_of_stream, supply_function supply)
                : state(std::move(state))
                , end_of_stream(std::move(end_of_stream))
                , supply(std::move(supply))
                , answered(false)
            {
            }
        };

        std::shared_ptr<continuations> m_continuations;

        void mark_answered() const
        {
            if (m_continuations->answered)
            {
                boost::throw_exception(std::logic_error("A prompt request can be answered only once"));
            }
            m_continuations->answered = true;
            m_continuations->state.remaining = token_buffer<Token>();
        }
    };

    // The caller-supplied source of additional input. A default-constructed
    // prompt answers every request with end_of_stream().
    template <class Token>
    struct prompt
    {
        typedef std::function<step(prompt_request<Token>)> function_type;

        prompt()
        {
        }

        template <class Function, class = typename std::enable_if<
                                      !std::is_same<typename std::decay<Function>::type, prompt>::value>::type>
        explicit prompt(Function &&callback)
            : m_callback(std::make_shared<function_type>(std::forward<Function>(callback)))
        {
        }

        step operator()(prompt_request<Token> request) const
        {
            if (!m_callback)
            {
                return request.end_of_stream();
            }
            return (*m_callback)(std::move(request));
        }

    private:
        std::shared_ptr<function_type const> m_callback;
    };
}
