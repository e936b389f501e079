#pragma once

#include <trickle/parser.hpp>
#include <silicium/optional.hpp>
#include <silicium/variant.hpp>
#include <boost/throw_exception.hpp>
#include <stdexcept>

namespace trickle
{
    // Runs `parsed` until it either reaches one of the handlers or waits for
    // the prompt callback. The native stack does not grow with the input.
    template <class Token, class T, class Fallibility>
    void run(parser<Token, T, Fallibility> const &parsed, prompt<Token> const &prompt_, input_state<Token> input,
             failure_handler<Token> on_failure, success_handler<Token, T> on_success)
    {
        bounce(parsed.run(prompt_, std::move(input), std::move(on_failure), std::move(on_success)));
    }

    // the outcome of a parse that has run to completion
    template <class Token, class T>
    using parse_outcome = Si::variant<success<Token, T>, failure<Token>>;

    namespace detail
    {
        template <class Token, class T>
        struct parse_session
        {
            typedef parse_outcome<Token, T> outcome_type;

            Si::optional<outcome_type> outcome;
            Si::optional<prompt_request<Token>> pending;
        };
    }

    // A parse that is waiting for another chunk. Answer it with feed() or
    // finish().
    template <class Token, class T>
    struct need_more_input
    {
        std::shared_ptr<detail::parse_session<Token, T>> session;

        input_state<Token> const &state() const
        {
            assert(session->pending);
            return session->pending->state();
        }
    };

    template <class Token, class T>
    using parse_result = Si::variant<success<Token, T>, failure<Token>, need_more_input<Token, T>>;

    namespace detail
    {
        template <class Token, class T>
        parse_result<Token, T> collect(std::shared_ptr<parse_session<Token, T>> session, step first)
        {
            bounce(std::move(first));
            if (session->outcome)
            {
                typename parse_session<Token, T>::outcome_type outcome = std::move(*session->outcome);
                session->outcome = Si::none;
                return Si::visit<parse_result<Token, T>>(outcome,
                                                         [](success<Token, T> &succeeded) -> parse_result<Token, T>
                                                         {
                                                             return std::move(succeeded);
                                                         },
                                                         [](failure<Token> &failed) -> parse_result<Token, T>
                                                         {
                                                             return std::move(failed);
                                                         });
            }
            if (session->pending)
            {
                return need_more_input<Token, T>{std::move(session)};
            }
            boost::throw_exception(
                std::logic_error("The prompt callback neither answered nor suspended; use run() for prompts that "
                                 "answer asynchronously"));
        }

        template <class Token, class T, class Fallibility>
        parse_result<Token, T> start(parser<Token, T, Fallibility> const &parsed, input_state<Token> input,
                                     prompt<Token> const &prompt_,
                                     std::shared_ptr<parse_session<Token, T>> session)
        {
            parse_session<Token, T> *const raw_session = session.get();
            step first = parsed.run(prompt_, std::move(input),
                                    failure_handler<Token>([raw_session](failure<Token> failed)
                                                           {
                                                               raw_session->outcome =
                                                                   typename parse_session<Token, T>::outcome_type(
                                                                       std::move(failed));
                                                               return finished();
                                                           }),
                                    success_handler<Token, T>([raw_session](input_state<Token> rest, T value)
                                                              {
                                                                  raw_session->outcome =
                                                                      typename parse_session<Token, T>::outcome_type(
                                                                          success<Token, T>{std::move(rest),
                                                                                            std::move(value)});
                                                                  return finished();
                                                              }));
            return collect(std::move(session), std::move(first));
        }
    }

    // Runs `parsed` on `input`. When `more` is incomplete and the parser needs
    // more than `input`, the result is need_more_input.
    template <class Token, class T, class Fallibility>
    parse_result<Token, T> run_parser(parser<Token, T, Fallibility> const &parsed, std::vector<Token> input,
                                      more_input const more)
    {
        auto session = std::make_shared<detail::parse_session<Token, T>>();
        detail::parse_session<Token, T> *const raw_session = session.get();
        prompt<Token> suspend([raw_session](prompt_request<Token> request)
                              {
                                  assert(!raw_session->pending);
                                  raw_session->pending = std::move(request);
                                  return finished();
                              });
        return detail::start(parsed, make_input_state(std::move(input), more), suspend, std::move(session));
    }

    // Runs `parsed` with a prompt callback that answers every request before
    // returning. The result is never need_more_input.
    template <class Token, class T, class Fallibility>
    parse_result<Token, T> run_parser(parser<Token, T, Fallibility> const &parsed, std::vector<Token> input,
                                      more_input const more, prompt<Token> const &prompt_)
    {
        return detail::start(parsed, make_input_state(std::move(input), more), prompt_,
                             std::make_shared<detail::parse_session<Token, T>>());
    }

    // Starts an incremental parse on the first chunk of a stream.
    template <class Token, class T, class Fallibility>
    parse_result<Token, T> parse(parser<Token, T, Fallibility> const &parsed, std::vector<Token> first_chunk)
    {
        return run_parser(parsed, std::move(first_chunk), more_input::incomplete);
    }

    // Supplies the next chunk to a result. An empty chunk declares the end of
    // the stream. A failure is returned unchanged; a success keeps the chunk
    // in its remaining input unless the stream has already ended.
    template <class Token, class T>
    parse_result<Token, T> feed(parse_result<Token, T> result, std::vector<Token> chunk)
    {
        return Si::visit<parse_result<Token, T>>(
            result,
            [&chunk](success<Token, T> &succeeded) -> parse_result<Token, T>
            {
                if (chunk.empty())
                {
                    succeeded.remaining.more = more_input::complete;
                }
                else if (succeeded.remaining.more == more_input::incomplete)
                {
                    succeeded.remaining.remaining = succeeded.remaining.remaining.append(std::move(chunk));
                }
                else
                {
                    boost::throw_exception(std::logic_error("Cannot feed input after the end of the stream"));
                }
                return std::move(succeeded);
            },
            [](failure<Token> &failed) -> parse_result<Token, T>
            {
                return std::move(failed);
            },
            [&chunk](need_more_input<Token, T> &waiting) -> parse_result<Token, T>
            {
                if (!waiting.session->pending)
                {
                    boost::throw_exception(std::logic_error("This parse has already been fed"));
                }
                prompt_request<Token> const request = std::move(*waiting.session->pending);
                waiting.session->pending = Si::none;
                step resumed = chunk.empty() ? request.end_of_stream() : request.supply(std::move(chunk));
                return detail::collect(waiting.session, std::move(resumed));
            });
    }

    template <class Token, class T>
    parse_result<Token, T> finish(parse_result<Token, T> result)
    {
        return feed(std::move(result), std::vector<Token>());
    }
}
