#pragma once

#include <trickle/prompt.hpp>

namespace trickle
{
    // Fallibility is a compile-time capability. A never_fails parser always
    // reaches its success handler, so repeating it until it fails would never
    // terminate; the repetition combinators only accept may_fail parsers.
    struct may_fail
    {
    };

    struct never_fails
    {
    };

    template <class First, class Second>
    struct sequenced_fallibility
    {
        typedef may_fail type;
    };

    template <>
    struct sequenced_fallibility<never_fails, never_fails>
    {
        typedef never_fails type;
    };

    template <class Token, class T, class Fallibility = may_fail>
    struct parser
    {
        typedef Token token_type;
        typedef T result_type;
        typedef Fallibility fallibility;
        typedef std::function<step(prompt<Token> const &, input_state<Token>, failure_handler<Token>,
                                   success_handler<Token, T>)>
            function_type;

        explicit parser(function_type run)
            : m_run(std::make_shared<function_type>(std::move(run)))
        {
        }

        // a parser that never fails can be used wherever failure is allowed
        template <class Other, class = typename std::enable_if<std::is_same<Fallibility, may_fail>::value &&
                                                               std::is_same<Other, never_fails>::value>::type>
        parser(parser<Token, T, Other> const &infallible)
            : m_run(infallible.m_run)
        {
        }

        step run(prompt<Token> const &prompt_, input_state<Token> input, failure_handler<Token> on_failure,
                 success_handler<Token, T> on_success) const
        {
            return (*m_run)(prompt_, std::move(input), std::move(on_failure), std::move(on_success));
        }

    private:
        template <class, class, class>
        friend struct parser;

        std::shared_ptr<function_type const> m_run;
    };

    template <class Parser>
    struct is_repeatable : std::is_same<typename Parser::fallibility, may_fail>
    {
    };
}
