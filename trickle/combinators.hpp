#pragma once

#include <trickle/parser.hpp>
#include <trickle/persistent_list.hpp>
#include <silicium/variant.hpp>

namespace trickle
{
    template <class Token, class T>
    parser<Token, typename std::decay<T>::type, never_fails> always(T &&value)
    {
        typedef typename std::decay<T>::type result_type;
        return parser<Token, result_type, never_fails>(
            [value = std::forward<T>(value)](prompt<Token> const &, input_state<Token> input, failure_handler<Token>,
                                             success_handler<Token, result_type> on_success)
            {
                return detail::succeed_later(on_success, std::move(input), value);
            });
    }

    template <class Token, class T>
    parser<Token, T> fail_with(std::string message)
    {
        return parser<Token, T>([message](prompt<Token> const &, input_state<Token> input,
                                          failure_handler<Token> on_failure, success_handler<Token, T>)
                                {
                                    return detail::fail_later(on_failure, std::move(input), context_stack(), message);
                                });
    }

    // Runs `first` and passes its result to `continue_with`, which returns the
    // parser to run next.
    template <class Token, class A, class FirstFallibility, class ContinueWith>
    auto bind(parser<Token, A, FirstFallibility> const &first, ContinueWith &&continue_with)
    {
        typedef typename std::decay<decltype(continue_with(std::declval<A>()))>::type second_parser;
        typedef typename second_parser::result_type result_type;
        typedef typename sequenced_fallibility<FirstFallibility, typename second_parser::fallibility>::type fallibility;
        return parser<Token, result_type, fallibility>(
            [ first, continue_with = std::forward<ContinueWith>(continue_with) ](
                prompt<Token> const &prompt_, input_state<Token> input, failure_handler<Token> on_failure,
                success_handler<Token, result_type> on_success)
            {
                return first.run(prompt_, std::move(input), on_failure,
                                 success_handler<Token, A>(
                                     [prompt_, continue_with, on_failure, on_success](input_state<Token> rest, A value)
                                     {
                                         second_parser const second = continue_with(std::move(value));
                                         return second.run(prompt_, std::move(rest), on_failure, on_success);
                                     }));
            });
    }

    template <class Token, class A, class FirstFallibility, class B, class SecondFallibility>
    parser<Token, B, typename sequenced_fallibility<FirstFallibility, SecondFallibility>::type>
    then(parser<Token, A, FirstFallibility> const &first, parser<Token, B, SecondFallibility> const &second)
    {
        return bind(first, [second](A const &)
                    {
                        return second;
                    });
    }

    // runs both and keeps the result of the first
    template <class Token, class A, class FirstFallibility, class B, class SecondFallibility>
    parser<Token, A, typename sequenced_fallibility<FirstFallibility, SecondFallibility>::type>
    skip_right(parser<Token, A, FirstFallibility> const &first, parser<Token, B, SecondFallibility> const &second)
    {
        return bind(first, [second](A value)
                    {
                        return bind(second, [value](B const &)
                                    {
                                        return always<Token>(value);
                                    });
                    });
    }

    template <class Token, class A, class Fallibility, class Transformation>
    auto map(parser<Token, A, Fallibility> const &original, Transformation &&transform)
    {
        typedef typename std::decay<decltype(transform(std::declval<A>()))>::type result_type;
        return parser<Token, result_type, Fallibility>(
            [ original, transform = std::forward<Transformation>(transform) ](
                prompt<Token> const &prompt_, input_state<Token> input, failure_handler<Token> on_failure,
                success_handler<Token, result_type> on_success)
            {
                return original.run(prompt_, std::move(input), on_failure,
                                    success_handler<Token, A>([transform, on_success](input_state<Token> rest, A value)
                                                              {
                                                                  return detail::succeed_later(
                                                                      on_success, std::move(rest),
                                                                      result_type(transform(std::move(value))));
                                                              }));
            });
    }

    // Tries `first`; if it fails, runs `second` from the state before `first`
    // plus whatever input `first` pulled in. A failure after `first` succeeded
    // does not come back here.
    template <class Token, class T, class FirstFallibility, class SecondFallibility>
    parser<Token, T, SecondFallibility> alternative(parser<Token, T, FirstFallibility> const &first,
                                                    parser<Token, T, SecondFallibility> const &second)
    {
        return parser<Token, T, SecondFallibility>(
            [first, second](prompt<Token> const &prompt_, input_state<Token> input, failure_handler<Token> on_failure,
                            success_handler<Token, T> on_success)
            {
                input_state<Token> const before = input;
                return first.run(prompt_, std::move(input),
                                 failure_handler<Token>(
                                     [prompt_, second, before, on_failure, on_success](failure<Token> failed)
                                     {
                                         return defer([prompt_, second, on_failure, on_success,
                                                       rest = add_stream(before, failed.remaining) ]()
                                                      {
                                                          return second.run(prompt_, rest, on_failure, on_success);
                                                      });
                                     }),
                                 on_success);
            });
    }

    // Adds `name` to the context of every failure that leaves `original`.
    template <class Token, class T, class Fallibility>
    parser<Token, T, Fallibility> label(parser<Token, T, Fallibility> const &original, std::string name)
    {
        return parser<Token, T, Fallibility>(
            [original, name](prompt<Token> const &prompt_, input_state<Token> input, failure_handler<Token> on_failure,
                             success_handler<Token, T> on_success)
            {
                return original.run(prompt_, std::move(input), failure_handler<Token>([name, on_failure](
                                                                   failure<Token> failed)
                                                               {
                                                                   failed.context.push_back(name);
                                                                   return detail::fail_later(
                                                                       on_failure, std::move(failed.remaining),
                                                                       std::move(failed.context),
                                                                       std::move(failed.message));
                                                               }),
                                    on_success);
            });
    }

    // Builds the parser on every run. Needed for recursive grammars.
    template <class Token, class T, class Fallibility = may_fail, class Make>
    parser<Token, T, Fallibility> lazy(Make make)
    {
        return parser<Token, T, Fallibility>([make](prompt<Token> const &prompt_, input_state<Token> input,
                                                    failure_handler<Token> on_failure,
                                                    success_handler<Token, T> on_success)
                                             {
                                                 return make().run(prompt_, std::move(input), on_failure, on_success);
                                             });
    }

    template <class Token, class T, class Fallibility>
    parser<Token, T, never_fails> option(parser<Token, T, Fallibility> const &original, T fallback)
    {
        return alternative(original, always<Token>(std::move(fallback)));
    }

    namespace detail
    {
        template <class Token, class T>
        step many_iteration(parser<Token, T> const &element, prompt<Token> const &prompt_, input_state<Token> input,
                            persistent_list<T> found, success_handler<Token, std::vector<T>> const &on_success)
        {
            input_state<Token> const before = input;
            return element.run(
                prompt_, std::move(input), failure_handler<Token>([before, found, on_success](failure<Token> failed)
                                                                  {
                                                                      return detail::succeed_later(
                                                                          on_success,
                                                                          add_stream(before, failed.remaining),
                                                                          found.oldest_first());
                                                                  }),
                success_handler<Token, T>([element, prompt_, found, on_success](input_state<Token> rest, T value)
                                          {
                                              return defer([ element, prompt_, on_success, rest = std::move(rest),
                                                             found = found.push_front(std::move(value)) ]()
                                                           {
                                                               return many_iteration(element, prompt_, rest, found,
                                                                                     on_success);
                                                           });
                                          }));
        }

        template <class Token, class T>
        step skip_many_iteration(parser<Token, T> const &element, prompt<Token> const &prompt_,
                                 input_state<Token> input, success_handler<Token, Si::unit> const &on_success)
        {
            input_state<Token> const before = input;
            return element.run(prompt_, std::move(input),
                               failure_handler<Token>([before, on_success](failure<Token> failed)
                                                      {
                                                          return detail::succeed_later(
                                                              on_success, add_stream(before, failed.remaining),
                                                              Si::unit());
                                                      }),
                               success_handler<Token, T>([element, prompt_, on_success](input_state<Token> rest, T)
                                                         {
                                                             return defer([element, prompt_, on_success, rest]()
                                                                          {
                                                                              return skip_many_iteration(
                                                                                  element, prompt_, rest, on_success);
                                                                          });
                                                         }));
        }
    }

    // Zero or more repetitions. Never fails itself, so the result cannot be
    // repeated again.
    template <class Token, class T, class Fallibility>
    parser<Token, std::vector<T>, never_fails> many(parser<Token, T, Fallibility> const &element)
    {
        static_assert(is_repeatable<parser<Token, T, Fallibility>>::value,
                      "many() would never terminate for a parser that cannot fail");
        return parser<Token, std::vector<T>, never_fails>(
            [element](prompt<Token> const &prompt_, input_state<Token> input, failure_handler<Token>,
                      success_handler<Token, std::vector<T>> on_success)
            {
                return detail::many_iteration(element, prompt_, std::move(input), persistent_list<T>(), on_success);
            });
    }

    template <class Token, class T, class Fallibility>
    parser<Token, std::vector<T>> many1(parser<Token, T, Fallibility> const &element)
    {
        static_assert(is_repeatable<parser<Token, T, Fallibility>>::value,
                      "many1() would never terminate for a parser that cannot fail");
        return bind(element, [element](T first)
                    {
                        return map(many(element), [first](std::vector<T> rest)
                                   {
                                       rest.insert(rest.begin(), first);
                                       return rest;
                                   });
                    });
    }

    template <class Token, class T, class Fallibility>
    parser<Token, Si::unit, never_fails> skip_many(parser<Token, T, Fallibility> const &element)
    {
        static_assert(is_repeatable<parser<Token, T, Fallibility>>::value,
                      "skip_many() would never terminate for a parser that cannot fail");
        return parser<Token, Si::unit, never_fails>(
            [element](prompt<Token> const &prompt_, input_state<Token> input, failure_handler<Token>,
                      success_handler<Token, Si::unit> on_success)
            {
                return detail::skip_many_iteration(element, prompt_, std::move(input), on_success);
            });
    }
}
