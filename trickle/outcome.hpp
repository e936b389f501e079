#pragma once

#include <trickle/input_state.hpp>
#include <trickle/step.hpp>
#include <cassert>
#include <memory>
#include <string>
#include <type_traits>
#include <vector>

namespace trickle
{
    // innermost label first
    typedef std::vector<std::string> context_stack;

    template <class Token>
    struct failure
    {
        input_state<Token> remaining;
        context_stack context;
        std::string message;
    };

    template <class Token, class T>
    struct success
    {
        input_state<Token> remaining;
        T value;
    };

    inline std::ostream &operator<<(std::ostream &out, context_stack const &context)
    {
        bool first = true;
        for (std::string const &label : context)
        {
            if (first)
            {
                first = false;
            }
            else
            {
                out << " > ";
            }
            out << label;
        }
        return out;
    }

    template <class Token>
    std::ostream &operator<<(std::ostream &out, failure<Token> const &failed)
    {
        if (!failed.context.empty())
        {
            out << failed.context << ": ";
        }
        return out << failed.message;
    }

    template <class Token>
    struct failure_handler
    {
        typedef std::function<step(failure<Token>)> function_type;

        template <class Function, class = typename std::enable_if<
                                      !std::is_same<typename std::decay<Function>::type, failure_handler>::value>::type>
        explicit failure_handler(Function &&handle)
            : m_handle(std::make_shared<function_type>(std::forward<Function>(handle)))
        {
        }

        step operator()(failure<Token> failed) const
        {
            assert(m_handle);
            return (*m_handle)(std::move(failed));
        }

    private:
        std::shared_ptr<function_type const> m_handle;
    };

    template <class Token, class T>
    struct success_handler
    {
        typedef std::function<step(input_state<Token>, T)> function_type;

        template <class Function, class = typename std::enable_if<
                                      !std::is_same<typename std::decay<Function>::type, success_handler>::value>::type>
        explicit success_handler(Function &&handle)
            : m_handle(std::make_shared<function_type>(std::forward<Function>(handle)))
        {
        }

        step operator()(input_state<Token> remaining, T value) const
        {
            assert(m_handle);
            return (*m_handle)(std::move(remaining), std::move(value));
        }

    private:
        std::shared_ptr<function_type const> m_handle;
    };

    namespace detail
    {
        template <class Token>
        step fail_later(failure_handler<Token> const &on_failure, input_state<Token> remaining, context_stack context,
                        std::string message)
        {
            return defer(
                [ on_failure, failed = failure<Token>{std::move(remaining), std::move(context), std::move(message)} ]()
                {
                    return on_failure(failed);
                });
        }

        template <class Token, class T>
        step succeed_later(success_handler<Token, T> const &on_success, input_state<Token> remaining, T value)
        {
            return defer([ on_success, remaining = std::move(remaining), value = std::move(value) ]()
                         {
                             return on_success(remaining, value);
                         });
        }
    }
}
