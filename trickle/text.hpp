#pragma once

#include <trickle/scan.hpp>
#include <boost/lexical_cast.hpp>
#include <cctype>
#include <cstdint>

namespace trickle
{
    template <class Token>
    parser<Token, Token> any_token()
    {
        return satisfy<Token>([](Token const &)
                              {
                                  return true;
                              });
    }

    namespace detail
    {
        inline std::string char_label(char const expected)
        {
            return std::string("failed parser char: ") + expected;
        }

        inline bool is_whitespace(char const c)
        {
            return std::isspace(static_cast<unsigned char>(c)) != 0;
        }

        inline bool is_letter(char const c)
        {
            return std::isalpha(static_cast<unsigned char>(c)) != 0;
        }

        inline bool is_digit(char const c)
        {
            return (c >= '0') && (c <= '9');
        }
    }

    inline parser<char, char> char_(char const expected)
    {
        return label(satisfy<char>([expected](char const c)
                                   {
                                       return c == expected;
                                   }),
                     detail::char_label(expected));
    }

    inline parser<char, char> char_in(std::string set)
    {
        return label(satisfy<char>([set](char const c)
                                   {
                                       return set.find(c) != std::string::npos;
                                   }),
                     "failed parser char: [" + set + "]");
    }

    inline parser<char, char> not_char(char const unexpected)
    {
        return label(satisfy<char>([unexpected](char const c)
                                   {
                                       return c != unexpected;
                                   }),
                     std::string(1, unexpected));
    }

    inline parser<char, char> not_char_in(std::string set)
    {
        return label(satisfy<char>([set](char const c)
                                   {
                                       return set.find(c) == std::string::npos;
                                   }),
                     "[" + set + "]");
    }

    // any character for which std::isspace holds
    inline parser<char, char> whitespace()
    {
        return satisfy<char>(detail::is_whitespace);
    }

    inline parser<char, char> space()
    {
        return char_(' ');
    }

    inline parser<char, std::vector<char>, never_fails> spaces()
    {
        return many(space());
    }

    inline parser<char, Si::unit, never_fails> skip_spaces()
    {
        return skip_many(space());
    }

    inline parser<char, Si::unit, never_fails> skip_whitespaces()
    {
        return skip_while<char>(detail::is_whitespace);
    }

    inline parser<char, char> letter()
    {
        return label(satisfy<char>(detail::is_letter), "letter");
    }

    inline parser<char, char> digit()
    {
        return label(satisfy<char>(detail::is_digit), "digit");
    }

    inline parser<char, std::string> word()
    {
        return map(many1(letter()), [](std::vector<char> const &letters)
                   {
                       return std::string(letters.begin(), letters.end());
                   });
    }

    typedef Si::variant<std::int64_t, double> number_value;

    // Decimal digits with an optional fraction. A dot ends the number as a
    // double even without digits after it ("12." is 12.0). Integers that do
    // not fit into 64 bits fail instead of losing precision.
    inline parser<char, number_value> number()
    {
        parser<char, std::vector<char>> const digits = take_while1<char>(detail::is_digit);
        parser<char, std::vector<char>, never_fails> const fraction =
            option(bind(char_('.'),
                        [](char)
                        {
                            return map(take_while<char>(detail::is_digit), [](std::vector<char> decimals)
                                       {
                                           decimals.insert(decimals.begin(), '.');
                                           return decimals;
                                       });
                        }),
                   std::vector<char>());
        return label(bind(digits,
                          [fraction](std::vector<char> const &integral)
                          {
                              return bind(fraction, [integral](std::vector<char> const &decimals)
                                                        -> parser<char, number_value>
                                          {
                                              std::string text(integral.begin(), integral.end());
                                              text.append(decimals.begin(), decimals.end());
                                              if (decimals.size() == 1)
                                              {
                                                  text += '0';
                                              }
                                              if (decimals.empty())
                                              {
                                                  std::int64_t integer = 0;
                                                  if (boost::conversion::try_lexical_convert(text, integer))
                                                  {
                                                      return always<char>(number_value(integer));
                                                  }
                                                  return fail_with<char, number_value>("integer out of range: " +
                                                                                       text);
                                              }
                                              double fractional = 0;
                                              if (boost::conversion::try_lexical_convert(text, fractional))
                                              {
                                                  return always<char>(number_value(fractional));
                                              }
                                              return fail_with<char, number_value>("invalid number: " + text);
                                          });
                          }),
                     "number");
    }

    // "\n" or "\r\n"
    inline parser<char, std::string> eol()
    {
        return label(alternative(string("\n"), string("\r\n")), "eol");
    }
}
