#pragma once

#include <trickle/token.hpp>
#include <utf8/checked.h>
#include <cstdint>

namespace trickle
{
    namespace detail
    {
        // number of bytes announced by the first byte of a UTF-8 sequence, 0
        // if it cannot start one
        inline std::size_t utf8_sequence_length(char const lead)
        {
            std::uint8_t const byte = static_cast<std::uint8_t>(lead);
            if (byte < 0x80)
            {
                return 1;
            }
            if ((byte & 0xE0) == 0xC0)
            {
                return 2;
            }
            if ((byte & 0xF0) == 0xE0)
            {
                return 3;
            }
            if ((byte & 0xF8) == 0xF0)
            {
                return 4;
            }
            return 0;
        }
    }

    // One UTF-8 encoded code point. The bytes may arrive in different chunks.
    // Consumes nothing if the sequence is malformed.
    inline parser<char, std::uint32_t> utf8_code_point()
    {
        typedef parser<char, std::uint32_t> result_parser;
        return label(bind(ensure<char>(1),
                          [](token_buffer<char> const &input) -> result_parser
                          {
                              std::size_t const length = detail::utf8_sequence_length(input.front());
                              if (length == 0)
                              {
                                  return fail_with<char, std::uint32_t>("invalid utf-8");
                              }
                              return bind(ensure<char>(length), [length](token_buffer<char> const &buffered)
                                                                    -> result_parser
                                          {
                                              token_buffer<char> const encoded = buffered.take(length);
                                              if (!utf8::is_valid(encoded.begin(), encoded.end()))
                                              {
                                                  return fail_with<char, std::uint32_t>("invalid utf-8");
                                              }
                                              char const *next = encoded.begin();
                                              std::uint32_t const code_point = utf8::next(next, encoded.end());
                                              return then(put<char>(buffered.drop(length)),
                                                          always<char>(code_point));
                                          });
                          }),
                     "utf8-code-point");
    }
}
