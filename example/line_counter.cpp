#include <trickle/trickle.hpp>
#include <algorithm>
#include <iostream>

namespace
{
    bool is_line_end(char const c)
    {
        return (c == '\n') || (c == '\r');
    }

    struct line_statistics
    {
        std::size_t lines;
        std::size_t longest;
    };

    trickle::parser<char, line_statistics, trickle::never_fails> count_lines()
    {
        auto const line = trickle::skip_right(trickle::take_till<char>(is_line_end), trickle::eol());
        return trickle::bind(trickle::many(line), [](std::vector<std::vector<char>> const &complete_lines)
                             {
                                 line_statistics statistics{complete_lines.size(), 0};
                                 for (std::vector<char> const &content : complete_lines)
                                 {
                                     statistics.longest = (std::max)(statistics.longest, content.size());
                                 }
                                 // the last line does not need a line break
                                 return trickle::map(trickle::take_till<char>(is_line_end),
                                                     [statistics](std::vector<char> const &last)
                                                     {
                                                         line_statistics total = statistics;
                                                         if (!last.empty())
                                                         {
                                                             ++total.lines;
                                                             total.longest = (std::max)(total.longest, last.size());
                                                         }
                                                         return total;
                                                     });
                             });
    }
}

int main()
{
    trickle::parse_result<char, line_statistics> result = trickle::parse(count_lines(), std::vector<char>());
    std::vector<char> chunk(4096);
    for (;;)
    {
        std::cin.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        std::size_t const received = static_cast<std::size_t>(std::cin.gcount());
        if (received == 0)
        {
            break;
        }
        result = trickle::feed(result, std::vector<char>(chunk.begin(), chunk.begin() + received));
    }
    result = trickle::finish(result);
    return Si::visit<int>(result,
                          [](trickle::success<char, line_statistics> &counted)
                          {
                              std::cout << counted.value.lines << " lines, the longest has " << counted.value.longest
                                        << " characters\n";
                              if (!counted.remaining.remaining.empty())
                              {
                                  std::cerr << "Stopped before a lone carriage return\n";
                                  return 1;
                              }
                              return 0;
                          },
                          [](trickle::failure<char> &failed)
                          {
                              std::cerr << failed << '\n';
                              return 1;
                          },
                          [](trickle::need_more_input<char, line_statistics> &)
                          {
                              std::cerr << "The parser still expects input\n";
                              return 1;
                          });
}
