#pragma once

#include <boost/test/test_tools.hpp>
#include <vector>

namespace boost
{
    namespace test_tools
    {
        namespace tt_detail
        {
            template <>
            struct print_log_value<std::vector<char>>
            {
                void operator()(std::ostream &out, std::vector<char> const &v)
                {
                    out << '"';
                    out.write(v.data(), static_cast<std::streamsize>(v.size()));
                    out << '"';
                }
            };

            template <>
            struct print_log_value<std::vector<std::vector<char>>>
            {
                void operator()(std::ostream &out, std::vector<std::vector<char>> const &v)
                {
                    out << '{';
                    bool first = true;
                    for (std::vector<char> const &e : v)
                    {
                        if (first)
                        {
                            first = false;
                        }
                        else
                        {
                            out << ", ";
                        }
                        print_log_value<std::vector<char>>()(out, e);
                    }
                    out << '}';
                }
            };
        }
    }
}
