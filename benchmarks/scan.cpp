#include <trickle/trickle.hpp>
#include <benchmark/benchmark.h>

namespace
{
    bool is_letter(char const c)
    {
        return (c >= 'a') && (c <= 'z');
    }

    std::vector<char> make_letters(std::size_t const size)
    {
        std::vector<char> letters(size);
        for (std::size_t i = 0; i < size; ++i)
        {
            letters[i] = static_cast<char>('a' + (i % 26));
        }
        return letters;
    }

    template <class T>
    void require_success(trickle::parse_result<char, T> result, benchmark::State &state)
    {
        if (!Si::visit<bool>(result,
                             [](trickle::success<char, T> &)
                             {
                                 return true;
                             },
                             [](trickle::failure<char> &)
                             {
                                 return false;
                             },
                             [](trickle::need_more_input<char, T> &)
                             {
                                 return false;
                             }))
        {
            state.SkipWithError("the parse did not succeed");
        }
    }

    template <class T, class Fallibility>
    void parse_in_chunks(benchmark::State &state, trickle::parser<char, T, Fallibility> const &parsed,
                         std::size_t const chunk_size)
    {
        std::size_t const size = static_cast<std::size_t>(state.range(0));
        std::vector<char> const letters = make_letters(size);
        for (auto _ : state)
        {
            trickle::parse_result<char, T> result = trickle::parse(parsed, std::vector<char>());
            for (std::size_t i = 0; i < size; i += chunk_size)
            {
                auto const begin = letters.begin() + static_cast<std::ptrdiff_t>(i);
                auto const end = letters.begin() + static_cast<std::ptrdiff_t>((std::min)(size, i + chunk_size));
                result = trickle::feed(result, std::vector<char>(begin, end));
            }
            result = trickle::finish(result);
            require_success(result, state);
        }
        state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(size));
    }

    void TakeWhileInOneChunk(benchmark::State &state)
    {
        parse_in_chunks(state, trickle::take_while<char>(is_letter), static_cast<std::size_t>(state.range(0)));
    }
    BENCHMARK(TakeWhileInOneChunk)->Range(1 << 10, 1 << 20);

    void TakeWhileInSmallChunks(benchmark::State &state)
    {
        parse_in_chunks(state, trickle::take_while<char>(is_letter), 64);
    }
    BENCHMARK(TakeWhileInSmallChunks)->Arg(1 << 16);

    void ManyLetters(benchmark::State &state)
    {
        parse_in_chunks(state, trickle::many(trickle::letter()), 4096);
    }
    BENCHMARK(ManyLetters)->Range(1 << 10, 1 << 16);

    void SkipManyLettersByteByByte(benchmark::State &state)
    {
        parse_in_chunks(state, trickle::skip_many(trickle::letter()), 1);
    }
    BENCHMARK(SkipManyLettersByteByByte)->Range(1 << 10, 1 << 14);
}
