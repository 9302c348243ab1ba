#include <nibble/ipv4.hpp>
#include <nibble/nibble.hpp>
#include <benchmark/benchmark.h>
#include <algorithm>

namespace
{
    std::size_t const total_size = 64 * 1024;

    bool is_lower_case(char const c)
    {
        return (c >= 'a') && (c <= 'z');
    }

    // Feeds the same input in pieces of chunk_size bytes.
    struct repeating_feeder
    {
        std::string const &whole;
        std::size_t chunk_size;
        std::size_t position;

        std::string operator()()
        {
            std::size_t const length = (std::min)(chunk_size, whole.size() - position);
            std::string chunk = whole.substr(position, length);
            position += length;
            return chunk;
        }
    };

    template <class T>
    void run_in_chunks(benchmark::State &state, nibble::parser<std::string, T> const &root, std::string const &input)
    {
        std::size_t const chunk_size = static_cast<std::size_t>(state.range(0));
        while (state.KeepRunning())
        {
            repeating_feeder feeder{input, chunk_size, 0};
            nibble::result<std::string, T> const parsed = nibble::parse_feed(feeder, root, "");
            if (!nibble::try_get_ok(parsed))
            {
                state.SkipWithError(nibble::describe(parsed).c_str());
                return;
            }
            benchmark::DoNotOptimize(parsed);
        }
        state.SetBytesProcessed(static_cast<int64_t>(state.iterations() * input.size()));
    }

    void TakeWhileInChunks(benchmark::State &state)
    {
        std::string const input = std::string(total_size, 'x') + "!";
        run_in_chunks(state, nibble::take_while<std::string>(is_lower_case), input);
    }
    BENCHMARK(TakeWhileInChunks)->Arg(1)->Arg(64)->Arg(4096);

    void ManyElementsInChunks(benchmark::State &state)
    {
        std::string const input = std::string(total_size, 'x') + "!";
        run_in_chunks(state, nibble::many(nibble::satisfy<std::string>(is_lower_case)), input);
    }
    BENCHMARK(ManyElementsInChunks)->Arg(1)->Arg(64)->Arg(4096);

    void IPv4Addresses(benchmark::State &state)
    {
        std::string input;
        while (input.size() < total_size)
        {
            input += "192.168.100.254,";
        }
        input += ";";
        run_in_chunks(state, nibble::many(nibble::before(nibble::ipv4(), nibble::element<std::string>(','))), input);
    }
    BENCHMARK(IPv4Addresses)->Arg(1)->Arg(4096);
}
