#include <benchmark/benchmark.h>
#include <iostream>
#include <boost/optional/optional.hpp>

namespace
{
    // Fails the run when the chunked scanning benchmark did not run or is far
    // below the throughput the engine is expected to reach.
    struct TestReporter : benchmark::BenchmarkReporter
    {
        boost::optional<bool> ok;
        benchmark::ConsoleReporter display;

        bool ReportContext(const Context &context) override
        {
            return display.ReportContext(context);
        }

        void ReportRuns(const std::vector<Run> &report) override
        {
            for (const Run &run : report)
            {
                if (run.benchmark_name() != "TakeWhileInSmallChunks/65536")
                {
                    continue;
                }
                auto const found = run.counters.find("bytes_per_second");
                if (found == run.counters.end())
                {
                    std::cerr << run.benchmark_name() << " did not report its throughput\n";
                    ok = false;
                    continue;
                }
                const double required_bytes =
#ifdef NDEBUG
                    4000000
#else
                    100000
#endif
                    ;
                const double measured = found->second;
                if (measured >= required_bytes)
                {
                    if (!ok)
                    {
                        ok = true;
                    }
                }
                else
                {
                    std::cerr << run.benchmark_name() << " is too slow: " << measured << " bytes/s ("
                              << required_bytes << " required)\n";
                    ok = false;
                }
            }
            return display.ReportRuns(report);
        }
    };
}

int main(int argc, char **argv)
{
    benchmark::Initialize(&argc, argv);
    TestReporter reporter;
    benchmark::RunSpecifiedBenchmarks(&reporter);
    if (!reporter.ok)
    {
        std::cerr << "At least one of the required test benchmarks did not run\n";
        return 1;
    }
    return (*reporter.ok ? 0 : 1);
}
