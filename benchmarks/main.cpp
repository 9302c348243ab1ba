#include <benchmark/benchmark.h>
#include <iostream>
#include <boost/optional/optional.hpp>

namespace
{
    // Fails the program when the reference benchmark did not run or did not
    // parse its input.
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
                if (run.benchmark_name() != "TakeWhileInChunks/4096")
                {
                    continue;
                }
                if (run.error_occurred)
                {
                    std::cerr << run.benchmark_name() << " failed: " << run.error_message << '\n';
                    ok = false;
                    continue;
                }
                auto const bytes_per_second = run.counters.find("bytes_per_second");
                if ((bytes_per_second == run.counters.end()) || (bytes_per_second->second.value <= 0))
                {
                    std::cerr << run.benchmark_name() << " did not report its throughput\n";
                    ok = false;
                    continue;
                }
                if (!ok)
                {
                    ok = true;
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
