#include "benchmark/benchmark.h"
#include "gflags/gflags.h"
#include "glog/logging.h"

DECLARE_uint64(random_seed);

int main(int argc, char** argv) {
  // Initializes Google's flags, logging, and benchmark libraries.
  // Use " -- " to separate between gflags and gbenchmark args.
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);  // NOLINT
  ::benchmark::Initialize(&argc, argv);
  LOG(INFO) << "Running zkmatrix benchmarks with random_seed=" << FLAGS_random_seed << ".";
  if (::benchmark::ReportUnrecognizedArguments(argc, argv)) {
    return 1;
  }
  ::benchmark::RunSpecifiedBenchmarks();

  return 0;
}
