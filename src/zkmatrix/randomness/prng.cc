#include "zkmatrix/randomness/prng.h"

#include <chrono>

#include "gflags/gflags.h"
#include "glog/logging.h"

DEFINE_uint64(random_seed, 0, "Overrides the seed of every default-constructed Prng (0 = time).");

namespace zkmatrix {

namespace {

uint64_t SeedFromSystemTime() {
  return std::chrono::duration_cast<std::chrono::nanoseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

uint64_t ChooseSeed() {
  const uint64_t seed = FLAGS_random_seed != 0 ? FLAGS_random_seed : SeedFromSystemTime();
  LOG(INFO) << "Seeding PRNG with " << seed << " (rerun with --random_seed=" << seed
            << " to reproduce).";
  return seed;
}

}  // namespace

Prng::Prng() : Prng(ChooseSeed()) {}

}  // namespace zkmatrix
