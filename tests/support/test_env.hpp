#pragma once

#include <cstdlib>
#include <string>

namespace hyperpga::test_support {

inline void configure_deterministic_test_env() {
  setenv("HYPERPGA_BACKEND", "cpu", 1);
  setenv("HYPERPGA_NUM_THREADS", "1", 1);
  unsetenv("HYPERPGA_VERBOSE");
}

inline void configure_parallel_test_env(int threads) {
  setenv("HYPERPGA_BACKEND", "parallel", 1);
  setenv("HYPERPGA_NUM_THREADS", std::to_string(threads).c_str(), 1);
}

} // namespace hyperpga::test_support
