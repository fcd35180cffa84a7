#include "benchmark.h"

BENCHMARK_MAIN();
