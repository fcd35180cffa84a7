#include <iostream>
#include <string>
#include <stdexcept>
#include <vector>
#include "Arguments.h"
#include "RaceTest.h"

namespace {

const int DEFAULT_THREADS = 8;
const int DEFAULT_ITERATIONS = 100000;

bool anyLost(const std::vector<RaceResult>& results) {
    for (const auto& r : results) {
        if (r.synchronized && r.lostUpdates()) {
            return true;
        }
    }
    return false;
}

} // namespace

int main(int argc, char** argv) {
    int threads = DEFAULT_THREADS;
    int iterations = DEFAULT_ITERATIONS;

    try {
        if (argc > 3) {
            throw std::invalid_argument("too many arguments");
        }
        if (argc > 1) {
            threads = parsePositive(argv[1]);
        }
        if (argc > 2) {
            iterations = parsePositive(argv[2]);
        }
    } catch (const std::invalid_argument& e) {
        std::cerr << "invalid argument: " << e.what() << "\n";
        std::cerr << "usage: " << argv[0] << " [threads] [iterations]\n";
        return 2;
    } catch (const std::out_of_range& e) {
        std::cerr << "argument out of range: " << e.what() << "\n";
        std::cerr << "usage: " << argv[0] << " [threads] [iterations]\n";
        return 2;
    }

    ThreadRaceTest simpleTest(threads, iterations);
    bool lost = anyLost(simpleTest.runAllTests());

    std::cout << "\n\n=== Testing with different thread counts ===\n";

    for (int n : {2, 4, 8, 16}) {
        std::cout << "\n--- " << n << " threads ---\n";
        ThreadRaceTest test(n, iterations);
        lost = test.testWithMutex().lostUpdates() || lost;
        lost = test.testWithGuardedInt().lostUpdates() || lost;
        lost = test.testWithGuardedCas().lostUpdates() || lost;
    }

    if (lost) {
        std::cerr << "\nsynchronized counter lost updates\n";
        return 1;
    }
    return 0;
}
