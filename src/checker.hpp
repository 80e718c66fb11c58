#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <vector>

#include "challenge.hpp"

struct CheckResult {
    const Challenge *challenge;
    size_t example; // 1-based
    bool passed;
    std::string actual; // the answer, or the error that replaced it
    double seconds;
};

// run a single registered example, turning a thrown error into a failure
[[nodiscard]] CheckResult check_example(const Challenge &c, size_t index);

// every example of every challenge, solved concurrently;
// results come back in the order the challenges and their examples were given
// threads == 0 picks the hardware concurrency
[[nodiscard]] std::vector<CheckResult> check_examples(std::span<const Challenge * const> challenges,
        unsigned threads = 0);
