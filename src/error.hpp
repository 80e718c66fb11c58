#pragma once

#include <stdexcept>

// malformed metadata or a duplicate id; raised while the registry is built
struct challenge_error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct unknown_challenge : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// the input text does not match the puzzle's grammar
struct parse_error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// well-formed input that the puzzle logic cannot answer
struct solve_error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct input_error : std::runtime_error {
    using std::runtime_error::runtime_error;
};
