#include <cstdlib>
#include <exception>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#ifdef ADVENT_WITH_MIMALLOC
#include <mimalloc-new-delete.h>
#endif

#include <fmt/color.h>
#include <fmt/format.h>

#include "challenge.hpp"
#include "checker.hpp"
#include "util.hpp"

static void usage() {
    fmt::print(stderr,
        "usage: advent run <challenge-id> [--input <path>]\n"
        "       advent list\n"
        "       advent verify [<challenge-id>...]\n"
        "\n"
        "environment:\n"
        "  VERBOSE=1   print diagnostics to stderr\n"
        "  THREADS=n   worker threads used by verify\n");
}

static std::string read_input(const char *path) {
    std::stringstream buffer;
    if (!path) {
        buffer << std::cin.rdbuf();
        if (std::cin.bad())
            throw input_error{ "Unable to read the full input from stdin" };
        return buffer.str();
    }
    std::ifstream fin(path, std::ios::binary);
    if (!fin)
        throw input_error{ fmt::format("Unable to open \"{}\"", path) };
    buffer << fin.rdbuf();
    if (fin.bad())
        throw input_error{ fmt::format("Unable to read \"{}\"", path) };
    return buffer.str();
}

static int cmd_run(int argc, char *argv[]) {
    if (argc < 1) {
        usage();
        return 1;
    }
    std::string_view id = argv[0];
    const char *path = nullptr;
    for (auto i = 1; i < argc; i++) {
        if (argv[i] == std::string_view{ "--input" } && i + 1 < argc) {
            path = argv[++i];
        } else {
            usage();
            return 1;
        }
    }

    auto &reg = registry();
    // look the id up before reading stdin, so a typo doesn't wait on input
    if (!reg.find(id))
        throw unknown_challenge{ fmt::format("Unknown challenge \"{}\"", id) };
    auto input = read_input(path);
    fmt::print("{}\n", run(reg, id, input));
    return 0;
}

static int cmd_list() {
    for (auto *c : registry().sorted())
        fmt::print("{:<4} {}\n", c->id, c->name);
    return 0;
}

static int cmd_verify(int argc, char *argv[]) {
    auto &reg = registry();
    std::vector<const Challenge *> selected;
    if (!argc)
        selected = reg.sorted();
    for (auto i = 0; i < argc; i++) {
        auto *c = reg.find(argv[i]);
        if (!c)
            throw unknown_challenge{ fmt::format("Unknown challenge \"{}\"", argv[i]) };
        selected.push_back(c);
    }

    auto threads = 0u;
    if (auto *env = ::getenv("THREADS"); env && *env)
        threads = parse_number<unsigned>(env, "THREADS value");

    auto results = check_examples(selected, threads);
    auto passed = 0zu;
    for (auto &r : results) {
        auto &expected = r.challenge->examples[r.example - 1].expected;
        std::string_view verdict = r.passed ? "PASS" : "FAIL";
        auto colour = r.passed ? fmt::terminal_color::green : fmt::terminal_color::red;
        fmt::print("[{} example {}] {} (actual: {}, expected: {}) {}\n",
                r.challenge->id, r.example, fmt::styled(verdict, fmt::fg(colour)),
                r.actual, expected, display(r.seconds));
        passed += r.passed;
    }
    fmt::print("{}/{} examples passed\n", passed, results.size());
    return passed == results.size() ? 0 : 1;
}

int main(int argc, char *argv[]) {
    if (argc < 2) {
        usage();
        return 1;
    }
    std::string_view cmd = argv[1];
    try {
        if (cmd == "run")
            return cmd_run(argc - 2, argv + 2);
        if (cmd == "list")
            return cmd_list();
        if (cmd == "verify")
            return cmd_verify(argc - 2, argv + 2);
    } catch (const std::exception &e) {
        fmt::print(stderr, "error: {}\n", e.what());
        return 1;
    }
    usage();
    return 1;
}
