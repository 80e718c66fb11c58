#include "checker.hpp"

#include <chrono>
#include <exception>

#define BOOST_THREAD_VERSION 5
#include <boost/thread/executors/basic_thread_pool.hpp>
#include <boost/thread/future.hpp>
#include <boost/thread/thread.hpp>

#include "util.hpp"

CheckResult check_example(const Challenge &c, size_t index) {
    auto &ex = c.examples.at(index);
    CheckResult res{ &c, index + 1, false, {}, 0.0 };
    auto t1 = std::chrono::steady_clock::now();
    try {
        res.actual = c.solve(ex.input);
        res.passed = res.actual == ex.expected;
    } catch (const std::exception &e) {
        res.actual = fmt::format("error: {}", e.what());
    }
    auto t2 = std::chrono::steady_clock::now();
    res.seconds = std::chrono::duration<double>(t2 - t1).count();
    return res;
}

std::vector<CheckResult> check_examples(std::span<const Challenge * const> challenges, unsigned threads) {
    if (!threads)
        threads = boost::thread::hardware_concurrency();
    if (!threads)
        threads = 1;
    trace("checking {} challenges on {} threads", challenges.size(), threads);

    boost::basic_thread_pool pool{ threads };
    std::vector<boost::future<CheckResult>> pending;
    for (auto *c : challenges)
        for (auto i = 0zu; i < c->examples.size(); i++)
            pending.push_back(boost::async(pool, [c, i] { return check_example(*c, i); }));

    std::vector<CheckResult> results;
    results.reserve(pending.size());
    for (auto &f : pending)
        results.push_back(f.get());
    pool.close();
    pool.join();
    return results;
}
