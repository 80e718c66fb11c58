#pragma once

#include <bit>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

#include <boost/container/small_vector.hpp>

// one bit per question a-z answered "yes"
class Response {
public:
    using mask_t = uint32_t;
    static constexpr size_t QUESTIONS = 26;
    static constexpr mask_t ALL = (mask_t{ 1 } << QUESTIONS) - 1u;

private:
    mask_t value;

public:
    constexpr Response() : value{} { }
    explicit constexpr Response(mask_t v) : value{ mask_t(v & ALL) } { }

    // lowercase letters only
    static Response parse(std::string_view sv);

    [[nodiscard]] constexpr mask_t get_value() const { return value; }
    [[nodiscard]] constexpr bool test(char question) const {
        if (question < 'a' || question > 'z')
            return false;
        return value >> (question - 'a') & 1u;
    }
    [[nodiscard]] constexpr size_t pop_count() const { return std::popcount(value); }

    constexpr bool operator==(const Response &other) const = default;
    constexpr Response operator|(Response other) const { return Response{ value | other.value }; }
    constexpr Response operator&(Response other) const { return Response{ value & other.value }; }
};

struct ResponseGroup {
    boost::container::small_vector<Response, 8> members;

    // questions anyone answered
    [[nodiscard]] Response merge_any() const;
    // questions everyone answered
    [[nodiscard]] Response merge_all() const;
};

// blank-line separated groups of one response per line
struct Responses : std::vector<ResponseGroup> {
    static Responses parse(std::string_view sv);
};

size_t questions_anyone_answered(const Responses &groups);
size_t questions_everyone_answered(const Responses &groups);
