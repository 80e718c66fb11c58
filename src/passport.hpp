#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

#include <boost/container/flat_map.hpp>

// views into the input text, which must outlive the passport
struct Passport {
    boost::container::flat_map<std::string_view, std::string_view> fields;

    [[nodiscard]] bool contains(std::string_view key) const { return fields.contains(key); }
    [[nodiscard]] std::optional<std::string_view> get(std::string_view key) const;
};

// blank-line separated records of whitespace separated "key:value" pairs
struct Passports : std::vector<Passport> {
    static Passports parse(std::string_view sv);
};

// cid is optional
inline constexpr std::array<std::string_view, 7> REQUIRED_FIELDS{
    "byr", "iyr", "eyr", "hgt", "hcl", "ecl", "pid" };

struct Height {
    enum class Unit { Centimeters, Inches };
    uint32_t value;
    Unit unit;

    // "150cm" or "60in"
    static std::optional<Height> parse(std::string_view sv);
};

[[nodiscard]] bool has_required_fields(const Passport &p);

// byr (Birth Year) - four digits; at least 1920 and at most 2002.
// iyr (Issue Year) - four digits; at least 2010 and at most 2020.
// eyr (Expiration Year) - four digits; at least 2020 and at most 2030.
// hgt (Height) - a number followed by either cm or in:
//     If cm, the number must be at least 150 and at most 193.
//     If in, the number must be at least 59 and at most 76.
// hcl (Hair Color) - a # followed by exactly six hexadecimal digits.
// ecl (Eye Color) - exactly one of: amb blu brn gry grn hzl oth.
// pid (Passport ID) - a nine-digit number, including leading zeroes.
// cid (Country ID) - ignored, missing or not.
[[nodiscard]] bool is_valid(const Passport &p);

size_t passports_with_required_fields(const Passports &passports);
size_t valid_passports(const Passports &passports);
