#include "passport.hpp"

#include <algorithm>
#include <cctype>

#include "challenge.hpp"

std::optional<std::string_view> Passport::get(std::string_view key) const {
    auto it = fields.find(key);
    if (it == fields.end())
        return {};
    return it->second;
}

Passports Passports::parse(std::string_view sv) {
    Passports passports;
    for (auto &group : split_groups(sv)) {
        Passport p;
        for (auto [number, line] : group) {
            while (!(line = trim(line)).empty()) {
                auto pair = line.substr(0, line.find_first_of(" \t"));
                line.remove_prefix(pair.size());
                auto colon = pair.find(':');
                if (colon == std::string_view::npos)
                    throw parse_error{ fmt::format(
                            "line {}: Expected \"{}\" to look like \"key:value\"", number, pair) };
                p.fields.insert_or_assign(pair.substr(0, colon), pair.substr(colon + 1));
            }
        }
        passports.push_back(std::move(p));
    }
    return passports;
}

static bool all_digits(std::string_view sv) {
    return std::ranges::all_of(sv, [](unsigned char ch) { return std::isdigit(ch); });
}

std::optional<Height> Height::parse(std::string_view sv) {
    if (sv.size() < 3)
        return {};
    auto number = sv.substr(0, sv.size() - 2);
    auto suffix = sv.substr(sv.size() - 2);
    Unit unit;
    if (suffix == "cm")
        unit = Unit::Centimeters;
    else if (suffix == "in")
        unit = Unit::Inches;
    else
        return {};
    if (number.size() > 9 || !all_digits(number))
        return {};
    return Height{ parse_number<uint32_t>(number), unit };
}

bool has_required_fields(const Passport &p) {
    return std::ranges::all_of(REQUIRED_FIELDS, [&](std::string_view key) {
        return p.contains(key);
    });
}

static bool year_between(std::optional<std::string_view> v, uint32_t min, uint32_t max) {
    if (!v || v->size() != 4 || !all_digits(*v))
        return false;
    auto year = parse_number<uint32_t>(*v);
    return min <= year && year <= max;
}

static bool height_ok(std::optional<std::string_view> v) {
    if (!v)
        return false;
    auto h = Height::parse(*v);
    if (!h)
        return false;
    switch (h->unit) {
        case Height::Unit::Centimeters: return 150 <= h->value && h->value <= 193;
        case Height::Unit::Inches: return 59 <= h->value && h->value <= 76;
    }
    return false;
}

static bool colour_ok(std::optional<std::string_view> v) {
    return v && v->size() == 7 && v->front() == '#'
        && std::ranges::all_of(v->substr(1), [](unsigned char ch) { return std::isxdigit(ch); });
}

static bool eye_colour_ok(std::optional<std::string_view> v) {
    static constexpr std::string_view colours[]{ "amb", "blu", "brn", "gry", "grn", "hzl", "oth" };
    return v && std::ranges::find(colours, *v) != std::end(colours);
}

static bool passport_id_ok(std::optional<std::string_view> v) {
    return v && v->size() == 9 && all_digits(*v);
}

bool is_valid(const Passport &p) {
    return year_between(p.get("byr"), 1920, 2002)
        && year_between(p.get("iyr"), 2010, 2020)
        && year_between(p.get("eyr"), 2020, 2030)
        && height_ok(p.get("hgt"))
        && colour_ok(p.get("hcl"))
        && eye_colour_ok(p.get("ecl"))
        && passport_id_ok(p.get("pid"));
}

size_t passports_with_required_fields(const Passports &passports) {
    return static_cast<size_t>(std::ranges::count_if(passports, has_required_fields));
}

size_t valid_passports(const Passports &passports) {
    return static_cast<size_t>(std::ranges::count_if(passports, is_valid));
}

static constexpr std::string_view example = R"(ecl:gry pid:860033327 eyr:2020 hcl:#fffffd
byr:1937 iyr:2017 cid:147 hgt:183cm

iyr:2013 ecl:amb cid:350 eyr:2023 pid:028048884
hcl:#cfa07d byr:1929

hcl:#ae17e1 iyr:2013
eyr:2024
ecl:brn pid:760753108 byr:1931
hgt:179cm

hcl:#cfa07d eyr:2025 pid:166559648
iyr:2011 ecl:brn hgt:59in
)";

static constexpr std::string_view invalid_example = R"(eyr:1972 cid:100
hcl:#18171d ecl:amb hgt:170 pid:186cm iyr:2018 byr:1926

iyr:2019
hcl:#602927 eyr:1967 hgt:170cm
ecl:grn pid:012533040 byr:1946

hcl:dab227 iyr:2012
ecl:brn hgt:182cm pid:021572410 eyr:2020 byr:1992 cid:277

hgt:59cm ecl:zzz
eyr:2038 hcl:74454a iyr:2023
pid:3556412378 byr:2007
)";

static constexpr std::string_view valid_example = R"(pid:087499704 hgt:74in ecl:grn iyr:2012 eyr:2030 byr:1980
hcl:#623a2f

eyr:2029 ecl:blu cid:129 byr:1989
iyr:2014 pid:896056539 hcl:#a97842 hgt:165cm

hcl:#888785
hgt:164cm byr:2001 iyr:2015 cid:88
pid:545766238 ecl:hzl
eyr:2022

iyr:2010 hgt:158cm hcl:#b6652a ecl:blu byr:1944 eyr:2021 pid:093154719
)";

void register_passport_processing(Registry &r) {
    r.add(make_challenge<&passports_with_required_fields>(
        "Day 4a: Passport Processing",
        "Count the passports that have every required field; cid may be missing.",
        { { example, "2" } }));
    r.add(make_challenge<&valid_passports>(
        "Day 4b: Passport Processing",
        "Count the passports whose required fields are all present and hold valid values.",
        { { invalid_example, "0" }, { valid_example, "4" } }));
}
