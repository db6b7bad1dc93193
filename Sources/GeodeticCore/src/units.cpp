#include "geodetic/units.hpp"
#include "geodetic/text.hpp"
#include <cmath>
#include <map>

namespace geodetic {
namespace units {

namespace {

constexpr double pi = 3.14159265358979323846;

struct unit_def {
    int code;
    const char* name;
    const char* symbol;
    unit_type type;
    double factor;   // NaN for non-linear units
    int base;
};

const unit_def hard_coded[] = {
    {9001, "metre",                  "m",     unit_type::length, 1.0,                     metre},
    {9002, "foot",                   "ft",    unit_type::length, 0.3048,                  metre},
    {9003, "US survey foot",         "ftUS",  unit_type::length, 1200.0 / 3937.0,         metre},
    {9030, "nautical mile",          "M",     unit_type::length, 1852.0,                  metre},
    {9036, "kilometre",              "km",    unit_type::length, 1000.0,                  metre},
    {1025, "millimetre",             "mm",    unit_type::length, 0.001,                   metre},
    {1033, "centimetre",             "cm",    unit_type::length, 0.01,                    metre},
    {9101, "radian",                 "rad",   unit_type::angle,  1.0,                     radian},
    {9102, "degree",                 "°", unit_type::angle, pi / 180.0,              radian},
    {9103, "arc-minute",             "′", unit_type::angle, pi / 10800.0,            radian},
    {9104, "arc-second",             "″", unit_type::angle, pi / 648000.0,           radian},
    {9105, "grad",                   "grad",  unit_type::angle,  pi / 200.0,              radian},
    {9109, "microradian",            "µrad", unit_type::angle, 1e-6,                 radian},
    {9110, "sexagesimal DMS",        "D.MS",  unit_type::angle,  std::nan(""),            radian},
    {9111, "sexagesimal DM",         "D.M",   unit_type::angle,  std::nan(""),            radian},
    {9122, "degree (supplier to define representation)", "°", unit_type::angle, pi / 180.0, radian},
    {9201, "unity",                  "",      unit_type::scale,  1.0,                     unity},
    {9202, "parts per million",      "ppm",   unit_type::scale,  1e-6,                    unity},
    {9203, "coefficient",            "",      unit_type::scale,  1.0,                     unity},
    {1040, "second",                 "s",     unit_type::time,   1.0,                     second},
    {1029, "year",                   "a",     unit_type::time,   31556925.445,            second},
};

unit_ptr make_unit(int code, const std::string& name, const std::string& symbol,
                   unit_type type, double factor, int base) {
    properties props;
    props.name = name;
    props.id.code = std::to_string(code);
    std::optional<double> scale;
    if (!std::isnan(factor)) scale = factor;
    return std::make_shared<const unit>(std::move(props), type, symbol, scale, base);
}

const std::map<int, unit_ptr>& table() {
    static const std::map<int, unit_ptr> units = [] {
        std::map<int, unit_ptr> m;
        for (const auto& d : hard_coded) {
            m.emplace(d.code, make_unit(d.code, d.name, d.symbol, d.type, d.factor, d.base));
        }
        return m;
    }();
    return units;
}

// Names and symbols accepted by parse(), mapped to a hard-coded unit
const std::map<std::string, int>& parse_table() {
    static const std::map<std::string, int> names = {
        {"m", 9001}, {"metre", 9001}, {"meter", 9001}, {"metres", 9001}, {"meters", 9001},
        {"ft", 9002}, {"foot", 9002}, {"feet", 9002},
        {"ftus", 9003}, {"us survey foot", 9003},
        {"km", 9036}, {"kilometre", 9036}, {"kilometer", 9036},
        {"mm", 1025}, {"millimetre", 1025}, {"millimeter", 1025},
        {"cm", 1033}, {"centimetre", 1033}, {"centimeter", 1033},
        {"rad", 9101}, {"radian", 9101},
        {"deg", 9102}, {"degree", 9102}, {"degrees", 9102}, {"°", 9102},
        {"arc-minute", 9103}, {"arc-second", 9104},
        {"grad", 9105}, {"gon", 9105},
        {"sexagesimal dms", 9110}, {"sexagesimal dm", 9111},
        {"unity", 9201}, {"ppm", 9202}, {"parts per million", 9202}, {"coefficient", 9203},
        {"s", 1040}, {"second", 1040}, {"a", 1029}, {"year", 1029},
    };
    return names;
}

} // namespace

unit_ptr from_epsg(int code) {
    const auto& units = table();
    auto it = units.find(code);
    return it != units.end() ? it->second : nullptr;
}

unit_ptr derive(int code, const std::string& name, const unit& base, double b, double c) {
    double factor = b / c;
    if (auto base_factor = base.factor_to_base()) {
        factor *= *base_factor;
    }
    return make_unit(code, name, name, base.type(), factor, base.base_code());
}

unit_ptr parse(int code, const std::string& text) {
    const auto& names = parse_table();
    auto it = names.find(text::to_lower(text));
    if (it == names.end()) return nullptr;
    auto known = from_epsg(it->second);
    if (!known) return nullptr;
    if (known->code() == std::to_string(code)) return known;
    // Same definition under the code of the dataset
    return make_unit(code, text, known->symbol(), known->type(),
                     known->factor_to_base().value_or(std::nan("")), known->base_code());
}

} // namespace units
} // namespace geodetic
