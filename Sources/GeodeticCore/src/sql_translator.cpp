#include "geodetic/sql_translator.hpp"
#include "geodetic/text.hpp"
#include <sstream>
#include <stdexcept>

namespace geodetic {

namespace {

// Words shortened by the SQL scripts of the EPSG dataset
std::string reword(const std::string& word) {
    if (word == "Coordinate_Operation") return "coordoperation";
    if (word == "Parameter") return "param";
    return word;
}

} // namespace

std::string sql_translator::table_name(const std::string& access_name) const {
    if (prefix_.empty()) {
        return access_name;
    }
    std::string name = prefix_;
    std::istringstream words(access_name);
    std::string word;
    while (words >> word) {
        name += reword(word);
    }
    return text::to_lower(name);
}

std::string sql_translator::apply(const std::string& sql) const {
    std::string out;
    out.reserve(sql.size() + 16);
    size_t end = 0;
    size_t start;
    while ((start = sql.find('[', end)) != std::string::npos) {
        out.append(sql, end, start - end);
        size_t close = sql.find(']', start + 1);
        if (close == std::string::npos) {
            throw std::invalid_argument("Missing ']' in SQL: " + sql);
        }
        if (!schema_.empty()) {
            out += '"' + schema_ + "\".";
        }
        out += '"' + table_name(sql.substr(start + 1, close - start - 1)) + '"';
        end = close + 1;
    }
    out.append(sql, end, std::string::npos);
    return out;
}

} // namespace geodetic
