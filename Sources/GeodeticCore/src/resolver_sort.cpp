#include "geodetic/resolver.hpp"
#include "geodetic/row_reader.hpp"
#include "geodetic/text.hpp"
#include <algorithm>

namespace geodetic {

namespace {

// Bound on the passes over the list. Real data converges in two or three.
constexpr int max_sort_iterations = 18;

} // namespace

// ============================================================================
// Supersession ordering
//
// A code superseded by another code of the same list is moved after its
// replacement. Replacements are looked at newest first. Cyclic data cannot
// be ordered: the first repeated arrangement stops the sort with a warning.
// ============================================================================

bool epsg_resolver::sort_impl(const table_info& info, std::vector<std::string>& codes) {
    if (codes.size() < 2 || !table_found("Supersession")) {
        return false;
    }

    std::map<std::string, std::vector<std::string>> edges;
    auto replacements_of = [&](const std::string& code) -> std::vector<std::string> {
        auto it = edges.find(code);
        if (it != edges.end()) return it->second;
        std::vector<std::string> found;
        if (text::is_all_digits(code) && code.size() < 19) {
            auto rows = run("supersession",
                            "SELECT SUPERSEDED_BY FROM [Supersession]"
                            " WHERE OBJECT_TABLE_NAME = ? AND OBJECT_CODE = ?"
                            " ORDER BY SUPERSESSION_YEAR DESC",
                            {object_table_name(info), static_cast<primary_key_t>(std::stoll(code))});
            for (const auto& row : rows) {
                if (auto r = row_reader(row, "Supersession", code).optional_string("SUPERSEDED_BY")) {
                    found.push_back(*r);
                }
            }
        }
        edges[code] = found;
        return found;
    };

    std::set<std::vector<std::string>> seen;
    seen.insert(codes);
    for (int iteration = 0; iteration < max_sort_iterations; ++iteration) {
        bool changed = false;
        for (size_t i = 0; i < codes.size(); ++i) {
            for (const auto& replacement : replacements_of(codes[i])) {
                for (size_t j = i + 1; j < codes.size(); ++j) {
                    if (codes[j] == replacement) {
                        // Move the replacement just before the code it supersedes
                        std::rotate(codes.begin() + i, codes.begin() + j, codes.begin() + j + 1);
                        ++i;
                        changed = true;
                        break;
                    }
                }
            }
        }
        if (!changed) {
            return iteration != 0;
        }
        if (!seen.insert(codes).second) {
            LOG_WARN("epsg", "Cyclic supersession between %s codes; keeping a partial order", info.table);
            return true;
        }
    }
    LOG_WARN("epsg", "Supersession order of %zu %s codes did not converge", codes.size(), info.table);
    return true;
}

} // namespace geodetic
