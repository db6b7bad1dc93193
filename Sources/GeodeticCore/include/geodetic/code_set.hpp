#pragma once

#ifdef __cplusplus

#include "objects.hpp"
#include <algorithm>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace geodetic {

/// Authority codes of one kind, as returned by epsg_resolver::authority_codes().
///
/// Holds the non-deprecated codes ordered by code, with their names.
/// Deprecated codes are hidden from iteration but contains() still finds
/// them, since they can be resolved individually.
///
/// The resolver keeps only a weak reference to each set: while a caller
/// holds one, the resolver reports that it cannot be closed.
class code_set {
public:
    struct entry {
        std::string code;
        std::string name;
    };

    code_set(object_kind kind, std::vector<entry> entries, std::set<std::string> deprecated)
        : kind_(kind), entries_(std::move(entries)), deprecated_(std::move(deprecated)) {}

    object_kind kind() const { return kind_; }

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    std::vector<entry>::const_iterator begin() const { return entries_.begin(); }
    std::vector<entry>::const_iterator end() const { return entries_.end(); }

    bool contains(const std::string& code) const {
        return find(code) != entries_.end() || deprecated_.count(code) != 0;
    }

    bool is_deprecated(const std::string& code) const {
        return deprecated_.count(code) != 0;
    }

    /// Name of a non-deprecated code.
    std::optional<std::string> name_of(const std::string& code) const {
        auto it = find(code);
        if (it == entries_.end()) return std::nullopt;
        return it->name;
    }

    std::vector<std::string> codes() const {
        std::vector<std::string> out;
        out.reserve(entries_.size());
        for (const auto& e : entries_) {
            out.push_back(e.code);
        }
        return out;
    }

private:
    std::vector<entry>::const_iterator find(const std::string& code) const {
        return std::find_if(entries_.begin(), entries_.end(),
                            [&](const entry& e) { return e.code == code; });
    }

    object_kind kind_;
    std::vector<entry> entries_;
    std::set<std::string> deprecated_;
};

using code_set_ptr = std::shared_ptr<const code_set>;

} // namespace geodetic

#endif // __cplusplus
