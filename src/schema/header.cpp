/**
 * @file header.cpp
 * @brief Header implementation
 */

#include "schema/header.hpp"

#include <unordered_set>

namespace csvcols {

Header::Header(Row names) : names_(std::move(names)) {}

int Header::index_of(const std::string& name) const {
    for (size_t i = 0; i < names_.size(); ++i) {
        if (names_[i] == name) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

ColumnSet Header::missing_columns(const ColumnSet& requested) const {
    const std::unordered_set<std::string> present(names_.begin(), names_.end());
    ColumnSet missing;
    for (const auto& name : requested) {
        if (present.find(name) == present.end()) {
            missing.push_back(name);
        }
    }
    return missing;
}

Status Header::check_columns(const ColumnSet& requested) const {
    const ColumnSet missing = missing_columns(requested);
    if (!missing.empty()) {
        return Status::NotFound("columns not present in header: " +
                                format_column_list(missing));
    }
    return Status::Ok();
}

Status Header::resolve(const ColumnSet& requested, ColumnIndexMap* indices) const {
    CSVCOLS_RETURN_IF_ERROR(check_columns(requested));

    indices->clear();
    indices->reserve(requested.size());
    for (const auto& name : requested) {
        indices->push_back(static_cast<size_t>(index_of(name)));
    }
    return Status::Ok();
}

Status Header::complement(const ColumnSet& requested, ColumnIndexMap* indices) const {
    CSVCOLS_RETURN_IF_ERROR(check_columns(requested));

    const std::unordered_set<std::string> dropped(requested.begin(), requested.end());
    indices->clear();
    for (size_t i = 0; i < names_.size(); ++i) {
        if (dropped.find(names_[i]) == dropped.end()) {
            indices->push_back(i);
        }
    }
    return Status::Ok();
}

std::string format_column_list(const ColumnSet& names) {
    std::string out = "[";
    for (size_t i = 0; i < names.size(); ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += names[i];
    }
    out += "]";
    return out;
}

}  // namespace csvcols
