/**
 * @file TagFilter.cpp
 * @brief Tag predicate evaluation and filter string parsing
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "TagFilter.hpp"
#include "SlopeErrors.hpp"
#include <algorithm>

namespace wayslope {

bool condition_matches(const TagMap& tags, const FilterCondition& condition) {
    auto it = tags.find(condition.key);
    if (it == tags.end()) {
        return false;
    }

    switch (condition.kind) {
        case FilterCondition::Kind::HAS_KEY:
            return true;
        case FilterCondition::Kind::KEY_EQUALS:
            return it->second == condition.value;
    }
    return false;
}

bool matches(const TagMap& tags, const FilterSpec& spec) {
    return std::any_of(spec.begin(), spec.end(),
        [&tags](const FilterCondition& condition) {
            return condition_matches(tags, condition);
        });
}

FilterSpec parse_filter_spec(const std::string& filter) {
    FilterSpec spec;

    size_t start = 0;
    size_t token_index = 0;
    while (true) {
        size_t comma = filter.find(',', start);
        std::string token = filter.substr(start,
            comma == std::string::npos ? std::string::npos : comma - start);

        size_t eq_pos = token.find('=');
        std::string key = token.substr(0, eq_pos);
        if (key.empty()) {
            throw ConfigurationError("filter condition " + std::to_string(token_index + 1) +
                                     " in \"" + filter + "\" has an empty key");
        }

        if (eq_pos == std::string::npos) {
            spec.push_back(FilterCondition::has_key(key));
        } else {
            spec.push_back(FilterCondition::key_equals(key, token.substr(eq_pos + 1)));
        }

        if (comma == std::string::npos) {
            break;
        }
        start = comma + 1;
        ++token_index;
    }

    return spec;
}

FilterSpec default_filter_spec() {
    return {FilterCondition::has_key("highway")};
}

std::string to_string(const FilterSpec& spec) {
    std::string result;
    for (size_t i = 0; i < spec.size(); ++i) {
        if (i > 0) result += ',';
        result += spec[i].key;
        if (spec[i].kind == FilterCondition::Kind::KEY_EQUALS) {
            result += '=';
            result += spec[i].value;
        }
    }
    return result;
}

} // namespace wayslope
