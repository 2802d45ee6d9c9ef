#pragma once

/**
 * @file TagFilter.hpp
 * @brief Tag predicate used to select ways
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "way_slope.hpp"
#include <string>
#include <vector>

namespace wayslope {

/**
 * @brief One filter condition: HasKey(key) or KeyEquals(key, value)
 */
struct FilterCondition {
    enum class Kind {
        HAS_KEY,
        KEY_EQUALS
    };

    Kind kind = Kind::HAS_KEY;
    std::string key;
    std::string value;  // Only meaningful for KEY_EQUALS

    static FilterCondition has_key(const std::string& key) {
        return FilterCondition{Kind::HAS_KEY, key, ""};
    }

    static FilterCondition key_equals(const std::string& key, const std::string& value) {
        return FilterCondition{Kind::KEY_EQUALS, key, value};
    }

    bool operator==(const FilterCondition& other) const {
        return kind == other.kind && key == other.key && value == other.value;
    }
};

/**
 * @brief Conditions combined with logical OR
 */
using FilterSpec = std::vector<FilterCondition>;

/**
 * @brief Check a single condition against a tag map
 */
bool condition_matches(const TagMap& tags, const FilterCondition& condition);

/**
 * @brief Check whether any condition of the spec holds for the tags
 *
 * An empty spec never matches.
 */
bool matches(const TagMap& tags, const FilterSpec& spec);

/**
 * @brief Parse a user filter string such as "highway=primary,surface"
 *
 * Tokens are separated by ','. Each token is split on its first '='; a token
 * without '=' becomes HasKey, a token with '=' becomes KeyEquals with the
 * exact (possibly empty) remainder. Keys and values are not trimmed.
 *
 * @throws ConfigurationError if a token has an empty key
 */
FilterSpec parse_filter_spec(const std::string& filter);

/**
 * @brief Default spec used when no filter is given: HasKey("highway")
 */
FilterSpec default_filter_spec();

/**
 * @brief Render a spec back to its "k,k=v" string form
 */
std::string to_string(const FilterSpec& spec);

} // namespace wayslope
