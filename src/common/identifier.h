#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace Fleetshard {

/**
 * Returns true when id is a non-empty string of ASCII decimal digits.
 * This is the only identifier format the partition engine accepts.
 */
bool IsNumericId(std::string_view id);

/**
 * Three-way comparison of two decimal identifiers by numeric value.
 * Works on arbitrarily long IDs (no integer conversion). Two spellings of
 * the same value ("007" and "7") are ordered lexically so the order stays total.
 * @return negative, zero or positive like strcmp
 */
int CompareNumeric(std::string_view a, std::string_view b);

struct NumericIdLess {
    bool operator()(std::string_view a, std::string_view b) const {
        return CompareNumeric(a, b) < 0;
    }
};

// Sorts ids in place, ascending by numeric value
void SortNumerically(std::vector<std::string>& ids);

} // namespace Fleetshard
