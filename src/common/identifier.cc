#include "identifier.h"

#include <algorithm>

namespace Fleetshard {

namespace {

std::string_view StripLeadingZeros(std::string_view id) {
    size_t pos = id.find_first_not_of('0');
    if (pos == std::string_view::npos) {
        // All zeros (or empty): keep a single digit so "000" compares as "0"
        return id.empty() ? id : id.substr(id.size() - 1);
    }
    return id.substr(pos);
}

} // namespace

bool IsNumericId(std::string_view id) {
    if (id.empty()) {
        return false;
    }
    return std::all_of(id.begin(), id.end(), [](char c) { return c >= '0' && c <= '9'; });
}

int CompareNumeric(std::string_view a, std::string_view b) {
    std::string_view na = StripLeadingZeros(a);
    std::string_view nb = StripLeadingZeros(b);

    if (na.size() != nb.size()) {
        return na.size() < nb.size() ? -1 : 1;
    }
    int cmp = na.compare(nb);
    if (cmp != 0) {
        return cmp;
    }
    return a.compare(b);
}

void SortNumerically(std::vector<std::string>& ids) {
    std::sort(ids.begin(), ids.end(), NumericIdLess());
}

} // namespace Fleetshard
