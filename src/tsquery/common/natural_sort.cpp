#include "tsquery/common/natural_sort.h"
#include <algorithm>
#include <cctype>

namespace tsquery {
namespace common {

namespace {

bool IsDigit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

// Compares two digit runs by numeric value; returns <0, 0 or >0.
int CompareNumbers(const std::string& a, size_t a_begin, size_t a_end,
                   const std::string& b, size_t b_begin, size_t b_end) {
    while (a_begin < a_end && a[a_begin] == '0') ++a_begin;
    while (b_begin < b_end && b[b_begin] == '0') ++b_begin;
    size_t a_len = a_end - a_begin;
    size_t b_len = b_end - b_begin;
    if (a_len != b_len) {
        return a_len < b_len ? -1 : 1;
    }
    return a.compare(a_begin, a_len, b, b_begin, b_len);
}

} // namespace

bool NaturalLess(const std::string& a, const std::string& b) {
    size_t i = 0;
    size_t j = 0;
    while (i < a.size() && j < b.size()) {
        if (IsDigit(a[i]) && IsDigit(b[j])) {
            size_t i_end = i;
            size_t j_end = j;
            while (i_end < a.size() && IsDigit(a[i_end])) ++i_end;
            while (j_end < b.size() && IsDigit(b[j_end])) ++j_end;
            int cmp = CompareNumbers(a, i, i_end, b, j, j_end);
            if (cmp != 0) {
                return cmp < 0;
            }
            i = i_end;
            j = j_end;
            continue;
        }
        if (a[i] != b[j]) {
            return static_cast<unsigned char>(a[i]) < static_cast<unsigned char>(b[j]);
        }
        ++i;
        ++j;
    }
    if (i != a.size() || j != b.size()) {
        return a.size() - i < b.size() - j;
    }
    // Equal under natural order ("a01" vs "a1"): fall back to byte order for a strict ordering
    return a < b;
}

void NaturalSort(std::vector<std::string>& values) {
    std::sort(values.begin(), values.end(), NaturalLess);
}

} // namespace common
} // namespace tsquery
