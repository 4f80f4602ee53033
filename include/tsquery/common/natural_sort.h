#pragma once

#include <string>
#include <vector>

namespace tsquery {
namespace common {

/**
 * @brief Orders strings so that embedded numbers compare by value
 *
 * "host2" sorts before "host10". Runs of digits compare numerically
 * (leading zeros ignored), everything else compares byte-wise.
 */
bool NaturalLess(const std::string& a, const std::string& b);

void NaturalSort(std::vector<std::string>& values);

} // namespace common
} // namespace tsquery
