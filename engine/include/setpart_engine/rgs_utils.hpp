#pragma once

#include "setpart_engine/types.hpp"
#include <string>

namespace setpart {

// Growth invariant: rgs[0] == 0 and each label is at most one above the running max.
bool is_valid_rgs(const Rgs& rgs);
int block_count(const Rgs& rgs);

// Display helpers for the info panel: "0 0 1 0 2" and "{1,2,4} {3} {5}".
std::string format_rgs(const Rgs& rgs);
std::string format_blocks(const Blocks& blocks);

} // namespace setpart
