#pragma once

#include "setpart_engine/types.hpp"
#include <optional>

namespace setpart {

// Window of block counts a mode admits for a set of size n. Throws InvalidRequest.
ModeBounds mode_bounds(int n, Mode mode, int k);

// Cursor positioned on the lexicographically smallest/largest RGS for (n, mode, k).
// Throws InvalidRequest for n < 0, or k outside 1..n (k == 0 only with n == 0) in ExactK.
Cursor first(int n, Mode mode, int k = 0);
Cursor last(int n, Mode mode, int k = 0);

// In-place lexicographic successor/predecessor. nullopt when there is none;
// the cursor is then left as it was.
std::optional<Rgs> next(Cursor& c);
std::optional<Rgs> previous(Cursor& c);

// Number of RGS the cursor for (n, mode, k) walks through: Bell(n) or S(n,k).
BigCount count(int n, Mode mode, int k = 0);

Blocks blocks_of(const Rgs& rgs);

} // namespace setpart
