#include "setpart_engine/rgs_utils.hpp"
#include <algorithm>
#include <sstream>

namespace setpart {

bool is_valid_rgs(const Rgs& rgs) {
    if (rgs.empty()) return true;
    if (rgs[0] != 0) return false;
    int runningMax = 0;
    for (size_t i = 1; i < rgs.size(); ++i) {
        if (rgs[i] < 0 || rgs[i] > runningMax + 1) return false;
        runningMax = std::max(runningMax, rgs[i]);
    }
    return true;
}

int block_count(const Rgs& rgs) {
    if (rgs.empty()) return 0;
    return *std::max_element(rgs.begin(), rgs.end()) + 1;
}

std::string format_rgs(const Rgs& rgs) {
    std::ostringstream out;
    for (size_t i = 0; i < rgs.size(); ++i) {
        if (i > 0) out << ' ';
        out << rgs[i];
    }
    return out.str();
}

std::string format_blocks(const Blocks& blocks) {
    if (blocks.empty()) return "{}";
    std::ostringstream out;
    for (size_t b = 0; b < blocks.size(); ++b) {
        if (b > 0) out << ' ';
        out << '{';
        for (size_t i = 0; i < blocks[b].size(); ++i) {
            if (i > 0) out << ',';
            out << blocks[b][i];
        }
        out << '}';
    }
    return out.str();
}

} // namespace setpart
