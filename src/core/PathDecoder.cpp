#include "PathDecoder.hpp"

namespace navmaze {

std::vector<std::string> decode_path(const std::vector<GridPos>& cells,
                                     const std::map<std::string, GridPos>& positions) {
    std::map<GridPos, std::string> at;
    for (const auto& kv : positions) at[kv.second] = kv.first;

    std::vector<std::string> nodes;
    for (const GridPos& p : cells) {
        auto it = at.find(p);
        if (it == at.end()) continue;
        if (nodes.empty() || nodes.back() != it->second) nodes.push_back(it->second);
    }
    return nodes;
}

} // namespace navmaze
