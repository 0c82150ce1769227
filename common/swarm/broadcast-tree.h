#pragma once

#include "common.h"

#include <map>
#include <string>
#include <vector>

namespace swarm {

// Spanning tree rooted at the local node. Peers are laid out as a binary heap:
// peers[0] hangs off the root and the parent of peers[i] is peers[(i - 1) / 2].
struct broadcast_tree {
    std::string root;
    std::map<std::string, std::vector<std::string>> children;
    std::map<std::string, std::string> parent;
    int depth = 0;

    size_t size() const { return parent.size() + (root.empty() ? 0 : 1); }

    json to_json() const;
};

broadcast_tree build_broadcast_tree(const std::string & root, const std::vector<std::string> & peers);

// depth-first pre-order from the root (root excluded); each member appears once
std::vector<std::string> broadcast_order(const broadcast_tree & tree);

} // namespace swarm
