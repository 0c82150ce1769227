#include "broadcast-tree.h"

#include <algorithm>
#include <set>

namespace swarm {

json broadcast_tree::to_json() const {
    json j_children = json::object();
    for (const auto & [node, kids] : children) {
        j_children[node] = kids;
    }
    return json{
        {"root", root},
        {"children", j_children},
        {"depth", depth}
    };
}

broadcast_tree build_broadcast_tree(const std::string & root, const std::vector<std::string> & peers) {
    broadcast_tree tree;
    tree.root = root;

    std::vector<std::string> sorted;
    for (const auto & id : peers) {
        if (id != root) {
            sorted.push_back(id);
        }
    }
    std::sort(sorted.begin(), sorted.end());
    sorted.erase(std::unique(sorted.begin(), sorted.end()), sorted.end());

    std::map<std::string, int> level;
    level[root] = 0;

    for (size_t i = 0; i < sorted.size(); i++) {
        const std::string & p = i == 0 ? root : sorted[(i - 1) / 2];
        tree.children[p].push_back(sorted[i]);
        tree.parent[sorted[i]] = p;
        level[sorted[i]] = level[p] + 1;
        tree.depth = std::max(tree.depth, level[sorted[i]]);
    }

    return tree;
}

static void visit(const broadcast_tree & tree, const std::string & node,
                  std::set<std::string> & visited, std::vector<std::string> & order) {
    auto it = tree.children.find(node);
    if (it == tree.children.end()) {
        return;
    }
    for (const auto & child : it->second) {
        if (!visited.insert(child).second) {
            continue;
        }
        order.push_back(child);
        visit(tree, child, visited, order);
    }
}

std::vector<std::string> broadcast_order(const broadcast_tree & tree) {
    std::vector<std::string> order;
    std::set<std::string> visited = {tree.root};
    visit(tree, tree.root, visited, order);
    return order;
}

} // namespace swarm
