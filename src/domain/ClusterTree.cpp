/**
 * @file ClusterTree.cpp
 * @brief Implementation of ClusterTree.
 */

#include "domain/ClusterTree.hpp"

#include <algorithm>
#include <stdexcept>

namespace thoughtflow::domain {

std::string LeafReasonToString(LeafReason reason) {
    switch (reason) {
        case LeafReason::None: return "none";
        case LeafReason::BelowMinSize: return "below_min_size";
        case LeafReason::DepthLimit: return "depth_limit";
        case LeafReason::ClusteringDegenerate: return "clustering_degenerate";
    }
    return "none";
}

NodeIndex ClusterTree::addNode(ClusterNode node, std::optional<NodeIndex> parent) {
    if (m_idIndex.count(node.id) > 0) {
        throw std::invalid_argument("Duplicate cluster id: " + node.id);
    }
    if (parent && *parent >= m_nodes.size()) {
        throw std::out_of_range("Parent index out of range for " + node.id);
    }

    NodeIndex index = m_nodes.size();
    node.parent = parent;
    m_idIndex[node.id] = index;
    m_nodes.push_back(std::move(node));

    if (parent) {
        m_nodes[*parent].children.push_back(index);
    }
    return index;
}

std::optional<NodeIndex> ClusterTree::findById(const std::string& id) const {
    auto it = m_idIndex.find(id);
    if (it == m_idIndex.end()) return std::nullopt;
    return it->second;
}

std::vector<NodeIndex> ClusterTree::preOrder() const {
    std::vector<NodeIndex> order;
    if (m_nodes.empty()) return order;
    order.reserve(m_nodes.size());

    std::vector<NodeIndex> stack{rootIndex()};
    while (!stack.empty()) {
        NodeIndex current = stack.back();
        stack.pop_back();
        order.push_back(current);
        const auto& kids = m_nodes[current].children;
        for (auto it = kids.rbegin(); it != kids.rend(); ++it) {
            stack.push_back(*it);
        }
    }
    return order;
}

std::vector<NodeIndex> ClusterTree::leaves() const {
    std::vector<NodeIndex> result;
    for (NodeIndex idx : preOrder()) {
        if (m_nodes[idx].isLeaf()) result.push_back(idx);
    }
    return result;
}

bool ClusterTree::validate(std::vector<std::string>& errors, bool requireLabels) const {
    const std::size_t before = errors.size();
    if (m_nodes.empty()) {
        errors.push_back("tree is empty");
        return false;
    }

    const ClusterNode& rootNode = m_nodes[rootIndex()];
    if (rootNode.depth != 0) errors.push_back("root depth is not 0");
    if (rootNode.parent) errors.push_back("root has a parent");

    for (const auto& n : m_nodes) {
        if (n.isLeaf() && !n.children.empty()) {
            errors.push_back(n.id + ": leaf has children");
        }
        if (!n.isLeaf() && n.children.empty()) {
            errors.push_back(n.id + ": internal node without children");
        }
        if (!std::is_sorted(n.memberIndices.begin(), n.memberIndices.end())) {
            errors.push_back(n.id + ": member indices are not sorted");
        }
        if (requireLabels && (!n.label || n.label->empty())) {
            errors.push_back(n.id + ": missing label");
        }
        if (!n.isLeaf() && !n.relationships.empty()) {
            errors.push_back(n.id + ": relationships on an internal node");
        }

        if (n.children.empty()) continue;

        std::vector<int> united;
        for (NodeIndex c : n.children) {
            const ClusterNode& child = m_nodes.at(c);
            if (child.depth != n.depth + 1) {
                errors.push_back(child.id + ": depth is not parent depth + 1");
            }
            if (child.id.rfind(n.id + "_", 0) != 0) {
                errors.push_back(child.id + ": id does not extend parent path " + n.id);
            }
            united.insert(united.end(), child.memberIndices.begin(), child.memberIndices.end());
        }
        std::sort(united.begin(), united.end());
        if (std::adjacent_find(united.begin(), united.end()) != united.end()) {
            errors.push_back(n.id + ": children share member indices");
        }
        if (united != n.memberIndices) {
            errors.push_back(n.id + ": children do not cover parent members");
        }
    }

    return errors.size() == before;
}

} // namespace thoughtflow::domain
