#include "model/ComponentTree.h"
#include "common/Logger.h"

namespace PEX {

ComponentTree::ComponentTree(const PageDefinition &page) {
    for (const auto &root : page.components) {
        index(root, nullptr, 0);
    }
    LOG_DEBUG("ComponentTree: Indexed {} components of page '{}'", order_.size(), page.pageName);
}

void ComponentTree::index(const ComponentInstance &node, const ComponentInstance *parent, int depth) {
    order_.push_back(&node);

    auto [it, inserted] = nodes_.emplace(node.instanceId, NodeInfo{&node, parent, depth});
    if (!inserted) {
        duplicateIds_.push_back(node.instanceId);
    }

    for (const auto &child : node.children) {
        index(child, &node, depth + 1);
    }
}

bool ComponentTree::isAncestor(const std::string &candidateId, const std::string &instanceId) const {
    auto it = nodes_.find(instanceId);
    if (it == nodes_.end()) {
        return false;
    }

    const ComponentInstance *current = it->second.parent;
    // Bounded by the number of components even if ids repeat
    for (size_t steps = 0; current && steps <= order_.size(); ++steps) {
        if (current->instanceId == candidateId) {
            return true;
        }
        auto parentIt = nodes_.find(current->instanceId);
        current = parentIt == nodes_.end() ? nullptr : parentIt->second.parent;
    }
    return false;
}

bool ComponentTree::validate(Diagnostics &diagnostics) const {
    bool valid = true;

    for (const auto &id : duplicateIds_) {
        diagnostics.error(DiagnosticCategory::TreeInvariant, id, "instanceId is used by more than one component");
        valid = false;
    }

    for (const ComponentInstance *node : order_) {
        if (!node->parentId) {
            continue;
        }

        const std::string &declared = *node->parentId;
        const ComponentInstance *actual = parentOf(node->instanceId);

        if (declared == node->instanceId || isAncestor(node->instanceId, declared)) {
            diagnostics.error(DiagnosticCategory::TreeInvariant, node->instanceId,
                              "parentId '" + declared + "' creates a cycle");
            valid = false;
            continue;
        }

        if (actual && actual->instanceId == declared) {
            continue;
        }

        if (!find(declared)) {
            diagnostics.warning(DiagnosticCategory::MalformedInput, node->instanceId,
                                "parentId '" + declared + "' does not match any component, ignored");
        } else if (!actual) {
            diagnostics.warning(DiagnosticCategory::MalformedInput, node->instanceId,
                                "root component declares parentId '" + declared + "', ignored");
        } else if (isAncestor(declared, node->instanceId)) {
            diagnostics.warning(DiagnosticCategory::MalformedInput, node->instanceId,
                                "parentId '" + declared + "' names an ancestor instead of the direct parent '" +
                                    actual->instanceId + "', ignored");
        } else {
            diagnostics.warning(DiagnosticCategory::MalformedInput, node->instanceId,
                                "parentId '" + declared + "' is not an ancestor, ignored");
        }
    }

    return valid;
}

bool ComponentTree::validatePages(const std::vector<const PageDefinition *> &pages, Diagnostics &diagnostics) {
    bool valid = true;
    for (const PageDefinition *page : pages) {
        if (page && !ComponentTree(*page).validate(diagnostics)) {
            LOG_ERROR("ComponentTree: Page '{}' violates the tree invariants", page->pageName);
            valid = false;
        }
    }
    return valid;
}

const ComponentInstance *ComponentTree::find(const std::string &instanceId) const {
    auto it = nodes_.find(instanceId);
    return it == nodes_.end() ? nullptr : it->second.node;
}

const ComponentInstance *ComponentTree::parentOf(const std::string &instanceId) const {
    auto it = nodes_.find(instanceId);
    return it == nodes_.end() ? nullptr : it->second.parent;
}

int ComponentTree::depthOf(const std::string &instanceId) const {
    auto it = nodes_.find(instanceId);
    return it == nodes_.end() ? -1 : it->second.depth;
}

}  // namespace PEX
