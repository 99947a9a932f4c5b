#pragma once

#include "common/Diagnostics.h"
#include "model/PageDefinition.h"
#include <string>
#include <unordered_map>
#include <vector>

namespace PEX {

/**
 * @brief Read-only index over one page's component forest
 *
 * Components stay owned by their parents inside the PageDefinition; the tree only
 * keeps non-owning pointers, so the page must outlive it. Lookups by instanceId
 * resolve to the first component carrying that id.
 */
class ComponentTree {
public:
    explicit ComponentTree(const PageDefinition &page);

    /**
     * @brief Check the forest invariants
     *
     * Duplicate instanceIds and parentIds that point at the component itself or one of
     * its descendants are errors. Any other parentId that does not name the actual
     * parent is a malformed-input warning and is otherwise ignored.
     *
     * @param diagnostics Receives one entry per violation
     * @return false when the page cannot be exported
     */
    bool validate(Diagnostics &diagnostics) const;

    /**
     * @brief Validate every page, reporting all violations before giving up
     * @return false when any page cannot be exported
     */
    static bool validatePages(const std::vector<const PageDefinition *> &pages, Diagnostics &diagnostics);

    const ComponentInstance *find(const std::string &instanceId) const;

    /**
     * @brief Actual parent of @p instanceId, nullptr for roots and unknown ids
     */
    const ComponentInstance *parentOf(const std::string &instanceId) const;

    /**
     * @brief Nesting depth, 0 for page roots, -1 for unknown ids
     */
    int depthOf(const std::string &instanceId) const;

    /**
     * @brief All components depth-first, pre-order, in authored order
     */
    const std::vector<const ComponentInstance *> &preOrder() const {
        return order_;
    }

    size_t size() const {
        return order_.size();
    }

private:
    struct NodeInfo {
        const ComponentInstance *node = nullptr;
        const ComponentInstance *parent = nullptr;
        int depth = 0;
    };

    void index(const ComponentInstance &node, const ComponentInstance *parent, int depth);
    bool isAncestor(const std::string &candidateId, const std::string &instanceId) const;

    std::unordered_map<std::string, NodeInfo> nodes_;
    std::vector<const ComponentInstance *> order_;
    std::vector<std::string> duplicateIds_;
};

}  // namespace PEX
