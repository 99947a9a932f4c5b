#pragma once

#include "model/ComponentInstance.h"
#include "model/ExportOptions.h"
#include <optional>
#include <string>

namespace PEX {

/**
 * @brief Source of markup for plugin-provided component kinds
 *
 * Consulted before the built-in emitters. The returned markup is placed inside the
 * component wrapper as-is.
 */
class IEmitterRegistry {
public:
    virtual ~IEmitterRegistry() = default;

    /**
     * @brief Whether an emitter is registered for @p kind from @p pluginId
     */
    virtual bool has(const std::string &kind, const std::string &pluginId) const = 0;

    /**
     * @brief Render a component
     * @param kind Component kind (componentId)
     * @param pluginId Plugin the kind belongs to
     * @param component The component to render
     * @param childrenMarkup Already emitted children, empty when there are none
     * @param target Export target the markup is for
     * @return Markup, or std::nullopt to fall back to the built-in emitters
     */
    virtual std::optional<std::string> render(const std::string &kind, const std::string &pluginId,
                                              const ComponentInstance &component, const std::string &childrenMarkup,
                                              ExportTarget target) const = 0;
};

}  // namespace PEX
