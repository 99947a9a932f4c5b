#pragma once

#include "emit/IEmitterRegistry.h"
#include <functional>
#include <map>
#include <utility>

namespace PEX {

/**
 * @brief Map-backed emitter registry keyed by (pluginId, kind)
 */
class EmitterRegistry : public IEmitterRegistry {
public:
    using RenderFunction = std::function<std::optional<std::string>(const ComponentInstance &component,
                                                                    const std::string &childrenMarkup,
                                                                    ExportTarget target)>;

    /**
     * @brief Register or replace the emitter of @p kind in @p pluginId
     */
    void registerEmitter(const std::string &pluginId, const std::string &kind, RenderFunction render);

    bool unregisterEmitter(const std::string &pluginId, const std::string &kind);

    size_t size() const {
        return emitters_.size();
    }

    bool has(const std::string &kind, const std::string &pluginId) const override;

    std::optional<std::string> render(const std::string &kind, const std::string &pluginId,
                                      const ComponentInstance &component, const std::string &childrenMarkup,
                                      ExportTarget target) const override;

private:
    std::map<std::pair<std::string, std::string>, RenderFunction> emitters_;
};

}  // namespace PEX
