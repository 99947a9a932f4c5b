#include "emit/EmitterRegistry.h"
#include "common/Logger.h"

namespace PEX {

void EmitterRegistry::registerEmitter(const std::string &pluginId, const std::string &kind, RenderFunction render) {
    LOG_DEBUG("EmitterRegistry: Registering {} from plugin {}", kind, pluginId);
    emitters_[{pluginId, kind}] = std::move(render);
}

bool EmitterRegistry::unregisterEmitter(const std::string &pluginId, const std::string &kind) {
    return emitters_.erase({pluginId, kind}) > 0;
}

bool EmitterRegistry::has(const std::string &kind, const std::string &pluginId) const {
    auto it = emitters_.find({pluginId, kind});
    return it != emitters_.end() && it->second;
}

std::optional<std::string> EmitterRegistry::render(const std::string &kind, const std::string &pluginId,
                                                   const ComponentInstance &component,
                                                   const std::string &childrenMarkup, ExportTarget target) const {
    auto it = emitters_.find({pluginId, kind});
    if (it == emitters_.end() || !it->second) {
        return std::nullopt;
    }
    return it->second(component, childrenMarkup, target);
}

}  // namespace PEX
