#pragma once

#include <string>

namespace PEX {

/**
 * @brief Server-side data endpoint derived from a component data source
 */
struct ApiEndpointConfig {
    std::string endpoint;        // as authored, e.g. /api/products
    std::string dataPath;        // response key wrapping the payload, empty means "items"
    std::string controllerName;  // ProductsController
    std::string methodName;      // getProducts
    std::string routePath;       // mapping registered by the controller

    std::string effectiveDataPath() const {
        return dataPath.empty() ? "items" : dataPath;
    }

    bool operator==(const ApiEndpointConfig &other) const = default;
};

}  // namespace PEX
