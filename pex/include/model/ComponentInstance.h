#pragma once

#include "model/PropValue.h"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace PEX {

/**
 * @brief Palette category of a component; layout children get wrapped to match the editor canvas
 */
enum class ComponentCategory { Layout, Ui, Data, Form, Navbar, General };

/**
 * @brief Raw CSS declarations as authored (camelCase property -> value)
 */
using StyleDeclarations = std::map<std::string, std::string>;

struct EventAction {
    std::string type;  // navigate, openUrl, ...
    PropMap config;    // e.g. {"route": "/contact"}
};

struct EventBinding {
    std::string eventType;  // click, hover, ...
    EventAction action;
};

enum class DataSourceType { Api, Static, Context };

struct DataSourceConfig {
    DataSourceType type = DataSourceType::Static;
    std::string endpoint;
    std::string method = "GET";
    std::string dataPath;
    PropValue staticData;
    std::map<std::string, std::string> fieldMapping;
};

struct ComponentSize {
    std::string width;
    std::string height;
};

struct GridPosition {
    int row = 0;
    int column = 0;
    int rowSpan = 1;
    int columnSpan = 1;
};

/**
 * @brief One node of an authored page tree
 *
 * Children are owned in render order. parentId is only a lookup key checked
 * against the real parent by ComponentTree.
 */
struct ComponentInstance {
    std::string instanceId;
    std::string componentId;  // kind: Label, Button, Container, ...
    std::string pluginId;
    ComponentCategory category = ComponentCategory::General;
    PropMap props;
    StyleDeclarations styles;
    std::vector<ComponentInstance> children;
    std::optional<std::string> parentId;
    std::vector<EventBinding> events;
    std::optional<DataSourceConfig> dataSource;
    std::map<std::string, std::string> templateBindings;
    std::optional<ComponentSize> size;
    std::optional<GridPosition> position;

    bool isLayout() const {
        return category == ComponentCategory::Layout;
    }

    /**
     * @brief Route of the first navigate action bound to a click event, empty when none
     */
    std::string navigationRoute() const;

    static ComponentCategory categoryFromString(const std::string &name);
    static const char *categoryName(ComponentCategory category);
};

}  // namespace PEX
