#pragma once

#include "model/ComponentInstance.h"
#include "style/StyleMap.h"
#include <string>

namespace PEX {

/**
 * @brief Image styles for the container / wrapper / img structure the editor renders
 */
struct ImageStyles {
    StyleMap container;
    StyleMap wrapper;
    StyleMap image;
};

/**
 * @brief Styles of the navigation bar parts, all derived from one component
 */
struct NavbarStyles {
    StyleMap container;
    StyleMap brand;
    StyleMap list;
    StyleMap activeLink;
    StyleMap inactiveLink;
    StyleMap toggle;
    StyleMap toggleLine;
};

/**
 * @brief Computes the final inline styles of every built-in component kind
 *
 * Precedence, lowest to highest: fixed tables (layout presets, button variants and
 * sizes, image and navbar defaults), then the style-affecting props, then the
 * authored styles. Output is a pure function of the component and its depth.
 */
class StyleResolver {
public:
    /**
     * @brief layoutType, then layoutMode, then "flex-column"
     */
    static std::string layoutOf(const ComponentInstance &component);

    /**
     * @brief display and flow/track properties of a layout preset; unknown names resolve as flex-column
     */
    static StyleMap layoutPreset(const std::string &layout);

    static bool isRowLayout(const std::string &layout);

    /**
     * @brief Container / ScrollableContainer styles
     * @param component The container
     * @param depth Nesting depth, 0 for page roots; nested containers become transparent wrappers
     */
    static StyleMap resolveContainer(const ComponentInstance &component, int depth);

    /**
     * @brief Wrapper style for a layout-category child of a container with @p parentLayout
     */
    static StyleMap layoutChildWrapper(const std::string &parentLayout);

    /**
     * @brief Strip background and card decorations that a nested container should not show
     *
     * Applies only to values carried over from authored styles; an intentional
     * gradient or url() background keeps everything.
     */
    static void applyNestedTransparency(StyleMap &styles);

    static bool hasIntentionalBackground(const StyleMap &styles);
    static bool isDefaultBackgroundColor(const std::string &value);

    static StyleMap buttonVariant(const std::string &variant);
    static StyleMap buttonSize(const std::string &size);
    static StyleMap resolveButton(const ComponentInstance &component);

    /**
     * @param hasParent Images inside a container default to the parent's full width
     */
    static ImageStyles resolveImage(const ComponentInstance &component, bool hasParent);

    static NavbarStyles resolveNavbar(const ComponentInstance &component);

    /**
     * @brief Labels, rich text and unknown kinds carry their authored styles unchanged
     */
    static StyleMap resolveAuthored(const ComponentInstance &component);

    /**
     * @brief Numbers become pixel lengths, strings pass through, anything else is empty
     */
    static std::string cssLength(const PropValue *value);
};

}  // namespace PEX
