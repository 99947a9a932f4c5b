#pragma once

#include "model/ExportOptions.h"
#include <string>

namespace PEX {

/**
 * @brief Fixed stylesheet, script and image texts shipped with every export
 */
class BaseAssets {
public:
    /**
     * @brief Reset and responsive rules; component styles stay inline
     */
    static const std::string &stylesheet(ExportTarget target);

    /**
     * @brief Navbar toggle and, for static sites, smooth anchor scrolling and button hover
     */
    static const std::string &script(ExportTarget target);

    /**
     * @brief 400x300 placeholder served for images the server project cannot resolve
     */
    static const std::string &placeholderSvg();

    /**
     * @brief Inline data URL shown by an <img> that failed to load, or has no usable source
     */
    static const std::string &brokenImageDataUrl();
};

}  // namespace PEX
