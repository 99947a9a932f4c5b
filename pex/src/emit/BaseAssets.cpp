#include "emit/BaseAssets.h"

namespace PEX {

namespace {

const char *const SHARED_RESET = R"(* {
  box-sizing: border-box;
  margin: 0;
  padding: 0;
}

html, body {
  width: 100%;
  min-height: 100%;
}

body {
  font-family: -apple-system, BlinkMacSystemFont, 'Segoe UI', Roboto, Oxygen, Ubuntu, Cantarell, sans-serif;
  line-height: 1.6;
  color: #333;
}

.page-content {
  width: 100%;
  min-height: 100vh;
}

.component {
  position: relative;
}
)";

const char *const STATIC_RULES = R"(
/* Only top-level containers span the page; nested ones size to their content */
.page-content > .container {
  width: 100%;
}

.image {
  max-width: 100%;
  height: auto;
}

.textbox {
  word-wrap: break-word;
}

@media (max-width: 768px) {
  .navbar ul {
    display: none !important;
    flex-direction: column !important;
    position: absolute !important;
    top: 100% !important;
    left: 0 !important;
    right: 0 !important;
    background: inherit !important;
    padding: 1rem !important;
    box-shadow: 0 4px 6px rgba(0,0,0,0.1) !important;
  }

  .navbar ul.active {
    display: flex !important;
  }

  .navbar .navbar-toggle {
    display: flex !important;
  }

  .container[style*="grid-template-columns"] {
    grid-template-columns: 1fr !important;
  }

  .container[style*="flex-direction: row"] {
    flex-direction: column !important;
  }
}
)";

const char *const SERVER_RULES = R"(
.navbar-nav {
  list-style: none;
}

.navbar-nav a {
  text-decoration: none;
  color: inherit;
}

.button {
  cursor: pointer;
}

@media (max-width: 768px) {
  .navbar {
    flex-wrap: wrap;
  }

  .navbar-nav {
    flex-direction: column;
    width: 100%;
    display: none !important;
  }

  .navbar-nav.active {
    display: flex !important;
  }

  .navbar .navbar-toggle {
    display: flex !important;
  }

  .container[style*="grid-template-columns"] {
    grid-template-columns: 1fr !important;
  }
}
)";

const char *const STATIC_SCRIPT = R"(// Site script generated by pexport

document.addEventListener('DOMContentLoaded', function() {
  document.querySelectorAll('.navbar-toggle').forEach(function(toggle) {
    toggle.addEventListener('click', function() {
      var navbar = this.closest('.navbar, nav');
      var navList = navbar ? navbar.querySelector('ul') : null;
      if (navList) {
        navList.classList.toggle('active');
      }
    });
  });

  document.querySelectorAll('a[href^="#"]').forEach(function(anchor) {
    anchor.addEventListener('click', function(e) {
      var href = this.getAttribute('href');
      if (href && href !== '#') {
        var target = document.querySelector(href);
        if (target) {
          e.preventDefault();
          target.scrollIntoView({ behavior: 'smooth' });
        }
      }
    });
  });

  document.querySelectorAll('.button').forEach(function(button) {
    button.addEventListener('mouseenter', function() {
      if (!this.disabled) {
        this.style.filter = 'brightness(0.9)';
      }
    });
    button.addEventListener('mouseleave', function() {
      this.style.filter = 'none';
    });
  });
});
)";

const char *const SERVER_SCRIPT = R"(// Site script generated by pexport

document.addEventListener('DOMContentLoaded', function() {
  document.querySelectorAll('.navbar-toggle').forEach(function(toggle) {
    toggle.addEventListener('click', function() {
      var navbar = this.closest('.navbar, nav');
      var navList = navbar ? navbar.querySelector('.navbar-nav') : null;
      if (navList) {
        navList.classList.toggle('active');
      }
    });
  });
});
)";

}  // namespace

const std::string &BaseAssets::stylesheet(ExportTarget target) {
    static const std::string staticCss = std::string("/* Base styles generated by pexport */\n") + SHARED_RESET + STATIC_RULES;
    static const std::string serverCss = std::string("/* Base styles generated by pexport */\n") +
                                         "/* Component styles are inline so the page matches the editor canvas */\n" +
                                         SHARED_RESET + SERVER_RULES;
    return target == ExportTarget::ServerProject ? serverCss : staticCss;
}

const std::string &BaseAssets::script(ExportTarget target) {
    static const std::string staticJs = STATIC_SCRIPT;
    static const std::string serverJs = SERVER_SCRIPT;
    return target == ExportTarget::ServerProject ? serverJs : staticJs;
}

const std::string &BaseAssets::placeholderSvg() {
    static const std::string svg =
        R"(<svg xmlns="http://www.w3.org/2000/svg" width="400" height="300" viewBox="0 0 400 300">
  <rect fill="#f0f0f0" width="400" height="300"/>
  <rect fill="#e0e0e0" x="50" y="50" width="300" height="200" rx="8"/>
  <path fill="#ccc" d="M175 120 L225 120 L200 95 Z M150 180 L180 150 L210 175 L250 135 L280 180 Z"/>
  <circle fill="#ccc" cx="260" cy="110" r="20"/>
  <text fill="#999" font-family="Arial, sans-serif" font-size="16" x="200" y="230" text-anchor="middle">Image not available</text>
</svg>
)";
    return svg;
}

const std::string &BaseAssets::brokenImageDataUrl() {
    // Percent-encoded so it can sit inside a double-quoted attribute and a single-quoted script string
    static const std::string url =
        "data:image/svg+xml,%3Csvg xmlns=%22http://www.w3.org/2000/svg%22 width=%22200%22 height=%22150%22%3E"
        "%3Crect fill=%22%23ddd%22 width=%22200%22 height=%22150%22/%3E"
        "%3Ctext fill=%22%23999%22 x=%2250%25%22 y=%2250%25%22 text-anchor=%22middle%22 dy=%22.3em%22%3E"
        "Image not found%3C/text%3E%3C/svg%3E";
    return url;
}

}  // namespace PEX
