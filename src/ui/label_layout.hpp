#ifndef UI_LABEL_LAYOUT_HPP
#define UI_LABEL_LAYOUT_HPP

#include <functional>
#include <string>
#include <vector>

namespace ui {
// Returns whether a UTF-8 line fits the available width.
using FitsFunc = std::function<bool(const std::string& line)>;

// Shortens text by whole characters until it plus "..." fits.
std::string elide_to_fit(const std::string& text, const FitsFunc& fits);

// One line if it fits, otherwise two lines split at a space near the middle,
// each elided. Text without spaces becomes a single elided line.
std::vector<std::string> wrap_label(const std::string& text, const FitsFunc& fits);
}

#endif
