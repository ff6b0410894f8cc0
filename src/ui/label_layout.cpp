#include "ui/label_layout.hpp"

#include <glibmm/ustring.h>

namespace ui {

std::string elide_to_fit(const std::string& text, const FitsFunc& fits)
{
    if (fits(text)) {
        return text;
    }

    Glib::ustring line(text);
    while (!line.empty() && !fits(line.raw() + "...")) {
        line.erase(line.length() - 1);
    }
    return line.raw() + "...";
}

std::vector<std::string> wrap_label(const std::string& text, const FitsFunc& fits)
{
    if (fits(text)) {
        return {text};
    }

    // Spaces are single bytes, so byte offsets split on character boundaries.
    size_t split = text.rfind(' ', text.size() / 2 + 1);
    if (split == std::string::npos) {
        split = text.find(' ');
    }
    if (split == std::string::npos) {
        return {elide_to_fit(text, fits)};
    }
    return {elide_to_fit(text.substr(0, split), fits), elide_to_fit(text.substr(split + 1), fits)};
}

}
