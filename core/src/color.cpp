#include <statusind/color.h>
#include <cstdlib>
#include <sstream>
#include <vector>

namespace statusind {

bool Color::parse(const std::string& text, Color& out) {
    std::vector<float> values;
    std::stringstream ss(text);
    std::string item;

    while (std::getline(ss, item, ',')) {
        const char* begin = item.c_str();
        char* end = nullptr;
        float v = std::strtof(begin, &end);
        if (end == begin) {
            return false;
        }
        while (*end == ' ') ++end;
        if (*end != '\0') {
            return false;
        }
        values.push_back(v);
    }

    if (values.size() == 3) {
        out = Color(values[0], values[1], values[2]);
        return true;
    }
    if (values.size() == 4) {
        out = Color(values[0], values[1], values[2], values[3]);
        return true;
    }
    return false;
}

Foreground pickForeground(float backgroundLuminanceSum) {
    return backgroundLuminanceSum > LIGHT_BACKGROUND_THRESHOLD ? Foreground::Black
                                                               : Foreground::White;
}

void ColorPolicy::reset(const Background& background) {
    m_luminanceSum = background.effective().channelSum();
    m_foreground = pickForeground(m_luminanceSum);
}

} // namespace statusind
