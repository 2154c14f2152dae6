#include "droidbridge/keycodes.hpp"
#include "droidbridge/text.hpp"

namespace droidbridge {

// http://developer.android.com/reference/android/view/KeyEvent.html
const std::map<std::string, int>& key_codes() {
    static const std::map<std::string, int> codes = {
        {"HOME", 3},
        {"BACK", 4},
        {"UP", 19},
        {"DOWN", 20},
        {"LEFT", 21},
        {"RIGHT", 22},
        {"CENTER", 23},
        {"VOLUME_UP", 24},
        {"VOLUME_DOWN", 25},
        {"POWER", 26},
        {"A", 29},
        {"C", 31},
        {"V", 50},
        {"X", 52},
        {"TAB", 61},
        {"ENTER", 66},
        {"BACKSPACE", 67},
        {"MENU", 82},
        {"ESC", 111},
        {"DEL", 112},
        {"CTRL", 113},
        {"END", 123},
        {"APP_SWITCH", 187},
    };
    return codes;
}

std::optional<int> key_code(const std::string& name) {
    const auto& codes = key_codes();
    auto it = codes.find(to_upper(name));
    if (it == codes.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace droidbridge
