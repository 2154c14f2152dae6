#ifndef DROIDBRIDGE_KEYCODES_HPP
#define DROIDBRIDGE_KEYCODES_HPP

#include <map>
#include <optional>
#include <string>

namespace droidbridge {

// Upper-case key names mapped to android.view.KeyEvent codes
const std::map<std::string, int>& key_codes();

// Case-insensitive lookup
std::optional<int> key_code(const std::string& name);

} // namespace droidbridge

#endif // DROIDBRIDGE_KEYCODES_HPP
