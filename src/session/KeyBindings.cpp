#include "mindgraph/session/KeyBindings.h"

#include <algorithm>
#include <cctype>

namespace mindgraph {

std::optional<InputEvent> translateKey(const KeyEvent& event) {
    if (event.editingText) {
        return std::nullopt;
    }

    std::string key = event.key;
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (key == "delete" || key == "backspace") return intent::DeleteSelection{};

    const bool mod = event.ctrl || event.meta;
    if (mod && key == "z") {
        if (event.shift) return intent::Redo{};
        return intent::Undo{};
    }
    if (mod && key == "y") return intent::Redo{};

    if (key == "tab") return intent::AddChild{};
    if (key == "enter") return intent::AddSibling{};

    return std::nullopt;
}

}  // namespace mindgraph
