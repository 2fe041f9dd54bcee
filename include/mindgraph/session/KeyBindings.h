#pragma once

#include "InputEvent.h"

#include <optional>
#include <string>

namespace mindgraph {

/// Keyboard event as delivered by the host canvas
struct KeyEvent {
    std::string key;          ///< "Tab", "Enter", "Delete", "Backspace", "z", ...
    bool ctrl = false;
    bool meta = false;        ///< Cmd on macOS, counts as Ctrl
    bool shift = false;
    bool editingText = false; ///< A text field has focus
};

/// Canvas shortcuts:
///   Tab                 add child
///   Enter               add sibling
///   Delete / Backspace  delete selection
///   Mod+Z               undo
///   Mod+Shift+Z, Mod+Y  redo
/// Nothing is translated while a text field has focus.
std::optional<InputEvent> translateKey(const KeyEvent& event);

}  // namespace mindgraph
