#pragma once

#include <chrono>
#include <optional>
#include <ostream>

namespace vin {

enum class Key {
    Modifier,       // Ctrl
    AltModifier,    // Alt
    Trigger         // CapsLock
};

struct KeyEdge {
    Key key{Key::Trigger};
    bool pressed{};
    bool repeat{};   // auto-repeat from a held key
};

/*! Delivers press/release edges for the keys the router cares about.
 *
 *  next() is called from the EventRouter's thread only.
 */
class InputSource {
public:
    InputSource() = default;
    virtual ~InputSource() = default;

    // Waits up to timeout for the next edge
    virtual std::optional<KeyEdge> next(std::chrono::milliseconds timeout) = 0;
};

std::ostream& operator << (std::ostream& os, Key key);
std::ostream& operator << (std::ostream& os, const KeyEdge& edge);

} // ns
