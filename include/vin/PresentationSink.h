#pragma once

#include <string>

#include "vin/Events.h"

namespace vin {

/*! Renders UI updates and inserts transcribed text for the user.
 *
 *  Called from the UI update thread only.
 */
class PresentationSink {
public:
    PresentationSink() = default;
    virtual ~PresentationSink() = default;

    virtual void render(const UIUpdate& update) = 0;

    virtual void insertText(const std::string& text) = 0;
};

} // ns
