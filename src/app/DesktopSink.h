#pragma once

#include "vin/PresentationSink.h"

/*! Presents the dictation state on the desktop.
 *
 *  Results go to stdout and to the clipboard. The clipboard is only touched on the
 *  GUI thread.
 */
class DesktopSink : public vin::PresentationSink
{
public:
    void render(const vin::UIUpdate& update) override;
    void insertText(const std::string& text) override;
};
