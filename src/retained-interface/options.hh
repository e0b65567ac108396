#pragma once

#include <clean-core/flags.hh>

namespace ri
{
/// per-widget behaviour when registering an area for input picking
enum class widget_option
{
    /// area is drawn but never picked, i.e. clicks fall through to widgets below
    no_input,
    /// a left press on this widget does not move keyboard capture to it
    no_keyboard,
};

CC_FLAGS_ENUM(widget_option);

using widget_options = cc::flags<widget_option>;
}
