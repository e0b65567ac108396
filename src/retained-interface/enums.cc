#include "enums.hh"

#include <clean-core/assert.hh>

cc::optional<ri::modifier_key> ri::modifier_of(key k)
{
    switch (k)
    {
    case key::ctrl_left:
        return modifier_key::ctrl_left;
    case key::ctrl_right:
        return modifier_key::ctrl_right;
    case key::shift_left:
        return modifier_key::shift_left;
    case key::shift_right:
        return modifier_key::shift_right;
    case key::alt_left:
        return modifier_key::alt_left;
    case key::alt_right:
        return modifier_key::alt_right;
    case key::gui_left:
        return modifier_key::gui_left;
    case key::gui_right:
        return modifier_key::gui_right;
    default:
        return {};
    }
}

cc::string_view ri::to_string(mouse_button b)
{
    switch (b)
    {
    case mouse_button::unknown:
        return "unknown";
    case mouse_button::left:
        return "left";
    case mouse_button::right:
        return "right";
    case mouse_button::middle:
        return "middle";
    case mouse_button::x1:
        return "x1";
    case mouse_button::x2:
        return "x2";
    case mouse_button::button6:
        return "button6";
    case mouse_button::button7:
        return "button7";
    case mouse_button::button8:
        return "button8";
    }
    CC_UNREACHABLE("unknown mouse button");
}

cc::string_view ri::to_string(cursor_icon c)
{
    switch (c)
    {
    case cursor_icon::arrow:
        return "arrow";
    case cursor_icon::text:
        return "text";
    case cursor_icon::hand:
        return "hand";
    case cursor_icon::crosshair:
        return "crosshair";
    case cursor_icon::resize_horizontal:
        return "resize_horizontal";
    case cursor_icon::resize_vertical:
        return "resize_vertical";
    case cursor_icon::not_allowed:
        return "not_allowed";
    }
    CC_UNREACHABLE("unknown cursor icon");
}
