#include "diagnostics.hh"

#include <clean-core/assert.hh>

cc::string_view ri::to_string(input_error e)
{
    switch (e)
    {
    case input_error::none:
        return "none";
    case input_error::allocation_exhausted:
        return "allocation exhausted";
    case input_error::mismatched_capture:
        return "mismatched capture";
    case input_error::stale_release_without_press:
        return "stale release without press";
    }
    CC_UNREACHABLE("unknown input error");
}

void ri::input_diagnostics::report(input_error e)
{
    switch (e)
    {
    case input_error::none:
        return;
    case input_error::allocation_exhausted:
        ++allocation_exhausted;
        break;
    case input_error::mismatched_capture:
        ++mismatched_capture;
        break;
    case input_error::stale_release_without_press:
        ++stale_release_without_press;
        break;
    }
    last_error = e;
}

int ri::input_diagnostics::count(input_error e) const
{
    switch (e)
    {
    case input_error::none:
        return 0;
    case input_error::allocation_exhausted:
        return allocation_exhausted;
    case input_error::mismatched_capture:
        return mismatched_capture;
    case input_error::stale_release_without_press:
        return stale_release_without_press;
    }
    CC_UNREACHABLE("unknown input error");
}

ri::input_diagnostics& ri::input_diagnostics::operator+=(input_diagnostics const& rhs)
{
    allocation_exhausted += rhs.allocation_exhausted;
    mismatched_capture += rhs.mismatched_capture;
    stale_release_without_press += rhs.stale_release_without_press;
    if (rhs.last_error != input_error::none)
        last_error = rhs.last_error;
    return *this;
}
