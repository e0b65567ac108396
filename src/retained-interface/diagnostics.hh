#pragma once

#include <cstdint>

#include <clean-core/string_view.hh>

namespace ri
{
/// recoverable anomalies of the input pipeline
/// none of them interrupt a cycle, they are absorbed and counted
enum class input_error : uint8_t
{
    none,
    allocation_exhausted,
    mismatched_capture,
    stale_release_without_press,
};

cc::string_view to_string(input_error e);

struct input_diagnostics
{
    int allocation_exhausted = 0;
    int mismatched_capture = 0;
    int stale_release_without_press = 0;

    input_error last_error = input_error::none;

    void report(input_error e);

    int count(input_error e) const;
    int total() const { return allocation_exhausted + mismatched_capture + stale_release_without_press; }
    bool empty() const { return total() == 0; }

    void clear() { *this = {}; }

    input_diagnostics& operator+=(input_diagnostics const& rhs);
};
}
