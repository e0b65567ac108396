#pragma once

// NOTE: this header includes everything needed to drive a retained ui
//       (widgets usually only need ui.hh)

#include <retained-interface/change_tracker.hh>
#include <retained-interface/diagnostics.hh>
#include <retained-interface/enums.hh>
#include <retained-interface/event_synthesizer.hh>
#include <retained-interface/handles.hh>
#include <retained-interface/id_arena.hh>
#include <retained-interface/input_state.hh>
#include <retained-interface/options.hh>
#include <retained-interface/primitives.hh>
#include <retained-interface/raw_input.hh>
#include <retained-interface/ui.hh>
#include <retained-interface/ui_event.hh>
#include <retained-interface/widget_input.hh>
