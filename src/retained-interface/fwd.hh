#pragma once

namespace ri
{
struct widget_id;
struct raw_input;
struct ui_event;
struct input_state;
struct input_diagnostics;
struct primitive;
struct render_list;
struct ui_settings;

class id_arena;
class id_list;
class id_list_walk;
class id_registry;
class event_synthesizer;
class widget_input;
class change_tracker;
class primitive_list;
class ui;
class ui_cell;
class ui_worker;

template <class T>
struct widget_cached_state;
template <class T>
class channel;
}
