#pragma once
#include <string>
#include "depth_monitor.h"
#include "param_store.h"

// -------------------------------------------------------------------
//                      COMMAND PARSER - DECLARATION
// -------------------------------------------------------------------

// Command dispatcher: ROLL lines go to the monitor, everything else to the
// command table. Returns false when the line was rejected or the command
// failed; the caller keeps reading either way.
bool process_console_command(std::string &line, DepthMonitor &monitor, ParamStore &params);

std::string get_help_text();
