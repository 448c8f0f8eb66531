#pragma once
#include <stdio.h>
#include <string>

/*

EXAMPLE USAGE

#include "logging.h"

bool ParamStore::load_json(...) {
  LOG_SECTION_START("load params");
  LOG_PRINTF("keys %d", 3);

  LOG_SECTION_START_VAR("set param", "key", "L_mm");
  LOG_SECTION_END(); // end set param

  LOG_SECTION_END(); // end load params
}

EXAMPLE OUTPUT (stderr)

---- {load params} start <12ms> ----
   keys 3
   ---- {set param | key {L_mm}} start <12ms> ----
   ---- {set param | key {L_mm}} end <13ms, Δ1ms> ----
---- {load params} end <13ms, Δ1ms> ----

*/

// ----- CONFIG -----
#define MAX_NESTED_SECTIONS 24
// ------------------

extern bool logging_on;

void log_indent();
void log_section_start(const std::string& section_name);
void log_section_start_var(const std::string& title, const std::string& var_name, const std::string& var_val);
void log_section_end();

template<typename... Args>
inline void log_printf(const char* fmt, Args... args) {
  char buf[200];
  snprintf(buf, sizeof(buf), fmt, args...);
  fputs(buf, stderr);
}

// Convenience macros
#define LOG_SECTION_START(title) \
  do { \
    if (logging_on) log_section_start(title); \
  } while (0)

#define LOG_SECTION_START_VAR(title, name, val) \
  do { \
    if (logging_on) log_section_start_var(title, name, val); \
  } while (0)

#define LOG_SECTION_END() \
  do { \
    if (logging_on) log_section_end(); \
  } while (0)

// -----------------------------------------------------------
// Formatted logging macros using log_printf
// -----------------------------------------------------------

#define LOG_PRINTF(fmt, ...) \
  do { \
    if (logging_on) { \
      log_indent(); \
      log_printf(fmt, ##__VA_ARGS__); \
      fputc('\n', stderr); \
    } \
  } while (0)

// the section is closed with LOG_SECTION_END() like any other
#define LOG_SECTION_START_PRINTF(title, fmt, ...) \
  do { \
    if (logging_on) { \
      char _log_title[160]; \
      snprintf(_log_title, sizeof(_log_title), "%s " fmt, title, ##__VA_ARGS__); \
      log_section_start(_log_title); \
    } \
  } while (0)

// -----------------------------------------------------------
// Variable logging (string, char*, bool, numbers)
// -----------------------------------------------------------

inline void log_var_value(const std::string& val) {
  fputs(val.c_str(), stderr);
}

inline void log_var_value(const char* val) {
  fputs(val ? val : "(null)", stderr);
}

inline void log_var_value(bool val) {
  fputs(val ? "true" : "false", stderr);
}

inline void log_var_value(int val) {
  fprintf(stderr, "%d", val);
}

inline void log_var_value(double val) {
  fprintf(stderr, "%.6g", val);
}

// ---------- core logging function ----------
template<typename T>
inline void log_var(const char* name, const T& val, bool newline = true, bool cont = false) {
  if (!logging_on) return;
  if (!cont) log_indent();

  if (cont) fputs(" | ", stderr);
  fputs(name, stderr);
  fputs(" {", stderr);
  log_var_value(val);
  fputs("}", stderr);
  if (newline) fputc('\n', stderr);
}

// ---------- user macros ----------
#define LOG_VAR(name, val) log_var(name, val, true, false)
#define LOG_VAR_CONT(name, val) log_var(name, val, true, true)
