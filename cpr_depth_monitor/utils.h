#pragma once
#include <math.h>
#include <stdio.h>
#include <stdint.h>
#include <string>

// -------------------------------------------------------------------
//                         UTILS - DECLARATIONS
// -------------------------------------------------------------------

// ---------------- Numeric helpers ----------------
double rad2deg(double rad);
double deg2rad(double deg);

extern bool verboseOn;

// ---------------- Clock ----------------
// milliseconds since the first call (steady clock)
uint32_t millis();

// ---------------- String helpers ----------------
std::string trim_copy(const std::string &s);
std::string to_upper_copy(const std::string &s);

// ---------------- Console helper ----------------
template<typename... Args>
void console_printf_verbose(const char *fmt, Args... args) {
  if (!verboseOn) return;
  char buf[200];
  snprintf(buf, sizeof(buf), fmt, args...);
  fputs(buf, stdout);
}
template<typename... Args>
void console_printf(const char *fmt, Args... args) {
  char buf[200];
  snprintf(buf, sizeof(buf), fmt, args...);
  fputs(buf, stdout);
}

// plain text, no formatting and no length limit
inline void console_print(const char *text) {
  fputs(text, stdout);
}
