#include "utils.h"
#include <algorithm>
#include <cctype>
#include <chrono>

// -------------------------------------------------------------------
//                         UTILS - IMPLEMENTATION
// -------------------------------------------------------------------

bool verboseOn = false;

// ---------------- Numeric helpers ----------------
double rad2deg(double rad) {
  return rad * 180.0 / M_PI;
}

double deg2rad(double deg) {
  return deg * M_PI / 180.0;
}

// -------------------------------------------------------------------
//                              CLOCK
// -------------------------------------------------------------------
uint32_t millis() {
  static const auto t0 = std::chrono::steady_clock::now();
  auto dt = std::chrono::steady_clock::now() - t0;
  return (uint32_t)std::chrono::duration_cast<std::chrono::milliseconds>(dt).count();
}

// -------------------------------------------------------------------
//                          STRING HELPERS
// -------------------------------------------------------------------
std::string trim_copy(const std::string &s) {
  size_t b = 0;
  size_t e = s.size();
  while (b < e && isspace((unsigned char)s[b])) b++;
  while (e > b && isspace((unsigned char)s[e - 1])) e--;
  return s.substr(b, e - b);
}

std::string to_upper_copy(const std::string &s) {
  std::string u = s;
  std::transform(u.begin(), u.end(), u.begin(),
                 [](unsigned char c) { return (char)toupper(c); });
  return u;
}
