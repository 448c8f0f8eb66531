#include "angle_parser.h"
#include <ctype.h>
#include <stdlib.h>
#include <string.h>

// -------------------------------------------------------------------
//                            PARSE HELPERS
// -------------------------------------------------------------------

static void skip_spaces(const std::string &s, size_t &pos) {
  while (pos < s.size() && isspace((unsigned char)s[pos])) pos++;
}

static bool expect_char(const std::string &s, size_t &pos, char c) {
  if (pos >= s.size() || s[pos] != c) return false;
  pos++;
  return true;
}

// [-+]?digits(.digits)?
static bool read_number(const std::string &s, size_t &pos, double *out) {
  size_t p = pos;
  if (p < s.size() && (s[p] == '-' || s[p] == '+')) p++;

  size_t digits_start = p;
  while (p < s.size() && isdigit((unsigned char)s[p])) p++;
  if (p == digits_start) return false;

  // fraction only when at least one digit follows the dot
  if (p + 1 < s.size() && s[p] == '.' && isdigit((unsigned char)s[p + 1])) {
    p++;
    while (p < s.size() && isdigit((unsigned char)s[p])) p++;
  }

  std::string token = s.substr(pos, p - pos);
  *out = strtod(token.c_str(), nullptr);
  pos = p;
  return true;
}

static bool keyword_at(const std::string &s, size_t pos, const char *kw) {
  size_t n = strlen(kw);
  if (pos + n > s.size()) return false;
  for (size_t i = 0; i < n; i++) {
    if (toupper((unsigned char)s[pos + i]) != kw[i]) return false;
  }
  return true;
}

// -------------------------------------------------------------------
//                         ROLL LINE PARSER
// -------------------------------------------------------------------

bool parse_two_angles(const std::string &line, double *theta_a_deg, double *theta_b_deg) {
  for (size_t start = 0; start < line.size(); start++) {
    if (!keyword_at(line, start, "ROLL")) continue;

    size_t pos = start + 4;
    double a = 0.0;
    double b = 0.0;

    skip_spaces(line, pos);
    if (!expect_char(line, pos, ',')) continue;
    skip_spaces(line, pos);
    if (!read_number(line, pos, &a)) continue;
    skip_spaces(line, pos);
    if (!expect_char(line, pos, ',')) continue;
    skip_spaces(line, pos);
    if (!read_number(line, pos, &b)) continue;

    *theta_a_deg = a;
    *theta_b_deg = b;
    return true;
  }
  return false;
}
