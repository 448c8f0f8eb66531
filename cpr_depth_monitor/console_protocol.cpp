#include "console_protocol.h"
#include <stdarg.h>

static char cmd_letter = '?';
static unsigned long cmd_num = 0;
static unsigned long start_ms = 0;

void increment_cmd_id(char letter) {
  cmd_letter = letter;
  cmd_num++;
}

char get_cmd_id_letter() {
  return cmd_letter;
}

unsigned long get_cmd_id_num() {
  return cmd_num;
}

unsigned long get_start_millis() {
  return start_ms;
}

void set_start_millis() {
  start_ms = millis();
}

void reset_cmd_id() {
  cmd_letter = '?';
  cmd_num = 0;
}

void cpr_make_id(char *out, size_t len) {
  snprintf(out, len, "%c%lu", get_cmd_id_letter(), get_cmd_id_num());
}

// ------------------------------------------------------------
// one line: [ERR ]MODULE info|err=<token> (<id>) <body>
// ------------------------------------------------------------
static void emit_line(const char *prefix, const char *module, const char *kind,
                      const char *token, const char *fmt, va_list ap) {
  char id[24];
  cpr_make_id(id, sizeof(id));

  char body[256];
  vsnprintf(body, sizeof(body), fmt, ap);

  fprintf(stdout, "%s%s %s=%s (%s)", prefix, module, kind, token, id);
  if (body[0]) fprintf(stdout, " %s", body);
  fputc('\n', stdout);
  fflush(stdout);
}

void cpr_emit_info(const char *module, const char *info_name, const char *fmt, ...) {
  va_list ap;
  va_start(ap, fmt);
  emit_line("", module, "info", info_name, fmt, ap);
  va_end(ap);
}

void cpr_emit_err(const char *module, const char *err_name, const char *fmt, ...) {
  va_list ap;
  va_start(ap, fmt);
  emit_line("ERR ", module, "err", err_name, fmt, ap);
  va_end(ap);
}
