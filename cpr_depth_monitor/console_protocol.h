#pragma once
#include <stddef.h>
#include "utils.h"

/*
======================================================================
CPR DEPTH MONITOR - CONSOLE RESPONSE FORMAT (PROTOCOL v1)
======================================================================

GENERAL FORMAT
--------------
MODULE info=<token> (<id>) key=value key=value
ERR MODULE err=<token> (<id>) key=value key=value

(<id>) FORMAT
-------------
(letter)(number)

- number : monotonic command counter since start (global)
- letter : command category

LETTER MEANINGS
---------------
r = roll sample (ROLL,<a>,<b> line)
s = one-shot solve command
p = parameter command
v = verification / misc

EXAMPLES
--------
DEPTH info=solved (r12) t1_deg=-34.00 t2_deg=32.50 D_mm=51.529 ...
ERR DEPTH err=flat_anchor (r13) t1_deg=0.00 t2_deg=12.00 msg="..."
RUN info=end (p14) status=ok duration_s=0.000

VERSION QUERY COMMAND
---------------------
Command:
  proto?

Response:
  PROTOCOL info=version (v15) version=1

======================================================================
*/

#define CPR_PROTOCOL_VERSION 1

// ============================================================
// EXECUTION CONTEXT (GLOBAL, SINGLE INSTANCE)
// ============================================================
void increment_cmd_id(char letter);
char get_cmd_id_letter();
unsigned long get_cmd_id_num();
unsigned long get_start_millis();
void set_start_millis();
void reset_cmd_id();

// ============================================================
// ID HELPERS
// ============================================================
void cpr_make_id(char *out, size_t len);

// ============================================================
// LOW-LEVEL EMIT
// ============================================================
void cpr_emit_info(const char *module, const char *info_name, const char *fmt, ...);
void cpr_emit_err(const char *module, const char *err_name, const char *fmt, ...);

// ============================================================
// GENERIC INFO / ERR (CORE)
// ============================================================
#define CPR_INFO(module, ev, fmt, ...) cpr_emit_info(module, ev, fmt, ##__VA_ARGS__)
#define CPR_ERR(module, ev, fmt, ...) cpr_emit_err(module, ev, fmt, ##__VA_ARGS__)

// ============================================================
// DEBUG (NOT PARSED BY HOST)
// ============================================================
#define CPR_DEBUG(fmt, ...) \
  console_printf_verbose("DEBUG " fmt "\n", ##__VA_ARGS__)

// ============================================================
// RUN LIFECYCLE (COMMAND START / END)
// ============================================================

// START
#define CPR_RUN_START(letter, params_cstr) \
  do { \
    set_start_millis(); \
    increment_cmd_id(letter); \
    CPR_INFO("RUN", "start", "params=%s", params_cstr); \
  } while (0)

// END OK
#define CPR_RUN_END_OK() \
  do { \
    float _dur_s = (millis() - get_start_millis()) / 1000.0f; \
    CPR_INFO("RUN", "end", "status=ok duration_s=%.3f", _dur_s); \
  } while (0)

// END ERROR
#define CPR_RUN_END_ERR(err_text) \
  do { \
    float _dur_s = (millis() - get_start_millis()) / 1000.0f; \
    CPR_ERR("RUN", "end", "status=error err=%s duration_s=%.3f", err_text, _dur_s); \
  } while (0)

// ============================================================
// PROTOCOL QUERY
// ============================================================
inline void cpr_report_protocol() {
  CPR_INFO("PROTOCOL", "version", "version=%d", CPR_PROTOCOL_VERSION);
}
