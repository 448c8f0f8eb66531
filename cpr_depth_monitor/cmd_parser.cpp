#include "cmd_parser.h"
#include "angle_parser.h"
#include "console_protocol.h"
#include "logging.h"
#include <stdlib.h>
#include <string.h>

// -------------------------------------------------------------------
//                           COMMAND CONTEXT
// -------------------------------------------------------------------

struct CommandContext {
  DepthMonitor &monitor;
  ParamStore &params;
  std::string raw;  // text after the command word (string-based commands)
};

typedef bool (*command_handler_t)(CommandContext &ctx, int argc, double *argv);

struct CommandEntry {
  const char *name;
  const char *fmt;
  char id_letter;
  command_handler_t handler;
  const char *desc;
};

// ============================================================
// All command handlers
// ============================================================

static bool cmd_solve(CommandContext &ctx, int argc, double *argv) {
  TwoAngleDepthSolver solver(ctx.params.geometry());
  DepthResult res = solver.solve(argv[0], argv[1]);
  report_depth_result(argv[0], argv[1], res);
  return res.ok;
}

static bool cmd_set_l(CommandContext &ctx, int argc, double *argv) {
  return ctx.params.set("L_mm", argv[0]);
}

static bool cmd_set_s(CommandContext &ctx, int argc, double *argv) {
  return ctx.params.set("s_mm", argv[0]);
}

static bool cmd_set_tol(CommandContext &ctx, int argc, double *argv) {
  return ctx.params.set("slope_tol", argv[0]);
}

static bool cmd_swap_on(CommandContext &ctx, int argc, double *argv) {
  return ctx.params.set("swap", 1.0);
}

static bool cmd_swap_off(CommandContext &ctx, int argc, double *argv) {
  return ctx.params.set("swap", 0.0);
}

static bool cmd_params(CommandContext &ctx, int argc, double *argv) {
  CPR_INFO("PARAMS", "json", "json=%s", ctx.params.to_json().c_str());
  return true;
}

static bool cmd_load_params(CommandContext &ctx, int argc, double *argv) {
  std::string err;
  if (!ctx.params.load_json(ctx.raw, &err)) {
    CPR_ERR("PARAMS", "load_failed", "reason=\"%s\"", err.c_str());
    return false;
  }
  CPR_INFO("PARAMS", "json", "json=%s", ctx.params.to_json().c_str());
  return true;
}

static bool cmd_reset_params(CommandContext &ctx, int argc, double *argv) {
  ctx.params.reset();
  return true;
}

static bool cmd_stats(CommandContext &ctx, int argc, double *argv) {
  ctx.monitor.print_stats();
  return true;
}

static bool cmd_clear_stats(CommandContext &ctx, int argc, double *argv) {
  ctx.monitor.reset_stats();
  return true;
}

static bool cmd_last(CommandContext &ctx, int argc, double *argv) {
  ctx.monitor.print_last();
  return ctx.monitor.hasLast();
}

static bool cmd_verbose_on(CommandContext &ctx, int argc, double *argv) {
  verboseOn = true;
  return true;
}

static bool cmd_verbose_off(CommandContext &ctx, int argc, double *argv) {
  verboseOn = false;
  return true;
}

static bool cmd_help(CommandContext &ctx, int argc, double *argv) {
  console_print(get_help_text().c_str());
  return true;
}

// "<json>" marks a string-based command: the rest of the line is passed raw
static CommandEntry command_table[] = {
  { "SOLVE", "%f %f", 's', cmd_solve, "SOLVE <theta1 deg> <theta2 deg> - one-shot solve with current params" },

  { "SETL", "%f", 'p', cmd_set_l, "SETL <mm> - cosine period L (> 0)" },
  { "SETS", "%f", 'p', cmd_set_s, "SETS <mm> - IMU separation s (> 0)" },
  { "SETTOL", "%f", 'p', cmd_set_tol, "SETTOL <tol> - slope tolerance (> 0)" },
  { "SWAPON", "", 'p', cmd_swap_on, "SWAPON - treat the 2nd ROLL angle as IMU1" },
  { "SWAPOFF", "", 'p', cmd_swap_off, "SWAPOFF - ROLL angles in IMU1, IMU2 order" },
  { "PARAMS", "", 'p', cmd_params, "PARAMS - print parameters as json" },
  { "LOADPARAMS", "<json>", 'p', cmd_load_params, "LOADPARAMS <json> - load parameters, e.g. {\"L_mm\":240,\"s_mm\":103}" },
  { "RESETPARAMS", "", 'p', cmd_reset_params, "RESETPARAMS - restore default parameters" },

  { "STATS", "", 'v', cmd_stats, "STATS - sample counters and deepest point" },
  { "CLEARSTATS", "", 'v', cmd_clear_stats, "CLEARSTATS - reset sample counters" },
  { "LAST", "", 'v', cmd_last, "LAST - repeat the last sample result" },

  { "VERBOSEON", "", 'v', cmd_verbose_on, "VERBOSEON - enable verbose output" },
  { "VERBOSEOFF", "", 'v', cmd_verbose_off, "VERBOSEOFF - disable verbose output" },

  { "HELP", "", 'v', cmd_help, "HELP - list of commands" },
};

static constexpr int COMMAND_COUNT = sizeof(command_table) / sizeof(command_table[0]);

// -------------------------------------------------------------------
//                            PARSE HELPERS
// -------------------------------------------------------------------

// text after the first space, trimmed
static std::string get_params_text(const std::string &line) {
  size_t space_idx = line.find_first_of(" \t");
  if (space_idx == std::string::npos) return "";
  return trim_copy(line.substr(space_idx + 1));
}

static int parse_args(const std::string &line, double *out, int max_args) {
  std::string params = get_params_text(line);
  if (params.empty()) return 0;

  int argc = 0;
  size_t pos = 0;
  while (argc < max_args && pos < params.size()) {
    size_t next_space = params.find(' ', pos);
    std::string token = (next_space == std::string::npos) ? params.substr(pos) : params.substr(pos, next_space - pos);
    token = trim_copy(token);
    if (!token.empty()) {
      char *end = nullptr;
      double v = strtod(token.c_str(), &end);
      if (end == token.c_str() || *end != '\0') break;  // not a number
      out[argc++] = v;
    }
    if (next_space == std::string::npos) break;
    pos = next_space + 1;
  }
  return argc;
}

static int count_format_args(const char *fmt) {
  int n = 0;
  for (const char *p = fmt; *p; p++) {
    if (*p == '%') n++;
  }
  return n;
}

// -------------------------------------------------------------------
//                        GET HELP TEXT
// -------------------------------------------------------------------

std::string get_help_text() {
  std::string help = "Supported Commands:\n";
  help += "  ROLL,<theta a>,<theta b> - angle sample, solved and reported\n";
  help += "  PROTO? - protocol version\n";
  for (int i = 0; i < COMMAND_COUNT; i++) {
    help += "  ";
    help += command_table[i].desc;
    help += "\n";
  }
  return help;
}

// -------------------------------------------------------------------
//                    PROCESS CONSOLE COMMAND (DISPATCHER)
// -------------------------------------------------------------------

bool process_console_command(std::string &line, DepthMonitor &monitor, ParamStore &params) {
  line = trim_copy(line);
  if (line.empty()) return true;

  std::string U = to_upper_copy(line);

  // ------------------------------------------------------------
  // ANGLE SAMPLES (hot path, no RUN wrapper)
  // ------------------------------------------------------------
  double theta_a, theta_b;
  if (parse_two_angles(line, &theta_a, &theta_b)) {
    monitor.process_sample(theta_a, theta_b);
    return true;
  }
  // a sample line that did not parse; other lines may still mention roll
  if (U.compare(0, 4, "ROLL") == 0) {
    increment_cmd_id('r');
    CPR_ERR("CMDROUTER", "bad_sample", "line=%s", line.c_str());
    return false;
  }

  // ------------------------------------------------------------
  // PROTOCOL QUERY (always allowed, no args)
  // ------------------------------------------------------------
  if (U == "PROTO?") {
    CPR_RUN_START('v', "proto?");
    cpr_report_protocol();
    CPR_RUN_END_OK();
    return true;
  }

  // command word = up to the first space
  std::string word = U.substr(0, U.find_first_of(" \t"));

  // ------------------------------------------------------------
  // COMMAND TABLE DISPATCH
  // ------------------------------------------------------------
  for (int i = 0; i < COMMAND_COUNT; i++) {
    const CommandEntry &cmd = command_table[i];
    if (word != cmd.name) continue;

    CommandContext ctx{ monitor, params, "" };
    double argv[8] = { 0 };
    int argc = 0;

    if (strcmp(cmd.fmt, "<json>") == 0) {
      // ==========================================================
      // STRING-BASED COMMANDS
      // ==========================================================
      ctx.raw = get_params_text(line);
      if (ctx.raw.empty()) {
        increment_cmd_id(cmd.id_letter);
        CPR_ERR("CMDROUTER", "missing_argument", "cmd=%s", cmd.name);
        return false;
      }
    } else {
      // ==========================================================
      // NUMERIC COMMANDS
      // ==========================================================
      int min_args = count_format_args(cmd.fmt);
      argc = parse_args(line, argv, 8);
      if (argc < min_args) {
        increment_cmd_id(cmd.id_letter);
        CPR_ERR("CMDROUTER", "invalid_args",
                "cmd=%s expected=%d got=%d",
                cmd.name, min_args, argc);
        return false;
      }
    }

    CPR_RUN_START(cmd.id_letter, cmd.name);
    LOG_SECTION_START_VAR("command", "cmd", cmd.name);

    bool ok = cmd.handler(ctx, argc, argv);

    LOG_SECTION_END();
    if (ok) {
      CPR_RUN_END_OK();
    } else {
      CPR_RUN_END_ERR("execution_failed");
    }
    return ok;
  }

  // ------------------------------------------------------------
  // UNKNOWN COMMAND
  // ------------------------------------------------------------
  increment_cmd_id('v');
  CPR_ERR("CMDROUTER", "unknown_command", "cmd=%s", line.c_str());
  console_print(get_help_text().c_str());
  return false;
}
