// cpr_depth_monitor
//
// Reads IMU angle pairs (ROLL,<a>,<b>) and console commands from stdin,
// one per line, and reports the solved compression depth on stdout.
// Logging goes to stderr.
//
//   cat /dev/ttyACM0 | cpr_depth_monitor --s 103 --L 240
//   cpr_depth_monitor --example

#include <stdlib.h>
#include <string.h>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include "cmd_parser.h"
#include "console_protocol.h"
#include "depth_monitor.h"
#include "depth_solver.h"
#include "logging.h"
#include "param_store.h"
#include "utils.h"

static const char usageText[] =
  "usage: cpr_depth_monitor [options]\n"
  "  --config <file>  load parameters from a json file\n"
  "  --L <mm>         cosine period (default 240)\n"
  "  --s <mm>         IMU separation (default 103)\n"
  "  --tol <tol>      slope tolerance (default 0.001)\n"
  "  --swap           treat the 2nd ROLL angle as IMU1\n"
  "  --verbose        DEBUG lines on stdout\n"
  "  --quiet          no log sections on stderr\n"
  "  --example        solve the built-in example and exit\n"
  "  --help           this text\n";

// ----------------------------------------------------------
//                 EXAMPLE HARNESS
// ----------------------------------------------------------
static int run_example() {
  const double theta1_deg = 25.1;
  const double theta2_deg = 1.0;
  const double s_mm = 103.0;
  const double L_mm = 240.0;

  DepthResult res = depth_from_two_angles(theta1_deg, theta2_deg, s_mm, L_mm);
  console_printf("OK: %s - %s\n", res.ok ? "True" : "False", res.message.c_str());
  if (res.ok) {
    console_printf("D (peak depth) [mm] = %.3f\n", res.D_mm);
    console_printf("x1 [mm] = %.3f\n", res.x1_mm);
    console_printf("x2 [mm] = %.3f\n", res.x2_mm);
    console_printf("y1 [mm] = %.3f\n", res.y1_mm);
    console_printf("y2 [mm] = %.3f\n", res.y2_mm);
    console_printf("Max depth on segment [mm] = %.3f at x = %.3f mm\n", res.ymin_mm, res.xmin_mm);
    return 0;
  }
  console_printf("No solution with these inputs. Try changing L_mm, s_mm or the angles.\n");
  return 1;
}

// ----------------------------------------------------------
//                 OPTION HELPERS
// ----------------------------------------------------------
static bool parse_double(const char *text, double *out) {
  if (!text || !*text) return false;
  char *end = nullptr;
  double v = strtod(text, &end);
  if (*end != '\0') return false;
  *out = v;
  return true;
}

static bool load_config_file(const char *path, ParamStore &params) {
  LOG_SECTION_START_VAR("load config", "file", path);

  std::ifstream in(path);
  if (!in) {
    LOG_PRINTF("cannot open {%s}", path);
    LOG_SECTION_END();
    return false;
  }
  std::stringstream buf;
  buf << in.rdbuf();

  std::string err;
  bool ok = params.load_json(buf.str(), &err);
  if (!ok) LOG_PRINTF("config rejected {%s}", err.c_str());

  LOG_SECTION_END();
  return ok;
}

static bool set_from_option(ParamStore &params, const char *key, const char *opt, const char *text) {
  double v;
  if (!parse_double(text, &v) || !params.set(key, v)) {
    fprintf(stderr, "invalid value for %s: %s\n", opt, text ? text : "(missing)");
    return false;
  }
  return true;
}

// ----------------------------------------------------------
//                 MAIN
// ----------------------------------------------------------
int main(int argc, char **argv) {
  ParamStore params;
  bool example = false;

  for (int i = 1; i < argc; i++) {
    const char *opt = argv[i];
    const char *next = (i + 1 < argc) ? argv[i + 1] : nullptr;

    if (strcmp(opt, "--help") == 0) {
      console_print(usageText);
      return 0;
    } else if (strcmp(opt, "--example") == 0) {
      example = true;
    } else if (strcmp(opt, "--quiet") == 0) {
      logging_on = false;
    } else if (strcmp(opt, "--verbose") == 0) {
      verboseOn = true;
    } else if (strcmp(opt, "--swap") == 0) {
      params.set("swap", 1.0);
    } else if (strcmp(opt, "--config") == 0) {
      if (!next || !load_config_file(next, params)) {
        fprintf(stderr, "invalid config: %s\n", next ? next : "(missing)");
        return 2;
      }
      i++;
    } else if (strcmp(opt, "--L") == 0) {
      if (!set_from_option(params, "L_mm", opt, next)) return 2;
      i++;
    } else if (strcmp(opt, "--s") == 0) {
      if (!set_from_option(params, "s_mm", opt, next)) return 2;
      i++;
    } else if (strcmp(opt, "--tol") == 0) {
      if (!set_from_option(params, "slope_tol", opt, next)) return 2;
      i++;
    } else {
      fprintf(stderr, "unknown option: %s\n%s", opt, usageText);
      return 2;
    }
  }

  if (example) return run_example();

  LOG_SECTION_START_PRINTF("cpr_depth_monitor", "| L=%.1f s=%.1f", params.get("L_mm"), params.get("s_mm"));
  params.list_params();

  DepthMonitor monitor(params);
  std::string line;
  while (std::getline(std::cin, line)) {
    process_console_command(line, monitor, params);
  }

  const DepthStats &st = monitor.getStats();
  LOG_PRINTF("samples %lu solved %lu failed %lu", st.samples, st.solved, st.failed);
  LOG_SECTION_END();
  return 0;
}
