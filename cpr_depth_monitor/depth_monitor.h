#pragma once
#include <string>
#include "depth_solver.h"
#include "param_store.h"

// -----------------------------------------------------------------------------
// DepthStats
//   Running counters over the samples fed to the monitor.
// -----------------------------------------------------------------------------
struct DepthStats {
  unsigned long samples = 0;
  unsigned long solved = 0;
  unsigned long failed = 0;
  unsigned long failed_by_status[DEPTH_NO_SOLUTION + 1] = { 0 };
  double deepest_ymin_mm = NAN;  // most negative ymin among solved samples
  double deepest_D_mm = NAN;     // D of that sample
};

// -----------------------------------------------------------------------------
// DepthMonitor
//   Feeds angle pairs into the solver with the current parameters, keeps
//   the latest result and reports every sample on the console.
// -----------------------------------------------------------------------------
class DepthMonitor {
public:
  explicit DepthMonitor(const ParamStore &params);

  // ---- sample input ---------------------------------------------------------
  DepthResult process_sample(double theta_a_deg, double theta_b_deg);
  bool process_line(const std::string &line);

  // ---- state ----------------------------------------------------------------
  const DepthStats &getStats() const;
  const DepthResult &getLastResult() const;
  bool hasLast() const;
  double getLastTheta1() const;
  double getLastTheta2() const;
  void reset_stats();

  // ---- reports --------------------------------------------------------------
  void print_stats() const;
  void print_last() const;

private:
  const ParamStore &params;
  DepthStats stats;
  DepthResult last;
  double last_theta1 = NAN;
  double last_theta2 = NAN;
  bool has_last = false;
};

// one DEPTH report line for a solve, with the current command id
void report_depth_result(double theta1_deg, double theta2_deg, const DepthResult &res);
