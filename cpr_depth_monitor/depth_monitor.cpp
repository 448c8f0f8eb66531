#include "depth_monitor.h"
#include "angle_parser.h"
#include "console_protocol.h"

// ============================================================
// Report line
// ============================================================
void report_depth_result(double theta1_deg, double theta2_deg, const DepthResult &res) {
  if (res.ok) {
    CPR_INFO("DEPTH", "solved",
             "t1_deg=%.2f t2_deg=%.2f D_mm=%.3f x1_mm=%.3f x2_mm=%.3f "
             "y1_mm=%.3f y2_mm=%.3f ymin_mm=%.3f xmin_mm=%.3f",
             theta1_deg, theta2_deg, res.D_mm, res.x1_mm, res.x2_mm,
             res.y1_mm, res.y2_mm, res.ymin_mm, res.xmin_mm);
  } else {
    CPR_ERR("DEPTH", depth_status_token(res.status),
            "t1_deg=%.2f t2_deg=%.2f msg=\"%s\"",
            theta1_deg, theta2_deg, res.message.c_str());
  }
}

// ============================================================
// Constructor
// ============================================================
DepthMonitor::DepthMonitor(const ParamStore &params_ref)
  : params(params_ref) {}

// ============================================================
// Sample input
// ============================================================
DepthResult DepthMonitor::process_sample(double theta_a_deg, double theta_b_deg) {
  double theta1 = theta_a_deg;
  double theta2 = theta_b_deg;
  if (params.swapOn()) {
    theta1 = theta_b_deg;
    theta2 = theta_a_deg;
  }

  TwoAngleDepthSolver solver(params.geometry());
  DepthResult res = solver.solve(theta1, theta2);

  stats.samples++;
  if (res.ok) {
    stats.solved++;
    if (isnan(stats.deepest_ymin_mm) || res.ymin_mm < stats.deepest_ymin_mm) {
      stats.deepest_ymin_mm = res.ymin_mm;
      stats.deepest_D_mm = res.D_mm;
    }
  } else {
    stats.failed++;
    stats.failed_by_status[res.status]++;
  }

  last = res;
  last_theta1 = theta1;
  last_theta2 = theta2;
  has_last = true;

  increment_cmd_id('r');
  report_depth_result(theta1, theta2, res);
  return res;
}

bool DepthMonitor::process_line(const std::string &line) {
  double a, b;
  if (!parse_two_angles(line, &a, &b)) {
    CPR_DEBUG("no angle pair in line {%s}", line.c_str());
    return false;
  }
  process_sample(a, b);
  return true;
}

// ============================================================
// State
// ============================================================
const DepthStats &DepthMonitor::getStats() const {
  return stats;
}

const DepthResult &DepthMonitor::getLastResult() const {
  return last;
}

bool DepthMonitor::hasLast() const {
  return has_last;
}

double DepthMonitor::getLastTheta1() const {
  return last_theta1;
}

double DepthMonitor::getLastTheta2() const {
  return last_theta2;
}

void DepthMonitor::reset_stats() {
  stats = DepthStats();
}

// ============================================================
// Reports
// ============================================================
void DepthMonitor::print_stats() const {
  CPR_INFO("STATS", "summary",
           "samples=%lu solved=%lu failed=%lu bad_geometry=%lu nonfinite_tangent=%lu "
           "flat_anchor=%lu no_solution=%lu deepest_ymin_mm=%.3f deepest_D_mm=%.3f",
           stats.samples, stats.solved, stats.failed,
           stats.failed_by_status[DEPTH_BAD_GEOMETRY],
           stats.failed_by_status[DEPTH_NONFINITE_TANGENT],
           stats.failed_by_status[DEPTH_FLAT_ANCHOR],
           stats.failed_by_status[DEPTH_NO_SOLUTION],
           stats.deepest_ymin_mm, stats.deepest_D_mm);
}

void DepthMonitor::print_last() const {
  if (!has_last) {
    CPR_ERR("STATS", "no_sample", "");
    return;
  }
  report_depth_result(last_theta1, last_theta2, last);
}
