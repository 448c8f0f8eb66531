#include "depth_solver.h"
#include "utils.h"

// ============================================================
//               TWO-ANGLE DEPTH SOLVER
// ============================================================

static constexpr double FLAT_ANCHOR_EPS = 1e-9;  // |m1| below this: no phase anchor
static constexpr double SMALL_SLOPE = 1e-3;      // anchor on IMU2 when |m1| below this
static constexpr double MIN_COND = 1e-2;         // min(|sin a1|, |sin a2|) accepted
static constexpr int BRANCH_K = 3;               // branches a0 + k*pi, k = -3..3

static const char *MSG_SOLVED = "Solved.";
static const char *MSG_BAD_GEOMETRY = "L_mm and s_mm must be positive.";
static const char *MSG_BAD_TOLERANCE = "slope_tol must be positive and finite.";
static const char *MSG_NONFINITE = "Angles produce non-finite tangent.";
static const char *MSG_FLAT_ANCHOR = "First angle too close to 0°, cannot solve reliably.";
static const char *MSG_NO_SOLUTION = "No consistent solution found for given angles/separation/period.";

// ============================================================
// Model helpers
// ============================================================
double wrap_pos(double x, double m) {
  double r = fmod(x, m);
  if (r < 0.0) r += m;
  if (r >= m) r -= m;  // -tiny + m rounds up to m
  return r;
}

double cosine_depth_mm(double x_mm, double D_mm, double L_mm) {
  return -0.5 * D_mm * (1.0 - cos(2.0 * M_PI * (x_mm / L_mm)));
}

double cosine_slope(double x_mm, double D_mm, double L_mm) {
  return -(D_mm * M_PI / L_mm) * sin(2.0 * M_PI * (x_mm / L_mm));
}

const char *depth_status_token(depth_status_t status) {
  switch (status) {
    case DEPTH_OK: return "ok";
    case DEPTH_BAD_GEOMETRY: return "bad_geometry";
    case DEPTH_NONFINITE_TANGENT: return "nonfinite_tangent";
    case DEPTH_FLAT_ANCHOR: return "flat_anchor";
    case DEPTH_NO_SOLUTION: return "no_solution";
  }
  return "unknown";
}

// tan() of 90 deg in radians is ~1.6e16, not inf
static bool is_vertical_angle(double deg) {
  return fmod(fabs(deg), 180.0) == 90.0;
}

// phase a_A with tan(a_A) = -sin(phiAB) / (cos(phiAB) - mB/mA)
static double solve_a_from_ratio(double mA, double mB, double phiAB) {
  double r = mB / mA;
  return atan2(-sin(phiAB), cos(phiAB) - r);
}

static DepthResult fail(depth_status_t status, const char *message) {
  DepthResult R;
  R.ok = false;
  R.status = status;
  R.message = message;
  return R;
}

// deepest y on [x1, x2]: the endpoints, or the first trough x = (k + 1/2) * L
// at or after x1 when it lies inside the segment (y = -D there)
static void segment_minimum(double x1, double x2, double D, double L,
                            double *ymin, double *xmin) {
  *ymin = cosine_depth_mm(x1, D, L);
  *xmin = x1;

  double y2 = cosine_depth_mm(x2, D, L);
  if (y2 < *ymin) {
    *ymin = y2;
    *xmin = x2;
  }

  double k = ceil(x1 / L - 0.5);
  double x_trough = (k + 0.5) * L;
  if (x_trough >= x1 && x_trough <= x2) {
    double yt = cosine_depth_mm(x_trough, D, L);
    if (yt < *ymin) {
      *ymin = yt;
      *xmin = x_trough;
    }
  }
}

// ============================================================
// D and x1 from theta1 and theta2
// ============================================================
DepthResult depth_from_two_angles(double theta1_deg, double theta2_deg,
                                  double s_mm, double L_mm,
                                  double slope_tol) {
  if (!(L_mm > 0.0) || !(s_mm > 0.0))
    return fail(DEPTH_BAD_GEOMETRY, MSG_BAD_GEOMETRY);
  if (!(slope_tol > 0.0) || !isfinite(slope_tol))
    return fail(DEPTH_BAD_GEOMETRY, MSG_BAD_TOLERANCE);

  double m1 = tan(deg2rad(theta1_deg));
  double m2 = tan(deg2rad(theta2_deg));

  if (!isfinite(m1) || !isfinite(m2) || is_vertical_angle(theta1_deg) || is_vertical_angle(theta2_deg))
    return fail(DEPTH_NONFINITE_TANGENT, MSG_NONFINITE);
  if (fabs(m1) < FLAT_ANCHOR_EPS)
    return fail(DEPTH_FLAT_ANCHOR, MSG_FLAT_ANCHOR);

  double phi = 2.0 * M_PI * (s_mm / L_mm);

  // Near-flat IMU1: solve the phase at IMU2 and shift back to IMU1
  double a0;
  if (fabs(m1) < SMALL_SLOPE && fabs(m2) >= SMALL_SLOPE) {
    double a2 = solve_a_from_ratio(m2, m1, -phi);
    a0 = a2 - phi;
  } else {
    a0 = solve_a_from_ratio(m1, m2, +phi);
  }

  DepthResult best;
  double best_cond = -1.0;

  for (int k = -BRANCH_K; k <= BRANCH_K; k++) {
    double a = a0 + k * M_PI;
    double s1 = sin(a);
    double s2 = sin(a + phi);

    double cond = fmin(fabs(s1), fabs(s2));
    if (cond < MIN_COND) continue;

    // depth from each slope
    double D1 = -(L_mm / M_PI) * (m1 / s1);
    double D2 = -(L_mm / M_PI) * (m2 / s2);
    if (!isfinite(D1) || !isfinite(D2)) continue;
    if (D1 <= 0.0 && D2 <= 0.0) continue;

    // blend weighted by |sin|, negative estimates count as zero
    double w1 = fabs(s1);
    double w2 = fabs(s2);
    double D = (w1 * fmax(D1, 0.0) + w2 * fmax(D2, 0.0)) / (w1 + w2);
    if (!isfinite(D) || D <= 0.0) continue;

    double x1 = wrap_pos((a * L_mm) / (2.0 * M_PI), L_mm);
    double x2 = x1 + s_mm;

    if (fabs(cosine_slope(x1, D, L_mm) - m1) > slope_tol) continue;
    if (fabs(cosine_slope(wrap_pos(x2, L_mm), D, L_mm) - m2) > slope_tol) continue;

    if (cond > best_cond) {
      best.D_mm = D;
      best.x1_mm = x1;
      best.x2_mm = x2;
      best.y1_mm = cosine_depth_mm(x1, D, L_mm);
      best.y2_mm = cosine_depth_mm(x2, D, L_mm);
      segment_minimum(x1, x2, D, L_mm, &best.ymin_mm, &best.xmin_mm);
      best_cond = cond;
    }
  }

  if (best_cond < 0.0)
    return fail(DEPTH_NO_SOLUTION, MSG_NO_SOLUTION);

  best.ok = true;
  best.status = DEPTH_OK;
  best.message = MSG_SOLVED;
  return best;
}

// -------------------------------------------------------------------
//                 TWO-ANGLE DEPTH SOLVER CLASS
// -------------------------------------------------------------------

TwoAngleDepthSolver::TwoAngleDepthSolver() {}

TwoAngleDepthSolver::TwoAngleDepthSolver(const DepthGeometry &geometry)
  : geo(geometry) {}

DepthResult TwoAngleDepthSolver::solve(double theta1_deg, double theta2_deg) const {
  return depth_from_two_angles(theta1_deg, theta2_deg, geo.s_mm, geo.L_mm, geo.slope_tol);
}

const DepthGeometry &TwoAngleDepthSolver::getGeometry() const {
  return geo;
}

void TwoAngleDepthSolver::setGeometry(const DepthGeometry &geometry) {
  geo = geometry;
}
