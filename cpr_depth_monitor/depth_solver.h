#pragma once
#include <math.h>
#include <string>

// -------------------------------------------------------------------
//                 TWO-ANGLE DEPTH SOLVER - DECLARATION
// -------------------------------------------------------------------
//
// Path model (full cosine of period L, peak-to-trough amplitude D):
//   y(x)  = -D/2 * (1 - cos(2*pi*x / L))      depth, negative = down
//   y'(x) = -(D*pi/L) * sin(2*pi*x / L)       slope
//
// Each IMU reports a tilt angle; slope = tan(angle). IMU2 sits s mm after
// IMU1 along x. From the two slopes the solver recovers D and x1.
//
// Failures are returned in the result (ok=false + status + message),
// never thrown.

enum depth_status_t {
  DEPTH_OK,
  DEPTH_BAD_GEOMETRY,       // L_mm or s_mm not positive
  DEPTH_NONFINITE_TANGENT,  // angle at +-90 deg or NaN
  DEPTH_FLAT_ANCHOR,        // |tan(theta1)| < 1e-9
  DEPTH_NO_SOLUTION         // no branch passed validation
};

struct DepthResult {
  bool ok = false;
  depth_status_t status = DEPTH_NO_SOLUTION;
  double D_mm = NAN;     // peak-to-trough amplitude
  double x1_mm = NAN;    // IMU1 position, wrapped to [0, L)
  double x2_mm = NAN;    // IMU2 position, unwrapped (x1 + s)
  double y1_mm = NAN;    // depth at IMU1
  double y2_mm = NAN;    // depth at IMU2
  double ymin_mm = NAN;  // deepest point on [x1, x2]
  double xmin_mm = NAN;  // where the deepest point is (unwrapped)
  std::string message;
};

// Fixed geometry of one sensor setup
struct DepthGeometry {
  double s_mm = 103.0;
  double L_mm = 240.0;
  double slope_tol = 1e-3;
};

// ---------------- Model helpers ----------------
double wrap_pos(double x, double m);
double cosine_depth_mm(double x_mm, double D_mm, double L_mm);
double cosine_slope(double x_mm, double D_mm, double L_mm);

const char *depth_status_token(depth_status_t status);

/**
 * Solve depth amplitude and sensor positions from two tilt angles.
 *
 * @param theta1_deg  angle at IMU1 (degrees)
 * @param theta2_deg  angle at IMU2 (degrees)
 * @param s_mm        IMU separation along the path, > 0
 * @param L_mm        cosine period, > 0
 * @param slope_tol   max |model slope - measured slope| for a candidate,
 *                    finite and > 0
 * @return            result, ok=false with a reason when no consistent
 *                    solution exists
 */
DepthResult depth_from_two_angles(double theta1_deg, double theta2_deg,
                                  double s_mm, double L_mm = 240.0,
                                  double slope_tol = 1e-3);

// -------------------------------------------------------------------
//                 TWO-ANGLE DEPTH SOLVER CLASS
// -------------------------------------------------------------------

class TwoAngleDepthSolver {
public:
  TwoAngleDepthSolver();
  explicit TwoAngleDepthSolver(const DepthGeometry &geometry);

  DepthResult solve(double theta1_deg, double theta2_deg) const;

  const DepthGeometry &getGeometry() const;
  void setGeometry(const DepthGeometry &geometry);

private:
  DepthGeometry geo;
};
