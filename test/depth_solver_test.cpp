#include <gtest/gtest.h>
#include <math.h>

#include "depth_solver.h"
#include "utils.h"

namespace {

// angle a sensor would report at x on a path of amplitude D
double angle_at(double x_mm, double D_mm, double L_mm) {
  return rad2deg(atan(cosine_slope(x_mm, D_mm, L_mm)));
}

void expect_slopes_reproduced(const DepthResult &res, double theta1, double theta2,
                              double L_mm, double tol) {
  EXPECT_NEAR(cosine_slope(res.x1_mm, res.D_mm, L_mm), tan(deg2rad(theta1)), tol);
  EXPECT_NEAR(cosine_slope(wrap_pos(res.x2_mm, L_mm), res.D_mm, L_mm), tan(deg2rad(theta2)), tol);
}

}  // namespace

TEST(DepthSolverTest, WorkedExampleSolves) {
  DepthResult res = depth_from_two_angles(25.1, 1.0, 103.0, 240.0);

  ASSERT_TRUE(res.ok) << res.message;
  EXPECT_EQ(res.status, DEPTH_OK);
  EXPECT_EQ(res.message, "Solved.");
  EXPECT_NEAR(res.D_mm, 85.92987, 1e-3);
  EXPECT_NEAR(res.x1_mm, 136.40723, 1e-3);
  EXPECT_NEAR(res.x2_mm, res.x1_mm + 103.0, 1e-9);
  EXPECT_NEAR(res.y1_mm, -82.02682, 1e-3);
  EXPECT_NEAR(res.y2_mm, -0.00517, 1e-3);
  // IMU1 is the deepest point of the segment here
  EXPECT_DOUBLE_EQ(res.ymin_mm, res.y1_mm);
  EXPECT_DOUBLE_EQ(res.xmin_mm, res.x1_mm);
  expect_slopes_reproduced(res, 25.1, 1.0, 240.0, 1e-3);
}

TEST(DepthSolverTest, TroughInsideSegmentIsReported) {
  DepthResult res = depth_from_two_angles(-34.0, 32.5, 107.0, 240.0);

  ASSERT_TRUE(res.ok) << res.message;
  EXPECT_NEAR(res.D_mm, 51.52945, 1e-3);
  EXPECT_NEAR(res.x1_mm, 60.21215, 1e-3);
  EXPECT_DOUBLE_EQ(res.xmin_mm, 120.0);
  EXPECT_DOUBLE_EQ(res.ymin_mm, -res.D_mm);
  EXPECT_LT(res.ymin_mm, res.y1_mm);
  EXPECT_LT(res.ymin_mm, res.y2_mm);
}

TEST(DepthSolverTest, RecoversSyntheticPathAcrossPeriod) {
  const double L = 240.0;
  const double s = 103.0;
  const double D = 50.0;
  const double phi = 2.0 * M_PI * s / L;

  int checked = 0;
  for (int i = 0; i < 480; i++) {
    double x1 = 0.25 + i * 0.5;
    double a = 2.0 * M_PI * x1 / L;
    // skip points next to a stationary point of either sensor
    if (fmin(fabs(sin(a)), fabs(sin(a + phi))) < 0.05) continue;

    double t1 = angle_at(x1, D, L);
    double t2 = angle_at(x1 + s, D, L);
    DepthResult res = depth_from_two_angles(t1, t2, s, L);

    ASSERT_TRUE(res.ok) << "x1=" << x1 << " " << res.message;
    EXPECT_NEAR(res.D_mm, D, 1e-3) << "x1=" << x1;
    EXPECT_NEAR(res.x1_mm, x1, 1e-3) << "x1=" << x1;
    checked++;
  }
  EXPECT_GT(checked, 300);
}

TEST(DepthSolverTest, InvariantsHoldWheneverSolved) {
  const double L = 240.0;
  const double s = 103.0;
  int solved = 0;

  for (int a = -60; a <= 60; a += 3) {
    for (int b = -60; b <= 60; b += 3) {
      DepthResult res = depth_from_two_angles(a + 0.5, b + 0.25, s, L);
      if (!res.ok) {
        EXPECT_FALSE(res.message.empty());
        EXPECT_TRUE(isnan(res.D_mm));
        continue;
      }
      solved++;
      EXPECT_GT(res.D_mm, 0.0);
      EXPECT_GE(res.x1_mm, 0.0);
      EXPECT_LT(res.x1_mm, L);
      EXPECT_NEAR(res.x2_mm - res.x1_mm, s, 1e-9);
      EXPECT_LE(res.ymin_mm, res.y1_mm);
      EXPECT_LE(res.ymin_mm, res.y2_mm);
      EXPECT_GE(res.xmin_mm, res.x1_mm);
      EXPECT_LE(res.xmin_mm, res.x2_mm);
      expect_slopes_reproduced(res, a + 0.5, b + 0.25, L, 1e-3);
    }
  }
  EXPECT_GT(solved, 0);
}

TEST(DepthSolverTest, NearFlatFirstSensorAnchorsOnSecond) {
  // |tan(theta1)| < 1e-3 with a well conditioned phase
  DepthResult res = depth_from_two_angles(0.03748437160509644, 0.28864451359970905, 103.0, 240.0);

  ASSERT_TRUE(res.ok) << res.message;
  EXPECT_NEAR(res.D_mm, 1.0, 1e-6);
  EXPECT_NEAR(res.x1_mm, 121.90986, 1e-3);
}

TEST(DepthSolverTest, MirroredPathGivesSameDepth) {
  // x -> -x swaps the sensors and flips both slopes
  const double L = 240.0;
  DepthResult a = depth_from_two_angles(25.1, 1.0, 103.0, L);
  DepthResult b = depth_from_two_angles(-1.0, -25.1, 103.0, L);

  ASSERT_TRUE(a.ok);
  ASSERT_TRUE(b.ok);
  EXPECT_NEAR(b.D_mm, a.D_mm, 1e-6);
  EXPECT_NEAR(b.x1_mm, wrap_pos(L - a.x2_mm, L), 1e-6);
  EXPECT_NEAR(b.y1_mm, a.y2_mm, 1e-6);
  EXPECT_NEAR(b.y2_mm, a.y1_mm, 1e-6);
}

TEST(DepthSolverTest, RejectsNonPositiveGeometry) {
  const double cases[][2] = { { 0.0, 240.0 }, { -103.0, 240.0 }, { 103.0, 0.0 }, { 103.0, -240.0 } };
  for (const auto &c : cases) {
    DepthResult res = depth_from_two_angles(25.1, 1.0, c[0], c[1]);
    EXPECT_FALSE(res.ok);
    EXPECT_EQ(res.status, DEPTH_BAD_GEOMETRY);
    EXPECT_EQ(res.message, "L_mm and s_mm must be positive.");
  }
}

TEST(DepthSolverTest, RejectsBadSlopeTolerance) {
  const double tols[] = { NAN, 0.0, -1e-3, INFINITY };
  for (double tol : tols) {
    DepthResult res = depth_from_two_angles(25.1, 1.0, 103.0, 240.0, tol);
    EXPECT_FALSE(res.ok);
    EXPECT_EQ(res.status, DEPTH_BAD_GEOMETRY);
    EXPECT_EQ(res.message, "slope_tol must be positive and finite.");
    EXPECT_TRUE(isnan(res.D_mm));
  }

  DepthGeometry g;
  g.slope_tol = NAN;
  TwoAngleDepthSolver solver(g);
  EXPECT_EQ(solver.solve(25.1, 1.0).status, DEPTH_BAD_GEOMETRY);
}

TEST(DepthSolverTest, HugeSeparationSolvesWithTroughInSegment) {
  const double s = 1e11;
  const double L = 240.0;
  DepthResult res = depth_from_two_angles(25.1, 1.0, s, L);

  ASSERT_TRUE(res.ok) << res.message;
  EXPECT_GT(res.D_mm, 0.0);
  EXPECT_GE(res.x1_mm, 0.0);
  EXPECT_LT(res.x1_mm, L);
  EXPECT_DOUBLE_EQ(res.x2_mm, res.x1_mm + s);
  // the segment spans many periods, so a full trough lies inside it
  EXPECT_NEAR(res.ymin_mm, -res.D_mm, 1e-9);
  EXPECT_GE(res.xmin_mm, res.x1_mm);
  EXPECT_LE(res.xmin_mm, res.x2_mm);
  EXPECT_LE(res.ymin_mm, res.y1_mm);
  EXPECT_LE(res.ymin_mm, res.y2_mm);
  expect_slopes_reproduced(res, 25.1, 1.0, L, 1e-3);
}

TEST(DepthSolverTest, RejectsFlatFirstAngle) {
  DepthResult res = depth_from_two_angles(0.0, 20.0, 103.0, 240.0);
  EXPECT_FALSE(res.ok);
  EXPECT_EQ(res.status, DEPTH_FLAT_ANCHOR);
}

TEST(DepthSolverTest, RejectsVerticalAngles) {
  EXPECT_EQ(depth_from_two_angles(90.0, 10.0, 103.0, 240.0).status, DEPTH_NONFINITE_TANGENT);
  EXPECT_EQ(depth_from_two_angles(-90.0, 10.0, 103.0, 240.0).status, DEPTH_NONFINITE_TANGENT);
  EXPECT_EQ(depth_from_two_angles(10.0, 90.0, 103.0, 240.0).status, DEPTH_NONFINITE_TANGENT);
  EXPECT_EQ(depth_from_two_angles(NAN, 10.0, 103.0, 240.0).status, DEPTH_NONFINITE_TANGENT);
  EXPECT_FALSE(depth_from_two_angles(90.0, 10.0, 103.0, 240.0).ok);
}

TEST(DepthSolverTest, InconsistentAnglesGiveNoSolution) {
  // half-period separation: slopes must be opposite, equal ones cannot fit
  DepthResult res = depth_from_two_angles(10.0, 10.0, 120.0, 240.0);
  EXPECT_FALSE(res.ok);
  EXPECT_EQ(res.status, DEPTH_NO_SOLUTION);
  EXPECT_EQ(res.message, "No consistent solution found for given angles/separation/period.");
}

TEST(DepthSolverTest, WrapPosIsTrueModulo) {
  EXPECT_DOUBLE_EQ(wrap_pos(250.0, 240.0), 10.0);
  EXPECT_DOUBLE_EQ(wrap_pos(-10.0, 240.0), 230.0);
  EXPECT_DOUBLE_EQ(wrap_pos(-490.0, 240.0), 230.0);
  EXPECT_DOUBLE_EQ(wrap_pos(0.0, 240.0), 0.0);
  EXPECT_LT(wrap_pos(-1e-18, 240.0), 240.0);
}

TEST(DepthSolverTest, ModelCurveShape) {
  EXPECT_DOUBLE_EQ(cosine_depth_mm(0.0, 50.0, 240.0), 0.0);
  EXPECT_DOUBLE_EQ(cosine_depth_mm(120.0, 50.0, 240.0), -50.0);
  EXPECT_NEAR(cosine_slope(60.0, 50.0, 240.0), -50.0 * M_PI / 240.0, 1e-12);
}

TEST(DepthSolverTest, SolverClassUsesItsGeometry) {
  DepthGeometry g;
  g.s_mm = 107.0;
  g.L_mm = 240.0;
  TwoAngleDepthSolver solver(g);

  DepthResult res = solver.solve(-34.0, 32.5);
  ASSERT_TRUE(res.ok);
  EXPECT_NEAR(res.D_mm, 51.52945, 1e-3);

  g.s_mm = -1.0;
  solver.setGeometry(g);
  EXPECT_EQ(solver.solve(-34.0, 32.5).status, DEPTH_BAD_GEOMETRY);
  EXPECT_DOUBLE_EQ(solver.getGeometry().s_mm, -1.0);
}

TEST(DepthSolverTest, StatusTokens) {
  EXPECT_STREQ(depth_status_token(DEPTH_OK), "ok");
  EXPECT_STREQ(depth_status_token(DEPTH_BAD_GEOMETRY), "bad_geometry");
  EXPECT_STREQ(depth_status_token(DEPTH_NONFINITE_TANGENT), "nonfinite_tangent");
  EXPECT_STREQ(depth_status_token(DEPTH_FLAT_ANCHOR), "flat_anchor");
  EXPECT_STREQ(depth_status_token(DEPTH_NO_SOLUTION), "no_solution");
}
