#pragma once
#include <map>
#include <string>
#include "depth_solver.h"

// -------------------------------------------------------------------
//                      PARAM STORE - DECLARATION
// -------------------------------------------------------------------
//
// Named numeric parameters of the depth monitor:
//
//   L_mm             cosine period                 > 0      (240)
//   s_mm             IMU separation                > 0      (103)
//   slope_tol        slope validation tolerance    > 0      (0.001)
//   segment_samples  kept for old configs, unused  >= 1     (400)
//   swap             treat 2nd angle as IMU1       0 or 1   (0)
//
// JSON form: {"L_mm":240,"s_mm":103,"slope_tol":0.001,"swap":false}

struct Param {
  double value{ 0.0 };
  double def{ 0.0 };
  double min_val{ 0.0 };
  bool min_exclusive{ false };
  bool is_flag{ false };  // only 0 or 1
};

class ParamStore {
public:
  ParamStore();

  bool has(const char *key) const;
  double get(const char *key) const;
  bool set(const char *key, double value);
  void reset();

  DepthGeometry geometry() const;
  bool swapOn() const;

  // all-or-nothing: on error the store is unchanged and err says why
  bool load_json(const std::string &text, std::string *err = nullptr);
  std::string to_json() const;

  void list_params() const;

private:
  std::map<std::string, Param> params;

  void add(const char *key, double def, double min_val, bool min_exclusive, bool is_flag = false);
  bool valid(const Param &p, double value) const;
};
