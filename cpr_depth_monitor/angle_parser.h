#pragma once
#include <string>

// -------------------------------------------------------------------
//                    ANGLE LINE PARSER - DECLARATION
// -------------------------------------------------------------------
//
// IMU firmware streams one pair of roll angles per line:
//
//   ROLL,<theta_a>,<theta_b>        e.g.  ROLL,-34.20,32.50
//
// The keyword is case-insensitive and may appear anywhere in the line,
// whitespace is allowed around the commas, numbers are [-+]?d+(.d+)?
// and anything after the second number is ignored.

// Returns false (outputs untouched) when the line carries no angle pair.
bool parse_two_angles(const std::string &line, double *theta_a_deg, double *theta_b_deg);
