#pragma once

#include "decimal.hpp"

// Iteration cap for a zoom factor. Staircase, non-decreasing in zoom:
//
//   zoom < 10    ->     512      zoom < 1e15  ->    32768
//   zoom < 100   ->    1024      zoom < 1e18  ->    65536
//   zoom < 1e3   ->    2048      zoom < 1e21  ->   131072
//   zoom < 1e4   ->    4096      zoom < 1e24  ->   262144
//   zoom < 1e5   ->    8192      zoom < 1e27  ->   524288
//   zoom < 1e12  ->   16384      zoom < 1e30  ->  1048576
//                                otherwise    ->  2097152
//
// NaN maps to the first step.
int cap_for(const Decimal& zoom);

inline int cap_for(double zoom) { return cap_for(Decimal(zoom)); }
