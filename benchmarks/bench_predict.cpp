// SPDX-License-Identifier: MIT

#include "qcl/classifier.hpp"
#include <chrono>
#include <iostream>

using namespace qcl;

int main(){
  ClassifierOptions o;
  o.nqubit = 8; o.c_depth = 4; o.num_class = 3; o.log = nullptr;
  QclClassifier clf(o);
  Pcg32 rng(42);
  Batch x(200, std::vector<double>(2));
  for (auto& row : x){ row[0] = rng.uniform(-1.0, 1.0); row[1] = rng.uniform(-1.0, 1.0); }
  clf.set_input_state(x);
  clf.create_initial_output_gate();
  const std::vector<double> theta = clf.theta();
  auto t0 = std::chrono::steady_clock::now();
  auto p = clf.pred(theta); (void)p;
  auto t1 = std::chrono::steady_clock::now();
  std::chrono::duration<double> dt = t1 - t0;
  std::cout << "Elapsed seconds: " << dt.count() << "\n";
  return 0;
}
