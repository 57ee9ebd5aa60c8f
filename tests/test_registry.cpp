// SPDX-License-Identifier: MIT

#include "qcl/learning_circuit.hpp"
#include "qcl/errors.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>

using namespace qcl;

static int fails=0;
#define CHECK(c) do{ if (!(c)) { std::cerr << "CHECK failed at " << __LINE__ << ": " #c "\n"; ++fails; } }while(0)
#define CHECK_NEAR(a,b,e) do{ if (std::fabs((a)-(b))>(e)) { std::cerr << "Mismatch at " << __LINE__ << ": " << (a) << " vs " << (b) << "\n"; ++fails; } }while(0)

template <class E, class F>
static bool throws(F&& f){
  try { f(); } catch (const E&) { return true; }
  return false;
}

static void theta_indices_are_contiguous(){
  LearningCircuit c(2);
  auto plus_x = [](double v, std::span<const double> x){ return v + x[0]; };
  CHECK(c.add_parametric_RX_gate(0, 0.1) == 0);
  c.add_input_RY_gate(1, [](std::span<const double> x){ return 2.0 * x[0]; });
  CHECK(c.add_parametric_input_RZ_gate(0, 0.2, plus_x) == 1);
  c.add_H_gate(1);
  CHECK(c.add_parametric_RY_gate(1, 0.3) == 2);
  c.add_companion_input_R_gate(1, Axis::X, 0, plus_x);
  CHECK(c.add_parametric_RZ_gate(1, 0.4) == 3);

  auto params = c.registry().learning_parameters();
  CHECK(params.size() == 4);
  for (std::size_t k=0;k<params.size();++k) CHECK(params[k].theta_index == k);
  // positions follow circuit parameter order: 0 learn, 1 input, 2 both, 3 learn, 4 input, 5 learn
  CHECK(params[0].position == 0 && params[1].position == 2 && params[2].position == 3 && params[3].position == 5);
  CHECK(params[0].is_also_input);   // companion of the input slot at position 4
  CHECK(params[1].is_also_input);   // Both
  CHECK(!params[2].is_also_input && !params[3].is_also_input);
  CHECK(c.circuit().parameter_count() == 6);
  CHECK(c.registry().input_count() == 3);

  auto inputs = c.registry().input_slots();
  CHECK(inputs.size() == 3);
  CHECK(!inputs[0].companion_theta_index);
  CHECK(inputs[1].companion_theta_index && *inputs[1].companion_theta_index == 1);
  CHECK(inputs[2].companion_theta_index && *inputs[2].companion_theta_index == 0);
}

static void snapshot_returns_applied_theta(){
  LearningCircuit c(3);
  for (std::size_t i=0;i<3;++i){
    c.add_parametric_RX_gate(i, 0.0);
    c.add_input_RZ_gate(i);
    c.add_parametric_RY_gate(i, 0.0);
  }
  std::vector<double> v = {0.25, -1.5, 3.0, 1e-9, 6.1, -0.0};
  c.update_parameters(v);
  CHECK(c.get_parameters() == v);
  // pushed to the circuit at the learning positions
  auto params = c.registry().learning_parameters();
  for (const auto& p : params) CHECK(c.circuit().get_parameter(p.position) == v[p.theta_index]);

  std::vector<double> short_theta = {1.0, 2.0};
  CHECK(throws<DimensionMismatch>([&]{ c.update_parameters(short_theta); }));
  CHECK(c.get_parameters() == v);
}

static void companion_tracks_latest_input(){
  ParameterRegistry r;
  std::size_t t = r.add_learning_slot(0, 0.5);
  r.add_input_slot(1, InputFuncWithParam([](double v, std::span<const double> x){ return v * 0.5 + x[0]; }), t);

  std::vector<double> x1 = {1.0}, x2 = {-2.0};
  auto a1 = r.bind_inputs(x1);
  CHECK(a1.size() == 1 && a1[0].position == 1);
  CHECK_NEAR(a1[0].angle, 1.25, 1e-15);
  CHECK_NEAR(r.snapshot_theta()[t], 1.25, 1e-15);
  auto a2 = r.bind_inputs(x2);
  CHECK_NEAR(a2[0].angle, 1.25 * 0.5 - 2.0, 1e-15);
  CHECK(r.snapshot_theta()[t] == a2[0].angle);

  // optimizer value committed after binding wins
  std::vector<double> theta = {0.75};
  auto applied = r.apply_theta(theta);
  CHECK(applied.size() == 1 && applied[0].position == 0 && applied[0].angle == 0.75);
  CHECK(r.snapshot_theta()[t] == 0.75);
}

static void invalid_references_rejected(){
  ParameterRegistry r;
  r.add_learning_slot(0, 0.0);
  auto f = InputFuncWithParam([](double v, std::span<const double>){ return v; });
  CHECK(throws<InvalidReference>([&]{ r.add_input_slot(1, f, 1); }));
  CHECK(r.slots().size() == 1);
  CHECK(throws<std::invalid_argument>([&]{ r.add_input_slot(1, f); }));
  CHECK(throws<std::invalid_argument>([&]{ r.add_input_slot(1, InputFunc([](std::span<const double>){ return 0.0; }), 0); }));
  CHECK(throws<std::invalid_argument>([&]{ r.add_learning_slot(0, 1.0); }));

  LearningCircuit c(1);
  CHECK(throws<InvalidReference>([&]{ c.add_companion_input_R_gate(0, Axis::Y, 3, f); }));
  CHECK(c.circuit().parameter_count() == 0);
  CHECK(throws<InvalidReference>([&]{ c.add_parametric_RX_gate(4, 0.0); }));
  CHECK(c.learning_parameter_count() == 0);
}

static void run_binds_inputs_and_routes_gradient(){
  LearningCircuit c(1);
  c.add_input_RY_gate(0, [](std::span<const double> x){ return 2.0 * std::asin(x[0]); });
  c.add_parametric_RZ_gate(0, 0.0);
  std::vector<double> x = {1.0};
  StateVector s = c.run(x);
  CHECK_NEAR(s.probability_of_basis(1), 1.0, 1e-12);
  CHECK_NEAR(c.circuit().get_parameter(0), M_PI, 1e-15);
  StateVector again = c.run_x_no_change();
  CHECK_NEAR(std::abs(s.inner_product(again)), 1.0, 1e-12);

  ParameterRegistry r;
  r.add_learning_slot(0, 0.0);
  r.add_input_slot(1, InputFunc([](std::span<const double>){ return 0.0; }));
  r.add_learning_input_slot(2, 0.0, [](double v, std::span<const double>){ return v; });
  r.add_learning_slot(3, 0.0);
  std::vector<double> per_pos = {1.0, 2.0, 3.0, 4.0};
  auto g = r.route_gradient(per_pos);
  CHECK(g.size() == 3);
  CHECK(g[0] == 1.0 && g[1] == 0.0 && g[2] == 4.0);
  std::vector<double> too_short = {1.0};
  CHECK(throws<DimensionMismatch>([&]{ r.route_gradient(too_short); }));
}

int main(){
  theta_indices_are_contiguous();
  snapshot_returns_applied_theta();
  companion_tracks_latest_input();
  invalid_references_rejected();
  run_binds_inputs_and_routes_gradient();
  if (fails==0) std::cout << "OK\n";
  return fails==0?0:1;
}
