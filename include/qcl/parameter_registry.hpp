// SPDX-License-Identifier: MIT

#pragma once
#include <cstddef>
#include <functional>
#include <optional>
#include <span>
#include <variant>
#include <vector>

namespace qcl {

// angle = f(x)
using InputFunc = std::function<double(std::span<const double>)>;
// angle = f(companion value, x)
using InputFuncWithParam = std::function<double(double, std::span<const double>)>;
using InputTransform = std::variant<InputFunc, InputFuncWithParam>;

enum class ParameterRole { Learning, Input, Both };

// One row of the parameter table. `position` indexes the circuit's parameter list.
struct ParameterSlot {
  ParameterRole role;
  std::size_t position;
  std::optional<std::size_t> theta_index;  // Learning, Both
  double value = 0.0;
  std::optional<InputTransform> transform; // Input, Both
  std::optional<std::size_t> companion;    // Input reading another slot's theta
  bool is_also_input = false;              // Learning slot overwritten by a separate Input slot
};

struct LearningParameter {
  std::size_t position;
  std::size_t theta_index;
  double value;
  bool is_also_input;
};

struct InputSlot {
  std::size_t position;
  const InputTransform* transform;
  std::optional<std::size_t> companion_theta_index;
};

struct ParameterAssignment {
  std::size_t position;
  double angle;
};

// Bookkeeping between the flat theta vector and circuit parameter positions.
//
// Two-phase protocol per execution:
//   Bind   - bind_inputs(x) evaluates every input transform (overwriting companion values).
//   Commit - the caller pushes the returned assignments into the circuit.
// apply_theta() produces assignments the same way; whichever batch is committed last
// decides the angle of a companion position.
class ParameterRegistry {
  std::vector<ParameterSlot> slots_;
  std::vector<std::size_t> theta_slot_; // theta index -> slot

  ParameterSlot& learning_slot_(std::size_t theta_index);
  bool position_taken_(std::size_t position) const;

public:
  std::size_t learning_count() const { return theta_slot_.size(); }
  std::size_t input_count() const;
  const std::vector<ParameterSlot>& slots() const { return slots_; }

  // Returns the new theta index (== learning_count() before the call).
  std::size_t add_learning_slot(std::size_t position, double initial);
  // companion, if given, must be an existing theta index (InvalidReference otherwise)
  // and the transform must then be an InputFuncWithParam.
  void add_input_slot(std::size_t position, InputTransform transform,
                      std::optional<std::size_t> companion = std::nullopt);
  // Learning slot whose own angle is also recomputed from the data.
  std::size_t add_learning_input_slot(std::size_t position, double initial, InputFuncWithParam transform);

  std::vector<ParameterAssignment> bind_inputs(std::span<const double> x);
  // Throws DimensionMismatch if theta.size() != learning_count().
  std::vector<ParameterAssignment> apply_theta(std::span<const double> theta);
  std::vector<double> snapshot_theta() const;

  std::vector<LearningParameter> learning_parameters() const;
  std::vector<InputSlot> input_slots() const;

  // Per-position gradient -> per-theta gradient. Input-driven positions contribute 0.
  std::vector<double> route_gradient(std::span<const double> per_position) const;
};

} // namespace qcl
