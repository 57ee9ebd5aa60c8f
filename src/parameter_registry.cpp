// SPDX-License-Identifier: MIT

#include "qcl/parameter_registry.hpp"
#include "qcl/errors.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace qcl {

ParameterSlot& ParameterRegistry::learning_slot_(std::size_t theta_index){
  if (theta_index >= theta_slot_.size())
    throw InvalidReference("no learning parameter with theta index " + std::to_string(theta_index));
  return slots_[theta_slot_[theta_index]];
}

bool ParameterRegistry::position_taken_(std::size_t position) const {
  return std::any_of(slots_.begin(), slots_.end(), [&](const ParameterSlot& s){ return s.position == position; });
}

std::size_t ParameterRegistry::input_count() const {
  return std::count_if(slots_.begin(), slots_.end(), [](const ParameterSlot& s){ return s.transform.has_value(); });
}

std::size_t ParameterRegistry::add_learning_slot(std::size_t position, double initial){
  if (position_taken_(position))
    throw std::invalid_argument("parameter position " + std::to_string(position) + " already registered");
  std::size_t theta = theta_slot_.size();
  slots_.push_back(ParameterSlot{ParameterRole::Learning, position, theta, initial, std::nullopt, std::nullopt});
  theta_slot_.push_back(slots_.size() - 1);
  return theta;
}

void ParameterRegistry::add_input_slot(std::size_t position, InputTransform transform, std::optional<std::size_t> companion){
  if (!companion){
    if (!std::holds_alternative<InputFunc>(transform))
      throw std::invalid_argument("input slot without companion needs a transform of x only");
    if (position_taken_(position))
      throw std::invalid_argument("parameter position " + std::to_string(position) + " already registered");
    slots_.push_back(ParameterSlot{ParameterRole::Input, position, std::nullopt, 0.0, std::move(transform), std::nullopt});
    return;
  }
  ParameterSlot& comp = learning_slot_(*companion);
  if (!std::holds_alternative<InputFuncWithParam>(transform))
    throw std::invalid_argument("companion-coupled input slot needs a transform of (value, x)");
  if (comp.position == position){
    if (comp.transform)
      throw std::invalid_argument("theta index " + std::to_string(*companion) + " already has an input transform");
    comp.role = ParameterRole::Both;
    comp.transform = std::move(transform);
    return;
  }
  if (position_taken_(position))
    throw std::invalid_argument("parameter position " + std::to_string(position) + " already registered");
  comp.is_also_input = true;
  slots_.push_back(ParameterSlot{ParameterRole::Input, position, std::nullopt, 0.0, std::move(transform), companion});
}

std::size_t ParameterRegistry::add_learning_input_slot(std::size_t position, double initial, InputFuncWithParam transform){
  std::size_t theta = add_learning_slot(position, initial);
  add_input_slot(position, std::move(transform), theta);
  return theta;
}

std::vector<ParameterAssignment> ParameterRegistry::bind_inputs(std::span<const double> x){
  std::vector<ParameterAssignment> out;
  for (auto& slot : slots_){
    if (!slot.transform) continue;
    double angle = 0.0;
    switch (slot.role) {
      case ParameterRole::Learning:
        continue;
      case ParameterRole::Both: {
        const auto& f = std::get<InputFuncWithParam>(*slot.transform);
        angle = f(slot.value, x);
        slot.value = angle;
        break;
      }
      case ParameterRole::Input:
        if (slot.companion){
          ParameterSlot& comp = slots_[theta_slot_[*slot.companion]];
          const auto& f = std::get<InputFuncWithParam>(*slot.transform);
          angle = f(comp.value, x);
          comp.value = angle;
        } else {
          angle = std::get<InputFunc>(*slot.transform)(x);
        }
        slot.value = angle;
        break;
    }
    out.push_back({slot.position, angle});
  }
  return out;
}

std::vector<ParameterAssignment> ParameterRegistry::apply_theta(std::span<const double> theta){
  if (theta.size() != theta_slot_.size())
    throw DimensionMismatch("theta has " + std::to_string(theta.size()) + " entries, circuit has " +
                            std::to_string(theta_slot_.size()) + " learning parameters");
  std::vector<ParameterAssignment> out;
  out.reserve(theta.size());
  for (std::size_t k=0;k<theta_slot_.size();++k){
    ParameterSlot& slot = slots_[theta_slot_[k]];
    slot.value = theta[k];
    out.push_back({slot.position, slot.value});
  }
  return out;
}

std::vector<double> ParameterRegistry::snapshot_theta() const {
  std::vector<double> theta;
  theta.reserve(theta_slot_.size());
  for (auto s : theta_slot_) theta.push_back(slots_[s].value);
  return theta;
}

std::vector<LearningParameter> ParameterRegistry::learning_parameters() const {
  std::vector<LearningParameter> out;
  out.reserve(theta_slot_.size());
  for (auto s : theta_slot_){
    const auto& slot = slots_[s];
    out.push_back({slot.position, *slot.theta_index, slot.value,
                   slot.role == ParameterRole::Both || slot.is_also_input});
  }
  return out;
}

std::vector<InputSlot> ParameterRegistry::input_slots() const {
  std::vector<InputSlot> out;
  for (const auto& slot : slots_){
    if (!slot.transform) continue;
    std::optional<std::size_t> comp = slot.role == ParameterRole::Both ? slot.theta_index : slot.companion;
    out.push_back({slot.position, &*slot.transform, comp});
  }
  return out;
}

std::vector<double> ParameterRegistry::route_gradient(std::span<const double> per_position) const {
  std::vector<double> grad(theta_slot_.size(), 0.0);
  for (std::size_t k=0;k<theta_slot_.size();++k){
    const auto& slot = slots_[theta_slot_[k]];
    if (slot.position >= per_position.size())
      throw DimensionMismatch("gradient has " + std::to_string(per_position.size()) +
                              " entries, parameter position " + std::to_string(slot.position) + " requested");
    if (slot.role == ParameterRole::Both || slot.is_also_input) continue;
    grad[k] = per_position[slot.position];
  }
  return grad;
}

} // namespace qcl
