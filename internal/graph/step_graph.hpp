#pragma once

#include <cstdint>
#include <unordered_map>
#include <vector>

#include "internal/model/step.hpp"

namespace shopfloor::graph {

/*
  Dependency DAG over one product's steps.

  Build() validates the step list and computes a topological order whose
  ties break by ascending sequence, then ascending id. The graph is
  immutable once built.
*/
class StepGraph {
 public:
  static StepGraph Build(std::uint64_t product_id, const std::vector<model::Step>& steps, bool reject_forward_dependencies = false);

  const std::vector<std::uint64_t>& Order() const {
    return order_;
  }

  const model::Step& Step(std::uint64_t step_id) const;

  const std::vector<std::uint64_t>& Dependencies(std::uint64_t step_id) const;
  const std::vector<std::uint64_t>& Dependents(std::uint64_t step_id) const;

  bool Contains(std::uint64_t step_id) const {
    return steps_.contains(step_id);
  }

  std::size_t size() const {
    return order_.size();
  }

 private:
  StepGraph() = default;

  std::uint64_t                                              product_id_ = 0;
  std::unordered_map<std::uint64_t, model::Step>             steps_;
  std::unordered_map<std::uint64_t, std::vector<std::uint64_t>> dependencies_;
  std::unordered_map<std::uint64_t, std::vector<std::uint64_t>> dependents_;
  std::vector<std::uint64_t>                                 order_;
};

} // namespace shopfloor::graph
