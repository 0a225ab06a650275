#include "step_graph.hpp"

#include <algorithm>
#include <set>
#include <tuple>

#include "internal/util/errors.hpp"

namespace shopfloor::graph {

using util::GraphError;
using util::GraphErrorKind;
using util::ValidationError;
using util::ValidationErrorKind;

StepGraph StepGraph::Build(std::uint64_t product_id, const std::vector<model::Step>& steps, bool reject_forward_dependencies) {
  StepGraph graph;
  graph.product_id_ = product_id;

  for (const auto& step : steps) {
    if (step.product_id != product_id) {
      throw ValidationError(ValidationErrorKind::kInvalidStep,
                            "step " + std::to_string(step.id) + " belongs to product " + std::to_string(step.product_id));
    }
    if (step.time_per_piece_seconds < 0) {
      throw ValidationError(ValidationErrorKind::kInvalidStep, "step " + std::to_string(step.id) + " has negative time per piece");
    }
    if (step.time_per_piece_seconds > model::kMaxTimePerPieceSeconds) {
      throw ValidationError(ValidationErrorKind::kInvalidStep, "step " + std::to_string(step.id) + " takes " +
                                                                   std::to_string(step.time_per_piece_seconds) + " s per piece, over the " +
                                                                   std::to_string(model::kMaxTimePerPieceSeconds) + " s limit");
    }
    if (!graph.steps_.emplace(step.id, step).second) {
      throw ValidationError(ValidationErrorKind::kInvalidStep, "duplicate step id " + std::to_string(step.id));
    }
    graph.dependencies_[step.id];
    graph.dependents_[step.id];
  }

  std::unordered_map<std::uint64_t, std::size_t> in_degree;
  for (const auto& step : steps) {
    std::set<std::uint64_t> unique_deps(step.dependencies.begin(), step.dependencies.end());
    for (auto dependency : unique_deps) {
      if (dependency == step.id) {
        throw GraphError(GraphErrorKind::kCycle, "step " + std::to_string(step.id) + " depends on itself");
      }
      auto it = graph.steps_.find(dependency);
      if (it == graph.steps_.end()) {
        throw GraphError(GraphErrorKind::kDanglingDependency,
                         "step " + std::to_string(step.id) + " depends on unknown step " + std::to_string(dependency));
      }
      if (reject_forward_dependencies && it->second.sequence > step.sequence) {
        throw ValidationError(ValidationErrorKind::kForwardDependency,
                              "step " + std::to_string(step.id) + " depends on later step " + std::to_string(dependency));
      }
      graph.dependencies_[step.id].push_back(dependency);
      graph.dependents_[dependency].push_back(step.id);
    }
    in_degree[step.id] = unique_deps.size();
  }

  // Kahn's algorithm; the ready set is ordered so ties resolve deterministically.
  auto key = [&graph](std::uint64_t id) { return std::make_tuple(graph.steps_.at(id).sequence, id); };
  std::set<std::tuple<std::int32_t, std::uint64_t>> ready;
  for (const auto& [id, degree] : in_degree) {
    if (degree == 0) ready.insert(key(id));
  }

  while (!ready.empty()) {
    const auto id = std::get<1>(*ready.begin());
    ready.erase(ready.begin());
    graph.order_.push_back(id);

    for (auto dependent : graph.dependents_[id]) {
      if (--in_degree[dependent] == 0) ready.insert(key(dependent));
    }
  }

  if (graph.order_.size() != graph.steps_.size()) {
    std::vector<std::uint64_t> stuck;
    for (const auto& [id, degree] : in_degree) {
      if (degree > 0) stuck.push_back(id);
    }
    std::sort(stuck.begin(), stuck.end());

    std::string ids;
    for (auto id : stuck) {
      if (!ids.empty()) ids += ",";
      ids += std::to_string(id);
    }
    throw GraphError(GraphErrorKind::kCycle, "dependency cycle in product " + std::to_string(product_id) + " among steps [" + ids + "]");
  }

  for (auto& [_, dependents] : graph.dependents_) {
    std::sort(dependents.begin(), dependents.end());
  }
  return graph;
}

const model::Step& StepGraph::Step(std::uint64_t step_id) const {
  auto it = steps_.find(step_id);
  if (it == steps_.end()) {
    throw util::NotFound("step " + std::to_string(step_id) + " not in product " + std::to_string(product_id_));
  }
  return it->second;
}

const std::vector<std::uint64_t>& StepGraph::Dependencies(std::uint64_t step_id) const {
  auto it = dependencies_.find(step_id);
  if (it == dependencies_.end()) {
    throw util::NotFound("step " + std::to_string(step_id) + " not in product " + std::to_string(product_id_));
  }
  return it->second;
}

const std::vector<std::uint64_t>& StepGraph::Dependents(std::uint64_t step_id) const {
  auto it = dependents_.find(step_id);
  if (it == dependents_.end()) {
    throw util::NotFound("step " + std::to_string(step_id) + " not in product " + std::to_string(product_id_));
  }
  return it->second;
}

} // namespace shopfloor::graph
