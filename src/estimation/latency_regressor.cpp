/*
 * Copyright (c) 2025 Lummy
 *
 * This software is released under the MIT License.
 * See the LICENSE file in the project root for full details.
 */

#include "afdsim/estimation/latency_regressor.hpp"

#include <fstream>
#include <sstream>
#include <utility>

#include <glog/logging.h>
#include <nlohmann/json.hpp>

namespace afdsim::estimation {

using json = nlohmann::json;

namespace {

Result<LayerType> layer_type_from_name(std::string_view name) {
  for (LayerType t : {LayerType::Attention, LayerType::FFN, LayerType::MoE,
                      LayerType::Communication}) {
    if (layer_type_str(t) == name) {
      return Ok(t);
    }
  }
  return Err<LayerType>(ErrorCode::ParseError,
                        "unknown layer type in model file: " + std::string(name));
}

/**
 * @brief Read {"weights": [...], "bias": x} into one row of the model
 */
Result<void> read_head(const json& head, std::string_view head_name, usize width,
                       Eigen::Index row, LinearLatencyModel& model) {
  if (!head.is_object() || !head.contains("weights") || !head["weights"].is_array()) {
    return Err<void>(ErrorCode::ParseError,
                     std::string(head_name) + " must be an object with a weights array");
  }
  const json& weights = head["weights"];
  if (weights.size() != width) {
    return Err<void>(ErrorCode::ParseError,
                     std::string(head_name) + " has " + std::to_string(weights.size()) +
                         " weights for " + std::to_string(width) + " features");
  }
  for (usize i = 0; i < width; ++i) {
    if (!weights[i].is_number()) {
      return Err<void>(ErrorCode::ParseError,
                       std::string(head_name) + " weight " + std::to_string(i) +
                           " is not a number");
    }
    model.weights(row, static_cast<Eigen::Index>(i)) = weights[i].get<f64>();
  }
  if (head.contains("bias")) {
    if (!head["bias"].is_number()) {
      return Err<void>(ErrorCode::ParseError,
                       std::string(head_name) + " bias is not a number");
    }
    model.bias(row) = head["bias"].get<f64>();
  }
  return Ok();
}

Result<LinearLatencyModel> read_model(const json& node, std::string_view type_name) {
  if (!node.is_object() || !node.contains("features") || !node["features"].is_array()) {
    return Err<LinearLatencyModel>(
        ErrorCode::ParseError,
        "model '" + std::string(type_name) + "' needs a features array");
  }

  LinearLatencyModel model;
  for (const auto& name : node["features"]) {
    if (!name.is_string()) {
      return Err<LinearLatencyModel>(
          ErrorCode::ParseError,
          "model '" + std::string(type_name) + "' has a non-string feature name");
    }
    model.feature_names.push_back(name.get<std::string>());
  }

  const usize width = model.feature_names.size();
  model.weights.setZero(2, static_cast<Eigen::Index>(width));

  static const std::pair<const char*, Eigen::Index> kHeads[] = {
      {"compute_ms", 0},
      {"memory_ms", 1},
  };
  for (const auto& [head_name, row] : kHeads) {
    if (!node.contains(head_name)) {
      return Err<LinearLatencyModel>(ErrorCode::ParseError,
                                     "model '" + std::string(type_name) +
                                         "' is missing " + head_name);
    }
    auto head = read_head(node[head_name], head_name, width, row, model);
    if (!head) {
      return Err<LinearLatencyModel>(
          ErrorCode::ParseError,
          "model '" + std::string(type_name) + "': " + head.error().message());
    }
  }
  return Ok(std::move(model));
}

}  // namespace

// ============================================================================
// Loading
// ============================================================================

Result<std::shared_ptr<const LatencyRegressor>> LatencyRegressor::load(
    const std::filesystem::path& path) {
  using Ptr = std::shared_ptr<const LatencyRegressor>;

  std::ifstream file(path);
  if (!file.is_open()) {
    return Err<Ptr>(ErrorCode::FileNotFound,
                    "Cannot open latency model: " + path.string());
  }
  std::stringstream buffer;
  buffer << file.rdbuf();

  json doc = json::parse(buffer.str(), nullptr, /*allow_exceptions=*/false);
  if (doc.is_discarded()) {
    return Err<Ptr>(ErrorCode::ParseError,
                    "Latency model is not valid JSON: " + path.string());
  }

  auto regressor = from_json(doc);
  if (regressor) {
    LOG(INFO) << "Loaded latency model from " << path.string();
  }
  return regressor;
}

Result<std::shared_ptr<const LatencyRegressor>> LatencyRegressor::from_json(
    const json& doc) {
  using Ptr = std::shared_ptr<const LatencyRegressor>;

  if (!doc.is_object() || !doc.contains("models") || !doc["models"].is_object()) {
    return Err<Ptr>(ErrorCode::ParseError, "Latency model needs a 'models' object");
  }

  auto regressor = std::make_shared<LatencyRegressor>();
  for (const auto& item : doc["models"].items()) {
    const std::string& type_name = item.key();
    const json& node = item.value();
    auto type = layer_type_from_name(type_name);
    if (!type) {
      return Err<Ptr>(std::move(type.error()));
    }
    auto model = read_model(node, type_name);
    if (!model) {
      return Err<Ptr>(std::move(model.error()));
    }
    auto installed = regressor->set_model(type.value(), std::move(model.value()));
    if (!installed) {
      return Err<Ptr>(ErrorCode::ParseError, installed.error().message());
    }
    VLOG(1) << "Latency model for " << type_name << ": "
            << regressor->models_.at(type.value()).feature_names.size() << " features";
  }
  return Ok(Ptr(std::move(regressor)));
}

// ============================================================================
// Inference
// ============================================================================

Result<void> LatencyRegressor::set_model(LayerType type, LinearLatencyModel model) {
  if (model.weights.cols() != static_cast<Eigen::Index>(model.feature_names.size())) {
    return Err<void>(ErrorCode::InvalidArgument,
                     "weight matrix has " + std::to_string(model.weights.cols()) +
                         " columns for " + std::to_string(model.feature_names.size()) +
                         " features");
  }
  models_.insert_or_assign(type, std::move(model));
  return Ok();
}

Result<LatencyPrediction> LatencyRegressor::predict(
    LayerType type, const std::map<std::string, f64>& features) const {
  auto it = models_.find(type);
  if (it == models_.end()) {
    return Err<LatencyPrediction>(
        ErrorCode::BackendUnavailable,
        "no latency model for layer type " + std::string(layer_type_str(type)));
  }
  const LinearLatencyModel& model = it->second;

  Eigen::VectorXd x(static_cast<Eigen::Index>(model.feature_names.size()));
  for (usize i = 0; i < model.feature_names.size(); ++i) {
    auto f = features.find(model.feature_names[i]);
    if (f == features.end()) {
      return Err<LatencyPrediction>(
          ErrorCode::BackendUnavailable,
          "feature '" + model.feature_names[i] + "' missing for " +
              std::string(layer_type_str(type)) + " model");
    }
    x(static_cast<Eigen::Index>(i)) = f->second;
  }

  const Eigen::Vector2d y = model.weights * x + model.bias;
  return Ok(LatencyPrediction{.compute_ms = y(0), .memory_ms = y(1)});
}

}  // namespace afdsim::estimation
