/*
 * Copyright (c) 2025 Lummy
 *
 * This software is released under the MIT License.
 * See the LICENSE file in the project root for full details.
 */

#include "afdsim/io/scenario_loader.hpp"

#include <initializer_list>
#include <system_error>

#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

namespace afdsim::io {

namespace fs = std::filesystem;

namespace {

using Keys = std::initializer_list<std::string_view>;

// ============================================================================
// YAML helpers
// ============================================================================

/**
 * @brief Reads typed fields out of one YAML mapping, keeping the first error
 *
 * Each field may be listed under several alias keys; the first alias present
 * wins. Fields that are absent leave the destination untouched.
 */
class FieldReader {
 public:
  FieldReader(YAML::Node map, std::string context)
      : map_(std::move(map)), context_(std::move(context)) {}

  template <typename T>
  FieldReader& read(Keys keys, T& out) {
    if (!status_) return *this;
    const YAML::Node value = lookup(keys);
    if (value) {
      convert(value, *keys.begin(), out);
    }
    return *this;
  }

  template <typename T>
  FieldReader& read(Keys keys, std::optional<T>& out) {
    T value{};
    const bool present = static_cast<bool>(lookup(keys));
    read(keys, value);
    if (status_ && present) out = value;
    return *this;
  }

  template <typename T>
  FieldReader& require(Keys keys, T& out) {
    if (!status_) return *this;
    if (!lookup(keys)) {
      status_ = Error(ErrorCode::ConfigValidation,
                      context_ + ": missing required key '" + std::string(*keys.begin()) + "'");
      return *this;
    }
    return read(keys, out);
  }

  [[nodiscard]] const Result<void>& status() const noexcept { return status_; }

 private:
  YAML::Node lookup(Keys keys) const {
    if (!map_.IsDefined() || !map_.IsMap()) return YAML::Node(YAML::NodeType::Undefined);
    for (std::string_view key : keys) {
      const YAML::Node value = map_[std::string(key)];
      if (value.IsDefined() && !value.IsNull()) {
        return value;
      }
    }
    return YAML::Node(YAML::NodeType::Undefined);
  }

  template <typename T>
  void convert(const YAML::Node& value, std::string_view key, T& out) {
    try {
      out = value.as<T>();
    } catch (const YAML::BadConversion& e) {
      status_ = Error(ErrorCode::ParseError, context_ + "." + std::string(key) +
                                                 ": wrong value type (line " +
                                                 std::to_string(e.mark.line + 1) + ")");
    }
  }

  YAML::Node map_;
  std::string context_;
  Result<void> status_;
};

Result<YAML::Node> load_yaml_file(const fs::path& path) {
  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) {
    return Err<YAML::Node>(ErrorCode::FileNotFound, "File not found: " + path.string());
  }
  try {
    return Ok(YAML::LoadFile(path.string()));
  } catch (const YAML::Exception& e) {
    return Err<YAML::Node>(ErrorCode::ParseError,
                           "Invalid YAML in " + path.string() + ": " + e.what());
  }
}

/**
 * @brief Accept an inline mapping or a path to a YAML file holding one
 */
Result<YAML::Node> resolve_mapping(const YAML::Node& value, const fs::path& base_dir,
                                   const std::string& what) {
  if (value.IsMap()) {
    return Ok(value);
  }
  if (!value.IsScalar()) {
    return Err<YAML::Node>(ErrorCode::ParseError,
                           what + " must be a mapping or a file path");
  }
  auto doc = load_yaml_file(base_dir / value.Scalar());
  if (!doc) {
    return doc;
  }
  if (!doc.value().IsMap()) {
    return Err<YAML::Node>(ErrorCode::ParseError,
                           what + " file " + value.Scalar() + " must hold a mapping");
  }
  return doc;
}

/**
 * @brief Merge `overrides` over `base`, recursing into nested mappings
 */
YAML::Node merge_mappings(const YAML::Node& base, const YAML::Node& overrides) {
  YAML::Node merged = YAML::Clone(base);
  if (!merged.IsMap()) {
    merged = YAML::Node(YAML::NodeType::Map);
  }
  if (!overrides.IsDefined() || !overrides.IsMap()) {
    return merged;
  }
  for (const auto& kv : overrides) {
    const std::string key = kv.first.Scalar();
    const YAML::Node current = merged[key];
    if (current.IsMap() && kv.second.IsMap()) {
      merged[key] = merge_mappings(current, kv.second);
    } else {
      merged[key] = YAML::Clone(kv.second);
    }
  }
  return merged;
}

// ============================================================================
// Config blocks
// ============================================================================

Result<model::HardwareSpec> parse_hardware(const YAML::Node& node) {
  std::string missing;
  for (const char* key :
       {"name", "peak_tflops", "memory_bandwidth_gbps", "hbm_gb", "interconnect_gbps"}) {
    if (!node[key]) {
      missing += missing.empty() ? key : std::string(", ") + key;
    }
  }
  if (!missing.empty()) {
    return Err<model::HardwareSpec>(ErrorCode::ConfigValidation,
                                    "Hardware config missing keys: " + missing);
  }

  model::HardwareSpec hw;
  FieldReader reader(node, "hardware");
  reader.read({"name"}, hw.name)
      .read({"peak_tflops"}, hw.peak_tflops)
      .read({"memory_bandwidth_gbps"}, hw.memory_bandwidth_gbps)
      .read({"hbm_gb"}, hw.hbm_gb)
      .read({"interconnect_gbps"}, hw.interconnect_gbps)
      .read({"max_concurrency"}, hw.max_concurrency)
      .read({"overlap_efficiency"}, hw.overlap_efficiency);
  if (!reader.status()) {
    return Err<model::HardwareSpec>(reader.status().error());
  }

  auto valid = hw.validate();
  if (!valid) {
    return Err<model::HardwareSpec>(std::move(valid.error()));
  }
  return Ok(std::move(hw));
}

Result<model::AttentionConfig> parse_attention(const YAML::Node& node) {
  model::AttentionConfig attn;
  FieldReader reader(node, "attn_config");
  reader.read({"d_model"}, attn.d_model)
      .read({"num_attention_heads", "num_heads"}, attn.num_heads)
      .read({"num_key_value_heads", "num_kv_heads"}, attn.num_kv_heads)
      .read({"head_dim"}, attn.head_dim)
      .read({"dtype_bits"}, attn.dtype_bits);
  if (!reader.status()) {
    return Err<model::AttentionConfig>(reader.status().error());
  }
  return Ok(attn);
}

Result<model::LayerPayload> parse_payload(LayerType type, const YAML::Node& entry,
                                          const model::AttentionConfig& attn) {
  switch (type) {
    case LayerType::Attention: {
      const YAML::Node block = entry["attn_config"] ? entry["attn_config"] : entry;
      model::AttentionPayload payload;
      FieldReader reader(block, "attn_config");
      reader.read({"kv_cache_len"}, payload.kv_cache_len);
      if (!reader.status()) return Err<model::LayerPayload>(reader.status().error());
      return Ok(model::LayerPayload(payload));
    }

    case LayerType::FFN: {
      model::FFNConfig ffn{.d_model = attn.d_model, .dtype_bits = attn.dtype_bits};
      std::string activation = std::string(model::activation_str(ffn.activation));
      FieldReader reader(entry["ffn_config"], "ffn_config");
      reader.read({"d_model"}, ffn.d_model)
          .require({"d_ff", "intermediate_size"}, ffn.d_ff)
          .read({"activation", "hidden_act"}, activation)
          .read({"dtype_bits"}, ffn.dtype_bits);
      if (!reader.status()) return Err<model::LayerPayload>(reader.status().error());

      auto act = model::parse_activation(activation);
      if (!act) return Err<model::LayerPayload>(std::move(act.error()));
      ffn.activation = act.value();
      return Ok(model::LayerPayload(ffn));
    }

    case LayerType::MoE: {
      model::MoEConfig moe{.d_model = attn.d_model, .dtype_bits = attn.dtype_bits};
      FieldReader reader(entry["moe_config"], "moe_config");
      reader.read({"d_model", "model_dim"}, moe.d_model)
          .require({"moe_intermediate_size", "d_ff"}, moe.expert_intermediate)
          .read({"n_routed_experts", "num_experts"}, moe.num_experts)
          .read({"num_experts_per_tok", "top_k"}, moe.experts_per_token)
          .read({"n_group", "num_groups"}, moe.num_groups)
          .read({"n_shared_experts", "num_shared_experts"}, moe.num_shared_experts)
          .read({"include_dispatch"}, moe.include_dispatch)
          .read({"dtype_bits"}, moe.dtype_bits);
      if (!reader.status()) return Err<model::LayerPayload>(reader.status().error());
      return Ok(model::LayerPayload(moe));
    }

    case LayerType::Communication: {
      const YAML::Node block = entry["comm_config"] ? entry["comm_config"] : entry;
      model::CommunicationConfig comm;
      std::string pattern = std::string(model::comm_pattern_str(comm.pattern));
      FieldReader reader(block, "comm_config");
      reader.read({"pattern"}, pattern)
          .read({"payload_mb"}, comm.payload_mb)
          .read({"num_devices"}, comm.num_devices);
      if (!reader.status()) return Err<model::LayerPayload>(reader.status().error());

      auto parsed = model::parse_comm_pattern(pattern);
      if (!parsed) return Err<model::LayerPayload>(std::move(parsed.error()));
      comm.pattern = parsed.value();
      return Ok(model::LayerPayload(comm));
    }
  }
  return Err<model::LayerPayload>(ErrorCode::InternalError, "unhandled layer type");
}

Result<model::LayerConfig> parse_layer(usize index, const YAML::Node& entry,
                                       const fs::path& base_dir) {
  const std::string where = "layer #" + std::to_string(index);
  if (!entry.IsMap()) {
    return Err<model::LayerConfig>(ErrorCode::ParseError, where + " must be a mapping");
  }

  std::string type_name;
  FieldReader reader(entry, where);
  reader.require({"type"}, type_name);
  if (!reader.status()) return Err<model::LayerConfig>(reader.status().error());

  auto type = canonical_layer_type(type_name);
  if (!type.has_value()) {
    return Err<model::LayerConfig>(ErrorCode::ConfigValidation,
                                   where + ": unsupported layer type '" + type_name + "'");
  }

  YAML::Node config = entry;
  if (entry["config"]) {
    auto resolved = resolve_mapping(entry["config"], base_dir, where + " config");
    if (!resolved) return Err<model::LayerConfig>(std::move(resolved.error()));
    config = resolved.value();
  }
  const YAML::Node merged = merge_mappings(config, entry["overrides"]);

  // Precedence: overrides, then the referenced config, then the entry itself
  std::string name = std::string(layer_type_str(*type)) + "_" + std::to_string(index);
  FieldReader entry_names(entry, where);
  entry_names.read({"name"}, name);
  FieldReader names(merged, where);
  names.read({"name"}, name);
  if (!entry_names.status()) return Err<model::LayerConfig>(entry_names.status().error());
  if (!names.status()) return Err<model::LayerConfig>(names.status().error());

  const YAML::Node attn_block =
      (*type == LayerType::Attention && !merged["attn_config"]) ? merged
                                                                : merged["attn_config"];
  auto attn = parse_attention(attn_block);
  if (!attn) {
    return Err<model::LayerConfig>(
        Error(attn.error().code(), where + " (" + name + "): " + attn.error().message()));
  }

  auto payload = parse_payload(*type, merged, attn.value());
  if (!payload) {
    return Err<model::LayerConfig>(Error(payload.error().code(), where + " (" + name +
                                                                     "): " +
                                                                     payload.error().message()));
  }

  model::LayerConfig layer{
      .name = std::move(name),
      .layer_id = static_cast<i32>(index),
      .attention = attn.value(),
      .payload = std::move(payload.value()),
  };
  auto valid = layer.validate();
  if (!valid) {
    return Err<model::LayerConfig>(std::move(valid.error()));
  }
  return Ok(std::move(layer));
}

Result<Scenario> parse_scenario_node(const YAML::Node& root, const fs::path& base_dir,
                                     std::string default_name) {
  if (!root.IsMap()) {
    return Err<Scenario>(ErrorCode::ParseError, "Scenario must be a YAML mapping");
  }

  Scenario scenario;
  scenario.name = std::move(default_name);
  FieldReader reader(root, "scenario");
  reader.read({"name"}, scenario.name);
  if (!reader.status()) return Err<Scenario>(reader.status().error());

  if (!root["hardware"]) {
    return Err<Scenario>(ErrorCode::ConfigValidation,
                         "Scenario must specify a 'hardware' block or reference");
  }
  auto hw_node = resolve_mapping(root["hardware"], base_dir, "hardware");
  if (!hw_node) return Err<Scenario>(std::move(hw_node.error()));
  auto hw = parse_hardware(hw_node.value());
  if (!hw) return Err<Scenario>(std::move(hw.error()));
  scenario.hardware = std::move(hw.value());

  const YAML::Node layers = root["layers"];
  if (!layers || !layers.IsSequence() || layers.size() == 0) {
    return Err<Scenario>(ErrorCode::ConfigValidation,
                         "Scenario must include at least one layer entry");
  }
  scenario.layers.reserve(layers.size());
  for (usize i = 0; i < layers.size(); ++i) {
    auto layer = parse_layer(i, layers[i], base_dir);
    if (!layer) return Err<Scenario>(std::move(layer.error()));
    scenario.layers.push_back(std::move(layer.value()));
  }

  LOG(INFO) << "Loaded scenario '" << scenario.name << "': " << scenario.layers.size()
            << " layers on " << scenario.hardware.name;
  return Ok(std::move(scenario));
}

}  // namespace

// ============================================================================
// Public API
// ============================================================================

std::optional<LayerType> canonical_layer_type(std::string_view type_name) {
  if (type_name == "attention" || type_name == "attention_layer") return LayerType::Attention;
  if (type_name == "ffn" || type_name == "ffn_layer") return LayerType::FFN;
  if (type_name == "moe" || type_name == "moe_layer") return LayerType::MoE;
  if (type_name == "communication") return LayerType::Communication;
  return std::nullopt;
}

Result<Scenario> load_scenario(const fs::path& path) {
  auto doc = load_yaml_file(path);
  if (!doc) {
    return Err<Scenario>(std::move(doc.error()));
  }
  const fs::path absolute = fs::absolute(path);
  return parse_scenario_node(doc.value(), absolute.parent_path(),
                             absolute.stem().string());
}

Result<Scenario> parse_scenario(std::string_view yaml_text, const fs::path& base_dir,
                                std::string default_name) {
  YAML::Node root;
  try {
    root = YAML::Load(std::string(yaml_text));
  } catch (const YAML::Exception& e) {
    return Err<Scenario>(ErrorCode::ParseError, std::string("Invalid YAML: ") + e.what());
  }
  return parse_scenario_node(root, base_dir, std::move(default_name));
}

Result<model::HardwareSpec> load_hardware(const fs::path& path) {
  auto doc = load_yaml_file(path);
  if (!doc) {
    return Err<model::HardwareSpec>(std::move(doc.error()));
  }
  if (!doc.value().IsMap()) {
    return Err<model::HardwareSpec>(ErrorCode::ParseError,
                                    "Hardware file must hold a mapping: " + path.string());
  }
  return parse_hardware(doc.value());
}

}  // namespace afdsim::io
