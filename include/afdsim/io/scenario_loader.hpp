/*
 * Copyright (c) 2025 Lummy
 *
 * This software is released under the MIT License.
 * See the LICENSE file in the project root for full details.
 */
#pragma once

/**
 * @file scenario_loader.hpp
 * @brief YAML scenario and hardware profile loading
 * @version 0.1.0
 *
 * Scenario layout:
 * @code
 *   name: deepseek_decode            # optional, defaults to the file stem
 *   hardware: hardware/h800.yaml     # inline mapping or path
 *   layers:
 *     - type: attention              # attention[_layer], ffn[_layer], moe[_layer],
 *       name: attn0                  # communication
 *       config: layers/attn.yaml     # optional mapping or path
 *       overrides: {attn_config: {kv_cache_len: 4096}}
 * @endcode
 *
 * Paths are resolved against the directory of the file that names them.
 * Runtime shape is never read from the scenario.
 */

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "afdsim/core/error.hpp"
#include "afdsim/model/hardware_spec.hpp"
#include "afdsim/model/layer_config.hpp"

namespace afdsim::io {

struct Scenario {
  std::string name;
  model::HardwareSpec hardware;
  std::vector<model::LayerConfig> layers;
};

/**
 * @brief Map a scenario layer type (or alias) to its LayerType
 */
[[nodiscard]] std::optional<LayerType> canonical_layer_type(std::string_view type_name);

/**
 * @brief Load and validate a scenario file
 *
 * @return FileNotFound for a missing scenario or referenced file,
 *         ParseError for malformed YAML or wrongly typed values,
 *         ConfigValidation for missing keys or out-of-range values
 */
[[nodiscard]] Result<Scenario> load_scenario(const std::filesystem::path& path);

/**
 * @brief Parse a scenario held in memory
 *
 * @param base_dir Directory relative references are resolved against
 * @param default_name Scenario name used when the document has none
 */
[[nodiscard]] Result<Scenario> parse_scenario(std::string_view yaml_text,
                                              const std::filesystem::path& base_dir,
                                              std::string default_name);

/**
 * @brief Load and validate a standalone hardware profile
 */
[[nodiscard]] Result<model::HardwareSpec> load_hardware(const std::filesystem::path& path);

}  // namespace afdsim::io
