/*
 * Copyright (c) 2025 Lummy
 *
 * This software is released under the MIT License.
 * See the LICENSE file in the project root for full details.
 */

#include "afdsim/estimation/layer_estimator.hpp"

#include <glog/logging.h>

#include "afdsim/arch/hardware_model.hpp"
#include "afdsim/ops/attention_ops.hpp"
#include "afdsim/ops/comm_ops.hpp"
#include "afdsim/ops/ffn_ops.hpp"
#include "afdsim/ops/moe_ops.hpp"

namespace afdsim::estimation {

namespace {

f64 as_f64(i64 v) { return static_cast<f64>(v); }

}  // namespace

// ============================================================================
// Composition
// ============================================================================

std::vector<std::string_view> LayerEstimator::composed_ops(
    const model::LayerConfig& config) {
  switch (config.type()) {
    case LayerType::Attention:
      return {ops::kAttentionQkvProj, ops::kAttentionScores, ops::kAttentionSoftmax,
              ops::kAttentionWeightedSum, ops::kAttentionOutputProj};

    case LayerType::FFN: {
      const auto& ffn = config.as<model::FFNConfig>();
      if (model::is_gated(ffn.activation)) {
        return {ops::kFfnUpProj, ops::kFfnGateProj, ops::kFfnActivation,
                ops::kFfnDownProj};
      }
      return {ops::kFfnUpProj, ops::kFfnActivation, ops::kFfnDownProj};
    }

    case LayerType::MoE: {
      const auto& moe = config.as<model::MoEConfig>();
      std::vector<std::string_view> names{ops::kMoeRouterGating, ops::kMoeTopkDispatch};
      if (moe.include_dispatch) names.push_back(ops::kMoeDispatch);
      names.push_back(ops::kMoeExpertMatmul);
      if (moe.num_shared_experts > 0) names.push_back(ops::kMoeSharedExpert);
      if (moe.include_dispatch) names.push_back(ops::kMoeCombine);
      return names;
    }

    case LayerType::Communication:
      return {ops::comm_op_name(config.as<model::CommunicationConfig>().pattern)};
  }
  return {};
}

// ============================================================================
// Features
// ============================================================================

std::map<std::string, f64> LayerEstimator::extract_features(
    const model::LayerConfig& config, const model::RuntimeShape& runtime,
    const model::HardwareSpec& hw) {
  std::map<std::string, f64> f;
  f["layer_id"] = static_cast<f64>(config.layer_id);
  f["layer_type"] = static_cast<f64>(static_cast<u8>(config.type()));
  f["batch"] = static_cast<f64>(runtime.batch_size);
  f["seq"] = static_cast<f64>(runtime.seq_len);
  f["tokens"] = as_f64(runtime.tokens());
  f["concurrency"] =
      static_cast<f64>(arch::effective_concurrency(runtime.concurrency_hint(), hw));
  f["hw_peak_tflops"] = hw.peak_tflops;
  f["hw_memory_bandwidth_gbps"] = hw.memory_bandwidth_gbps;
  f["hw_interconnect_gbps"] = hw.interconnect_gbps;

  const ops::OpShape shape = ops::OpShape::from_layer(config);

  switch (config.type()) {
    case LayerType::Attention:
      f["dtype_bits"] = shape.dtype_bits;
      f["d_model"] = as_f64(shape.d_model);
      f["num_heads"] = as_f64(shape.num_heads);
      f["num_kv_heads"] = as_f64(shape.num_kv_heads);
      f["head_dim"] = as_f64(shape.head_dim);
      f["kv_cache_len"] = as_f64(shape.kv_cache_len);
      break;

    case LayerType::FFN:
      f["dtype_bits"] = shape.dtype_bits;
      f["d_model"] = as_f64(shape.d_model);
      f["d_ff"] = as_f64(shape.d_ff);
      f["gated"] = shape.gated ? 1.0 : 0.0;
      break;

    case LayerType::MoE: {
      const auto& moe = config.as<model::MoEConfig>();
      f["dtype_bits"] = shape.dtype_bits;
      f["d_model"] = as_f64(shape.d_model);
      f["expert_intermediate"] = as_f64(shape.d_ff);
      f["num_experts"] = as_f64(shape.num_experts);
      f["experts_per_token"] = as_f64(shape.experts_per_token);
      f["num_groups"] = as_f64(shape.num_groups);
      f["num_shared_experts"] = as_f64(shape.num_shared_experts);
      f["include_dispatch"] = moe.include_dispatch ? 1.0 : 0.0;
      f["active_tokens"] = ops::moe_active_tokens(shape, runtime);
      break;
    }

    case LayerType::Communication: {
      const auto& comm = config.as<model::CommunicationConfig>();
      f["pattern"] = static_cast<f64>(static_cast<u8>(comm.pattern));
      f["payload_mb"] = comm.payload_mb;
      f["num_devices"] = static_cast<f64>(comm.num_devices);
      break;
    }
  }
  return f;
}

// ============================================================================
// Estimation
// ============================================================================

Result<LayerExecution> LayerEstimator::estimate(const model::LayerConfig& config,
                                                const model::RuntimeShape& runtime,
                                                const model::HardwareSpec& hw) const {
  auto valid = config.validate();
  if (!valid) {
    return Err<LayerExecution>(std::move(valid.error()));
  }

  const ops::OpShape shape = ops::OpShape::from_layer(config);
  const i32 concurrency = runtime.concurrency_hint();

  LayerExecution exec;
  exec.layer_name = config.name;
  exec.layer_type = config.type();

  arch::PhaseTimes totals;
  for (std::string_view op_name : composed_ops(config)) {
    const ops::FusionOp* op = library_.find(op_name);
    if (op == nullptr) {
      return Err<LayerExecution>(ErrorCode::InvalidArgument,
                                 "layer '" + config.name + "': fused op '" +
                                     std::string(op_name) + "' is not registered");
    }

    auto cost = op->evaluate(shape, runtime);
    if (!cost) {
      return Err<LayerExecution>(std::move(cost.error()));
    }
    const ops::OpCost& c = cost.value();

    auto times = arch::time_for(
        c.flops, c.bytes_read, c.bytes_written, hw, concurrency,
        op->over_interconnect ? arch::Channel::Interconnect : arch::Channel::Memory);
    if (!times) {
      return Err<LayerExecution>(
          Error(times.error().code(),
                std::string(op_name) + ": " + times.error().message()));
    }

    exec.flops += c.flops;
    exec.bytes_read += c.bytes_read;
    exec.bytes_written += c.bytes_written;
    totals += times.value();

    exec.breakdown[std::string(op_name)] = OpBreakdown{
        .flops = c.flops,
        .bytes_read = c.bytes_read,
        .bytes_written = c.bytes_written,
        .compute_time_ms = times.value().compute_ms,
        .memory_time_ms = times.value().memory_ms,
    };

    VLOG(2) << config.name << "/" << op_name << ": flops=" << c.flops
            << " read=" << c.bytes_read << " written=" << c.bytes_written
            << " compute_ms=" << times.value().compute_ms
            << " memory_ms=" << times.value().memory_ms;
  }

  exec.compute_time_ms = totals.compute_ms;
  exec.memory_time_ms = totals.memory_ms;
  exec.dominant_latency_ms = arch::dominant_latency_ms(totals);
  exec.estimated_execution_time_ms = exec.dominant_latency_ms;
  exec.overlapped_latency_ms = arch::overlapped_latency_ms(totals, hw);

  exec.features = extract_features(config, runtime, hw);
  exec.features["flops"] = exec.flops;
  exec.features["bytes_read"] = exec.bytes_read;
  exec.features["bytes_written"] = exec.bytes_written;

  VLOG(1) << "Estimated " << layer_type_str(exec.layer_type) << " layer '"
          << exec.layer_name << "': " << exec.dominant_latency_ms << " ms ("
          << exec.flops << " FLOPs, " << exec.bytes_moved() << " bytes)";

  return Ok(std::move(exec));
}

}  // namespace afdsim::estimation
