/**
 * @file test_comm_ops.cpp
 * @brief Unit tests for the collective communication fused ops
 */

#include <gtest/gtest.h>

#include "afdsim/ops/comm_ops.hpp"

using namespace afdsim;
using namespace afdsim::ops;

namespace {

OpShape comm_shape(model::CommPattern pattern, f64 payload_mb, i32 num_devices = 0) {
  return OpShape::from_layer(model::LayerConfig::communication_layer(
      "comm", 0,
      model::CommunicationConfig{
          .pattern = pattern, .payload_mb = payload_mb, .num_devices = num_devices}));
}

}  // namespace

TEST(CommOpsTest, OpNamePerPattern) {
  EXPECT_EQ(comm_op_name(model::CommPattern::AllToAll), kCommAllToAll);
  EXPECT_EQ(comm_op_name(model::CommPattern::AllReduce), kCommAllReduce);
  EXPECT_EQ(comm_op_name(model::CommPattern::AllGather), kCommAllGather);
  EXPECT_EQ(comm_op_name(model::CommPattern::ReduceScatter), kCommReduceScatter);
}

TEST(CommOpsTest, PayloadInBytes) {
  const OpShape s = comm_shape(model::CommPattern::AllToAll, 4.0);
  EXPECT_DOUBLE_EQ(s.payload_bytes, 4e6);

  auto bytes = comm_all_to_all_bytes(s, model::RuntimeShape{}).value();
  EXPECT_DOUBLE_EQ(bytes.read, 4e6);
  EXPECT_DOUBLE_EQ(bytes.written, 4e6);
  EXPECT_DOUBLE_EQ(comm_flops(s, model::RuntimeShape{}).value(), 0.0);
}

TEST(CommOpsTest, AllReduceMovesPayloadTwice) {
  const model::RuntimeShape r{};
  auto reduce = comm_all_reduce_bytes(comm_shape(model::CommPattern::AllReduce, 1.0), r);
  auto gather = comm_all_gather_bytes(comm_shape(model::CommPattern::AllGather, 1.0), r);
  auto scatter =
      comm_reduce_scatter_bytes(comm_shape(model::CommPattern::ReduceScatter, 1.0), r);

  EXPECT_DOUBLE_EQ(reduce.value().read, 2e6);
  EXPECT_DOUBLE_EQ(gather.value().read, 1e6);
  EXPECT_DOUBLE_EQ(scatter.value().read, 1e6);
}

TEST(CommOpsTest, RingFactor) {
  EXPECT_DOUBLE_EQ(comm_ring_factor(0), 1.0);  // Not modeled
  EXPECT_DOUBLE_EQ(comm_ring_factor(1), 0.0);  // Nothing leaves the device
  EXPECT_DOUBLE_EQ(comm_ring_factor(8), 7.0 / 8.0);

  auto bytes = comm_all_to_all_bytes(comm_shape(model::CommPattern::AllToAll, 8.0, 8),
                                     model::RuntimeShape{});
  EXPECT_DOUBLE_EQ(bytes.value().read, 7e6);
}

TEST(CommOpsTest, IndependentOfRuntimeShape) {
  const OpShape s = comm_shape(model::CommPattern::AllGather, 2.0);
  auto small = comm_all_gather_bytes(s, model::RuntimeShape{.batch_size = 1, .seq_len = 1});
  auto large = comm_all_gather_bytes(s, model::RuntimeShape{.batch_size = 64, .seq_len = 4096});
  EXPECT_DOUBLE_EQ(small.value().read, large.value().read);
}

TEST(CommOpsTest, AllOpsUseInterconnect) {
  for (const FusionOp& op : comm_ops()) {
    EXPECT_TRUE(op.over_interconnect) << op.name;
    EXPECT_EQ(op.family, LayerType::Communication);
  }
}

TEST(CommOpsTest, ZeroPayloadYieldsZero) {
  const OpShape s = comm_shape(model::CommPattern::AllReduce, 0.0, 4);
  for (const FusionOp& op : comm_ops()) {
    auto cost = op.evaluate(s, model::RuntimeShape{});
    ASSERT_TRUE(cost) << op.name;
    EXPECT_DOUBLE_EQ(cost.value().bytes_moved(), 0.0) << op.name;
  }
}
