/**
 * @file test_latency_regressor.cpp
 * @brief Unit tests for the linear latency model
 */

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include <nlohmann/json.hpp>

#include "afdsim/estimation/latency_regressor.hpp"

using namespace afdsim;
using namespace afdsim::estimation;
using json = nlohmann::json;

namespace fs = std::filesystem;

namespace {

json ffn_model_doc() {
  return json::parse(R"({
    "models": {
      "ffn": {
        "features": ["flops", "bytes_read"],
        "compute_ms": {"weights": [1e-9, 0.0], "bias": 0.5},
        "memory_ms": {"weights": [0.0, 2e-9], "bias": 0.25}
      }
    }
  })");
}

class LatencyRegressorFileTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dir_ = fs::temp_directory_path() /
           ("afdsim_regressor_" +
            std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
    fs::create_directories(dir_);
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(dir_, ec);
  }

  fs::path write(const std::string& name, const std::string& content) {
    const fs::path path = dir_ / name;
    std::ofstream(path) << content;
    return path;
  }

  fs::path dir_;
};

}  // namespace

// ============================================================================
// Parsing
// ============================================================================

TEST(LatencyRegressorTest, FromJson) {
  auto regressor = LatencyRegressor::from_json(ffn_model_doc());
  ASSERT_TRUE(regressor) << regressor.error().to_string();
  EXPECT_TRUE(regressor.value()->has_model(LayerType::FFN));
  EXPECT_FALSE(regressor.value()->has_model(LayerType::Attention));
}

TEST(LatencyRegressorTest, RejectsMalformedDocuments) {
  EXPECT_FALSE(LatencyRegressor::from_json(json::array()));
  EXPECT_FALSE(LatencyRegressor::from_json(json{{"models", 3}}));

  auto unknown_type = ffn_model_doc();
  unknown_type["models"]["conv"] = unknown_type["models"]["ffn"];
  auto r = LatencyRegressor::from_json(unknown_type);
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error().code(), ErrorCode::ParseError);

  auto short_weights = ffn_model_doc();
  short_weights["models"]["ffn"]["memory_ms"]["weights"] = json::array({1.0});
  r = LatencyRegressor::from_json(short_weights);
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error().code(), ErrorCode::ParseError);

  auto missing_head = ffn_model_doc();
  missing_head["models"]["ffn"].erase("compute_ms");
  EXPECT_FALSE(LatencyRegressor::from_json(missing_head));
}

// ============================================================================
// Inference
// ============================================================================

TEST(LatencyRegressorTest, PredictIsAffine) {
  auto regressor = LatencyRegressor::from_json(ffn_model_doc());
  ASSERT_TRUE(regressor);

  const std::map<std::string, f64> features{
      {"flops", 4e9}, {"bytes_read", 1e9}, {"tokens", 128.0}};
  auto p = regressor.value()->predict(LayerType::FFN, features);
  ASSERT_TRUE(p);
  EXPECT_DOUBLE_EQ(p.value().compute_ms, 4.5);
  EXPECT_DOUBLE_EQ(p.value().memory_ms, 2.25);
}

TEST(LatencyRegressorTest, MissingModelOrFeatureIsUnavailable) {
  auto regressor = LatencyRegressor::from_json(ffn_model_doc());
  ASSERT_TRUE(regressor);

  auto no_model = regressor.value()->predict(LayerType::MoE, {{"flops", 1.0}});
  ASSERT_FALSE(no_model);
  EXPECT_EQ(no_model.error().code(), ErrorCode::BackendUnavailable);

  auto no_feature = regressor.value()->predict(LayerType::FFN, {{"flops", 1.0}});
  ASSERT_FALSE(no_feature);
  EXPECT_EQ(no_feature.error().code(), ErrorCode::BackendUnavailable);
}

TEST(LatencyRegressorTest, SetModelChecksWidth) {
  LatencyRegressor regressor;
  LinearLatencyModel model;
  model.feature_names = {"flops", "tokens"};
  model.weights.setZero(2, 3);

  auto bad = regressor.set_model(LayerType::Attention, model);
  ASSERT_FALSE(bad);
  EXPECT_EQ(bad.error().code(), ErrorCode::InvalidArgument);

  model.weights.setOnes(2, 2);
  ASSERT_TRUE(regressor.set_model(LayerType::Attention, model));
  auto p = regressor.predict(LayerType::Attention, {{"flops", 2.0}, {"tokens", 3.0}});
  ASSERT_TRUE(p);
  EXPECT_DOUBLE_EQ(p.value().compute_ms, 5.0);
  EXPECT_DOUBLE_EQ(p.value().memory_ms, 5.0);
}

// ============================================================================
// Files
// ============================================================================

TEST_F(LatencyRegressorFileTest, LoadFromFile) {
  const fs::path path = write("model.json", ffn_model_doc().dump());
  auto regressor = LatencyRegressor::load(path);
  ASSERT_TRUE(regressor) << regressor.error().to_string();
  EXPECT_TRUE(regressor.value()->has_model(LayerType::FFN));
}

TEST_F(LatencyRegressorFileTest, MissingFile) {
  auto regressor = LatencyRegressor::load(dir_ / "absent.json");
  ASSERT_FALSE(regressor);
  EXPECT_EQ(regressor.error().code(), ErrorCode::FileNotFound);
}

TEST_F(LatencyRegressorFileTest, InvalidJson) {
  const fs::path path = write("broken.json", "{\"models\": {");
  auto regressor = LatencyRegressor::load(path);
  ASSERT_FALSE(regressor);
  EXPECT_EQ(regressor.error().code(), ErrorCode::ParseError);
}

TEST(LatencyRegressorTest, BundledModel) {
  auto regressor =
      LatencyRegressor::load(fs::path(AFDSIM_CONFIG_DIR) / "models" / "latency_model.json");
  ASSERT_TRUE(regressor) << regressor.error().to_string();
  EXPECT_TRUE(regressor.value()->has_model(LayerType::FFN));
  EXPECT_TRUE(regressor.value()->has_model(LayerType::Attention));
  EXPECT_FALSE(regressor.value()->has_model(LayerType::MoE));
}
