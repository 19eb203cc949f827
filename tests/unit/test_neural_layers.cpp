/**
 * @file test_neural_layers.cpp
 * @brief Unit tests for Tensor, Linear, LayerNorm and MLPModel
 */

#include <gtest/gtest.h>
#include "NeuralLayers.hpp"
#include "ForecastErrors.hpp"
#include <cmath>
#include <limits>
#include <sstream>

using namespace MMWF;
using namespace MMWF::ML;

class NeuralLayersTest : public ::testing::Test {
protected:
    void SetUp() override {
        rng.seed(42);
    }

    std::mt19937 rng;
};

// =============================================================================
// Tensor
// =============================================================================

TEST_F(NeuralLayersTest, TensorConstruction) {
    Tensor t1({2, 3, 4});
    EXPECT_EQ(t1.numel(), 24u);
    EXPECT_EQ(t1.dim(), 3);
    EXPECT_DOUBLE_EQ(t1.sum(), 0.0);

    Tensor t2({3, 3}, 1.5);
    EXPECT_DOUBLE_EQ(t2(1, 1), 1.5);

    EXPECT_THROW(Tensor({2, 2}, std::vector<double>{1.0, 2.0}), std::invalid_argument);
}

TEST_F(NeuralLayersTest, TensorArithmetic) {
    Tensor a({2, 2}, 1.0);
    Tensor b({2, 2}, 2.0);

    EXPECT_DOUBLE_EQ((a + b)(0, 0), 3.0);
    EXPECT_DOUBLE_EQ((b - a)(1, 1), 1.0);
    EXPECT_DOUBLE_EQ((a * b)(0, 1), 2.0);
    EXPECT_DOUBLE_EQ((b * 3.0)(1, 0), 6.0);

    Tensor c({3, 2});
    EXPECT_THROW(a + c, std::invalid_argument);
}

TEST_F(NeuralLayersTest, SliceAndStack) {
    Tensor batch({2, 3, 2});
    for (size_t i = 0; i < batch.size(); ++i) batch.data[i] = static_cast<double>(i);

    Tensor second = batch.slice(1);
    ASSERT_EQ(second.shape, (std::vector<int>{3, 2}));
    EXPECT_DOUBLE_EQ(second(0, 0), 6.0);
    EXPECT_DOUBLE_EQ(second(2, 1), 11.0);

    Tensor restacked = stack({batch.slice(0), batch.slice(1)});
    EXPECT_EQ(restacked.shape, batch.shape);
    EXPECT_DOUBLE_EQ(restacked.maxAbsDiff(batch), 0.0);

    EXPECT_THROW(batch.slice(2), std::out_of_range);
}

TEST_F(NeuralLayersTest, GatherAndConcat) {
    Tensor src({3, 2}, std::vector<double>{1, 2, 3, 4, 5, 6});
    Tensor gathered = gatherRows(src, {2, 0, 2});
    ASSERT_EQ(gathered.shape, (std::vector<int>{3, 2}));
    EXPECT_DOUBLE_EQ(gathered(0, 0), 5.0);
    EXPECT_DOUBLE_EQ(gathered(1, 1), 2.0);

    Tensor other({3, 1}, 9.0);
    Tensor joined = concatColumns({&src, &other});
    ASSERT_EQ(joined.shape, (std::vector<int>{3, 3}));
    EXPECT_DOUBLE_EQ(joined(1, 0), 3.0);
    EXPECT_DOUBLE_EQ(joined(1, 2), 9.0);

    Tensor short_rows({2, 1});
    EXPECT_THROW(concatColumns({&src, &short_rows}), std::invalid_argument);
}

TEST_F(NeuralLayersTest, TensorStreamRoundTrip) {
    Tensor t({2, 3}, std::vector<double>{1.5, -2, 3, 4, 5.25, 6});
    std::stringstream buffer;
    t.write(buffer);

    Tensor loaded;
    loaded.read(buffer);
    EXPECT_EQ(loaded.shape, t.shape);
    EXPECT_DOUBLE_EQ(loaded.maxAbsDiff(t), 0.0);
}

TEST_F(NeuralLayersTest, TruncatedTensorStreamIsDataError) {
    Tensor t({4, 4}, 1.0);
    std::stringstream buffer;
    t.write(buffer);
    std::string bytes = buffer.str();

    std::stringstream truncated(bytes.substr(0, bytes.size() - 8));
    Tensor loaded;
    EXPECT_THROW(loaded.read(truncated), DataError);
}

TEST_F(NeuralLayersTest, AllFiniteDetectsNaN) {
    Tensor t({2, 2}, 1.0);
    EXPECT_TRUE(t.allFinite());
    t(1, 0) = std::numeric_limits<double>::quiet_NaN();
    EXPECT_FALSE(t.allFinite());
}

// =============================================================================
// Activations
// =============================================================================

TEST_F(NeuralLayersTest, Activations) {
    Tensor x({3}, std::vector<double>{-1.0, 0.0, 2.0});

    Tensor r = Activation::relu(x);
    EXPECT_DOUBLE_EQ(r(0), 0.0);
    EXPECT_DOUBLE_EQ(r(2), 2.0);

    Tensor s = Activation::silu(x);
    EXPECT_NEAR(s(0), -1.0 / (1.0 + std::exp(1.0)), 1e-12);
    EXPECT_DOUBLE_EQ(s(1), 0.0);
    EXPECT_NEAR(s(2), 2.0 / (1.0 + std::exp(-2.0)), 1e-12);

    Tensor swish = Activation::getActivation("swish")(x);
    EXPECT_DOUBLE_EQ(swish.maxAbsDiff(s), 0.0);

    EXPECT_THROW(Activation::getActivation("softsign"), std::invalid_argument);
}

// =============================================================================
// Linear / LayerNorm
// =============================================================================

TEST_F(NeuralLayersTest, LinearForward) {
    Linear layer(3, 2);
    layer.weight = Tensor({2, 3}, std::vector<double>{1, 0, 0,
                                                      0, 1, 1});
    layer.bias_vec = Tensor({2}, std::vector<double>{0.5, -1.0});

    Tensor x({2, 3}, std::vector<double>{1, 2, 3,
                                         4, 5, 6});
    Tensor y = layer.forward(x);
    ASSERT_EQ(y.shape, (std::vector<int>{2, 2}));
    EXPECT_DOUBLE_EQ(y(0, 0), 1.5);
    EXPECT_DOUBLE_EQ(y(0, 1), 4.0);
    EXPECT_DOUBLE_EQ(y(1, 0), 4.5);
    EXPECT_DOUBLE_EQ(y(1, 1), 10.0);

    EXPECT_THROW(layer.forward(Tensor({2, 4})), std::invalid_argument);
}

TEST_F(NeuralLayersTest, LinearKeepsLeadingAxes) {
    Linear layer(4, 5);
    layer.initWeights("xavier", rng);

    Tensor x({2, 3, 4}, 0.25);
    Tensor y = layer.forward(x);
    EXPECT_EQ(y.shape, (std::vector<int>{2, 3, 5}));
}

TEST_F(NeuralLayersTest, LinearInitMethods) {
    for (const char* method : {"linear", "xavier", "kaiming", "trunc_normal"}) {
        Linear layer(16, 8);
        layer.initWeights(method, rng);
        EXPECT_TRUE(layer.weight.allFinite()) << method;
        EXPECT_GT(layer.weight.norm(), 0.0) << method;
    }

    Linear layer(4, 4);
    EXPECT_THROW(layer.initWeights("orthogonal", rng), std::invalid_argument);
}

TEST_F(NeuralLayersTest, LayerNormNormalizesRows) {
    LayerNorm norm(4);
    Tensor x({2, 4}, std::vector<double>{1, 2, 3, 4,
                                         10, 10, 10, 14});
    Tensor y = norm.forward(x);

    for (int i = 0; i < 2; ++i) {
        double mean = 0.0, var = 0.0;
        for (int j = 0; j < 4; ++j) mean += y(i, j);
        mean /= 4.0;
        for (int j = 0; j < 4; ++j) var += (y(i, j) - mean) * (y(i, j) - mean);
        var /= 4.0;
        EXPECT_NEAR(mean, 0.0, 1e-10);
        EXPECT_NEAR(var, 1.0, 1e-4);
    }

    // Constant rows map to the shift
    Tensor flat({1, 4}, 3.0);
    EXPECT_NEAR(norm.forward(flat).norm(), 0.0, 1e-12);
}

// =============================================================================
// MLPModel
// =============================================================================

TEST_F(NeuralLayersTest, MLPShapesAndParameters) {
    MLPConfig config;
    config.layer_sizes = {6, 8, 8};
    MLPModel mlp(config, rng);

    EXPECT_EQ(mlp.inputDim(), 6);
    EXPECT_EQ(mlp.outputDim(), 8);
    EXPECT_EQ(mlp.numDense(), 2u);
    ASSERT_NE(mlp.layerNorm(), nullptr);

    // (6*8 + 8) + (8*8 + 8) + 2*8
    EXPECT_EQ(mlp.numParameters(), 56u + 72u + 16u);

    auto params = mlp.namedParameters("block");
    ASSERT_EQ(params.size(), 6u);
    EXPECT_EQ(params[0].first, "block.dense0.weight");
    EXPECT_EQ(params[3].first, "block.dense1.bias");
    EXPECT_EQ(params[5].first, "block.norm.beta");

    Tensor y = mlp.forward(Tensor({5, 6}, 0.3));
    EXPECT_EQ(y.shape, (std::vector<int>{5, 8}));
    EXPECT_TRUE(y.allFinite());
}

TEST_F(NeuralLayersTest, MLPWithoutLayerNorm) {
    MLPConfig config;
    config.layer_sizes = {4, 8, 2};
    config.use_layer_norm = false;
    MLPModel mlp(config, rng);

    EXPECT_EQ(mlp.layerNorm(), nullptr);
    EXPECT_EQ(mlp.namedParameters("head").size(), 4u);
}

TEST_F(NeuralLayersTest, MLPSameSeedSameWeights) {
    MLPConfig config;
    config.layer_sizes = {3, 5, 5};

    std::mt19937 rng_a(7), rng_b(7);
    MLPModel a(config, rng_a);
    MLPModel b(config, rng_b);

    Tensor x({2, 3}, std::vector<double>{0.1, -0.2, 0.3, 1.0, 2.0, -3.0});
    EXPECT_DOUBLE_EQ(a.forward(x).maxAbsDiff(b.forward(x)), 0.0);
}
