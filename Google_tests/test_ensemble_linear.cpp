//
// Created by the bayesnet authors on 10/17/26.
//

#include <gtest/gtest.h>
#include <torch/torch.h>
#include "nn/linear.h"
#include "exception.h"

using bayesnet::nn::EnsembleLinear;

static void freeze_all(const EnsembleLinear &layer) {
    for (auto &unit: layer->units()) {
        unit->set_freeze(true);
    }
}

TEST(EnsembleLinear, owns_independent_units) {
    EnsembleLinear layer(3, 5, 4);
    ASSERT_EQ(layer->num_ensembles(), 3);
    ASSERT_EQ(layer->units().size(), 3);
    ASSERT_EQ(layer->parameters().size(), 12);
    ASSERT_FALSE(torch::equal(layer->units()[0]->weight_mu, layer->units()[1]->weight_mu));
}

TEST(EnsembleLinear, rank2_input_is_shared_by_every_model) {
    EnsembleLinear layer(3, 5, 4);
    freeze_all(layer);
    auto x = torch::randn({7, 5});
    auto out = layer->forward(x);
    ASSERT_EQ(out.sizes(), torch::IntArrayRef({3, 7, 4}));
    for (int64_t i = 0; i < 3; i++) {
        ASSERT_TRUE(torch::allclose(out[i], layer->units()[i]->forward(x)));
    }
}

TEST(EnsembleLinear, rank3_input_is_split_by_model) {
    EnsembleLinear layer(3, 5, 4);
    freeze_all(layer);
    auto x = torch::randn({3, 2, 5});
    auto out = layer->forward(x);
    ASSERT_EQ(out.sizes(), torch::IntArrayRef({3, 2, 4}));
    for (int64_t i = 0; i < 3; i++) {
        ASSERT_TRUE(torch::allclose(out[i], layer->units()[i]->forward(x[i])));
    }
}

TEST(EnsembleLinear, single_slice_is_broadcast) {
    EnsembleLinear layer(3, 5, 4);
    freeze_all(layer);
    auto x = torch::randn({1, 6, 5});
    ASSERT_TRUE(torch::allclose(layer->forward(x), layer->forward(x[0])));
}

TEST(EnsembleLinear, elite_restricted_forward) {
    EnsembleLinear layer(4, 5, 2);
    freeze_all(layer);
    auto x = torch::randn({6, 5});
    layer->set_elite({2, 0});
    // recording the elite set alone does not restrict the computation
    ASSERT_EQ(layer->forward(x).size(0), 4);

    layer->toggle_use_only_elite();
    ASSERT_TRUE(layer->use_only_elite());
    auto out = layer->forward(x);
    ASSERT_EQ(out.sizes(), torch::IntArrayRef({2, 6, 2}));
    ASSERT_TRUE(torch::allclose(out[0], layer->units()[2]->forward(x)));
    ASSERT_TRUE(torch::allclose(out[1], layer->units()[0]->forward(x)));
    ASSERT_THROW(layer->forward(torch::randn({4, 6, 5})), bayesnet::ShapeError);
    ASSERT_EQ(layer->forward(torch::randn({2, 6, 5})).size(0), 2);

    layer->toggle_use_only_elite();
    ASSERT_FALSE(layer->use_only_elite());
    ASSERT_EQ(layer->forward(x).size(0), 4);
    ASSERT_EQ(layer->parameters().size(), 16);
}

TEST(EnsembleLinear, toggle_without_elite_uses_all_models) {
    EnsembleLinear layer(3, 5, 2);
    layer->toggle_use_only_elite();
    ASSERT_EQ(layer->active_members(), std::vector<int64_t>({0, 1, 2}));
    ASSERT_EQ(layer->forward(torch::randn({2, 5})).size(0), 3);
}

TEST(EnsembleLinear, invalid_elite_set) {
    EnsembleLinear layer(3, 5, 2);
    ASSERT_THROW(layer->set_elite({}), bayesnet::ConfigurationError);
    ASSERT_THROW(layer->set_elite({0, 3}), bayesnet::ConfigurationError);
    ASSERT_THROW(layer->set_elite({-1}), bayesnet::ConfigurationError);
    ASSERT_THROW(layer->set_elite({1, 1}), bayesnet::ConfigurationError);
    ASSERT_TRUE(layer->elite_models().empty());
}

TEST(EnsembleLinear, invalid_input_shape) {
    EnsembleLinear layer(3, 5, 2);
    ASSERT_THROW(layer->forward(torch::randn({2, 3, 2, 5})), bayesnet::ShapeError);
    ASSERT_THROW(layer->forward(torch::randn({5})), bayesnet::ShapeError);
    ASSERT_THROW(layer->forward(torch::randn({2, 4, 5})), bayesnet::ShapeError);
}

TEST(EnsembleLinear, invalid_ensemble_size) {
    ASSERT_THROW(EnsembleLinear(0, 5, 2), bayesnet::ConfigurationError);
}
