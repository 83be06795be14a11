// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//
// Tests for learning rate schedules, the optimizer and the parameter moving average.

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <cmath>
#include <memory>
#include <optional>
#include <vector>

#include "modules/parameter_store.h"
#include "training/moving_average.h"
#include "training/optimizer.h"
#include "training/schedule.h"
#include "utilities/utils.h"

using Catch::Approx;

namespace {

TrainingOptions sgd_options(float lr) {
    TrainingOptions options;
    options.Optim = EOptimMethod::SGD;
    options.LearningRate = lr;
    options.MaxGradNorm = 0.f;
    options.DecayMethod = EDecayMethod::NONE;
    return options;
}

void set(Tensor& t, const std::vector<float>& values) {
    t.Data = values;
}

} // namespace

TEST_CASE("constant, cosine and linear schedules", "[schedule]") {
    ConstantSchedule constant(0.3f);
    REQUIRE(constant.eval(1) == Approx(0.3f));
    REQUIRE(constant.eval(100000) == Approx(0.3f));

    CosineSchedule cosine(1.f, 10, 2, 0.1f);
    REQUIRE(cosine.eval(1) == Approx(0.5f));
    REQUIRE(cosine.eval(2) == Approx(1.f));
    REQUIRE(cosine.eval(7) == Approx(0.55f));
    REQUIRE(cosine.eval(12) == Approx(0.1f));
    REQUIRE(cosine.eval(50) == Approx(0.1f));

    LinearSchedule linear(1.f, 0.f, 10, 0);
    REQUIRE(linear.eval(0) == Approx(1.f));
    REQUIRE(linear.eval(5) == Approx(0.5f));
    REQUIRE(linear.eval(20) == Approx(0.f).margin(1e-6));
}

TEST_CASE("noam schedule warms up then decays", "[schedule]") {
    NoamSchedule noam(2.f, 4, 16);
    REQUIRE(noam.eval(1) == Approx(0.0625f));
    REQUIRE(noam.eval(0) == Approx(noam.eval(1)));
    REQUIRE(noam.eval(4) == Approx(0.25f));
    REQUIRE(noam.eval(16) == Approx(0.125f));
    REQUIRE(noam.eval(2) < noam.eval(4));
    REQUIRE(noam.eval(8) < noam.eval(4));
}

TEST_CASE("stepwise schedule picks the last passed threshold", "[schedule]") {
    StepwiseSchedule<int> accum({0, 2, 5}, {1, 2, 4});
    REQUIRE(accum.eval(1) == 1);
    REQUIRE(accum.eval(2) == 1);
    REQUIRE(accum.eval(3) == 2);
    REQUIRE(accum.eval(5) == 2);
    REQUIRE(accum.eval(6) == 4);
    REQUIRE(accum.eval(1000) == 4);

    REQUIRE_FALSE(accum.changed_at(1).has_value());
    REQUIRE_FALSE(accum.changed_at(2).has_value());
    REQUIRE(accum.changed_at(3) == std::optional<int>(2));
    REQUIRE_FALSE(accum.changed_at(4).has_value());
    REQUIRE(accum.changed_at(6) == std::optional<int>(4));

    REQUIRE_THROWS_AS(StepwiseSchedule<float>({0, 1}, {0.1f}), config_error);
    REQUIRE_THROWS_AS(StepwiseSchedule<float>({}, {}), config_error);
}

TEST_CASE("make_lr_schedule follows decay_method", "[schedule]") {
    TrainingOptions options;
    options.LearningRate = 2.f;
    options.WarmupSteps = 4;
    options.TrainSteps = 14;

    options.DecayMethod = EDecayMethod::NONE;
    REQUIRE(make_lr_schedule(options, 16)->eval(7) == Approx(2.f));

    options.DecayMethod = EDecayMethod::NOAM;
    REQUIRE(make_lr_schedule(options, 16)->eval(4) == Approx(0.25f));

    options.DecayMethod = EDecayMethod::LINEAR;
    options.FinalLrFraction = 0.5f;
    auto linear = make_lr_schedule(options, 16);
    REQUIRE(linear->eval(2) == Approx(1.f));
    REQUIRE(linear->eval(14) == Approx(1.f));
}

TEST_CASE("sgd step updates trainable parameters only", "[optimizer]") {
    modules::ParameterStore params;
    int w = params.add("w", {2});
    int frozen = params.add("frozen", {2}, false);
    set(params.value(w), {1.f, 2.f});
    set(params.value(frozen), {5.f, 6.f});

    TrainingOptions options = sgd_options(0.1f);
    Optimizer optim(params, options, make_lr_schedule(options, 8));
    REQUIRE(optim.training_step() == 1);

    set(params.grad(w), {0.5f, -1.f});
    set(params.grad(frozen), {1.f, 1.f});
    optim.step();

    REQUIRE(params.value(w).Data[0] == Approx(0.95f));
    REQUIRE(params.value(w).Data[1] == Approx(2.1f));
    REQUIRE(params.value(frozen).Data == std::vector<float>{5.f, 6.f});
    REQUIRE(optim.training_step() == 2);

    optim.zero_grad();
    REQUIRE(params.grad(w).Data == std::vector<float>{0.f, 0.f});
}

TEST_CASE("gradient norm is clipped to max_grad_norm", "[optimizer]") {
    modules::ParameterStore params;
    int w = params.add("w", {2});
    TrainingOptions options = sgd_options(1.f);
    options.MaxGradNorm = 1.f;
    Optimizer optim(params, options, make_lr_schedule(options, 8));

    set(params.grad(w), {3.f, 4.f});
    optim.step();
    REQUIRE(optim.last_grad_norm() == Approx(5.f));
    REQUIRE(params.value(w).Data[0] == Approx(-0.6f));
    REQUIRE(params.value(w).Data[1] == Approx(-0.8f));
}

TEST_CASE("tied parameters are updated once", "[optimizer]") {
    modules::ParameterStore params;
    int a = params.add("a", {2});
    int b = params.add("b", {2});
    params.tie(b, a);
    REQUIRE(params.trainable_parameters() == std::vector<int>{a});

    TrainingOptions options = sgd_options(1.f);
    Optimizer optim(params, options, make_lr_schedule(options, 8));
    set(params.grad(b), {1.f, 1.f});
    optim.step();
    REQUIRE(params.value(a).Data == std::vector<float>{-1.f, -1.f});
    REQUIRE(params.value(b).Data == params.value(a).Data);
}

TEST_CASE("adam first step moves by the learning rate", "[optimizer]") {
    modules::ParameterStore params;
    int w = params.add("w", {2});
    set(params.value(w), {1.f, 2.f});

    TrainingOptions options = sgd_options(0.1f);
    options.Optim = EOptimMethod::ADAM;
    Optimizer optim(params, options, make_lr_schedule(options, 8));
    set(params.grad(w), {0.5f, -1.f});
    optim.step();

    REQUIRE(params.value(w).Data[0] == Approx(0.9f).margin(1e-5));
    REQUIRE(params.value(w).Data[1] == Approx(2.1f).margin(1e-5));

    OptimizerState state = optim.state_dict();
    REQUIRE(state.Method == "adam");
    REQUIRE(state.TrainingStep == 2);
    REQUIRE(state.Buffers.count("exp_avg.w") == 1);
    REQUIRE(state.Buffers.count("exp_avg_sq.w") == 1);
    REQUIRE(state.ParamSteps.at("w") == 1);
}

TEST_CASE("optimizer state of another method restores only the counters", "[optimizer]") {
    modules::ParameterStore params;
    int w = params.add("w", {2});
    TrainingOptions adam_options = sgd_options(0.1f);
    adam_options.Optim = EOptimMethod::ADAM;
    Optimizer adam(params, adam_options, make_lr_schedule(adam_options, 8));
    set(params.grad(w), {1.f, 1.f});
    adam.step();
    adam.step();

    TrainingOptions options = sgd_options(0.1f);
    Optimizer sgd(params, options, make_lr_schedule(options, 8));
    sgd.load_state_dict(adam.state_dict());
    REQUIRE(sgd.training_step() == 3);
    REQUIRE(sgd.state_dict().Buffers.empty());
}

TEST_CASE("moving average starts from the parameters", "[average]") {
    modules::ParameterStore params;
    int w = params.add("w", {1});
    set(params.value(w), {1.f});

    MovingAverage average(0.f);
    REQUIRE(average.empty());
    average.update(params, 1);
    REQUIRE(average.averages().at(0).second.Data[0] == Approx(1.f));

    set(params.value(w), {3.f});
    average.update(params, 1);
    // decay = 1 - 2 / 11
    REQUIRE(average.averages().at(0).second.Data[0] == Approx(29.f / 11.f));

    MovingAverage strong(0.99f);
    strong.update(params, 1);
    set(params.value(w), {5.f});
    strong.update(params, 100);
    REQUIRE(strong.averages().at(0).second.Data[0] == Approx(0.01f * 3.f + 0.99f * 5.f));
}

TEST_CASE("average swap guard restores the live weights", "[average]") {
    modules::ParameterStore params;
    int w = params.add("w", {2});
    set(params.value(w), {1.f, 1.f});
    MovingAverage average(0.f);
    average.update(params, 1);
    set(params.value(w), {0.25f, -2.f});

    {
        AverageSwapGuard guard(params, &average, ETensorDType::FP32);
        REQUIRE(guard.active());
        REQUIRE(params.value(w).Data == std::vector<float>{1.f, 1.f});
    }
    REQUIRE(params.value(w).Data == std::vector<float>{0.25f, -2.f});

    {
        AverageSwapGuard guard(params, nullptr, ETensorDType::FP32);
        REQUIRE_FALSE(guard.active());
        REQUIRE(params.value(w).Data == std::vector<float>{0.25f, -2.f});
    }
}
