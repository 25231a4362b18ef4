/// @file test_world_component.cpp
/// @brief Tests for WorldComponentPipeline

#include <catch2/catch_test_macros.hpp>
#include <tickspace/physics/space.hpp>

#include <string>
#include <vector>

using namespace tick_physics;

namespace {

class CountingComponent : public IWorldComponent {
public:
    void apply(Space&) override { ++applied; }
    std::string name() const override { return "counting"; }

    int applied = 0;
};

} // namespace

TEST_CASE("WorldComponentPipeline: applies in registration order", "[physics][world_component]") {
    Space space(SpaceConfig::defaults(), nullptr, std::make_unique<InlineWorker>());
    WorldComponentPipeline pipeline;
    std::vector<int> order;

    for (int i = 0; i < 4; ++i) {
        pipeline.add(std::make_shared<FunctionComponent>([&order, i](Space&) { order.push_back(i); }));
    }

    pipeline.apply_all(space);
    pipeline.apply_all(space);

    REQUIRE(order == std::vector<int>{0, 1, 2, 3, 0, 1, 2, 3});
    REQUIRE(pipeline.size() == 4);
}

TEST_CASE("WorldComponentPipeline: null components are ignored", "[physics][world_component]") {
    Space space(SpaceConfig::defaults(), nullptr, std::make_unique<InlineWorker>());
    WorldComponentPipeline pipeline;

    pipeline.add(nullptr);
    REQUIRE(pipeline.empty());

    pipeline.apply_all(space);
}

TEST_CASE("WorldComponentPipeline: components added while applying", "[physics][world_component]") {
    Space space(SpaceConfig::defaults(), nullptr, std::make_unique<InlineWorker>());
    WorldComponentPipeline pipeline;
    auto late = std::make_shared<CountingComponent>();
    bool added = false;

    pipeline.add(std::make_shared<FunctionComponent>([&](Space&) {
        if (!added) {
            added = true;
            pipeline.add(late);
        }
    }));

    // The late component joins the pass that registered it
    pipeline.apply_all(space);
    REQUIRE(pipeline.size() == 2);
    REQUIRE(late->applied == 1);

    pipeline.apply_all(space);
    REQUIRE(pipeline.size() == 2);
    REQUIRE(late->applied == 2);
}

TEST_CASE("FunctionComponent: names and empty callables", "[physics][world_component]") {
    Space space(SpaceConfig::defaults(), nullptr, std::make_unique<InlineWorker>());

    FunctionComponent named([](Space&) {}, "gravity");
    REQUIRE(named.name() == "gravity");

    FunctionComponent unnamed([](Space&) {});
    REQUIRE(unnamed.name() == "function_component");

    FunctionComponent empty(nullptr);
    empty.apply(space);

    CountingComponent counting;
    REQUIRE(counting.name() == "counting");
}
