#include <gtest/gtest.h>
#include "search/search_driver.hpp"
#include "common/errors.hpp"
#include "test_helpers.hpp"

#include <cmath>
#include <cstdio>

using namespace modex;
using namespace modex::fixtures;

namespace {

Schedule single(GeneratorDecl decl) {
    return DependencyScheduler::build(graphSchema(), {std::move(decl)});
}

std::shared_ptr<LossEvaluator> distanceFrom(double target, Direction direction) {
    auto eval = std::make_shared<LossEvaluator>(direction);
    eval->addTerm(std::make_unique<FunctionLoss>(
        "distance", [target](const ModelInstance& g, const LossContext&) {
            return std::fabs(static_cast<double>(g.count(kV)) - target);
        }));
    return eval;
}

SearchOptions untilExhausted() {
    SearchOptions opts;
    opts.iterations = 0;
    return opts;
}

} // namespace

TEST(SearchDriverTest, ChainSucceeds) {
    WiringPattern w;
    w.boxes = {{"a", "e"}, {"b", "e"}};
    w.ports = {{"a_out", "a", {HomConstraint::requireTag(kV, "out")}},
               {"b_in", "b", {HomConstraint::requireTag(kV, "in")}}};
    w.junctions = {{"j", vertices(1)}};
    w.wires = {{"a_out", "j"}, {"b_in", "j"}};
    GeneratorDecl e = GeneratorDecl::primitive("e", listOf({edge()}));
    e.sharing = Sharing::Shared;
    Schedule s = DependencyScheduler::build(graphSchema(), {GeneratorDecl::additive("chain", w), e});

    SearchDriver driver(s, untilExhausted());
    SearchOutcome out = driver.run();
    EXPECT_EQ(out.status, SearchStatus::Success);
    ASSERT_TRUE(out.best);
    EXPECT_EQ(out.best->count(kE), 2u);
    EXPECT_EQ(out.best->count(kV), 3u);
    EXPECT_EQ(out.best_stream, "chain");
    EXPECT_FALSE(out.best_score.has_value());
    EXPECT_EQ(out.emitted, 1u);
    EXPECT_EQ(out.root_reasons.at("chain"), ExhaustionReason::Depleted);
}

TEST(SearchDriverTest, TracksBestScore) {
    GeneratorDecl g = GeneratorDecl::primitive("g", growing(6));
    g.loss = distanceFrom(3.0, Direction::Minimize);
    Schedule s = single(g);

    SearchOutcome out = SearchDriver(s, untilExhausted()).run();
    EXPECT_EQ(out.status, SearchStatus::Success);
    EXPECT_EQ(out.best->count(kV), 3u);
    EXPECT_EQ(out.best_score, 0.0);
    EXPECT_EQ(out.emitted, 6u);
}

TEST(SearchDriverTest, MaximizeKeepsFirstOfTies) {
    GeneratorDecl g = GeneratorDecl::primitive("g", growing(5));
    g.loss = distanceFrom(3.0, Direction::Maximize);
    Schedule s = single(g);

    // Distances 2, 1, 0, 1, 2: vertices(1) and vertices(5) tie.
    SearchOutcome out = SearchDriver(s, untilExhausted()).run();
    EXPECT_EQ(out.best->count(kV), 1u);
    EXPECT_EQ(out.best_score, 2.0);
}

TEST(SearchDriverTest, IterationBudget) {
    Schedule s = single(GeneratorDecl::primitive("g", growing(10)));
    SearchOptions opts;
    opts.iterations = 3;
    SearchDriver driver(s, opts);
    SearchOutcome out = driver.run();
    EXPECT_EQ(out.emitted, 3u);
    EXPECT_EQ(driver.explorer().history("g").size(), 3u);
    EXPECT_EQ(out.root_reasons.at("g"), ExhaustionReason::None);
    // No loss: the first emission stays best.
    EXPECT_EQ(out.best->count(kV), 1u);
}

TEST(SearchDriverTest, EmptyRootIsExhausted) {
    Schedule s = single(GeneratorDecl::primitive("g", listOf({})));
    SearchOutcome out = SearchDriver(s, untilExhausted()).run();
    EXPECT_EQ(out.status, SearchStatus::Exhausted);
    EXPECT_FALSE(out.best);
    EXPECT_EQ(out.emitted, 0u);
}

TEST(SearchDriverTest, RoundRobinOverRoots) {
    ScheduleOptions schedule_options;
    schedule_options.allow_multiple_roots = true;
    Schedule s = DependencyScheduler::build(graphSchema(),
                                            {GeneratorDecl::primitive("x", growing(2)),
                                             GeneratorDecl::primitive("y", growing(4))},
                                            schedule_options);

    SearchOptions opts;
    opts.allow_multiple_roots = true;
    opts.iterations = 3;
    SearchDriver driver(s, opts);
    SearchOutcome out = driver.run();
    EXPECT_EQ(out.emitted, 3u);
    EXPECT_EQ(driver.explorer().history("x").size(), 2u);
    EXPECT_EQ(driver.explorer().history("y").size(), 1u);
    EXPECT_EQ(out.best_stream, "x");

    opts.iterations = 0;
    SearchDriver full(s, opts);
    out = full.run();
    EXPECT_EQ(out.emitted, 6u);
    EXPECT_EQ(out.root_reasons.at("x"), ExhaustionReason::Depleted);
    EXPECT_EQ(out.root_reasons.at("y"), ExhaustionReason::Depleted);

    SearchOptions strict;
    EXPECT_THROW(SearchDriver(s, strict).run(), MultipleRootsError);
}

TEST(SearchDriverTest, WallClockTimeout) {
    Schedule s = single(GeneratorDecl::primitive("g", growing(10)));
    SearchOptions opts;
    opts.iterations = 0;
    opts.max_seconds = 1e-9;
    SearchOutcome out = SearchDriver(s, opts).run();
    EXPECT_EQ(out.status, SearchStatus::Timeout);
    EXPECT_TRUE(out.budget_exhausted);
    EXPECT_EQ(out.emitted, 0u);
}

TEST(SearchDriverTest, ResumeFromCheckpoint) {
    Schedule s = single(GeneratorDecl::primitive("g", growing(6)));
    const std::string path = ::testing::TempDir() + "modex_search_resume.yaml";

    SearchOptions first;
    first.iterations = 2;
    first.checkpoint_path = path;
    first.checkpoint_every = 1;
    SearchOutcome a = SearchDriver(s, first).run();
    EXPECT_EQ(a.emitted, 2u);

    SearchOptions second = first;
    second.resume = true;
    SearchDriver resumed(s, second);
    SearchOutcome b = resumed.run();
    EXPECT_EQ(b.emitted, 4u);
    EXPECT_EQ(resumed.explorer().history("g")[3].instance->count(kV), 4u);
    EXPECT_EQ(resumed.explorer().drawCount("g"), 4u);
    std::remove(path.c_str());
}
