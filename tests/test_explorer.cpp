#include <gtest/gtest.h>
#include "explore/explorer.hpp"
#include "common/errors.hpp"
#include "test_helpers.hpp"

#include <algorithm>

using namespace modex;
using namespace modex::fixtures;

namespace {

GeneratorDecl disjoint(const std::string& id, const std::vector<std::pair<std::string, std::string>>& boxes) {
    WiringPattern w;
    for (const auto& [box, gen] : boxes) w.boxes.push_back({box, gen});
    return GeneratorDecl::additive(id, w);
}

GeneratorDecl product(const std::string& id, const std::vector<std::string>& dims,
                      InstancePtr base = nullptr, bool expand_inadmissible = true) {
    ProductSpec p;
    p.dimensions = dims;
    p.base = std::move(base);
    p.expand_inadmissible = expand_inadmissible;
    return GeneratorDecl::multiplicative(id, p);
}

std::shared_ptr<LossEvaluator> lossOf(std::unique_ptr<LossFunction> term,
                                      StopCriterion stop = {}) {
    auto eval = std::make_shared<LossEvaluator>();
    eval->addTerm(std::move(term));
    eval->setStopCriterion(stop);
    return eval;
}

std::vector<std::vector<size_t>> positions(Explorer& ex, const std::string& key) {
    std::vector<std::vector<size_t>> out;
    for (const auto& p : ex.state(key).provenance) out.push_back(p.position);
    return out;
}

size_t drain(Explorer& ex, const std::string& key) {
    size_t n = 0;
    while (ex.next(key)) n++;
    return n;
}

} // namespace

// ─── Primitive streams ─────────────────────────────────────────

TEST(ExplorerTest, PrimitiveStreamDepletes) {
    Schedule s = DependencyScheduler::build(graphSchema(),
                                            {GeneratorDecl::primitive("g", growing(3))});
    Explorer ex(s);
    EXPECT_EQ(ex.rootKey(), "g");
    for (size_t i = 1; i <= 3; i++) {
        auto inst = ex.next("g");
        ASSERT_TRUE(inst.has_value());
        EXPECT_EQ((*inst)->count(kV), i);
    }
    EXPECT_FALSE(ex.next("g").has_value());
    EXPECT_TRUE(ex.exhausted("g"));
    EXPECT_EQ(ex.reason("g"), ExhaustionReason::Depleted);
    EXPECT_EQ(ex.drawCount("g"), 3u);
    // Exhaustion is sticky.
    EXPECT_FALSE(ex.next("g").has_value());
    EXPECT_EQ(ex.drawCount("g"), 3u);
}

TEST(ExplorerTest, AtPullsLazily) {
    Schedule s = DependencyScheduler::build(graphSchema(),
                                            {GeneratorDecl::primitive("g", growing(5))});
    Explorer ex(s);
    auto third = ex.at("g", 2);
    ASSERT_TRUE(third.has_value());
    EXPECT_EQ((*third)->count(kV), 3u);
    EXPECT_EQ(ex.history("g").size(), 3u);
    EXPECT_FALSE(ex.at("g", 9).has_value());
    EXPECT_EQ(ex.history("g").size(), 5u);
}

TEST(ExplorerTest, UnknownStream) {
    Schedule s = DependencyScheduler::build(graphSchema(),
                                            {GeneratorDecl::primitive("g", growing(1))});
    Explorer ex(s);
    EXPECT_THROW(ex.next("nope"), ModexError);
}

TEST(ExplorerTest, ThresholdStopsStream) {
    // Scores 5, 3, 1, -1, ... ; stop at the first score <= 0.
    auto loss = lossOf(std::make_unique<FunctionLoss>(
                           "shrink", [](const ModelInstance& g, const LossContext&) {
                               return 7.0 - 2.0 * static_cast<double>(g.count(kV));
                           }),
                       StopCriterion::threshold(Comparison::LessEqual, 0.0));
    GeneratorDecl g = GeneratorDecl::primitive("g", growing(10));
    g.loss = loss;
    Schedule s = DependencyScheduler::build(graphSchema(), {g});
    Explorer ex(s);

    EXPECT_EQ(drain(ex, "g"), 4u);
    EXPECT_EQ(ex.reason("g"), ExhaustionReason::Stopped);
    const History& h = ex.history("g");
    EXPECT_EQ(h.back().score, -1.0);
    EXPECT_EQ(h.front().score, 5.0);
    EXPECT_EQ(ex.drawCount("g"), 4u);
}

TEST(ExplorerTest, FilterSkipsCandidates) {
    GeneratorDecl g = GeneratorDecl::primitive("g", growing(6));
    g.constraints.push_back(OutputConstraint::filterBy(
        "even", [](const ModelInstance& m) { return m.count(kV) % 2 == 0; }));
    Schedule s = DependencyScheduler::build(graphSchema(), {g});
    Explorer ex(s);

    EXPECT_EQ(drain(ex, "g"), 3u);
    EXPECT_EQ(ex.history("g")[1].instance->count(kV), 4u);
    EXPECT_EQ(ex.state("g").provenance[1].position, std::vector<size_t>({3}));
    EXPECT_EQ(ex.reason("g"), ExhaustionReason::Depleted);
}

TEST(ExplorerTest, TooManySkipsExhaustsLayer) {
    GeneratorDecl g = GeneratorDecl::primitive("g", growing(10));
    g.constraints.push_back(OutputConstraint::filterBy("never", [](const ModelInstance&) {
        return false;
    }));
    g.max_skips = 3;
    Schedule s = DependencyScheduler::build(graphSchema(), {g});
    Explorer ex(s);

    EXPECT_FALSE(ex.next("g").has_value());
    EXPECT_EQ(ex.reason("g"), ExhaustionReason::LayerExhausted);
    EXPECT_EQ(ex.drawCount("g"), 4u);
    EXPECT_TRUE(ex.history("g").empty());
}

TEST(ExplorerTest, ChaseRewritesCandidate) {
    GeneratorDecl g = GeneratorDecl::primitive("g", growing(2));
    g.constraints.push_back(OutputConstraint::chaseWith(
        "add_edge", [](const InstancePtr& in) -> std::optional<InstancePtr> {
            InstanceBuilder b = InstanceBuilder::from(*in);
            b.addElements("E", 1);
            b.setRelation("src", 0, 0);
            b.setRelation("tgt", 0, 0);
            return b.build();
        }));
    // Filters see the chased instance.
    g.constraints.insert(g.constraints.begin(), OutputConstraint::filterBy(
        "has_edge", [](const ModelInstance& m) { return m.count(kE) == 1; }));
    Schedule s = DependencyScheduler::build(graphSchema(), {g});
    Explorer ex(s);

    EXPECT_EQ(drain(ex, "g"), 2u);
    EXPECT_EQ(ex.history("g")[1].instance->count(kE), 1u);
    EXPECT_EQ(ex.history("g")[1].instance->count(kV), 2u);
}

// ─── Additive streams ──────────────────────────────────────────

TEST(ExplorerTest, OdometerOrder) {
    std::vector<GeneratorDecl> decls = {disjoint("c", {{"a", "x"}, {"b", "y"}}),
                                        GeneratorDecl::primitive("x", growing(2)),
                                        GeneratorDecl::primitive("y", growing(2))};
    Schedule s = DependencyScheduler::build(graphSchema(), decls);
    Explorer ex(s);

    EXPECT_EQ(drain(ex, "c"), 4u);
    using P = std::vector<size_t>;
    EXPECT_EQ(positions(ex, "c"), std::vector<P>({{0, 0}, {0, 1}, {1, 0}, {1, 1}}));
    // Disjoint union of vertices(i + 1) and vertices(j + 1).
    EXPECT_EQ(ex.history("c")[2].instance->count(kV), 3u);
    EXPECT_EQ(ex.reason("c"), ExhaustionReason::Depleted);
}

TEST(ExplorerTest, EmptyChildDepletesComposite) {
    std::vector<GeneratorDecl> decls = {disjoint("c", {{"a", "x"}, {"b", "y"}}),
                                        GeneratorDecl::primitive("x", growing(2)),
                                        GeneratorDecl::primitive("y", listOf({}))};
    Schedule s = DependencyScheduler::build(graphSchema(), decls);
    Explorer ex(s);
    EXPECT_FALSE(ex.next("c").has_value());
    EXPECT_EQ(ex.reason("c"), ExhaustionReason::Depleted);
}

TEST(ExplorerTest, SharedAndReentrantDraws) {
    auto build = [](Sharing sharing) {
        GeneratorDecl e = GeneratorDecl::primitive("e", growing(3));
        e.sharing = sharing;
        return DependencyScheduler::build(graphSchema(),
                                          {disjoint("c", {{"a", "e"}, {"b", "e"}}), e});
    };

    Schedule shared = build(Sharing::Shared);
    Explorer ex1(shared);
    EXPECT_EQ(drain(ex1, "c"), 9u);
    EXPECT_EQ(ex1.drawCount("e"), 3u);
    EXPECT_EQ(ex1.state("c").children, std::vector<std::string>({"e", "e"}));

    Schedule reentrant = build(Sharing::Reentrant);
    Explorer ex2(reentrant);
    EXPECT_EQ(drain(ex2, "c"), 9u);
    EXPECT_EQ(ex2.drawCount("e"), 6u);
    EXPECT_EQ(ex2.state("c").children, std::vector<std::string>({"c/a", "c/b"}));
    EXPECT_EQ(ex2.history("c/a").size(), 3u);
}

TEST(ExplorerTest, UnspecifiedFollowsReentrantParent) {
    GeneratorDecl mid = disjoint("m", {{"inner", "leaf"}});
    mid.sharing = Sharing::Reentrant;
    std::vector<GeneratorDecl> decls = {disjoint("r", {{"x", "m"}, {"y", "m"}}), mid,
                                        GeneratorDecl::primitive("leaf", growing(2))};
    Schedule s = DependencyScheduler::build(graphSchema(), decls);
    Explorer ex(s);

    EXPECT_EQ(drain(ex, "r"), 4u);
    auto keys = ex.streamKeys();
    EXPECT_NE(std::find(keys.begin(), keys.end(), "r/x/inner"), keys.end());
    EXPECT_NE(std::find(keys.begin(), keys.end(), "r/y/inner"), keys.end());
    EXPECT_EQ(ex.drawCount("leaf"), 4u);
}

TEST(ExplorerTest, InadmissibleGluingsAreSkipped) {
    WiringPattern w;
    w.boxes = {{"a", "x"}, {"b", "y"}};
    w.ports = {{"pa", "a", {HomConstraint::requireTag(kV, "nowhere")}}, {"pb", "b", {}}};
    w.junctions = {{"j", vertices(1)}};
    w.wires = {{"pa", "j"}, {"pb", "j"}};
    std::vector<GeneratorDecl> decls = {GeneratorDecl::additive("c", w),
                                        GeneratorDecl::primitive("x", growing(2)),
                                        GeneratorDecl::primitive("y", growing(2))};
    Schedule s = DependencyScheduler::build(graphSchema(), decls);
    Explorer ex(s);

    EXPECT_FALSE(ex.next("c").has_value());
    EXPECT_EQ(ex.reason("c"), ExhaustionReason::Depleted);
    EXPECT_EQ(ex.state("c").attempts, 4u);
}

TEST(ExplorerTest, UnwiredJunctionKeepsBoxSequence) {
    WiringPattern w;
    w.boxes = {{"a", "g"}};
    w.junctions = {{"j", vertices(1)}};
    Schedule s = DependencyScheduler::build(graphSchema(),
                                            {GeneratorDecl::additive("c", w),
                                             GeneratorDecl::primitive("g", growing(3))});
    Explorer ex(s);

    EXPECT_EQ(drain(ex, "c"), 3u);
    ASSERT_EQ(ex.history("g").size(), 3u);
    for (size_t i = 0; i < 3; i++) {
        EXPECT_EQ(ex.history("c")[i].instance, ex.history("g")[i].instance);
        EXPECT_EQ(ex.history("c")[i].instance->count(kV), i + 1);
    }
    EXPECT_EQ(ex.reason("c"), ExhaustionReason::Depleted);
}

TEST(ExplorerTest, NestedPortTagsConstrainOuterGluing) {
    // inner: an edge whose only port must land on the "in" vertex.
    WiringPattern inner;
    inner.boxes = {{"e", "edges"}};
    inner.ports = {{"pe", "e", {HomConstraint::requireTag(kV, "in")}}};
    inner.junctions = {{"j", vertices(1)}};
    inner.wires = {{"pe", "j"}};

    // outer: glue a "z" vertex onto inner without constraints of its own.
    WiringPattern outer;
    outer.boxes = {{"x", "inner"}, {"y", "marks"}};
    outer.ports = {{"px", "x", {}}, {"py", "y", {}}};
    outer.junctions = {{"j", vertices(1)}};
    outer.wires = {{"px", "j"}, {"py", "j"}};

    InstanceBuilder mark(graphSchema());
    mark.addElements("V", 1);
    mark.addTag("V", 0, "z");
    std::vector<InstancePtr> marks = {mark.build()};

    Schedule s = DependencyScheduler::build(graphSchema(),
                                            {GeneratorDecl::additive("outer", outer),
                                             GeneratorDecl::additive("inner", inner),
                                             GeneratorDecl::primitive("edges", listOf({edge()})),
                                             GeneratorDecl::primitive("marks", listOf(marks))});
    for (uint64_t seed = 0; seed < 16; seed++) {
        ExplorerOptions opts;
        opts.seed = seed;
        Explorer ex(s, opts);
        auto glued = ex.next("outer");
        ASSERT_TRUE(glued.has_value()) << "seed " << seed;
        EXPECT_EQ((*glued)->count(kV), 2u);
        auto z = (*glued)->elementsWithTag(kV, "z");
        ASSERT_EQ(z.size(), 1u);
        EXPECT_TRUE((*glued)->hasTag(kV, z[0], "in")) << "seed " << seed;
        ASSERT_EQ(ex.state("inner").interfaces.size(), 1u);
        EXPECT_EQ(ex.state("inner").interfaces[0].size(), 1u);
    }
}

TEST(ExplorerTest, DependencyScoreSeesChildHistories) {
    GeneratorDecl x = GeneratorDecl::primitive("x", growing(2));
    x.loss = lossOf(std::make_unique<SizeLoss>());
    GeneratorDecl y = GeneratorDecl::primitive("y", growing(2));
    y.loss = lossOf(std::make_unique<SizeLoss>());
    GeneratorDecl c = disjoint("c", {{"a", "x"}, {"b", "y"}});
    c.loss = lossOf(std::make_unique<DependencyScoreLoss>());
    Schedule s = DependencyScheduler::build(graphSchema(), {c, x, y});
    Explorer ex(s);

    ASSERT_TRUE(ex.next("c").has_value());
    EXPECT_EQ(ex.history("c")[0].score, 2.0);
    ASSERT_TRUE(ex.next("c").has_value());
    EXPECT_EQ(ex.history("c")[1].score, 3.0);
}

TEST(ExplorerTest, SameSeedSameStream) {
    WiringPattern w;
    w.boxes = {{"a", "p"}, {"b", "q"}};
    w.ports = {{"pa", "a", {}}, {"pb", "b", {}}};
    w.junctions = {{"j", vertices(1)}};
    w.wires = {{"pa", "j"}, {"pb", "j"}};
    std::vector<InstancePtr> paths = {path(2), path(3)};
    std::vector<GeneratorDecl> decls = {GeneratorDecl::additive("c", w),
                                        GeneratorDecl::primitive("p", listOf(paths)),
                                        GeneratorDecl::primitive("q", listOf(paths))};
    Schedule s = DependencyScheduler::build(graphSchema(), decls);

    ExplorerOptions opts;
    opts.seed = 42;
    Explorer ex1(s, opts);
    Explorer ex2(s, opts);
    EXPECT_EQ(drain(ex1, "c"), 4u);
    EXPECT_EQ(drain(ex2, "c"), 4u);
    for (size_t i = 0; i < 4; i++) {
        EXPECT_TRUE(*ex1.history("c")[i].instance == *ex2.history("c")[i].instance);
        EXPECT_EQ(ex1.state("c").provenance[i].seed, ex2.state("c").provenance[i].seed);
    }
}

TEST(ExplorerTest, AttemptSeedDependsOnEveryInput) {
    uint32_t base = Explorer::attemptSeed(1, "c", 0);
    EXPECT_EQ(base, Explorer::attemptSeed(1, "c", 0));
    EXPECT_NE(base, Explorer::attemptSeed(2, "c", 0));
    EXPECT_NE(base, Explorer::attemptSeed(1, "d", 0));
    EXPECT_NE(base, Explorer::attemptSeed(1, "c", 1));
}

// ─── Multiplicative streams ────────────────────────────────────

TEST(ExplorerTest, ProductBreadthFirstOrder) {
    std::vector<GeneratorDecl> decls = {product("p", {"a", "b"}),
                                        GeneratorDecl::primitive("a", growing(3)),
                                        GeneratorDecl::primitive("b", growing(2))};
    Schedule s = DependencyScheduler::build(graphSchema(), decls);
    Explorer ex(s);

    EXPECT_EQ(drain(ex, "p"), 6u);
    using P = std::vector<size_t>;
    EXPECT_EQ(positions(ex, "p"),
              std::vector<P>({{0, 0}, {1, 0}, {0, 1}, {2, 0}, {1, 1}, {2, 1}}));
    // vertices(3) x vertices(2) over the terminal base.
    EXPECT_EQ(ex.history("p")[5].instance->count(kV), 6u);
}

TEST(ExplorerTest, ProductOfTwoByTwo) {
    std::vector<GeneratorDecl> decls = {product("p", {"a", "b"}),
                                        GeneratorDecl::primitive("a", growing(2)),
                                        GeneratorDecl::primitive("b", growing(2))};
    Schedule s = DependencyScheduler::build(graphSchema(), decls);
    Explorer ex(s);

    EXPECT_EQ(drain(ex, "p"), 4u);
    auto pos = positions(ex, "p");
    EXPECT_EQ(pos.front(), std::vector<size_t>({0, 0}));
    EXPECT_EQ(pos.back(), std::vector<size_t>({1, 1}));
}

TEST(ExplorerTest, InadmissibleProductNodes) {
    auto build = [](bool expand) {
        return DependencyScheduler::build(
            graphSchema(), {product("p", {"d"}, vertices(1), expand),
                            GeneratorDecl::primitive("d", listOf({vertices(1), edge(), vertices(1)}))});
    };

    Schedule expanding = build(true);
    Explorer ex1(expanding);
    EXPECT_EQ(drain(ex1, "p"), 2u);
    EXPECT_EQ(ex1.state("p").provenance[1].position, std::vector<size_t>({2}));

    Schedule pruning = build(false);
    Explorer ex2(pruning);
    EXPECT_EQ(drain(ex2, "p"), 1u);
    EXPECT_EQ(ex2.reason("p"), ExhaustionReason::Depleted);
}
