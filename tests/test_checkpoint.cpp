#include <gtest/gtest.h>
#include "explore/checkpoint.hpp"
#include "explore/explorer.hpp"
#include "common/errors.hpp"
#include "test_helpers.hpp"

#include <cstdio>

using namespace modex;
using namespace modex::fixtures;

namespace {

/// Two path boxes glued at one vertex; the gluing point is picked by
/// the seeded homomorphism search.
Schedule gluedPaths() {
    WiringPattern w;
    w.boxes = {{"a", "p"}, {"b", "q"}};
    w.ports = {{"pa", "a", {}}, {"pb", "b", {}}};
    w.junctions = {{"j", vertices(1)}};
    w.wires = {{"pa", "j"}, {"pb", "j"}};
    std::vector<InstancePtr> paths = {path(1), path(2), path(3)};
    GeneratorDecl q = GeneratorDecl::primitive("q", listOf(paths));
    auto loss = std::make_shared<LossEvaluator>();
    loss->addTerm(std::make_unique<SizeLoss>());
    q.loss = loss;
    return DependencyScheduler::build(graphSchema(),
                                      {GeneratorDecl::additive("c", w),
                                       GeneratorDecl::primitive("p", listOf(paths)), q});
}

Schedule gridProduct() {
    ProductSpec p;
    p.dimensions = {"a", "b"};
    return DependencyScheduler::build(graphSchema(),
                                      {GeneratorDecl::multiplicative("grid", p),
                                       GeneratorDecl::primitive("a", growing(3)),
                                       GeneratorDecl::primitive("b", growing(3))});
}

ExplorerOptions seeded(uint64_t seed) {
    ExplorerOptions opts;
    opts.seed = seed;
    return opts;
}

void expectSameHistory(Explorer& a, Explorer& b, const std::string& key) {
    const History& ha = a.history(key);
    const History& hb = b.history(key);
    ASSERT_EQ(ha.size(), hb.size()) << key;
    for (size_t i = 0; i < ha.size(); i++) {
        EXPECT_TRUE(*ha[i].instance == *hb[i].instance) << key << " #" << i;
        EXPECT_EQ(ha[i].score, hb[i].score) << key << " #" << i;
    }
}

} // namespace

TEST(CheckpointTest, ResumeContinuesIdentically) {
    Schedule s = gluedPaths();
    Explorer original(s, seeded(42));
    for (int i = 0; i < 4; i++) ASSERT_TRUE(original.next("c").has_value());

    std::string text = Checkpoint::toYaml(original);
    Explorer resumed(s, seeded(42));
    Checkpoint::fromYaml(resumed, text);

    for (const auto& key : {"c", "p", "q"}) expectSameHistory(original, resumed, key);
    EXPECT_EQ(resumed.drawCount("p"), original.drawCount("p"));
    EXPECT_EQ(resumed.drawCount("q"), original.drawCount("q"));
    EXPECT_EQ(resumed.state("c").attempts, original.state("c").attempts);

    while (true) {
        auto x = original.next("c");
        auto y = resumed.next("c");
        ASSERT_EQ(x.has_value(), y.has_value());
        if (!x) break;
        EXPECT_TRUE(**x == **y);
    }
    EXPECT_EQ(resumed.history("c").size(), 9u);
    EXPECT_EQ(resumed.drawCount("q"), original.drawCount("q"));
}

TEST(CheckpointTest, ProductFrontierSurvives) {
    Schedule s = gridProduct();
    Explorer original(s);
    for (int i = 0; i < 3; i++) ASSERT_TRUE(original.next("grid").has_value());

    Explorer resumed(s);
    Checkpoint::fromYaml(resumed, Checkpoint::toYaml(original));
    const auto& cursor = std::get<ProductCursor>(resumed.state("grid").cursor);
    EXPECT_EQ(cursor.visited, std::get<ProductCursor>(original.state("grid").cursor).visited);

    std::vector<std::vector<size_t>> a, b;
    while (original.next("grid")) {}
    while (resumed.next("grid")) {}
    for (const auto& p : original.state("grid").provenance) a.push_back(p.position);
    for (const auto& p : resumed.state("grid").provenance) b.push_back(p.position);
    EXPECT_EQ(a, b);
    EXPECT_EQ(b.size(), 9u);
}

TEST(CheckpointTest, ExhaustionIsRestored) {
    Schedule s = gridProduct();
    Explorer original(s);
    while (original.next("grid")) {}

    Explorer resumed(s);
    Checkpoint::fromYaml(resumed, Checkpoint::toYaml(original));
    EXPECT_TRUE(resumed.exhausted("grid"));
    EXPECT_EQ(resumed.reason("grid"), ExhaustionReason::Depleted);
    EXPECT_FALSE(resumed.next("grid").has_value());
}

TEST(CheckpointTest, RejectsOtherSearchSpaces) {
    Schedule s = gluedPaths();
    Explorer original(s, seeded(1));
    original.next("c");
    std::string text = Checkpoint::toYaml(original);

    Explorer wrong_seed(s, seeded(2));
    EXPECT_THROW(Checkpoint::fromYaml(wrong_seed, text), CheckpointError);

    Schedule other = gridProduct();
    Explorer wrong_space(other, seeded(1));
    EXPECT_THROW(Checkpoint::fromYaml(wrong_space, text), CheckpointError);
}

TEST(CheckpointTest, MalformedDocuments) {
    Schedule s = gridProduct();
    Explorer ex(s);
    EXPECT_THROW(Checkpoint::fromYaml(ex, "streams: [unterminated"), CheckpointError);
    EXPECT_THROW(Checkpoint::fromYaml(ex, "- just\n- a list\n"), CheckpointError);
    EXPECT_THROW(Checkpoint::fromYaml(ex, "version: 1\nschema: Graph\n"), CheckpointError);
    EXPECT_THROW(Checkpoint::fromYaml(ex, "version: 99\nschema: Graph\nseed: 0\n"),
                 CheckpointError);
}

TEST(CheckpointTest, FailedLoadKeepsExplorerState) {
    Schedule s = gridProduct();
    Explorer ex(s);
    for (int i = 0; i < 3; i++) ASSERT_TRUE(ex.next("grid").has_value());
    const uint64_t draws = ex.drawCount("a");

    // Children rebuild fine, then the grid cursor fails to parse.
    std::string text = Checkpoint::toYaml(ex);
    const std::string from = "kind: product";
    size_t at = text.find(from);
    ASSERT_NE(at, std::string::npos);
    text.replace(at, from.size(), "kind: additive");
    EXPECT_THROW(Checkpoint::fromYaml(ex, text), CheckpointError);

    EXPECT_EQ(ex.history("grid").size(), 3u);
    EXPECT_EQ(ex.state("grid").provenance.size(), 3u);
    EXPECT_EQ(ex.drawCount("a"), draws);

    Explorer fresh(s);
    while (fresh.next("grid")) {}
    while (ex.next("grid")) {}
    std::vector<std::vector<size_t>> a, b;
    for (const auto& p : fresh.state("grid").provenance) a.push_back(p.position);
    for (const auto& p : ex.state("grid").provenance) b.push_back(p.position);
    EXPECT_EQ(a, b);
    EXPECT_EQ(b.size(), 9u);
}

TEST(CheckpointTest, SaveAndLoadFile) {
    Schedule s = gridProduct();
    Explorer original(s);
    original.next("grid");
    original.next("grid");

    const std::string path = ::testing::TempDir() + "modex_checkpoint_test.yaml";
    Checkpoint::save(original, path);

    Explorer resumed(s);
    Checkpoint::load(resumed, path);
    expectSameHistory(original, resumed, "grid");
    std::remove(path.c_str());

    EXPECT_THROW(Checkpoint::load(resumed, path + ".missing"), CheckpointError);
}
