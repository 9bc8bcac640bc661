#include <gtest/gtest.h>
#include "config/search_space_loader.hpp"
#include "explore/explorer.hpp"
#include "common/errors.hpp"

#include <cstdio>
#include <fstream>

using namespace modex;

namespace {

const char* kChain = R"(
schema:
  name: Graph
  objects: [E, V]
  relations:
    - {name: src, dom: E, codom: V}
    - {name: tgt, dom: E, codom: V}

search:
  seed: 7
  iterations: 25
  homomorphism:
    strategy: backtracking
    max_steps: 5000

logging:
  level: warn

generators:
  - id: edges
    kind: explicit
    sharing: reentrant
    instances:
      - counts: {E: 1, V: 2}
        relations: {src: [0], tgt: [1]}
        tags: {V: {0: [in], 1: [out]}}

  - id: chain
    kind: additive
    max_skips: 10
    wiring:
      boxes:
        - {id: left, generator: edges}
        - {id: right, generator: edges}
      ports:
        - id: left_out
          box: left
          constraints: [{object: V, require_tag: out}]
        - id: right_in
          box: right
          constraints: [{object: V, require_tag: in}]
      junctions:
        - id: mid
          overlap: {counts: {V: 1}}
      wires:
        - {port: left_out, junction: mid}
        - {port: right_in, junction: mid}
    constraints:
      - filter: nonempty
    loss:
      function: size
      stop: {kind: max_emitted, count: 1}
)";

std::string replace(std::string text, const std::string& from, const std::string& to) {
    auto at = text.find(from);
    if (at != std::string::npos) text.replace(at, from.size(), to);
    return text;
}

template <typename E>
E expectError(const std::string& text) {
    SearchSpaceLoader loader;
    try {
        loader.loadString(text);
    } catch (const E& e) {
        return e;
    }
    ADD_FAILURE() << "no error raised";
    return E("none");
}

} // namespace

TEST(ConfigTest, LoadsChain) {
    SearchSpaceLoader loader;
    SearchSpaceSpec spec = loader.loadString(kChain);

    EXPECT_EQ(spec.schema->name(), "Graph");
    EXPECT_EQ(spec.schema->objectCount(), 2u);
    EXPECT_EQ(spec.options.seed, 7u);
    EXPECT_EQ(spec.options.iterations, 25u);
    EXPECT_EQ(spec.options.homomorphism.strategy, StrategyKind::Backtracking);
    EXPECT_EQ(spec.options.hom_budget.max_steps, 5000u);
    EXPECT_EQ(spec.log_level, "warn");

    ASSERT_EQ(spec.generators.size(), 2u);
    const GeneratorDecl& chain = spec.generators[1];
    EXPECT_EQ(chain.kindName(), "additive");
    EXPECT_EQ(chain.max_skips, 10u);
    EXPECT_EQ(chain.constraints.size(), 1u);
    ASSERT_TRUE(chain.loss);
    EXPECT_EQ(chain.loss->stopCriterion().kind, StopCriterion::Kind::MaxEmitted);
    EXPECT_EQ(spec.generators[0].sharing, Sharing::Reentrant);
    EXPECT_EQ(chain.dependencies(), std::vector<std::string>({"edges", "edges"}));
}

TEST(ConfigTest, ChainExploresToPath) {
    SearchSpaceLoader loader;
    SearchSpaceSpec spec = loader.loadString(kChain);
    Schedule schedule = spec.buildSchedule();

    ExplorerOptions opts;
    opts.seed = spec.options.seed;
    opts.homomorphism = spec.options.homomorphism;
    Explorer ex(schedule, opts);

    auto glued = ex.next(ex.rootKey());
    ASSERT_TRUE(glued.has_value());
    EXPECT_EQ((*glued)->count("E"), 2u);
    EXPECT_EQ((*glued)->count("V"), 3u);
    EXPECT_EQ((*glued)->apply("tgt", 0), (*glued)->apply("src", 1));
    EXPECT_EQ(ex.history("chain")[0].score, 5.0);
    EXPECT_EQ(ex.reason("chain"), ExhaustionReason::Stopped);
}

TEST(ConfigTest, MissingJunctionIsLocated) {
    std::string text = replace(kChain, "{port: left_out, junction: mid}", "{port: left_out}");
    auto e = expectError<MissingFieldError>(text);
    EXPECT_EQ(e.location(), "generators[1].wiring.wires[0]");
    EXPECT_NE(std::string(e.what()).find("junction"), std::string::npos);
    EXPECT_NE(std::string(e.what()).find("line"), std::string::npos);
}

TEST(ConfigTest, UnknownKind) {
    auto e = expectError<ConfigError>(replace(kChain, "kind: explicit", "kind: magic"));
    EXPECT_EQ(e.location(), "generators[0].kind");
}

TEST(ConfigTest, UnknownHooks) {
    auto filter = expectError<DanglingReferenceError>(
        replace(kChain, "filter: nonempty", "filter: sparkly"));
    EXPECT_EQ(filter.location(), "generators[1].constraints[0].filter");

    auto loss = expectError<DanglingReferenceError>(
        replace(kChain, "function: size", "function: beauty"));
    EXPECT_EQ(loss.location(), "generators[1].loss.function");
}

TEST(ConfigTest, BadScalars) {
    auto level = expectError<ConfigError>(replace(kChain, "level: warn", "level: loud"));
    EXPECT_EQ(level.location(), "logging.level");

    auto iterations = expectError<ConfigError>(replace(kChain, "iterations: 25", "iterations: many"));
    EXPECT_EQ(iterations.location(), "search.iterations");

    auto sharing = expectError<ConfigError>(replace(kChain, "sharing: reentrant", "sharing: maybe"));
    EXPECT_EQ(sharing.location(), "generators[0].sharing");

    expectError<ConfigError>(replace(kChain, "strategy: backtracking", "strategy: psychic"));
    expectError<ConfigError>(replace(kChain, "kind: max_emitted", "kind: forever"));
}

TEST(ConfigTest, InstanceLiteralErrors) {
    expectError<ConfigError>(replace(kChain, "counts: {V: 1}", "counts: {W: 1}"));
    expectError<ConfigError>(replace(kChain, "relations: {src: [0], tgt: [1]}",
                                     "relations: {src: [0]}"));
    expectError<ConfigError>(replace(kChain, "require_tag: out", "require_tag: out, element: x"));
}

TEST(ConfigTest, MalformedYaml) {
    SearchSpaceLoader loader;
    EXPECT_THROW(loader.loadString("schema: [unclosed"), ConfigError);
    EXPECT_THROW(loader.loadString("- a\n- b\n"), ConfigError);
    EXPECT_THROW(loader.loadString("generators: []\n"), MissingFieldError);
}

TEST(ConfigTest, RegisteredSource) {
    const char* doc = R"(
schema:
  objects: [E, V]
  relations:
    - {name: src, dom: E, codom: V}
generators:
  - id: copies
    kind: source
    source: terminal_copies
    params: {limit: 3}
)";
    SearchSpaceLoader loader;
    Schedule schedule = loader.loadString(doc).buildSchedule();
    Explorer ex(schedule);
    size_t n = 0;
    while (auto inst = ex.next("copies")) {
        n++;
        EXPECT_EQ((*inst)->count("E"), n);
        EXPECT_EQ((*inst)->count("V"), n);
    }
    EXPECT_EQ(n, 3u);

    auto bad = expectError<ConfigError>(replace(doc, "limit: 3", "limit: lots"));
    EXPECT_EQ(bad.location(), "generators[0].params");
}

TEST(ConfigTest, CustomHooks) {
    SearchSpaceLoader loader;
    loader.hooks().registerFilter("small", [](const ModelInstance& m) {
        return m.totalElements() < 4;
    });
    SearchSpaceSpec spec = loader.loadString(replace(kChain, "filter: nonempty", "filter: small"));
    Schedule schedule = spec.buildSchedule();
    Explorer ex(schedule);
    EXPECT_FALSE(ex.next("chain").has_value());
    EXPECT_EQ(ex.reason("chain"), ExhaustionReason::Depleted);
}

TEST(ConfigTest, LoadFile) {
    const std::string path = ::testing::TempDir() + "modex_config_test.yaml";
    {
        std::ofstream out(path);
        out << kChain;
    }
    SearchSpaceLoader loader;
    EXPECT_EQ(loader.loadFile(path).generators.size(), 2u);
    std::remove(path.c_str());

    EXPECT_THROW(loader.loadFile(path + ".missing"), ConfigError);
}
