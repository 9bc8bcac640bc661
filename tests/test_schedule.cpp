#include <gtest/gtest.h>
#include "schedule/dependency_scheduler.hpp"
#include "common/errors.hpp"
#include "test_helpers.hpp"

#include <algorithm>

using namespace modex;
using namespace modex::fixtures;

namespace {

/// Additive generator whose boxes draw from the given generators, with
/// no ports or wires.
GeneratorDecl union_of(const std::string& id, const std::vector<std::string>& gens) {
    WiringPattern w;
    for (size_t i = 0; i < gens.size(); i++) {
        w.boxes.push_back({"b" + std::to_string(i), gens[i]});
    }
    return GeneratorDecl::additive(id, w);
}

GeneratorDecl leaf(const std::string& id) {
    return GeneratorDecl::primitive(id, listOf({edge()}));
}

} // namespace

TEST(ScheduleTest, SingleChain) {
    std::vector<GeneratorDecl> decls = {union_of("top", {"mid"}), union_of("mid", {"leaf"}),
                                        leaf("leaf")};
    Schedule s = DependencyScheduler::build(graphSchema(), decls);

    EXPECT_EQ(s.size(), 3u);
    EXPECT_EQ(s.root(), 0u);
    EXPECT_EQ(s.indexOf("leaf"), 2u);
    EXPECT_FALSE(s.find("nope").has_value());
    EXPECT_THROW(s.indexOf("nope"), DanglingReferenceError);

    EXPECT_EQ(s.topologicalOrder(), std::vector<GeneratorIndex>({2, 1, 0}));
    EXPECT_EQ(s.dependencies(0), std::vector<GeneratorIndex>({1}));
    EXPECT_EQ(s.dependents(2), std::vector<GeneratorIndex>({1}));
    EXPECT_NO_THROW(s.wiring(0));
    EXPECT_THROW(s.wiring(2), ModexError);
}

TEST(ScheduleTest, RepeatedSlotsNeedSharing) {
    std::vector<GeneratorDecl> decls = {union_of("pair", {"e", "e"}), leaf("e")};
    try {
        DependencyScheduler::build(graphSchema(), decls);
        FAIL() << "expected SharingPolicyError";
    } catch (const SharingPolicyError& e) {
        EXPECT_EQ(e.location(), "generators[1]");
    }

    decls[1].sharing = Sharing::Reentrant;
    Schedule s = DependencyScheduler::build(graphSchema(), decls);
    EXPECT_EQ(s.dependencies(0), std::vector<GeneratorIndex>({1, 1}));
    EXPECT_EQ(s.dependents(1), std::vector<GeneratorIndex>({0}));
}

TEST(ScheduleTest, SharingAcrossComposites) {
    std::vector<GeneratorDecl> decls = {union_of("top", {"a", "b"}), union_of("a", {"e"}),
                                        union_of("b", {"e"}), leaf("e")};
    EXPECT_THROW(DependencyScheduler::build(graphSchema(), decls), SharingPolicyError);

    decls[3].sharing = Sharing::Shared;
    Schedule s = DependencyScheduler::build(graphSchema(), decls);
    EXPECT_EQ(s.dependents(3), std::vector<GeneratorIndex>({1, 2}));
    // Leaves before their dependents.
    const auto& topo = s.topologicalOrder();
    auto pos = [&](GeneratorIndex g) {
        return std::find(topo.begin(), topo.end(), g) - topo.begin();
    };
    EXPECT_LT(pos(3), pos(1));
    EXPECT_LT(pos(3), pos(2));
    EXPECT_LT(pos(1), pos(0));
    EXPECT_LT(pos(2), pos(0));
}

TEST(ScheduleTest, DanglingReference) {
    std::vector<GeneratorDecl> decls = {union_of("top", {"ghost"})};
    try {
        DependencyScheduler::build(graphSchema(), decls);
        FAIL() << "expected DanglingReferenceError";
    } catch (const DanglingReferenceError& e) {
        EXPECT_EQ(e.location(), "generators[0].wiring.boxes[0]");
    }

    ProductSpec p;
    p.dimensions = {"ghost"};
    EXPECT_THROW(DependencyScheduler::build(graphSchema(),
                                            {GeneratorDecl::multiplicative("prod", p)}),
                 DanglingReferenceError);
}

TEST(ScheduleTest, DuplicateAndInvalidIds) {
    EXPECT_THROW(DependencyScheduler::build(graphSchema(), {leaf("x"), leaf("x")}),
                 DuplicateIdError);
    EXPECT_THROW(DependencyScheduler::build(graphSchema(), {leaf("")}), MissingFieldError);
    EXPECT_THROW(DependencyScheduler::build(graphSchema(), {leaf("a/b")}), ConfigError);
    EXPECT_THROW(DependencyScheduler::build(graphSchema(), {}), MissingFieldError);
    EXPECT_THROW(DependencyScheduler::build(nullptr, {leaf("x")}), MissingFieldError);
}

TEST(ScheduleTest, CycleReportsPath) {
    std::vector<GeneratorDecl> decls = {union_of("a", {"b"}), union_of("b", {"c"}),
                                        union_of("c", {"a"})};
    try {
        DependencyScheduler::build(graphSchema(), decls);
        FAIL() << "expected CycleError";
    } catch (const CycleError& e) {
        EXPECT_EQ(e.cycle(), std::vector<std::string>({"a", "b", "c", "a"}));
    }
}

TEST(ScheduleTest, SelfReferenceIsCycle) {
    EXPECT_THROW(DependencyScheduler::build(graphSchema(), {union_of("a", {"a"})}), CycleError);
}

TEST(ScheduleTest, MultipleRoots) {
    std::vector<GeneratorDecl> decls = {leaf("x"), leaf("y")};
    try {
        DependencyScheduler::build(graphSchema(), decls);
        FAIL() << "expected MultipleRootsError";
    } catch (const MultipleRootsError& e) {
        EXPECT_EQ(e.roots(), std::vector<std::string>({"x", "y"}));
    }

    ScheduleOptions opts;
    opts.allow_multiple_roots = true;
    Schedule s = DependencyScheduler::build(graphSchema(), decls, opts);
    EXPECT_EQ(s.roots(), std::vector<GeneratorIndex>({0, 1}));
    EXPECT_THROW(s.root(), MultipleRootsError);
}

TEST(ScheduleTest, PrimitiveNeedsSource) {
    EXPECT_THROW(DependencyScheduler::build(graphSchema(),
                                            {GeneratorDecl::primitive("p", nullptr)}),
                 MissingFieldError);
}

TEST(ScheduleTest, PortConstraintOutsideOverlap) {
    WiringPattern w;
    w.boxes = {{"a", "e"}, {"b", "e2"}};
    w.ports = {{"pa", "a", {HomConstraint::fixTarget(kV, 3, 0)}}, {"pb", "b", {}}};
    w.junctions = {{"j", vertices(1)}};
    w.wires = {{"pa", "j"}, {"pb", "j"}};
    std::vector<GeneratorDecl> decls = {GeneratorDecl::additive("top", w), leaf("e"), leaf("e2")};
    EXPECT_THROW(DependencyScheduler::build(graphSchema(), decls), SchemaMismatchError);
}

TEST(ScheduleTest, ForeignSchemaJunction) {
    auto other = std::make_shared<Schema>("Sets");
    other->addObject("X");
    InstanceBuilder b(other);
    b.addElements("X", 1);

    WiringPattern w;
    w.boxes = {{"a", "e"}};
    w.junctions = {{"j", b.build()}};
    std::vector<GeneratorDecl> decls = {GeneratorDecl::additive("top", w), leaf("e")};
    EXPECT_THROW(DependencyScheduler::build(graphSchema(), decls), SchemaMismatchError);
}
