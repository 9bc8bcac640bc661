#include "generators/generator.hpp"
#include "common/errors.hpp"

namespace modex {

std::optional<InstancePtr> ExplicitSource::at(size_t index) const {
    if (index >= instances_.size()) return std::nullopt;
    return instances_[index];
}

std::optional<InstancePtr> FunctionSource::at(size_t index) const {
    if (limit_ && index >= *limit_) return std::nullopt;
    return fn_(index);
}

OutputConstraint OutputConstraint::filterBy(std::string name, FilterFn fn) {
    OutputConstraint c;
    c.kind = Kind::Filter;
    c.name = std::move(name);
    c.filter = std::move(fn);
    return c;
}

OutputConstraint OutputConstraint::chaseWith(std::string name, ChaseFn fn) {
    OutputConstraint c;
    c.kind = Kind::Chase;
    c.name = std::move(name);
    c.chase = std::move(fn);
    return c;
}

std::optional<InstancePtr> OutputConstraint::apply(const InstancePtr& candidate) const {
    if (kind == Kind::Chase) return chase(candidate);
    if (filter(*candidate)) return candidate;
    return std::nullopt;
}

Sharing parseSharing(const std::string& name) {
    if (name == "shared") return Sharing::Shared;
    if (name == "reentrant") return Sharing::Reentrant;
    throw ConfigError("unknown sharing policy '" + name + "' (expected shared or reentrant)");
}

std::string sharingName(Sharing sharing) {
    switch (sharing) {
        case Sharing::Unspecified: return "unspecified";
        case Sharing::Shared: return "shared";
        case Sharing::Reentrant: return "reentrant";
    }
    return "?";
}

namespace {

template <class... Ts> struct Overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

} // namespace

std::vector<std::string> GeneratorDecl::dependencies() const {
    return std::visit(Overloaded{
        [](const PrimitiveSpec&) { return std::vector<std::string>{}; },
        [](const AdditiveSpec& spec) {
            std::vector<std::string> out;
            for (const auto& box : spec.wiring.boxes) out.push_back(box.generator);
            return out;
        },
        [](const MultiplicativeSpec& spec) { return spec.product.dimensions; },
    }, kind);
}

std::string GeneratorDecl::kindName() const {
    return std::visit(Overloaded{
        [](const PrimitiveSpec&) { return std::string("primitive"); },
        [](const AdditiveSpec&) { return std::string("additive"); },
        [](const MultiplicativeSpec&) { return std::string("multiplicative"); },
    }, kind);
}

GeneratorDecl GeneratorDecl::primitive(std::string id, std::shared_ptr<const PrimitiveSource> source) {
    GeneratorDecl decl;
    decl.id = std::move(id);
    decl.kind = PrimitiveSpec{std::move(source)};
    return decl;
}

GeneratorDecl GeneratorDecl::additive(std::string id, WiringPattern wiring) {
    GeneratorDecl decl;
    decl.id = std::move(id);
    decl.kind = AdditiveSpec{std::move(wiring)};
    return decl;
}

GeneratorDecl GeneratorDecl::multiplicative(std::string id, ProductSpec product) {
    GeneratorDecl decl;
    decl.id = std::move(id);
    decl.kind = MultiplicativeSpec{std::move(product)};
    return decl;
}

} // namespace modex
