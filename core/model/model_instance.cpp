#include "model/model_instance.hpp"
#include "common/errors.hpp"
#include "common/hash.hpp"

#include <sstream>

namespace modex {

// ─── ModelInstance ─────────────────────────────────────────────

InstancePtr ModelInstance::empty(SchemaPtr schema) {
    return InstanceBuilder(std::move(schema)).build();
}

InstancePtr ModelInstance::terminal(SchemaPtr schema) {
    InstanceBuilder builder(schema);
    for (size_t o = 0; o < schema->objectCount(); o++) {
        builder.addElement(o);
    }
    for (size_t r = 0; r < schema->relationCount(); r++) {
        builder.setRelation(r, 0, 0);
    }
    return builder.build();
}

size_t ModelInstance::count(const std::string& object) const {
    return counts_.at(schema_->objectIndex(object));
}

size_t ModelInstance::totalElements() const {
    size_t total = 0;
    for (size_t c : counts_) total += c;
    return total;
}

size_t ModelInstance::apply(const std::string& relation, size_t element) const {
    return apply(schema_->relationIndex(relation), element);
}

bool ModelInstance::hasTag(size_t object, size_t element, const std::string& tag) const {
    return tags_.at(object).at(element).count(tag) > 0;
}

std::vector<size_t> ModelInstance::elementsWithTag(size_t object, const std::string& tag) const {
    std::vector<size_t> out;
    for (size_t e = 0; e < counts_.at(object); e++) {
        if (tags_[object][e].count(tag)) out.push_back(e);
    }
    return out;
}

bool ModelInstance::operator==(const ModelInstance& other) const {
    if (schema_ != other.schema_ && !(*schema_ == *other.schema_)) return false;
    if (fingerprint_ != other.fingerprint_) return false;
    return counts_ == other.counts_ &&
           relations_ == other.relations_ &&
           tags_ == other.tags_;
}

std::string ModelInstance::describe() const {
    std::ostringstream out;
    for (size_t o = 0; o < counts_.size(); o++) {
        if (o > 0) out << " ";
        out << schema_->objectName(o) << "=" << counts_[o];
    }
    return out.str();
}

void ModelInstance::forEachElement(
    const std::function<void(size_t object, size_t element)>& fn) const {
    for (size_t o = 0; o < counts_.size(); o++) {
        for (size_t e = 0; e < counts_[o]; e++) {
            fn(o, e);
        }
    }
}

// ─── InstanceBuilder ───────────────────────────────────────────

InstanceBuilder::InstanceBuilder(SchemaPtr schema)
    : schema_(std::move(schema)) {
    if (!schema_) {
        throw SchemaMismatchError("instance builder needs a schema");
    }
    counts_.assign(schema_->objectCount(), 0);
    relations_.resize(schema_->relationCount());
    tags_.resize(schema_->objectCount());
}

InstanceBuilder InstanceBuilder::from(const ModelInstance& instance) {
    InstanceBuilder builder(instance.schema());
    builder.counts_ = instance.counts_;
    builder.relations_ = instance.relations_;
    builder.tags_ = instance.tags_;
    return builder;
}

size_t InstanceBuilder::addElement(size_t object) {
    return addElements(object, 1);
}

size_t InstanceBuilder::addElement(const std::string& object) {
    return addElements(schema_->objectIndex(object), 1);
}

size_t InstanceBuilder::addElements(size_t object, size_t n) {
    if (object >= counts_.size()) {
        throw SchemaMismatchError("object index out of range: " + std::to_string(object));
    }
    size_t first = counts_[object];
    counts_[object] += n;
    tags_[object].resize(counts_[object]);
    for (size_t r = 0; r < schema_->relationCount(); r++) {
        if (schema_->relation(r).dom == object) {
            relations_[r].resize(counts_[object], kUnset);
        }
    }
    return first;
}

size_t InstanceBuilder::addElements(const std::string& object, size_t n) {
    return addElements(schema_->objectIndex(object), n);
}

void InstanceBuilder::setRelation(size_t relation, size_t from, size_t to) {
    if (relation >= relations_.size()) {
        throw SchemaMismatchError("relation index out of range: " + std::to_string(relation));
    }
    const Relation& rel = schema_->relation(relation);
    if (from >= counts_[rel.dom]) {
        throw SchemaMismatchError("relation '" + rel.name + "': no element " +
                                  std::to_string(from) + " in " + schema_->objectName(rel.dom));
    }
    relations_[relation][from] = to;
}

void InstanceBuilder::setRelation(const std::string& relation, size_t from, size_t to) {
    setRelation(schema_->relationIndex(relation), from, to);
}

void InstanceBuilder::addTag(size_t object, size_t element, const std::string& tag) {
    if (object >= counts_.size() || element >= counts_[object]) {
        throw SchemaMismatchError("cannot tag missing element " + std::to_string(element));
    }
    tags_[object][element].insert(tag);
}

void InstanceBuilder::addTag(const std::string& object, size_t element, const std::string& tag) {
    addTag(schema_->objectIndex(object), element, tag);
}

InstancePtr InstanceBuilder::build() const {
    for (size_t r = 0; r < relations_.size(); r++) {
        const Relation& rel = schema_->relation(r);
        const auto& values = relations_[r];
        for (size_t x = 0; x < values.size(); x++) {
            if (values[x] == kUnset) {
                throw SchemaMismatchError("relation '" + rel.name + "' undefined at element " +
                                          std::to_string(x));
            }
            if (values[x] >= counts_[rel.codom]) {
                throw SchemaMismatchError("relation '" + rel.name + "' maps " + std::to_string(x) +
                                          " outside " + schema_->objectName(rel.codom));
            }
        }
    }

    std::shared_ptr<ModelInstance> instance(new ModelInstance());
    instance->schema_ = schema_;
    instance->counts_ = counts_;
    instance->relations_ = relations_;
    instance->tags_ = tags_;

    Fnv1a hash;
    for (size_t c : counts_) hash.add(static_cast<uint64_t>(c));
    for (const auto& values : relations_) {
        for (size_t v : values) hash.add(static_cast<uint64_t>(v));
    }
    for (const auto& per_object : tags_) {
        for (const auto& element_tags : per_object) {
            hash.add(static_cast<uint64_t>(element_tags.size()));
            for (const auto& tag : element_tags) hash.add(tag);
        }
    }
    instance->fingerprint_ = hash.value();
    return instance;
}

} // namespace modex
