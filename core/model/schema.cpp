#include "model/schema.hpp"
#include "common/errors.hpp"

namespace modex {

Schema::Schema(std::string name) : name_(std::move(name)) {}

size_t Schema::addObject(const std::string& name) {
    if (object_index_.count(name)) {
        throw SchemaMismatchError("object already declared: " + name);
    }
    size_t index = objects_.size();
    objects_.push_back(name);
    object_index_[name] = index;
    return index;
}

size_t Schema::addRelation(const std::string& name, const std::string& dom,
                           const std::string& codom) {
    if (relation_index_.count(name)) {
        throw SchemaMismatchError("relation already declared: " + name);
    }
    Relation rel;
    rel.name = name;
    rel.dom = objectIndex(dom);
    rel.codom = objectIndex(codom);

    size_t index = relations_.size();
    relations_.push_back(rel);
    relation_index_[name] = index;
    return index;
}

size_t Schema::objectIndex(const std::string& name) const {
    auto it = object_index_.find(name);
    if (it == object_index_.end()) {
        throw SchemaMismatchError("unknown object '" + name + "' in schema '" + name_ + "'");
    }
    return it->second;
}

size_t Schema::relationIndex(const std::string& name) const {
    auto it = relation_index_.find(name);
    if (it == relation_index_.end()) {
        throw SchemaMismatchError("unknown relation '" + name + "' in schema '" + name_ + "'");
    }
    return it->second;
}

std::optional<size_t> Schema::findObject(const std::string& name) const {
    auto it = object_index_.find(name);
    if (it == object_index_.end()) return std::nullopt;
    return it->second;
}

std::optional<size_t> Schema::findRelation(const std::string& name) const {
    auto it = relation_index_.find(name);
    if (it == relation_index_.end()) return std::nullopt;
    return it->second;
}

std::vector<size_t> Schema::relationsFrom(size_t object) const {
    std::vector<size_t> out;
    for (size_t r = 0; r < relations_.size(); r++) {
        if (relations_[r].dom == object) out.push_back(r);
    }
    return out;
}

std::vector<size_t> Schema::relationsInto(size_t object) const {
    std::vector<size_t> out;
    for (size_t r = 0; r < relations_.size(); r++) {
        if (relations_[r].codom == object) out.push_back(r);
    }
    return out;
}

bool Schema::operator==(const Schema& other) const {
    if (objects_ != other.objects_) return false;
    if (relations_.size() != other.relations_.size()) return false;
    for (size_t r = 0; r < relations_.size(); r++) {
        const Relation& a = relations_[r];
        const Relation& b = other.relations_[r];
        if (a.name != b.name || a.dom != b.dom || a.codom != b.codom) return false;
    }
    return true;
}

} // namespace modex
