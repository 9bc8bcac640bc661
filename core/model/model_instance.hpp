#pragma once

#include "model/schema.hpp"

#include <cstdint>
#include <functional>
#include <limits>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace modex {

class ModelInstance;
using InstancePtr = std::shared_ptr<const ModelInstance>;

// ─── ModelInstance ─────────────────────────────────────────────
// Immutable finite realization of a Schema. Elements of object X are
// 0..count(X)-1; each relation is a total function stored as a vector
// indexed by domain element. Elements may carry string tags that
// interface constraints refer to. Built only through InstanceBuilder.

class ModelInstance {
public:
    /// Instance with no elements at all.
    static InstancePtr empty(SchemaPtr schema);

    /// One element per object, every relation maps 0 -> 0.
    static InstancePtr terminal(SchemaPtr schema);

    const SchemaPtr& schema() const { return schema_; }

    size_t count(size_t object) const { return counts_.at(object); }
    size_t count(const std::string& object) const;
    size_t totalElements() const;
    bool isEmpty() const { return totalElements() == 0; }

    /// Value of relation at a domain element.
    size_t apply(size_t relation, size_t element) const {
        return relations_.at(relation).at(element);
    }
    size_t apply(const std::string& relation, size_t element) const;
    const std::vector<size_t>& relationValues(size_t relation) const {
        return relations_.at(relation);
    }

    const std::set<std::string>& tags(size_t object, size_t element) const {
        return tags_.at(object).at(element);
    }
    bool hasTag(size_t object, size_t element, const std::string& tag) const;
    std::vector<size_t> elementsWithTag(size_t object, const std::string& tag) const;

    /// Structural fingerprint; equal instances have equal fingerprints.
    uint64_t fingerprint() const { return fingerprint_; }

    bool operator==(const ModelInstance& other) const;
    bool operator!=(const ModelInstance& other) const { return !(*this == other); }

    /// Short "E=2 V=3" style summary for logs.
    std::string describe() const;

    void forEachElement(const std::function<void(size_t object, size_t element)>& fn) const;

private:
    friend class InstanceBuilder;
    ModelInstance() = default;

    SchemaPtr schema_;
    std::vector<size_t> counts_;
    std::vector<std::vector<size_t>> relations_;
    std::vector<std::vector<std::set<std::string>>> tags_;
    uint64_t fingerprint_ = 0;
};

// ─── InstanceBuilder ───────────────────────────────────────────
// Mutable staging area for a ModelInstance. build() checks that every
// relation is total and in range.

class InstanceBuilder {
public:
    static constexpr size_t kUnset = std::numeric_limits<size_t>::max();

    explicit InstanceBuilder(SchemaPtr schema);

    /// Start from an existing instance (copies elements, relations and tags).
    static InstanceBuilder from(const ModelInstance& instance);

    size_t addElement(size_t object);
    size_t addElement(const std::string& object);

    /// Add n elements, returning the index of the first one.
    size_t addElements(size_t object, size_t n);
    size_t addElements(const std::string& object, size_t n);

    void setRelation(size_t relation, size_t from, size_t to);
    void setRelation(const std::string& relation, size_t from, size_t to);

    void addTag(size_t object, size_t element, const std::string& tag);
    void addTag(const std::string& object, size_t element, const std::string& tag);

    size_t count(size_t object) const { return counts_.at(object); }
    const SchemaPtr& schema() const { return schema_; }

    /// Throws SchemaMismatchError when a relation is partial or out of range.
    InstancePtr build() const;

private:
    SchemaPtr schema_;
    std::vector<size_t> counts_;
    std::vector<std::vector<size_t>> relations_;
    std::vector<std::vector<std::set<std::string>>> tags_;
};

} // namespace modex
