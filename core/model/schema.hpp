#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace modex {

/// A typed relation (total function) between two schema objects.
struct Relation {
    std::string name;
    size_t dom = 0;
    size_t codom = 0;
};

// ─── Schema ────────────────────────────────────────────────────
// Fixed set of entity types (objects) and typed relations between
// them. Shared by every instance of one search space.

class Schema {
public:
    explicit Schema(std::string name = "");

    size_t addObject(const std::string& name);
    size_t addRelation(const std::string& name, const std::string& dom, const std::string& codom);

    const std::string& name() const { return name_; }
    size_t objectCount() const { return objects_.size(); }
    size_t relationCount() const { return relations_.size(); }

    const std::string& objectName(size_t object) const { return objects_.at(object); }
    const Relation& relation(size_t relation) const { return relations_.at(relation); }

    /// Index lookups; throw SchemaMismatchError for unknown names.
    size_t objectIndex(const std::string& name) const;
    size_t relationIndex(const std::string& name) const;

    std::optional<size_t> findObject(const std::string& name) const;
    std::optional<size_t> findRelation(const std::string& name) const;

    /// Relations whose domain (resp. codomain) is the given object.
    std::vector<size_t> relationsFrom(size_t object) const;
    std::vector<size_t> relationsInto(size_t object) const;

    bool operator==(const Schema& other) const;
    bool operator!=(const Schema& other) const { return !(*this == other); }

private:
    std::string name_;
    std::vector<std::string> objects_;
    std::vector<Relation> relations_;
    std::unordered_map<std::string, size_t> object_index_;
    std::unordered_map<std::string, size_t> relation_index_;
};

using SchemaPtr = std::shared_ptr<const Schema>;

} // namespace modex
