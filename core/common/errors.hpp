#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace modex {

// ─── Error hierarchy ───────────────────────────────────────────
// ConfigError and its subclasses are raised while a search space is
// built and are fatal. CompositionError subclasses reject a single
// candidate and are recovered by the exploration engine.

class ModexError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Malformed or inconsistent search-space configuration.
/// location() is a path into the configuration document, possibly empty.
class ConfigError : public ModexError {
public:
    explicit ConfigError(const std::string& message, std::string location = "")
        : ModexError(location.empty() ? message : location + ": " + message),
          location_(std::move(location)), detail_(message) {}

    const std::string& location() const { return location_; }
    const std::string& detail() const { return detail_; }

private:
    std::string location_;
    std::string detail_;
};

class CycleError : public ConfigError {
public:
    explicit CycleError(std::vector<std::string> cycle)
        : ConfigError("dependency cycle: " + join(cycle)), cycle_(std::move(cycle)) {}

    const std::vector<std::string>& cycle() const { return cycle_; }

private:
    static std::string join(const std::vector<std::string>& ids) {
        std::string out;
        for (const auto& id : ids) {
            if (!out.empty()) out += " -> ";
            out += id;
        }
        return out;
    }

    std::vector<std::string> cycle_;
};

class MultipleRootsError : public ConfigError {
public:
    explicit MultipleRootsError(std::vector<std::string> roots)
        : ConfigError("more than one root generator: " + list(roots)),
          roots_(std::move(roots)) {}

    const std::vector<std::string>& roots() const { return roots_; }

private:
    static std::string list(const std::vector<std::string>& ids) {
        std::string out;
        for (const auto& id : ids) {
            if (!out.empty()) out += ", ";
            out += "'" + id + "'";
        }
        return out;
    }

    std::vector<std::string> roots_;
};

class DanglingReferenceError : public ConfigError {
public:
    using ConfigError::ConfigError;
};

class DuplicateIdError : public ConfigError {
public:
    using ConfigError::ConfigError;
};

class MissingFieldError : public ConfigError {
public:
    using ConfigError::ConfigError;
};

class SharingPolicyError : public ConfigError {
public:
    using ConfigError::ConfigError;
};

class SchemaMismatchError : public ConfigError {
public:
    using ConfigError::ConfigError;
};

/// A single composition attempt failed; the candidate is inadmissible.
class CompositionError : public ModexError {
public:
    using ModexError::ModexError;
};

class NoHomomorphism : public CompositionError {
public:
    using CompositionError::CompositionError;
};

class SearchTimeout : public CompositionError {
public:
    using CompositionError::CompositionError;
};

/// Too many consecutive inadmissible candidates in one stream.
class LayerExhausted : public ModexError {
public:
    explicit LayerExhausted(std::string stream)
        : ModexError("layer exhausted: " + stream), stream_(std::move(stream)) {}

    const std::string& stream() const { return stream_; }

private:
    std::string stream_;
};

class CheckpointError : public ModexError {
public:
    using ModexError::ModexError;
};

} // namespace modex
