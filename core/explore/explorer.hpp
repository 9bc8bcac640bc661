#pragma once

#include "compose/additive_composer.hpp"
#include "compose/multiplicative_composer.hpp"
#include "explore/stream_state.hpp"
#include "homomorphism/hom_searcher.hpp"
#include "schedule/dependency_scheduler.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>

namespace modex {

struct ExplorerOptions {
    uint64_t seed = 0;
    HomSearchOptions homomorphism;
    SearchBudget hom_budget;        // per homomorphism search
};

// ─── Explorer ──────────────────────────────────────────────────
// Lazy, reproducible enumeration of every stream of a Schedule.
//
// Stream keys: a shared generator has a single stream keyed by its id.
// A reentrant generator gets one stream per referencing slot, keyed
// "<parent key>/<slot>" where slot is the box id (additive) or
// "dim<i>" (multiplicative). A generator without a sharing declaration
// follows the stream that references it.
//
// Composite streams pull their children only as far as the current
// candidate needs. Each composition attempt uses an rng seeded from
// (search seed, stream key, attempt number).

class Explorer {
public:
    explicit Explorer(const Schedule& schedule, ExplorerOptions options = {});

    Explorer(const Explorer&) = delete;
    Explorer& operator=(const Explorer&) = delete;

    /// Key of the single root stream. Throws MultipleRootsError.
    std::string rootKey() const;
    std::vector<std::string> rootKeys() const;

    /// Next emission of a stream, or nullopt once it is exhausted.
    /// Any generator id is a valid key; nested reentrant keys exist once
    /// their parent stream has been touched.
    std::optional<InstancePtr> next(const std::string& key);

    /// The k-th emission (0-based), pulling lazily until it exists.
    std::optional<InstancePtr> at(const std::string& key, size_t k);

    const History& history(const std::string& key);
    bool exhausted(const std::string& key);
    ExhaustionReason reason(const std::string& key);

    /// Successful PrimitiveSource::at calls made for a generator.
    uint64_t drawCount(const std::string& generator_id) const;

    const StreamState& state(const std::string& key);
    std::vector<std::string> streamKeys() const;

    const Schedule& schedule() const { return schedule_; }
    const ExplorerOptions& options() const { return options_; }

    /// Seed of the composition rng for one attempt of a stream.
    static uint32_t attemptSeed(uint64_t search_seed, const std::string& key, uint64_t attempt);

private:
    friend class Checkpoint;

    struct Candidate {
        InstancePtr instance;
        ConstraintSet exposed;
    };

    StreamState& stream(const std::string& key);
    StreamState& createStream(const std::string& key, GeneratorIndex generator,
                              const std::string& parent_key);
    std::string childKey(const std::string& parent_key, GeneratorIndex parent,
                         GeneratorIndex child, const std::string& slot) const;

    std::optional<InstancePtr> advance(StreamState& s);
    std::optional<Candidate> nextPrimitive(StreamState& s, std::vector<size_t>& position);
    std::optional<Candidate> nextAdditive(StreamState& s, std::vector<size_t>& position,
                                          uint32_t& seed);
    std::optional<Candidate> nextProduct(StreamState& s, std::vector<size_t>& position,
                                         uint32_t& seed);

    bool available(const std::string& key, size_t k) { return at(key, k).has_value(); }

    // Deterministic production from a recorded position.
    Candidate composeAdditive(const StreamState& s, const std::vector<size_t>& position,
                              uint32_t seed) const;
    Candidate composeProduct(const StreamState& s, const std::vector<size_t>& position,
                             uint32_t seed) const;

    /// Chases then filters; nullopt when rejected. `rejected_by` names
    /// the rejecting constraint.
    std::optional<InstancePtr> applyOutputConstraints(const GeneratorDecl& decl,
                                                      InstancePtr candidate,
                                                      std::string& rejected_by) const;
    std::optional<double> score(const StreamState& s, const ModelInstance& instance) const;
    LossContext lossContext(const StreamState& s) const;
    void recordSkip(StreamState& s, const std::string& why);
    void accept(StreamState& s, const Candidate& candidate, std::vector<size_t> position,
                uint32_t seed);

    const Schedule& schedule_;
    ExplorerOptions options_;
    HomSearcher searcher_;
    AdditiveComposer additive_;
    MultiplicativeComposer multiplicative_;

    std::map<std::string, StreamState> streams_;
    std::unordered_map<std::string, uint64_t> draws_;
};

} // namespace modex
