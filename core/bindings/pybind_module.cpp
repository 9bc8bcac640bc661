// PyBind11 bindings for the modex C++ core.
// Exposes the data model, homomorphism search, the loader and the driver.

// NOTE: Requires pybind11 to be installed.
// Build with: cmake -DMODEX_BUILD_PYTHON_BINDINGS=ON

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/functional.h>

#include "model/schema.hpp"
#include "model/model_instance.hpp"
#include "homomorphism/homomorphism.hpp"
#include "homomorphism/hom_searcher.hpp"
#include "config/search_space_loader.hpp"
#include "search/search_driver.hpp"
#include "common/errors.hpp"
#include "common/log.hpp"

#include <memory>
#include <random>

namespace py = pybind11;

PYBIND11_MODULE(modex_bindings, m) {
    m.doc() = "modex C++ core bindings";

    // ── Errors ──
    auto modex_error = py::register_exception<modex::ModexError>(m, "ModexError");
    py::register_exception<modex::ConfigError>(m, "ConfigError", modex_error.ptr());
    py::register_exception<modex::CompositionError>(m, "CompositionError", modex_error.ptr());
    py::register_exception<modex::CheckpointError>(m, "CheckpointError", modex_error.ptr());

    m.def("set_log_level", [](const std::string& level) {
        modex::setLogLevel(modex::parseLogLevel(level));
    });

    // ── Schema ──
    py::class_<modex::Schema, std::shared_ptr<modex::Schema>>(m, "Schema")
        .def(py::init<std::string>(), py::arg("name") = "")
        .def("add_object", &modex::Schema::addObject)
        .def("add_relation", &modex::Schema::addRelation)
        .def("name", &modex::Schema::name)
        .def("object_count", &modex::Schema::objectCount)
        .def("relation_count", &modex::Schema::relationCount)
        .def("object_name", &modex::Schema::objectName)
        .def("object_index", &modex::Schema::objectIndex)
        .def("relation_index", &modex::Schema::relationIndex);

    // ── ModelInstance ──
    py::class_<modex::ModelInstance, std::shared_ptr<modex::ModelInstance>>(m, "ModelInstance")
        .def("count", py::overload_cast<const std::string&>(&modex::ModelInstance::count, py::const_))
        .def("total_elements", &modex::ModelInstance::totalElements)
        .def("apply", py::overload_cast<const std::string&, size_t>(
                          &modex::ModelInstance::apply, py::const_))
        .def("tags", &modex::ModelInstance::tags)
        .def("fingerprint", &modex::ModelInstance::fingerprint)
        .def("describe", &modex::ModelInstance::describe)
        .def("__eq__", [](const modex::ModelInstance& a, const modex::ModelInstance& b) {
            return a == b;
        })
        .def("__repr__", [](const modex::ModelInstance& inst) {
            return "<ModelInstance " + inst.describe() + ">";
        });

    // ── InstanceBuilder ──
    py::class_<modex::InstanceBuilder>(m, "InstanceBuilder")
        .def(py::init([](std::shared_ptr<modex::Schema> schema) {
            return modex::InstanceBuilder(std::move(schema));
        }))
        .def("add_elements", py::overload_cast<const std::string&, size_t>(
                                 &modex::InstanceBuilder::addElements))
        .def("set_relation", py::overload_cast<const std::string&, size_t, size_t>(
                                 &modex::InstanceBuilder::setRelation))
        .def("add_tag", py::overload_cast<const std::string&, size_t, const std::string&>(
                            &modex::InstanceBuilder::addTag))
        .def("build", [](const modex::InstanceBuilder& b) {
            return std::const_pointer_cast<modex::ModelInstance>(b.build());
        });

    // ── Homomorphism search ──
    py::class_<modex::Homomorphism>(m, "Homomorphism")
        .def_readonly("components", &modex::Homomorphism::components)
        .def("__call__", &modex::Homomorphism::operator());

    py::enum_<modex::StrategyKind>(m, "StrategyKind")
        .value("AUTO", modex::StrategyKind::Auto)
        .value("EXHAUSTIVE", modex::StrategyKind::Exhaustive)
        .value("BACKTRACKING", modex::StrategyKind::Backtracking);

    py::class_<modex::HomSearchOptions>(m, "HomSearchOptions")
        .def(py::init<>())
        .def_readwrite("strategy", &modex::HomSearchOptions::strategy)
        .def_readwrite("injective", &modex::HomSearchOptions::injective)
        .def_readwrite("exhaustive_limit", &modex::HomSearchOptions::exhaustive_limit);

    py::class_<modex::HomSearcher>(m, "HomSearcher")
        .def(py::init<modex::HomSearchOptions>(), py::arg("options") = modex::HomSearchOptions{})
        .def("find_all", [](const modex::HomSearcher& s, const modex::ModelInstance& src,
                            const modex::ModelInstance& tgt) {
            return s.findAll(src, tgt, {}).maps;
        })
        .def("find_one", [](const modex::HomSearcher& s, const modex::ModelInstance& src,
                            const modex::ModelInstance& tgt, uint32_t seed) {
            std::mt19937 rng(seed);
            return s.findOne(src, tgt, {}, rng);
        }, py::arg("source"), py::arg("target"), py::arg("seed") = 0);

    // ── Search ──
    py::enum_<modex::SearchStatus>(m, "SearchStatus")
        .value("SUCCESS", modex::SearchStatus::Success)
        .value("EXHAUSTED", modex::SearchStatus::Exhausted)
        .value("TIMEOUT", modex::SearchStatus::Timeout);

    py::class_<modex::SearchOutcome>(m, "SearchOutcome")
        .def_readonly("status", &modex::SearchOutcome::status)
        .def_property_readonly("best", [](const modex::SearchOutcome& o) {
            return std::const_pointer_cast<modex::ModelInstance>(o.best);
        })
        .def_readonly("best_score", &modex::SearchOutcome::best_score)
        .def_readonly("best_stream", &modex::SearchOutcome::best_stream)
        .def_readonly("emitted", &modex::SearchOutcome::emitted)
        .def_readonly("elapsed_seconds", &modex::SearchOutcome::elapsed_seconds);

    m.def("run_file", [](const std::string& path, py::object seed, py::object iterations) {
        modex::SearchSpaceLoader loader;
        modex::SearchSpaceSpec spec = loader.loadFile(path);
        if (!seed.is_none()) spec.options.seed = seed.cast<uint64_t>();
        if (!iterations.is_none()) spec.options.iterations = iterations.cast<size_t>();
        modex::Schedule schedule = spec.buildSchedule();
        modex::SearchDriver driver(schedule, spec.options);
        return driver.run();
    }, py::arg("path"), py::arg("seed") = py::none(), py::arg("iterations") = py::none());
}
