/**
 * PyBind11 entry point for looptrim.
 *
 * Exposes loop parsing, alignment building, the residue index mapper and
 * model ranking so a Python-hosted modeling engine can drive the residue
 * selection directly.
 */

#include <pybind11/functional.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <optional>
#include <string>
#include <vector>

#include "looptrim/common/result_types.h"
#include "looptrim/errors/error_categories.h"
#include "looptrim/errors/looptrim_error.h"
#include "looptrim/modules/alignment/alignment_builder.h"
#include "looptrim/modules/loops/loop_spec.h"
#include "looptrim/modules/mapping/residue_index_mapper.h"
#include "looptrim/modules/ranking/model_ranker.h"

namespace py = pybind11;

namespace lt = looptrim;

PYBIND11_MODULE(_looptrim_cpp, m) {
    m.doc() = "looptrim - loop trimming bookkeeping for homology modeling";
    m.attr("__version__") = "0.1.0";

    // ----------------------- Custom Exception Types -----------------------
    static py::exception<lt::errors::LooptrimError> exc_looptrim(m, "LooptrimError");
    static py::exception<lt::errors::ParseError> exc_parse(m, "ParseError", PyExc_ValueError);
    static py::exception<lt::errors::ConfigError> exc_config(m, "ConfigError", PyExc_ValueError);
    static py::exception<lt::errors::FileNotFoundError> exc_file_not_found(m, "FileNotFoundError", PyExc_FileNotFoundError);
    static py::exception<lt::errors::FileWriteError> exc_file_write(m, "FileWriteError", PyExc_OSError);
    static py::exception<lt::errors::FormatError> exc_format(m, "FormatError", PyExc_ValueError);
    static py::exception<lt::errors::IndexError> exc_index(m, "IndexError", PyExc_IndexError);
    static py::exception<lt::errors::NoValidModelError> exc_no_model(m, "NoValidModelError", PyExc_RuntimeError);

    py::register_exception_translator([](std::exception_ptr p) {
        try {
            if (p) std::rethrow_exception(p);
        } catch (const lt::errors::ParseError& e) {
            py::set_error(exc_parse, e.formatted().c_str());
        } catch (const lt::errors::ConfigError& e) {
            py::set_error(exc_config, e.formatted().c_str());
        } catch (const lt::errors::FileNotFoundError& e) {
            py::set_error(exc_file_not_found, e.formatted().c_str());
        } catch (const lt::errors::FileWriteError& e) {
            py::set_error(exc_file_write, e.formatted().c_str());
        } catch (const lt::errors::FormatError& e) {
            py::set_error(exc_format, e.formatted().c_str());
        } catch (const lt::errors::IndexError& e) {
            py::set_error(exc_index, e.formatted().c_str());
        } catch (const lt::errors::NoValidModelError& e) {
            py::set_error(exc_no_model, e.formatted().c_str());
        } catch (const lt::errors::LooptrimError& e) {
            py::set_error(exc_looptrim, e.formatted().c_str());
        }
    });

    py::enum_<lt::errors::ErrorCategory>(m, "ErrorCategory")
        .value("FileIO", lt::errors::ErrorCategory::FileIO)
        .value("Validation", lt::errors::ErrorCategory::Validation)
        .value("Format", lt::errors::ErrorCategory::Format)
        .value("Algorithm", lt::errors::ErrorCategory::Algorithm)
        .value("UserError", lt::errors::ErrorCategory::UserError)
        .export_values();

    // ----------------------- Loops -----------------------
    py::class_<lt::loops::LoopSpec>(m, "LoopSpec")
        .def(py::init([](int start, int end, int keep_n, int keep_c) {
                 lt::loops::LoopSpec loop{start, end, keep_n, keep_c};
                 lt::loops::validate_loop_spec(loop);
                 return loop;
             }),
             py::arg("start"), py::arg("end"), py::arg("keep_n"), py::arg("keep_c"))
        .def_readonly("start", &lt::loops::LoopSpec::start)
        .def_readonly("end", &lt::loops::LoopSpec::end)
        .def_readonly("keep_n", &lt::loops::LoopSpec::keep_n)
        .def_readonly("keep_c", &lt::loops::LoopSpec::keep_c)
        .def_property_readonly("trimmed_start", &lt::loops::LoopSpec::trimmed_start)
        .def_property_readonly("trimmed_end", &lt::loops::LoopSpec::trimmed_end)
        .def_property_readonly("trimmed_length", &lt::loops::LoopSpec::trimmed_length)
        .def("__repr__", [](const lt::loops::LoopSpec& self) {
            return "LoopSpec(" + self.to_string() + ")";
        });

    py::class_<lt::loops::LoopSet>(m, "LoopSet")
        .def("__len__", &lt::loops::LoopSet::size)
        .def("__getitem__", [](const lt::loops::LoopSet& self, size_t idx) {
            if (idx >= self.size()) {
                throw py::index_error("loop index out of range");
            }
            return self[idx];
        })
        .def_property_readonly("loops", &lt::loops::LoopSet::loops)
        .def_property_readonly("total_trimmed", &lt::loops::LoopSet::total_trimmed)
        .def("validate_against", &lt::loops::LoopSet::validate_against, py::arg("sequence_length"));

    m.def("parse_loop_set",
          [](const std::vector<std::string>& loops, const std::vector<std::string>& keeps,
             std::optional<int> sequence_length) {
              if (sequence_length) {
                  return lt::loops::parse_loop_set(loops, keeps, *sequence_length);
              }
              return lt::loops::parse_loop_set(loops, keeps);
          },
          py::arg("loops"), py::arg("keeps"), py::arg("sequence_length") = py::none(),
          "Parse parallel 'start:end' and 'keep_n:keep_c' lists into a sorted LoopSet.");

    // ----------------------- Alignment -----------------------
    py::class_<lt::alignment::AlignmentRecord>(m, "AlignmentRecord")
        .def_readonly("template_id", &lt::alignment::AlignmentRecord::template_id)
        .def_readonly("target_id", &lt::alignment::AlignmentRecord::target_id)
        .def_readonly("template_sequence", &lt::alignment::AlignmentRecord::template_sequence)
        .def_readonly("target_sequence", &lt::alignment::AlignmentRecord::target_sequence)
        .def_property_readonly("gap_count", &lt::alignment::AlignmentRecord::gap_count)
        .def_property_readonly("retained_length", &lt::alignment::AlignmentRecord::retained_length)
        .def("to_pir", &lt::alignment::AlignmentRecord::to_pir)
        .def("write", [](const lt::alignment::AlignmentRecord& self, const std::string& path) {
            lt::alignment::write_alignment(self, path);
        }, py::arg("path"));

    m.def("build_alignment",
          [](const std::string& sequence, const lt::loops::LoopSet& loops,
             const std::string& template_id, const std::string& structure_file,
             const std::string& target_id, const std::string& chain_id) {
              lt::alignment::AlignmentIds ids;
              ids.template_id = template_id;
              ids.structure_file = structure_file;
              ids.chain_id = chain_id;
              ids.target_id = target_id;
              return lt::alignment::build_alignment(sequence, loops, ids);
          },
          py::arg("sequence"), py::arg("loops"), py::arg("template_id"),
          py::arg("structure_file"), py::arg("target_id"), py::arg("chain_id") = "A");

    m.def("read_alignment", &lt::alignment::read_alignment, py::arg("path"));

    // ----------------------- Mapping -----------------------
    py::class_<lt::mapping::ResidueIndexMapper>(m, "ResidueIndexMapper")
        .def(py::init<const lt::loops::LoopSet&, int>(), py::arg("loops"),
             py::arg("sequence_length") = 0)
        .def("map", &lt::mapping::ResidueIndexMapper::map, py::arg("original"),
             "Output index for an original residue, or None if it is trimmed.")
        .def("map_or_throw", &lt::mapping::ResidueIndexMapper::map_or_throw, py::arg("original"))
        .def("is_retained", &lt::mapping::ResidueIndexMapper::is_retained, py::arg("original"))
        .def("offset_before", &lt::mapping::ResidueIndexMapper::offset_before, py::arg("original"))
        .def_property_readonly("excluded_count", &lt::mapping::ResidueIndexMapper::excluded_count)
        .def("selection", [](const lt::mapping::ResidueIndexMapper& self) {
            return self.selection_predicate();
        }, "Callable original -> output index (or None), for engine selection hooks.")
        .def("mapping_table", [](const lt::mapping::ResidueIndexMapper& self, int sequence_length) {
            py::list rows;
            for (const auto& row : self.mapping_table(sequence_length)) {
                py::object output = row.output < 0 ? py::object(py::none()) : py::object(py::int_(row.output));
                rows.append(py::make_tuple(row.original, output,
                                           lt::mapping::role_name(row.role), row.loop_index));
            }
            return rows;
        }, py::arg("sequence_length") = 0);

    // ----------------------- Ranking -----------------------
    py::class_<lt::CandidateModel>(m, "CandidateModel")
        .def(py::init([](const std::string& name, const std::string& path, double quality,
                         double secondary, bool failed) {
                 lt::CandidateModel model;
                 model.name = name;
                 model.path = path;
                 model.quality_score = quality;
                 model.secondary_score = secondary;
                 model.failed = failed;
                 return model;
             }),
             py::arg("name"), py::arg("path") = "", py::arg("quality_score") = 0.0,
             py::arg("secondary_score") = 0.0, py::arg("failed") = false)
        .def_readwrite("name", &lt::CandidateModel::name)
        .def_readwrite("path", &lt::CandidateModel::path)
        .def_readwrite("quality_score", &lt::CandidateModel::quality_score)
        .def_readwrite("secondary_score", &lt::CandidateModel::secondary_score)
        .def_readwrite("failed", &lt::CandidateModel::failed);

    m.def("rank_models",
          [](const std::vector<lt::CandidateModel>& candidates) {
              return lt::ranking::rank_models(candidates).accepted();
          },
          py::arg("candidates"),
          "Drop failed candidates and sort ascending by quality score (best first).");
}
