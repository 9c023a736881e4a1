#pragma once

#include <istream>
#include <map>
#include <string>
#include <vector>

#include "modeling_engine.h"

namespace looptrim {
namespace engine {

/**
 * Engine configuration, filled from CLI flags.
 */
struct EngineConfig {
    /**
     * Shell command run once per job. Placeholders:
     *   {alignment} {selection} {template} {target} {structure}
     *   {models} {scores} {out_dir}
     */
    std::string command_template;

    // Score table name inside the output directory; "" means <id>.scores
    std::string score_file;
};

/**
 * One row of an engine score table: "name quality secondary status".
 */
struct ScoreEntry {
    std::string name;
    double quality_score = 0.0;
    double secondary_score = 0.0;
    bool ok = true;
};

/**
 * Parse a score table. Blank lines and '#' comments are skipped; status is
 * "ok" or anything else for a failed model.
 *
 * @throws FormatError on malformed rows
 */
std::vector<ScoreEntry> parse_score_table(std::istream& in, const std::string& source_name);

/**
 * Replace {name} placeholders with values. Values are shell quoted when
 * they contain characters outside [A-Za-z0-9_./:=+-]. "{{" and "}}" produce
 * literal braces.
 *
 * @throws ConfigError on an unknown or unterminated placeholder
 */
std::string expand_command(const std::string& command_template,
                           const std::map<std::string, std::string>& values);

/**
 * Runs an external modeling program through the shell.
 *
 * The selection predicate is materialized as <out_dir>/<id>.engine.sel
 * ("original output" per built residue) before the command starts. After it
 * exits, candidates <id>.1 .. <id>.<model_count> are collected from the
 * score table; a model missing from the table, marked failed, or whose
 * structure file does not exist is reported as failed.
 */
class ExternalCommandEngine : public ModelingEngine {
public:
    explicit ExternalCommandEngine(EngineConfig config);

    std::string name() const override { return "external"; }

    std::vector<CandidateModel> submit(const ModelingJob& job,
                                       const mapping::SelectionPredicate& selection,
                                       int model_count) override;

    const EngineConfig& config() const { return config_; }

private:
    EngineConfig config_;
};

}  // namespace engine
}  // namespace looptrim
