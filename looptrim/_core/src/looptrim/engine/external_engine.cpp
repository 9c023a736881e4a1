#include "external_engine.h"

#include <sys/wait.h>

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

#include "looptrim/common/logging.h"
#include "looptrim/errors/looptrim_error.h"
#include "looptrim/errors/messages.h"

namespace fs = std::filesystem;

namespace looptrim {
namespace engine {

namespace {

bool is_shell_safe(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.' || c == '/' ||
           c == ':' || c == '=' || c == '+' || c == '-';
}

std::string shell_quote(const std::string& value) {
    bool safe = !value.empty();
    for (char c : value) {
        if (!is_shell_safe(c)) {
            safe = false;
            break;
        }
    }
    if (safe) {
        return value;
    }

    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted.push_back(c);
        }
    }
    quoted.push_back('\'');
    return quoted;
}

double parse_score(const std::string& token, const std::string& source_name, int line_no) {
    char* end = nullptr;
    double value = std::strtod(token.c_str(), &end);
    if (end == token.c_str() || *end != '\0') {
        throw errors::messages::file_parse_error(
            source_name, "score table",
            "line " + std::to_string(line_no) + ": '" + token + "' is not a number");
    }
    return value;
}

void write_engine_selection(const std::string& path, const mapping::SelectionPredicate& selection,
                            int sequence_length) {
    std::ofstream out(path);
    if (!out) {
        throw errors::messages::file_write_error(path, "cannot open for writing");
    }
    out << "# original output\n";
    for (int i = 1; i <= sequence_length; ++i) {
        if (auto output = selection(i)) {
            out << i << ' ' << *output << '\n';
        }
    }
    if (!out) {
        throw errors::messages::file_write_error(path, "write failed");
    }
}

void remove_stale_output(const std::string& path) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        throw errors::messages::file_write_error(path, "cannot remove old engine output: " +
                                                           ec.message());
    }
}

}  // namespace

std::vector<ScoreEntry> parse_score_table(std::istream& in, const std::string& source_name) {
    std::vector<ScoreEntry> entries;
    std::string line;
    int line_no = 0;

    while (std::getline(in, line)) {
        ++line_no;
        auto hash = line.find('#');
        if (hash != std::string::npos) {
            line.erase(hash);
        }

        std::istringstream fields(line);
        std::vector<std::string> tokens;
        std::string token;
        while (fields >> token) {
            tokens.push_back(token);
        }
        if (tokens.empty()) {
            continue;
        }
        if (tokens.size() != 4) {
            throw errors::messages::file_parse_error(
                source_name, "score table",
                "line " + std::to_string(line_no) + ": expected 'name quality secondary status', got " +
                    std::to_string(tokens.size()) + " field(s)");
        }

        ScoreEntry entry;
        entry.name = tokens[0];
        entry.quality_score = parse_score(tokens[1], source_name, line_no);
        entry.secondary_score = parse_score(tokens[2], source_name, line_no);
        entry.ok = (tokens[3] == "ok");
        // Failed rows may carry nan placeholders; accepted rows must be rankable
        const bool finite =
            std::isfinite(entry.quality_score) && std::isfinite(entry.secondary_score);
        if (entry.ok && !finite) {
            throw errors::messages::file_parse_error(
                source_name, "score table",
                "line " + std::to_string(line_no) + ": non-finite score for '" + entry.name +
                    "' with status ok");
        }
        entries.push_back(std::move(entry));
    }
    return entries;
}

std::string expand_command(const std::string& command_template,
                           const std::map<std::string, std::string>& values) {
    std::string out;
    out.reserve(command_template.size());

    size_t pos = 0;
    while (pos < command_template.size()) {
        char c = command_template[pos];
        const bool doubled = pos + 1 < command_template.size() && command_template[pos + 1] == c;
        if ((c == '{' || c == '}') && doubled) {
            out.push_back(c);
            pos += 2;
            continue;
        }
        if (c != '{') {
            out.push_back(c);
            ++pos;
            continue;
        }

        size_t close = command_template.find('}', pos);
        if (close == std::string::npos) {
            throw errors::ConfigError("Unterminated placeholder in engine command",
                                      "Close every '{' with '}'", command_template);
        }
        std::string key = command_template.substr(pos + 1, close - pos - 1);
        auto it = values.find(key);
        if (it == values.end()) {
            throw errors::ConfigError(
                "Unknown placeholder {" + key + "} in engine command",
                "Use {alignment}, {selection}, {template}, {target}, {structure}, {models}, "
                "{scores} or {out_dir}; write {{ and }} for literal braces",
                command_template);
        }
        out += shell_quote(it->second);
        pos = close + 1;
    }
    return out;
}

ExternalCommandEngine::ExternalCommandEngine(EngineConfig config) : config_(std::move(config)) {
    if (config_.command_template.empty()) {
        throw errors::ConfigError("No engine command given",
                                  "Pass --engine-cmd with the modeling program to run");
    }
}

std::vector<CandidateModel> ExternalCommandEngine::submit(
    const ModelingJob& job, const mapping::SelectionPredicate& selection, int model_count) {
    const fs::path out_dir(job.output_dir.empty() ? "." : job.output_dir);
    const std::string selection_path = (out_dir / (job.id + ".engine.sel")).string();
    const std::string score_file = config_.score_file.empty() ? job.id + ".scores" : config_.score_file;
    const std::string score_path = (out_dir / score_file).string();

    write_engine_selection(selection_path, selection, static_cast<int>(job.alignment.length()));

    const std::map<std::string, std::string> values = {
        {"alignment", job.alignment_path},
        {"selection", selection_path},
        {"template", job.alignment.template_id},
        {"target", job.id},
        {"structure", job.structure_path},
        {"models", std::to_string(model_count)},
        {"scores", score_path},
        {"out_dir", out_dir.string()},
    };
    const std::string command = expand_command(config_.command_template, values);

    // Outputs of an earlier run in the same directory must not be read back
    remove_stale_output(score_path);
    for (int n = 1; n <= model_count; ++n) {
        remove_stale_output((out_dir / (job.id + "." + std::to_string(n) + ".pdb")).string());
    }

    common::Logger::instance()
        .event(common::LogLevel::Debug, "engine")
        .field("command", command)
        .field("models", model_count)
        .emit();
    common::log_info("Running modeling engine for " + job.id + " (" +
                     std::to_string(model_count) + " models)");

    int status = std::system(command.c_str());
    if (status == -1) {
        throw errors::EngineError(command, "could not start the shell");
    }
    if (!WIFEXITED(status)) {
        throw errors::EngineError(command, "terminated by a signal");
    }
    if (WEXITSTATUS(status) != 0) {
        throw errors::EngineError(command,
                                  "exited with status " + std::to_string(WEXITSTATUS(status)));
    }

    std::ifstream scores_in(score_path);
    if (!scores_in) {
        throw errors::EngineError(command, "did not write the score table " + score_path);
    }
    std::map<std::string, ScoreEntry> scores;
    for (auto& entry : parse_score_table(scores_in, score_path)) {
        scores[entry.name] = entry;
    }

    std::vector<CandidateModel> candidates;
    candidates.reserve(static_cast<size_t>(model_count));
    for (int n = 1; n <= model_count; ++n) {
        CandidateModel candidate;
        candidate.name = job.id + "." + std::to_string(n);
        candidate.path = (out_dir / (candidate.name + ".pdb")).string();

        auto it = scores.find(candidate.name);
        if (it == scores.end()) {
            candidate.failed = true;
        } else {
            candidate.quality_score = it->second.quality_score;
            candidate.secondary_score = it->second.secondary_score;
            candidate.failed = !it->second.ok;
        }
        std::error_code ec;
        if (!candidate.failed && !fs::exists(candidate.path, ec)) {
            common::log_warn("model " + candidate.name + " has a score but no file " +
                             candidate.path);
            candidate.failed = true;
        }
        candidates.push_back(std::move(candidate));
    }
    return candidates;
}

}  // namespace engine
}  // namespace looptrim
