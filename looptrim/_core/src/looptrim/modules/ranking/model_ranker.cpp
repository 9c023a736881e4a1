#include "model_ranker.h"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <ostream>

#include "looptrim/common/logging.h"
#include "looptrim/errors/looptrim_error.h"

namespace looptrim {
namespace ranking {

RankedModels::RankedModels(std::vector<CandidateModel> accepted, size_t num_candidates)
    : accepted_(std::move(accepted)), num_candidates_(num_candidates) {}

bool ranks_before(const CandidateModel& a, const CandidateModel& b) {
    if (a.quality_score != b.quality_score) {
        return a.quality_score < b.quality_score;
    }
    if (a.secondary_score != b.secondary_score) {
        return a.secondary_score < b.secondary_score;
    }
    return a.name < b.name;
}

RankedModels rank_models(const std::vector<CandidateModel>& candidates) {
    std::vector<CandidateModel> accepted;
    accepted.reserve(candidates.size());
    size_t num_failed = 0;

    for (const auto& candidate : candidates) {
        if (candidate.failed || !std::isfinite(candidate.quality_score) ||
            !std::isfinite(candidate.secondary_score)) {
            ++num_failed;
            common::Logger::instance()
                .event(common::LogLevel::Debug, "model_ranker")
                .field("candidate", candidate.name)
                .field("status", "rejected")
                .emit();
            continue;
        }
        accepted.push_back(candidate);
    }

    if (accepted.empty()) {
        throw errors::NoValidModelError(candidates.size(), num_failed);
    }

    std::sort(accepted.begin(), accepted.end(), ranks_before);

    if (num_failed > 0) {
        common::log_warn(std::to_string(num_failed) + " of " + std::to_string(candidates.size()) +
                         " candidate models failed and were skipped");
    }
    return RankedModels(std::move(accepted), candidates.size());
}

void report_top_model(const RankedModels& ranked, std::ostream& out) {
    const auto& top = ranked.top();
    const std::ios::fmtflags flags = out.flags();
    const std::streamsize precision = out.precision();
    out << "Top model: " << top.name << " (quality score " << std::fixed << std::setprecision(3)
        << top.quality_score << ", secondary " << top.secondary_score << ")"
        << " [" << ranked.num_accepted() << "/" << ranked.num_candidates() << " accepted]\n";
    out.flags(flags);
    out.precision(precision);
}

}  // namespace ranking
}  // namespace looptrim
