#pragma once

#include <iosfwd>
#include <vector>

#include "looptrim/common/result_types.h"

namespace looptrim {
namespace ranking {

/**
 * Accepted candidates in ranking order, best first.
 */
class RankedModels {
public:
    RankedModels(std::vector<CandidateModel> accepted, size_t num_candidates);

    const CandidateModel& top() const { return accepted_.front(); }
    const std::vector<CandidateModel>& accepted() const { return accepted_; }
    size_t num_accepted() const { return accepted_.size(); }
    size_t num_candidates() const { return num_candidates_; }
    size_t num_rejected() const { return num_candidates_ - accepted_.size(); }

private:
    std::vector<CandidateModel> accepted_;
    size_t num_candidates_;
};

/**
 * Order used for ranking: quality_score, then secondary_score, then name.
 * A total order, so the ranking does not depend on the order the engine
 * produced its candidates in.
 */
bool ranks_before(const CandidateModel& a, const CandidateModel& b);

/**
 * Drop failed candidates (and those with non-finite quality scores) and sort
 * the rest ascending by quality.
 *
 * @throws NoValidModelError if nothing is left
 */
RankedModels rank_models(const std::vector<CandidateModel>& candidates);

/**
 * Write the "Top model" summary line.
 */
void report_top_model(const RankedModels& ranked, std::ostream& out);

}  // namespace ranking
}  // namespace looptrim
