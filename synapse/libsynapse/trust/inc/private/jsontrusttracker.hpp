#ifndef SYNAPSE_TRUST_JSONTRUSTTRACKER_HPP_
#define SYNAPSE_TRUST_JSONTRUSTTRACKER_HPP_

#include <map>
#include <string>

#include "trusttracker.hpp"

namespace synapse::trust
{
// Scores read once from a JSON object mapping agent ids to numbers. Unknown agents score 0.
class JSONTrustTracker : public TrustTracker
{
public:
    explicit JSONTrustTracker(std::string file_path);

    [[nodiscard]] double get_trust_score(const std::string &agent_id) const override;
    [[nodiscard]] size_t size() const;

private:
    void load();

    const std::string             file_path_;
    std::map<std::string, double> scores_;
};
}  // namespace synapse::trust

#endif  // SYNAPSE_TRUST_JSONTRUSTTRACKER_HPP_
