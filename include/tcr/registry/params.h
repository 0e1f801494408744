// TCR - Registry Parameters
// Copyright (c) 2024 TCR Developers
// MIT License
//
// The twelve governed parameters a registry is deployed with, and the
// token the deployment mints. Unprefixed values govern listing
// challenges; "p"-prefixed values govern reparameterization challenges.
//
// Config file layout:
//   [paramDefaults]
//   minDeposit=10
//   commitStageLength=600
//   ...
//   [token]
//   supply=1000000000000000000
//   name=TestCoin
//   decimals=18
//   symbol=TEST

#ifndef TCR_REGISTRY_PARAMS_H
#define TCR_REGISTRY_PARAMS_H

#include "tcr/core/status.h"
#include "tcr/core/types.h"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace tcr {

namespace util { class ConfigManager; }

namespace registry {

/// Parameter names
namespace ParamName {
    constexpr const char* MIN_DEPOSIT = "minDeposit";
    constexpr const char* P_MIN_DEPOSIT = "pMinDeposit";
    constexpr const char* APPLY_STAGE_LEN = "applyStageLen";
    constexpr const char* P_APPLY_STAGE_LEN = "pApplyStageLen";
    constexpr const char* COMMIT_STAGE_LEN = "commitStageLen";
    constexpr const char* P_COMMIT_STAGE_LEN = "pCommitStageLen";
    constexpr const char* REVEAL_STAGE_LEN = "revealStageLen";
    constexpr const char* P_REVEAL_STAGE_LEN = "pRevealStageLen";
    constexpr const char* DISPENSATION_PCT = "dispensationPct";
    constexpr const char* P_DISPENSATION_PCT = "pDispensationPct";
    constexpr const char* VOTE_QUORUM = "voteQuorum";
    constexpr const char* P_VOTE_QUORUM = "pVoteQuorum";
}

/// Longest accepted stage length in seconds (100 years)
constexpr uint64_t MAX_STAGE_LENGTH = 100ULL * 365 * 24 * 60 * 60;

/// Config section holding the parameter defaults
constexpr const char* PARAM_DEFAULTS_SECTION = "paramDefaults";

/// Config section holding the token description
constexpr const char* TOKEN_SECTION = "token";

struct ParamDefaults {
    Amount minDeposit{10};
    Amount pMinDeposit{100};
    uint64_t applyStageLength{600};
    uint64_t pApplyStageLength{1200};
    uint64_t commitStageLength{600};
    uint64_t pCommitStageLength{600};
    uint64_t revealStageLength{600};
    uint64_t pRevealStageLength{600};
    uint64_t dispensationPct{50};
    uint64_t pDispensationPct{50};
    uint64_t voteQuorum{50};
    uint64_t pVoteQuorum{50};

    /// Every value individually valid (see ValidateParameter)
    Status Validate() const;

    /// Values keyed by parameter name
    std::map<std::string, uint64_t> ToMap() const;
};

struct TokenParams {
    Amount supply{1000000000000000000ULL};
    std::string name{"TestCoin"};
    uint8_t decimals{18};
    std::string symbol{"TEST"};
};

/// All governed parameter names, in deployment order
const std::vector<std::string>& AllParameterNames();

bool IsKnownParameter(const std::string& name);

/**
 * Check a candidate value for a parameter.
 *
 * Percentages and quorums must not exceed 100; deposits and stage lengths
 * must be non-zero, and stage lengths at most MAX_STAGE_LENGTH.
 */
Status ValidateParameter(const std::string& name, uint64_t value);

/**
 * Read [paramDefaults]. Accepts both the long config names
 * (commitStageLength) and the parameter names (commitStageLen); missing
 * keys keep the values already in `out`.
 */
Status LoadParamDefaults(const util::ConfigManager& config, ParamDefaults* out);

/// Read [token]; missing keys keep the values already in `out`
Status LoadTokenParams(const util::ConfigManager& config, TokenParams* out);

/// Source of current parameter values (the parameterizer)
class ParameterSource {
public:
    virtual ~ParameterSource() = default;

    /// Current value; 0 for an unknown name
    virtual uint64_t Get(const std::string& name) const = 0;
};

} // namespace registry
} // namespace tcr

#endif // TCR_REGISTRY_PARAMS_H
