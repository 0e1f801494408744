// TCR - Registry Parameters Implementation
// Copyright (c) 2024 TCR Developers
// MIT License

#include "tcr/registry/params.h"
#include "tcr/core/fixedpoint.h"
#include "tcr/util/config.h"
#include "tcr/util/logging.h"

#include <algorithm>
#include <set>
#include <string>

namespace tcr {
namespace registry {

namespace {

/// Parameter name paired with the longer key used in config files
struct ConfigAlias {
    const char* param;
    const char* configKey;
};

const ConfigAlias kConfigAliases[] = {
    {ParamName::MIN_DEPOSIT,        "minDeposit"},
    {ParamName::P_MIN_DEPOSIT,      "pMinDeposit"},
    {ParamName::APPLY_STAGE_LEN,    "applyStageLength"},
    {ParamName::P_APPLY_STAGE_LEN,  "pApplyStageLength"},
    {ParamName::COMMIT_STAGE_LEN,   "commitStageLength"},
    {ParamName::P_COMMIT_STAGE_LEN, "pCommitStageLength"},
    {ParamName::REVEAL_STAGE_LEN,   "revealStageLength"},
    {ParamName::P_REVEAL_STAGE_LEN, "pRevealStageLength"},
    {ParamName::DISPENSATION_PCT,   "dispensationPct"},
    {ParamName::P_DISPENSATION_PCT, "pDispensationPct"},
    {ParamName::VOTE_QUORUM,        "voteQuorum"},
    {ParamName::P_VOTE_QUORUM,      "pVoteQuorum"},
};

uint64_t* FieldFor(ParamDefaults& params, const std::string& name) {
    if (name == ParamName::MIN_DEPOSIT) return &params.minDeposit;
    if (name == ParamName::P_MIN_DEPOSIT) return &params.pMinDeposit;
    if (name == ParamName::APPLY_STAGE_LEN) return &params.applyStageLength;
    if (name == ParamName::P_APPLY_STAGE_LEN) return &params.pApplyStageLength;
    if (name == ParamName::COMMIT_STAGE_LEN) return &params.commitStageLength;
    if (name == ParamName::P_COMMIT_STAGE_LEN) return &params.pCommitStageLength;
    if (name == ParamName::REVEAL_STAGE_LEN) return &params.revealStageLength;
    if (name == ParamName::P_REVEAL_STAGE_LEN) return &params.pRevealStageLength;
    if (name == ParamName::DISPENSATION_PCT) return &params.dispensationPct;
    if (name == ParamName::P_DISPENSATION_PCT) return &params.pDispensationPct;
    if (name == ParamName::VOTE_QUORUM) return &params.voteQuorum;
    if (name == ParamName::P_VOTE_QUORUM) return &params.pVoteQuorum;
    return nullptr;
}

bool IsStageLength(const std::string& name) {
    return name == ParamName::APPLY_STAGE_LEN || name == ParamName::P_APPLY_STAGE_LEN ||
           name == ParamName::COMMIT_STAGE_LEN || name == ParamName::P_COMMIT_STAGE_LEN ||
           name == ParamName::REVEAL_STAGE_LEN || name == ParamName::P_REVEAL_STAGE_LEN;
}

bool IsPercentage(const std::string& name) {
    return name == ParamName::DISPENSATION_PCT || name == ParamName::P_DISPENSATION_PCT ||
           name == ParamName::VOTE_QUORUM || name == ParamName::P_VOTE_QUORUM;
}

} // anonymous namespace

// ============================================================================
// Names and validation
// ============================================================================

const std::vector<std::string>& AllParameterNames() {
    static const std::vector<std::string> names = [] {
        std::vector<std::string> out;
        for (const auto& alias : kConfigAliases) {
            out.emplace_back(alias.param);
        }
        return out;
    }();
    return names;
}

bool IsKnownParameter(const std::string& name) {
    const auto& names = AllParameterNames();
    return std::find(names.begin(), names.end(), name) != names.end();
}

Status ValidateParameter(const std::string& name, uint64_t value) {
    if (!IsKnownParameter(name)) {
        return Status::InvalidArgument("unknown parameter '" + name + "'");
    }
    if (IsPercentage(name)) {
        if (value > fixedpoint::PERCENT) {
            return Status::InvalidArgument(name + " must not exceed 100");
        }
        return Status::Ok();
    }
    if (value == 0) {
        return Status::InvalidArgument(name + " must be non-zero");
    }
    if (IsStageLength(name) && value > MAX_STAGE_LENGTH) {
        return Status::InvalidArgument(name + " exceeds " + std::to_string(MAX_STAGE_LENGTH) +
                                       " seconds");
    }
    return Status::Ok();
}

// ============================================================================
// ParamDefaults
// ============================================================================

Status ParamDefaults::Validate() const {
    for (const auto& [name, value] : ToMap()) {
        Status s = ValidateParameter(name, value);
        if (!s.ok()) {
            return s;
        }
    }
    return Status::Ok();
}

std::map<std::string, uint64_t> ParamDefaults::ToMap() const {
    ParamDefaults copy = *this;
    std::map<std::string, uint64_t> out;
    for (const auto& name : AllParameterNames()) {
        out[name] = *FieldFor(copy, name);
    }
    return out;
}

// ============================================================================
// Loading
// ============================================================================

Status LoadParamDefaults(const util::ConfigManager& config, ParamDefaults* out) {
    ParamDefaults params = *out;

    for (const auto& alias : kConfigAliases) {
        for (const char* key : {alias.configKey, alias.param}) {
            if (!config.HasKey(key, PARAM_DEFAULTS_SECTION)) {
                continue;
            }
            auto value = config.TryGetUInt(key, PARAM_DEFAULTS_SECTION);
            if (!value) {
                return Status::InvalidArgument(std::string(PARAM_DEFAULTS_SECTION) + "." +
                                               key + " is not an unsigned integer");
            }
            *FieldFor(params, alias.param) = *value;
        }
    }

    std::set<std::string> known;
    for (const auto& alias : kConfigAliases) {
        known.insert(alias.param);
        known.insert(alias.configKey);
    }
    for (const auto& key : config.UnknownKeys(PARAM_DEFAULTS_SECTION, known)) {
        LOG_WARN(util::LogCategory::CONFIG) << "Ignoring unknown key "
                                            << PARAM_DEFAULTS_SECTION << "." << key;
    }

    Status s = params.Validate();
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::CONFIG) << "Invalid parameter defaults: " << s.ToString();
        return s;
    }

    *out = params;
    return Status::Ok();
}

Status LoadTokenParams(const util::ConfigManager& config, TokenParams* out) {
    TokenParams token = *out;

    if (config.HasKey("supply", TOKEN_SECTION)) {
        auto supply = config.TryGetUInt("supply", TOKEN_SECTION);
        if (!supply) {
            return Status::InvalidArgument("token.supply is not an unsigned integer");
        }
        token.supply = *supply;
    }
    if (config.HasKey("decimals", TOKEN_SECTION)) {
        auto decimals = config.TryGetUInt("decimals", TOKEN_SECTION);
        if (!decimals || *decimals > 255) {
            return Status::InvalidArgument("token.decimals must be in [0, 255]");
        }
        token.decimals = static_cast<uint8_t>(*decimals);
    }
    for (const auto& key : config.UnknownKeys(TOKEN_SECTION,
                                              {"supply", "name", "decimals", "symbol"})) {
        LOG_WARN(util::LogCategory::CONFIG) << "Ignoring unknown key " << TOKEN_SECTION
                                            << "." << key;
    }
    token.name = config.GetString("name", token.name, TOKEN_SECTION);
    token.symbol = config.GetString("symbol", token.symbol, TOKEN_SECTION);

    if (token.supply == 0) {
        return Status::InvalidArgument("token.supply must be non-zero");
    }

    *out = token;
    return Status::Ok();
}

} // namespace registry
} // namespace tcr
