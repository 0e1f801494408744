// TCR - Deployment Context Implementation
// Copyright (c) 2024 TCR Developers
// MIT License

#include "tcr/node/context.h"
#include "tcr/bank/bank.h"
#include "tcr/crypto/hasher.h"
#include "tcr/events/events.h"
#include "tcr/governance/parameterizer.h"
#include "tcr/registry/registry.h"
#include "tcr/token/token.h"
#include "tcr/util/config.h"
#include "tcr/util/logging.h"
#include "tcr/voting/poll_engine.h"
#include "tcr/voting/voting_rights.h"

#include <string>

namespace tcr {
namespace node {

Status LoadInitOptions(const util::ConfigManager& config, TcrInitOptions* out) {
    TcrInitOptions options = *out;

    Status s = registry::LoadParamDefaults(config, &options.params);
    if (!s.ok()) {
        return s;
    }
    s = registry::LoadTokenParams(config, &options.token);
    if (!s.ok()) {
        return s;
    }

    for (const auto& key : config.UnknownKeys(DEPLOY_SECTION,
                                              {"registryName", "hasher", "deployer", "logLevel"})) {
        LOG_WARN(util::LogCategory::CONFIG) << "Ignoring unknown key " << DEPLOY_SECTION
                                            << "." << key;
    }

    options.registryName = config.GetString("registryName", options.registryName, DEPLOY_SECTION);
    options.hasher = config.GetString("hasher", options.hasher, DEPLOY_SECTION);
    if (!crypto::CreateHasher(options.hasher)) {
        return Status::InvalidArgument("unknown hasher '" + options.hasher + "'");
    }

    if (config.HasKey("deployer", DEPLOY_SECTION)) {
        std::string hex = config.GetString("deployer", "", DEPLOY_SECTION);
        Address deployer = Address::FromHex(hex);
        if (deployer.IsNull()) {
            return Status::InvalidArgument("deploy.deployer is not a 20-byte hex address");
        }
        options.deployer = deployer;
    }

    if (config.HasKey("logLevel", DEPLOY_SECTION)) {
        auto level = util::ParseLogLevel(config.GetString("logLevel", "", DEPLOY_SECTION));
        if (!level) {
            return Status::InvalidArgument("deploy.logLevel is not a log level");
        }
        options.logLevel = level;
    }

    *out = options;
    return Status::Ok();
}

Status LoadInitOptionsFile(const std::string& path, TcrInitOptions* out) {
    util::ConfigManager config;
    util::ConfigParseResult parsed = config.ParseFile(path);
    if (!parsed.success) {
        std::string where = parsed.errorFile.empty() ? path : parsed.errorFile;
        if (parsed.errorLine > 0) {
            where += ":" + std::to_string(parsed.errorLine);
        }
        LOG_ERROR(util::LogCategory::CONFIG) << where << ": " << parsed.errorMessage;
        return Status::InvalidArgument(where + ": " + parsed.errorMessage);
    }
    return LoadInitOptions(config, out);
}

Status InitializeContext(TcrContext& context, const TcrInitOptions& options) {
    if (options.logLevel) {
        util::Logger::Instance().SetLevel(*options.logLevel);
    }
    LOG_INFO(util::LogCategory::DEFAULT) << "Deploying " << options.registryName << "...";

    // ========================================================================
    // Step 1: Validate options
    // ========================================================================

    Status s = options.params.Validate();
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::DEFAULT) << "Invalid parameters: " << s.ToString();
        return s;
    }
    if (options.token.supply == 0) {
        return Status::InvalidArgument("token supply must be non-zero");
    }

    auto hasher = crypto::CreateHasher(options.hasher);
    if (!hasher) {
        LOG_ERROR(util::LogCategory::DEFAULT) << "Unknown hasher: " << options.hasher;
        return Status::InvalidArgument("unknown hasher '" + options.hasher + "'");
    }

    // ========================================================================
    // Step 2: Token
    // ========================================================================

    context.deployer = options.deployer;
    context.eventLog = std::make_shared<events::EventLog>();
    context.hasher = hasher;
    context.token = std::make_shared<token::StandardToken>(
        options.token.name, options.token.symbol, options.token.decimals,
        options.token.supply, options.deployer, context.eventLog);

    LOG_INFO(util::LogCategory::DEFAULT) << "Token " << options.token.symbol << " minted "
                                         << options.token.supply << " to "
                                         << options.deployer.ToHex();

    // ========================================================================
    // Step 3: Voting
    // ========================================================================

    context.votingRights = std::make_shared<voting::VotingRights>(
        context.token, context.votingAddress, context.eventLog);
    context.voting = std::make_shared<voting::PollEngine>(
        context.votingRights, context.hasher, context.eventLog);

    // ========================================================================
    // Step 4: Bank, parameterizer, registry
    // ========================================================================

    context.bank = std::make_shared<bank::Bank>(context.eventLog);
    context.bank->AuthorizeWriter(context.registryAddress);
    context.bank->AuthorizeWriter(context.parameterizerAddress);

    context.parameterizer = std::make_shared<governance::Parameterizer>(
        context.token, context.voting, context.bank, options.params,
        context.parameterizerAddress, context.eventLog);

    context.registry = std::make_shared<registry::Registry>(
        context.token, context.voting, context.parameterizer, context.bank,
        context.registryAddress, options.registryName, context.eventLog);

    LOG_INFO(util::LogCategory::DEFAULT) << options.registryName << " deployed (vote hash "
                                         << context.hasher->Name() << ", minDeposit "
                                         << options.params.minDeposit << ")";
    return Status::Ok();
}

} // namespace node
} // namespace tcr
