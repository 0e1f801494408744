// TCR - Deployment Context
// Copyright (c) 2024 TCR Developers
// MIT License
//
// Wires one token, voting-rights ledger, poll engine, bank, parameterizer
// and registry together around a shared event log.

#ifndef TCR_NODE_CONTEXT_H
#define TCR_NODE_CONTEXT_H

#include "tcr/core/status.h"
#include "tcr/core/types.h"
#include "tcr/registry/params.h"
#include "tcr/util/logging.h"

#include <memory>
#include <optional>
#include <string>

namespace tcr {

namespace bank { class Bank; }
namespace crypto { class Hasher; }
namespace events { class EventLog; }
namespace governance { class Parameterizer; }
namespace registry { class Registry; }
namespace token { class StandardToken; }
namespace util { class ConfigManager; }
namespace voting { class PollEngine; class VotingRights; }

namespace node {

/// Config section holding the deployment options
constexpr const char* DEPLOY_SECTION = "deploy";

struct TcrInitOptions {
    registry::ParamDefaults params;
    registry::TokenParams token;

    /// Receives the minted supply
    Address deployer{MakeAddress("deployer")};

    /// Registry display name
    std::string registryName{"The TestChain Registry"};

    /// Vote hash: "sha3-256" or "sha256"
    std::string hasher{"sha3-256"};

    /// Applied to the global logger when set
    std::optional<util::LogLevel> logLevel;
};

/**
 * Read [paramDefaults], [token] and [deploy] (registryName, hasher,
 * deployer as a hex address, logLevel). Missing keys keep the values in `out`.
 */
Status LoadInitOptions(const util::ConfigManager& config, TcrInitOptions* out);

/// Parse `path` and apply it with LoadInitOptions; `out` is untouched on error
Status LoadInitOptionsFile(const std::string& path, TcrInitOptions* out);

/**
 * One registry deployment.
 *
 * Contract addresses are derived from fixed labels so tests and tools can
 * name them without looking them up.
 */
struct TcrContext {
    // ========================================================================
    // Shared
    // ========================================================================

    std::shared_ptr<events::EventLog> eventLog;
    std::shared_ptr<tcr::token::StandardToken> token;
    std::shared_ptr<crypto::Hasher> hasher;

    // ========================================================================
    // Voting
    // ========================================================================

    std::shared_ptr<tcr::voting::VotingRights> votingRights;
    std::shared_ptr<tcr::voting::PollEngine> voting;

    // ========================================================================
    // Protocol
    // ========================================================================

    std::shared_ptr<tcr::bank::Bank> bank;
    std::shared_ptr<governance::Parameterizer> parameterizer;
    std::shared_ptr<tcr::registry::Registry> registry;

    // ========================================================================
    // Addresses
    // ========================================================================

    Address deployer;
    Address votingAddress{MakeAddress("voting")};
    Address registryAddress{MakeAddress("registry")};
    Address parameterizerAddress{MakeAddress("parameterizer")};

    bool IsReady() const {
        return token && voting && parameterizer && registry;
    }
};

/**
 * Build every component of a deployment.
 *
 * The whole token supply is minted to options.deployer. The registry and
 * the parameterizer are authorized to write to the bank.
 */
Status InitializeContext(TcrContext& context, const TcrInitOptions& options);

} // namespace node
} // namespace tcr

#endif // TCR_NODE_CONTEXT_H
