#pragma once

#include <functional>
#include <optional>
#include <string>
#include <utility>

#include "app/Subscription.hpp"
#include "domain/domain_model.hpp"

namespace pp::core::app {

struct CallResult {
    bool        ok{true};
    std::string error;

    static CallResult success() { return {}; }
    static CallResult failure(std::string message) { return {false, std::move(message)}; }
};

struct StartResult {
    bool         ok{false};
    std::string  error;
    Subscription subscription;
};

struct HydrateResult {
    bool                           ok{true};
    std::string                    error;
    std::optional<domain::GameInfo> game;
};

struct ListGamesResult {
    bool             ok{true};
    std::string      error;
    domain::GameList games;
};

using CallDone    = std::function<void(const CallResult&)>;
using HydrateDone = std::function<void(const HydrateResult&)>;
using ListDone    = std::function<void(const ListGamesResult&)>;

// Sinks for one subscription. After onError or onDone no handler is called again.
template <typename T>
struct StreamHandlers {
    std::function<void(const T&)>           onEvent;
    std::function<void(const std::string&)> onError;
    std::function<void()>                   onDone;
};

struct CompressionRequest {
    std::string                  gamePath;
    std::string                  gameName;
    domain::CompressionAlgorithm algorithm{domain::kDefaultAlgorithm};
};

// Port to the job-execution backend. Implementations live in net (JSON lines over TCP)
// or in tests.
//
// Every completion and stream event is delivered on the caller's event loop.
// Once a returned Subscription is cancelled, its handlers are never invoked again.
class IBridgePort {
public:
    virtual ~IBridgePort() = default;

    // Starts compressing and subscribes to its progress in one step.
    // ok == false means the backend refused or could not be reached; no handler will fire.
    virtual StartResult compressGame(const CompressionRequest& request,
                                     StreamHandlers<domain::CompressionProgress> handlers) = 0;

    // Best-effort notification; the caller decides the job outcome locally.
    virtual void cancelCompression(CallDone done) = 0;

    virtual void decompressGame(const std::string& gamePath, CallDone done) = 0;

    // game is empty when the backend has nothing better than what the caller holds.
    virtual void hydrateGame(const std::string& gamePath,
                             const std::string& gameName,
                             domain::Platform platform,
                             HydrateDone done) = 0;

    virtual void listGames(ListDone done) = 0;

    virtual void updateAutomationConfig(const domain::AutomationConfig& config, CallDone done) = 0;
    virtual void startAutoCompression(CallDone done) = 0;
    virtual void stopAutoCompression(CallDone done) = 0;

    virtual Subscription watchAutomationQueue(StreamHandlers<domain::AutomationQueue> handlers) = 0;
    virtual Subscription watchAutoCompressionStatus(StreamHandlers<bool> handlers) = 0;
    virtual Subscription watchSchedulerState(StreamHandlers<domain::SchedulerState> handlers) = 0;
    virtual Subscription watchWatcherEvents(StreamHandlers<domain::WatcherEvent> handlers) = 0;
};

} // namespace pp::core::app
