#include "support/FakeBridgePort.hpp"

#include <utility>

namespace pp::core::test {

using namespace pp::core::domain;

namespace {

template <typename T>
T takeFront(std::vector<T>& v) {
    T front = std::move(v.front());
    v.erase(v.begin());
    return front;
}

} // namespace

app::StartResult FakeBridgePort::compressGame(const app::CompressionRequest& request,
                                              app::StreamHandlers<CompressionProgress> handlers) {
    compressRequests.push_back(request);

    app::StartResult result;
    if (refuseCompressWith) {
        result.error = *refuseCompressWith;
        return result;
    }
    result.ok           = true;
    result.subscription = progress.open(std::move(handlers));
    return result;
}

void FakeBridgePort::cancelCompression(app::CallDone done) {
    ++cancelCalls;
    if (done) {
        done(cancelResult);
    }
}

void FakeBridgePort::decompressGame(const std::string& gamePath, app::CallDone done) {
    decompressCalls.push_back({gamePath, std::move(done)});
}

void FakeBridgePort::hydrateGame(const std::string& gamePath,
                                 const std::string& gameName,
                                 Platform platform,
                                 app::HydrateDone done) {
    hydrateCalls.push_back({gamePath, gameName, platform, std::move(done)});
}

void FakeBridgePort::listGames(app::ListDone done) {
    listCalls.push_back(std::move(done));
}

void FakeBridgePort::updateAutomationConfig(const AutomationConfig& config, app::CallDone done) {
    configPushes.push_back(config);
    if (done) {
        done(configResult);
    }
}

void FakeBridgePort::startAutoCompression(app::CallDone done) {
    ++startAutoCalls;
    if (done) {
        done(startAutoResult);
    }
}

void FakeBridgePort::stopAutoCompression(app::CallDone done) {
    ++stopAutoCalls;
    if (done) {
        done(stopAutoResult);
    }
}

app::Subscription FakeBridgePort::watchAutomationQueue(app::StreamHandlers<AutomationQueue> handlers) {
    return queue.open(std::move(handlers));
}

app::Subscription FakeBridgePort::watchAutoCompressionStatus(app::StreamHandlers<bool> handlers) {
    return autoStatus.open(std::move(handlers));
}

app::Subscription FakeBridgePort::watchSchedulerState(app::StreamHandlers<SchedulerState> handlers) {
    return scheduler.open(std::move(handlers));
}

app::Subscription FakeBridgePort::watchWatcherEvents(app::StreamHandlers<WatcherEvent> handlers) {
    return watcher.open(std::move(handlers));
}

void FakeBridgePort::completeDecompress(const app::CallResult& result) {
    auto call = takeFront(decompressCalls);
    call.done(result);
}

void FakeBridgePort::completeHydrate(const app::HydrateResult& result) {
    auto call = takeFront(hydrateCalls);
    call.done(result);
}

void FakeBridgePort::completeList(const app::ListGamesResult& result) {
    auto done = takeFront(listCalls);
    done(result);
}

CompressionProgress makeProgress(std::int64_t processed, std::int64_t total) {
    CompressionProgress p;
    p.gameName       = "Game";
    p.filesTotal     = total;
    p.filesProcessed = processed;
    p.bytesOriginal  = total * 100;
    return p;
}

GameInfo makeGame(const std::string& name, const std::string& path, std::int64_t sizeBytes, Platform platform) {
    GameInfo g;
    g.name      = name;
    g.path      = path;
    g.sizeBytes = sizeBytes;
    g.platform  = platform;
    return g;
}

} // namespace pp::core::test
