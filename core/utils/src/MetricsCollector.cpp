#include "MetricsCollector.h"
#include <sstream>
#include <iomanip>

namespace BlockSync {

    MetricsCollector::MetricsCollector()
        : startTime_(std::chrono::system_clock::now()) {
    }

    MetricsCollector& MetricsCollector::instance() {
        static MetricsCollector instance;
        return instance;
    }

    // Protocol metrics
    void MetricsCollector::incrementBlockChecksumRequests() { protocolMetrics_.blockChecksumRequests++; }
    void MetricsCollector::incrementDeltaRequests() { protocolMetrics_.deltaRequests++; }
    void MetricsCollector::incrementPatchRequests() { protocolMetrics_.patchRequests++; }
    void MetricsCollector::incrementFallbackRequests() { protocolMetrics_.fallbackRequests++; }
    void MetricsCollector::incrementRequestsFailed() { protocolMetrics_.requestsFailed++; }

    // Network metrics
    void MetricsCollector::incrementConnectionsAccepted() { networkMetrics_.connectionsAccepted++; }
    void MetricsCollector::incrementConnectionsClosed() { networkMetrics_.connectionsClosed++; }

    void MetricsCollector::addBytesReceived(uint64_t bytes) {
        networkMetrics_.bytesReceived += bytes;
    }

    void MetricsCollector::addBytesSent(uint64_t bytes) {
        networkMetrics_.bytesSent += bytes;
    }

    // Delta metrics
    void MetricsCollector::incrementSignaturesComputed() { deltaMetrics_.signaturesComputed++; }

    void MetricsCollector::recordDelta(uint64_t copiedBlocks, uint64_t literalBytes, uint64_t computeTimeMs) {
        deltaMetrics_.deltasComputed++;
        deltaMetrics_.copiedBlocks += copiedBlocks;
        deltaMetrics_.literalBytes += literalBytes;
        deltaMetrics_.totalDeltaComputeTimeMs += computeTimeMs;
    }

    void MetricsCollector::incrementPatchesApplied() { deltaMetrics_.patchesApplied++; }

    // Get metrics - create snapshots
    ProtocolMetricsSnapshot MetricsCollector::getProtocolMetrics() const {
        ProtocolMetricsSnapshot snapshot;
        snapshot.blockChecksumRequests = protocolMetrics_.blockChecksumRequests.load();
        snapshot.deltaRequests = protocolMetrics_.deltaRequests.load();
        snapshot.patchRequests = protocolMetrics_.patchRequests.load();
        snapshot.fallbackRequests = protocolMetrics_.fallbackRequests.load();
        snapshot.requestsFailed = protocolMetrics_.requestsFailed.load();
        return snapshot;
    }

    NetworkMetricsSnapshot MetricsCollector::getNetworkMetrics() const {
        NetworkMetricsSnapshot snapshot;
        snapshot.connectionsAccepted = networkMetrics_.connectionsAccepted.load();
        snapshot.connectionsClosed = networkMetrics_.connectionsClosed.load();
        snapshot.bytesReceived = networkMetrics_.bytesReceived.load();
        snapshot.bytesSent = networkMetrics_.bytesSent.load();
        return snapshot;
    }

    DeltaMetricsSnapshot MetricsCollector::getDeltaMetrics() const {
        DeltaMetricsSnapshot snapshot;
        snapshot.signaturesComputed = deltaMetrics_.signaturesComputed.load();
        snapshot.deltasComputed = deltaMetrics_.deltasComputed.load();
        snapshot.copiedBlocks = deltaMetrics_.copiedBlocks.load();
        snapshot.literalBytes = deltaMetrics_.literalBytes.load();
        snapshot.patchesApplied = deltaMetrics_.patchesApplied.load();
        snapshot.avgDeltaComputeTimeMs = snapshot.deltasComputed > 0
            ? deltaMetrics_.totalDeltaComputeTimeMs.load() / snapshot.deltasComputed
            : 0;
        return snapshot;
    }

    std::string MetricsCollector::getMetricsSummary() const {
        std::stringstream ss;

        auto uptime = getUptime();
        auto hours = std::chrono::duration_cast<std::chrono::hours>(uptime).count();
        auto minutes = std::chrono::duration_cast<std::chrono::minutes>(uptime % std::chrono::hours(1)).count();

        auto protocol = getProtocolMetrics();
        auto network = getNetworkMetrics();
        auto delta = getDeltaMetrics();

        ss << "=== BlockSync Metrics Summary ===" << std::endl;
        ss << "Uptime: " << hours << "h " << minutes << "m" << std::endl << std::endl;

        ss << "--- Protocol Metrics ---" << std::endl;
        ss << "  BLOCKCHK Requests: " << protocol.blockChecksumRequests << std::endl;
        ss << "  DELTA Requests: " << protocol.deltaRequests << std::endl;
        ss << "  PATCH Requests: " << protocol.patchRequests << std::endl;
        ss << "  Fallback Requests: " << protocol.fallbackRequests << std::endl;
        ss << "  Failed Requests: " << protocol.requestsFailed << std::endl << std::endl;

        ss << "--- Network Metrics ---" << std::endl;
        double receivedMB = network.bytesReceived / (1024.0 * 1024.0);
        double sentMB = network.bytesSent / (1024.0 * 1024.0);
        ss << std::fixed << std::setprecision(2);
        ss << "  Connections Accepted: " << network.connectionsAccepted << std::endl;
        ss << "  Connections Closed: " << network.connectionsClosed << std::endl;
        ss << "  Received: " << receivedMB << " MB" << std::endl;
        ss << "  Sent: " << sentMB << " MB" << std::endl << std::endl;

        ss << "--- Delta Metrics ---" << std::endl;
        ss << "  Signatures Computed: " << delta.signaturesComputed << std::endl;
        ss << "  Deltas Computed: " << delta.deltasComputed << std::endl;
        ss << "  Copied Blocks: " << delta.copiedBlocks << std::endl;
        ss << "  Literal Bytes: " << delta.literalBytes << std::endl;
        ss << "  Patches Applied: " << delta.patchesApplied << std::endl;
        ss << "  Avg Delta Compute: " << delta.avgDeltaComputeTimeMs << " ms" << std::endl;

        return ss.str();
    }

    std::chrono::seconds MetricsCollector::getUptime() const {
        return std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now() - startTime_);
    }

    void MetricsCollector::reset() {
        protocolMetrics_.blockChecksumRequests = 0;
        protocolMetrics_.deltaRequests = 0;
        protocolMetrics_.patchRequests = 0;
        protocolMetrics_.fallbackRequests = 0;
        protocolMetrics_.requestsFailed = 0;

        networkMetrics_.connectionsAccepted = 0;
        networkMetrics_.connectionsClosed = 0;
        networkMetrics_.bytesReceived = 0;
        networkMetrics_.bytesSent = 0;

        deltaMetrics_.signaturesComputed = 0;
        deltaMetrics_.deltasComputed = 0;
        deltaMetrics_.copiedBlocks = 0;
        deltaMetrics_.literalBytes = 0;
        deltaMetrics_.patchesApplied = 0;
        deltaMetrics_.totalDeltaComputeTimeMs = 0;
    }

}
