#pragma once

#include <string>
#include <atomic>
#include <chrono>
#include <cstdint>

namespace BlockSync {

    // Snapshot structs for returning metrics (non-atomic)
    struct ProtocolMetricsSnapshot {
        uint64_t blockChecksumRequests{0};
        uint64_t deltaRequests{0};
        uint64_t patchRequests{0};
        uint64_t fallbackRequests{0};
        uint64_t requestsFailed{0};
    };

    struct NetworkMetricsSnapshot {
        uint64_t connectionsAccepted{0};
        uint64_t connectionsClosed{0};
        uint64_t bytesReceived{0};
        uint64_t bytesSent{0};
    };

    struct DeltaMetricsSnapshot {
        uint64_t signaturesComputed{0};
        uint64_t deltasComputed{0};
        uint64_t copiedBlocks{0};
        uint64_t literalBytes{0};
        uint64_t patchesApplied{0};
        uint64_t avgDeltaComputeTimeMs{0};
    };

    // Internal structs with atomics
    struct ProtocolMetrics {
        std::atomic<uint64_t> blockChecksumRequests{0};
        std::atomic<uint64_t> deltaRequests{0};
        std::atomic<uint64_t> patchRequests{0};
        std::atomic<uint64_t> fallbackRequests{0};
        std::atomic<uint64_t> requestsFailed{0};
    };

    struct NetworkMetrics {
        std::atomic<uint64_t> connectionsAccepted{0};
        std::atomic<uint64_t> connectionsClosed{0};
        std::atomic<uint64_t> bytesReceived{0};
        std::atomic<uint64_t> bytesSent{0};
    };

    struct DeltaMetrics {
        std::atomic<uint64_t> signaturesComputed{0};
        std::atomic<uint64_t> deltasComputed{0};
        std::atomic<uint64_t> copiedBlocks{0};
        std::atomic<uint64_t> literalBytes{0};
        std::atomic<uint64_t> patchesApplied{0};
        std::atomic<uint64_t> totalDeltaComputeTimeMs{0};
    };

    class MetricsCollector {
    public:
        static MetricsCollector& instance();

        // Protocol metrics
        void incrementBlockChecksumRequests();
        void incrementDeltaRequests();
        void incrementPatchRequests();
        void incrementFallbackRequests();
        void incrementRequestsFailed();

        // Network metrics
        void incrementConnectionsAccepted();
        void incrementConnectionsClosed();
        void addBytesReceived(uint64_t bytes);
        void addBytesSent(uint64_t bytes);

        // Delta metrics
        void incrementSignaturesComputed();
        void recordDelta(uint64_t copiedBlocks, uint64_t literalBytes, uint64_t computeTimeMs);
        void incrementPatchesApplied();

        ProtocolMetricsSnapshot getProtocolMetrics() const;
        NetworkMetricsSnapshot getNetworkMetrics() const;
        DeltaMetricsSnapshot getDeltaMetrics() const;

        std::string getMetricsSummary() const;

        std::chrono::seconds getUptime() const;

        // Zero all counters (tests)
        void reset();

    private:
        MetricsCollector();

        ProtocolMetrics protocolMetrics_;
        NetworkMetrics networkMetrics_;
        DeltaMetrics deltaMetrics_;
        std::chrono::system_clock::time_point startTime_;
    };

}
