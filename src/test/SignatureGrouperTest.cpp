#include <iostream>
#include <string>
#include <vector>
#include <cassert>

#include "analysis/SignatureGrouper.hpp"
#include "utils/Logger.hpp"

using ErrorWatch::Analysis::SignatureGrouper;
using ErrorWatch::Signature::SignatureExtractor;
using ErrorWatch::core::LogRecord;

static std::vector<LogRecord> sampleBatch() {
    return {
        LogRecord("2024-05-01T10:00:00", "java.io.IOException: disk 12345 full", "/ecs/app/web"),
        LogRecord("2024-05-01T09:00:00", "java.io.IOException: disk 67890 full", "/ecs/app/worker"),
        LogRecord("2024-05-01T11:00:00", "    at com.x.Y.run(Y.java:1)", "/ecs/app/web"),
        LogRecord("2024-05-01T08:00:00", "java.util.concurrent.TimeoutException", "/ecs/app/web"),
        LogRecord("", "", "/ecs/app/web"),
        LogRecord("2024-05-01T12:00:00", "java.io.IOException: disk 11111 full", "/ecs/app/web"),
    };
}

static void testGrouping() {
    std::cout << "[Test] Records fold into aggregates..." << std::endl;
    SignatureGrouper grouper{SignatureExtractor()};

    SignatureGrouper::Stats stats;
    const auto groups = grouper.group(sampleBatch(), &stats);

    assert(groups.size() == 2);
    assert(stats.records == 6);
    assert(stats.grouped == 4);
    assert(stats.skipped == 2);

    std::uint64_t sum = 0;
    for (const auto& [sig, agg] : groups) {
        assert(sig == agg.signature);
        sum += agg.count;
    }
    assert(sum == stats.grouped);

    const auto& io = groups.at("IOException: disk {num} full");
    assert(io.count == 3);
    assert(io.sources.size() == 2);
    assert(io.sources.count("/ecs/app/web") == 1);
    assert(io.sources.count("/ecs/app/worker") == 1);
    assert(io.firstSeenTimestamp == "2024-05-01T09:00:00");
    assert(io.lastSeenTimestamp == "2024-05-01T12:00:00");
    // First record wins, later ones never overwrite the sample.
    assert(io.sampleMessage == "java.io.IOException: disk 12345 full");

    const auto& timeout = groups.at("TimeoutException");
    assert(timeout.count == 1);
    assert(timeout.lastSeenTimestamp == "2024-05-01T08:00:00");
    std::cout << "[PASS] Records fold into aggregates" << std::endl;
}

static void testHexIdsShareAGroup() {
    std::cout << "[Test] Mixed hex ids share a group..." << std::endl;
    SignatureGrouper grouper{SignatureExtractor()};
    const auto groups = grouper.group({
        LogRecord("2024-05-01T10:00:00", "NullPointerException: user 9a8f7e6d1c2b not found", "/ecs/app/web"),
        LogRecord("2024-05-01T10:05:00", "NullPointerException: user 00112233aabb not found", "/ecs/app/web"),
    });

    assert(groups.size() == 1);
    const auto& agg = groups.begin()->second;
    assert(agg.signature == "NullPointerException: user {id} not found");
    assert(agg.count == 2);
    assert(agg.sampleMessage == "NullPointerException: user 9a8f7e6d1c2b not found");
    std::cout << "[PASS] Mixed hex ids share a group" << std::endl;
}

static void testInvalidUtf8Text() {
    std::cout << "[Test] Sample and source are valid UTF-8..." << std::endl;
    SignatureGrouper grouper{SignatureExtractor()};
    const auto groups = grouper.group({LogRecord("t", "IOException: caf\xE9 closed", "legacy-\xFF")});
    const auto& agg = groups.begin()->second;
    assert(agg.sampleMessage == "IOException: caf\xEF\xBF\xBD closed");
    assert(agg.sources.count("legacy-\xEF\xBF\xBD") == 1);
    std::cout << "[PASS] Sample and source are valid UTF-8" << std::endl;
}

static void testSampleCap() {
    std::cout << "[Test] Sample message is capped..." << std::endl;
    SignatureGrouper grouper(SignatureExtractor(), 10);
    const auto groups = grouper.group({LogRecord("t", "java.io.IOException: disk 12345 full", "s")});
    assert(groups.begin()->second.sampleMessage == "java.io.IO");

    SignatureGrouper uncapped(SignatureExtractor(), 0);
    const std::string longMessage = "java.io.IOException: " + std::string(500, 'z');
    const auto all = uncapped.group({LogRecord("t", longMessage, "s")});
    assert(all.begin()->second.sampleMessage == longMessage);
    std::cout << "[PASS] Sample message is capped" << std::endl;
}

static void testEmptyAndSkippedOnly() {
    std::cout << "[Test] Empty batches..." << std::endl;
    SignatureGrouper grouper{SignatureExtractor()};
    SignatureGrouper::Stats stats;
    assert(grouper.group({}, &stats).empty());
    assert(stats.records == 0 && stats.grouped == 0);

    const auto groups = grouper.group({LogRecord("t", "Caused by: x", "s"), LogRecord("t", " ", "s")}, &stats);
    assert(groups.empty());
    assert(stats.skipped == 2);
    std::cout << "[PASS] Empty batches" << std::endl;
}

static void testIncrementalAdd() {
    std::cout << "[Test] Incremental add matches batch grouping..." << std::endl;
    SignatureGrouper grouper{SignatureExtractor()};
    ErrorWatch::core::AggregateMap incremental;
    for (const auto& r : sampleBatch())
        grouper.add(incremental, r);

    const auto batch = grouper.group(sampleBatch());
    assert(incremental.size() == batch.size());
    for (const auto& [sig, agg] : batch) {
        const auto& other = incremental.at(sig);
        assert(other.count == agg.count);
        assert(other.sources == agg.sources);
        assert(other.lastSeenTimestamp == agg.lastSeenTimestamp);
        assert(other.sampleMessage == agg.sampleMessage);
    }
    std::cout << "[PASS] Incremental add matches batch grouping" << std::endl;
}

int main() {
    ErrorWatch::Utils::getLogger().setConsole(nullptr);

    testGrouping();
    testHexIdsShareAGroup();
    testInvalidUtf8Text();
    testSampleCap();
    testEmptyAndSkippedOnly();
    testIncrementalAdd();

    std::cout << "[PASS] All SignatureGrouper tests" << std::endl;
    return 0;
}
