#include <iostream>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>
#include <cassert>

#include "core/PatternError.hpp"
#include "history/InMemoryHistoryStore.hpp"
#include "history/JsonFileHistoryStore.hpp"
#include "pipeline/RunCoordinator.hpp"
#include "utils/Logger.hpp"

using ErrorWatch::core::LogRecord;
using ErrorWatch::History::HistoryEntry;
using ErrorWatch::History::HistoryMap;
using ErrorWatch::History::InMemoryHistoryStore;
using ErrorWatch::History::JsonFileHistoryStore;
using ErrorWatch::Pipeline::EngineSettings;
using ErrorWatch::Pipeline::RunCoordinator;
using ErrorWatch::Utils::CivilDate;

static const char* const kTimeout = "SocketTimeoutException: Read timed out";
static const char* const kNpe     = "NullPointerException: order {num} missing";

static CivilDate date(const char* s) {
    auto d = CivilDate::parse(s);
    assert(d.has_value());
    return *d;
}

static std::vector<LogRecord> batch() {
    return {
        LogRecord("2024-05-10T01:00:00", "java.net.SocketTimeoutException: Read timed out", "/ecs/app/web"),
        LogRecord("2024-05-10T01:05:00", "java.net.SocketTimeoutException: Read timed out", "/ecs/app/web"),
        LogRecord("2024-05-10T01:07:00", "java.net.SocketTimeoutException: Read timed out", "/ecs/app/api"),
        LogRecord("2024-05-10T02:00:00", "java.lang.NullPointerException: order 123456 missing", "/ecs/app/web"),
        LogRecord("2024-05-10T03:30:00", "java.lang.NullPointerException: order 654321 missing", "/ecs/app/web"),
        LogRecord("2024-05-10T03:30:00", "\tat com.shop.Orders.load(Orders.java:88)", "/ecs/app/web"),
    };
}

static void testFirstRun() {
    std::cout << "[Test] First run: everything is new..." << std::endl;
    InMemoryHistoryStore store;
    RunCoordinator coordinator(EngineSettings{}, store);

    const auto outcome = coordinator.run(batch(), date("2024-05-10"));
    const auto& report = outcome.report;

    assert(outcome.historySaved);
    assert(outcome.historyError.empty());

    assert(report.totalRecords() == 6);
    assert(report.groupedRecords() == 5);
    assert(report.skippedRecords() == 1);
    assert(report.runDate() == "2024-05-10");

    assert(report.attention().size() == 1);
    assert(report.attention()[0].signature() == kNpe);
    assert(report.attention()[0].count() == 2);
    assert(report.attention()[0].aggregate.lastSeenTimestamp == "2024-05-10T03:30:00");

    assert(report.noise().size() == 1);
    assert(report.noise()[0].signature() == kTimeout);
    assert(report.noise()[0].count() == 3);
    assert(report.noise()[0].aggregate.sources.size() == 2);
    assert(report.noiseRecordCount() == 3);

    // Noise is still tracked in history and can be new.
    assert(report.newSignatures().size() == 2);
    assert(report.isNew(kNpe) && report.isNew(kTimeout));

    assert(store.saveCount() == 1);
    assert(store.stored().size() == 2);
    assert(store.stored().at(kNpe).totalCount == 2);
    std::cout << "[PASS] First run: everything is new" << std::endl;
}

static void testSecondRun() {
    std::cout << "[Test] Second run: nothing new, counts accumulate..." << std::endl;
    InMemoryHistoryStore store;
    RunCoordinator coordinator(EngineSettings{}, store);

    coordinator.run(batch(), date("2024-05-10"));
    const auto outcome = coordinator.run(batch(), date("2024-05-11"));

    assert(outcome.report.newSignatures().empty());
    assert(store.stored().at(kNpe).totalCount == 4);
    assert(store.stored().at(kNpe).firstSeenDate == "2024-05-10");
    assert(store.stored().at(kNpe).lastSeenDate == "2024-05-11");
    assert(store.stored().at(kTimeout).totalCount == 6);
    std::cout << "[PASS] Second run: nothing new, counts accumulate" << std::endl;
}

static void testExpiryDuringRun() {
    std::cout << "[Test] Stale history is expired during the run..." << std::endl;
    HistoryMap seed;
    seed["OldException"] = HistoryEntry{"2023-12-01", "2024-01-01", 9};
    seed[kNpe] = HistoryEntry{"2024-04-01", "2024-04-02", 5};
    InMemoryHistoryStore store(seed);

    EngineSettings settings;
    settings.retentionDays = 30;
    RunCoordinator coordinator(settings, store);

    const auto outcome = coordinator.run(batch(), date("2024-05-10"));
    assert(outcome.report.expiredSignatures() == 1);
    assert(store.stored().count("OldException") == 0);

    // Updated before expiry, so an old but re-observed signature survives.
    assert(!outcome.report.isNew(kNpe));
    assert(store.stored().at(kNpe).totalCount == 7);
    std::cout << "[PASS] Stale history is expired during the run" << std::endl;
}

static void testSaveFailure() {
    std::cout << "[Test] Save failure keeps the report..." << std::endl;
    InMemoryHistoryStore store;
    store.setFailSaves(true);
    RunCoordinator coordinator(EngineSettings{}, store);

    const auto outcome = coordinator.run(batch(), date("2024-05-10"));
    assert(!outcome.historySaved);
    assert(!outcome.historyError.empty());
    assert(outcome.report.patternCount() == 2);
    assert(outcome.report.newSignatures().size() == 2);
    assert(store.stored().empty());
    std::cout << "[PASS] Save failure keeps the report" << std::endl;
}

static void testDryRun() {
    std::cout << "[Test] Persistence can be turned off..." << std::endl;
    InMemoryHistoryStore store;
    EngineSettings settings;
    settings.persistHistory = false;
    RunCoordinator coordinator(settings, store);

    const auto first = coordinator.run(batch(), date("2024-05-10"));
    const auto second = coordinator.run(batch(), date("2024-05-10"));
    assert(!first.historySaved && first.historyError.empty());
    assert(store.saveCount() == 0);
    // Nothing was persisted, so the second run still sees everything as new.
    assert(second.report.newSignatures().size() == 2);
    std::cout << "[PASS] Persistence can be turned off" << std::endl;
}

static void testCustomNoise() {
    std::cout << "[Test] Custom noise patterns..." << std::endl;
    InMemoryHistoryStore store;
    EngineSettings settings;
    settings.customNoisePatterns.push_back({"nullpointer", false});
    RunCoordinator coordinator(settings, store);

    const auto outcome = coordinator.run(batch(), date("2024-05-10"));
    assert(outcome.report.attention().empty());
    assert(outcome.report.noise().size() == 2);
    assert(outcome.report.noise()[0].signature() == kTimeout);
    std::cout << "[PASS] Custom noise patterns" << std::endl;
}

static void testConstructionErrors() {
    std::cout << "[Test] Bad settings fail at construction..." << std::endl;
    InMemoryHistoryStore store;

    bool threw = false;
    try {
        EngineSettings settings;
        settings.customNoisePatterns.push_back({"(oops", false});
        RunCoordinator coordinator(settings, store);
    } catch (const ErrorWatch::core::PatternError& e) {
        threw = true;
        assert(e.pattern() == "(oops");
    }
    assert(threw);

    threw = false;
    try {
        EngineSettings settings;
        settings.retentionDays = -1;
        RunCoordinator coordinator(settings, store);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[PASS] Bad settings fail at construction" << std::endl;
}

static void testLifecycleAcrossRuns() {
    std::cout << "[Test] Signature lifecycle across runs..." << std::endl;
    const char* const npe = "NullPointerException: user {id} not found";
    InMemoryHistoryStore store;
    RunCoordinator coordinator(EngineSettings{}, store);

    // Hex ids of different values land in one group.
    const std::vector<LogRecord> day1{
        LogRecord("2024-05-01T09:00:00", "NullPointerException: user 9a8f7e6d1c2b not found", "web"),
        LogRecord("2024-05-01T09:01:00", "NullPointerException: user 00112233aabb not found", "web"),
        LogRecord("2024-05-01T09:02:00", "NullPointerException: user 0badc0ffee11 not found", "web"),
        LogRecord("2024-05-01T09:03:00", "com.foo.bar.SocketTimeoutException: Read timed out", "web"),
    };
    auto outcome = coordinator.run(day1, date("2024-05-01"));
    assert(outcome.report.attention().size() == 1);
    assert(outcome.report.attention()[0].signature() == npe);
    assert(outcome.report.attention()[0].count() == 3);
    assert(outcome.report.noise().size() == 1);
    assert(outcome.report.noise()[0].signature() == kTimeout);
    assert(outcome.report.isNew(npe));
    assert(store.stored().at(npe) == (HistoryEntry{"2024-05-01", "2024-05-01", 3}));

    // Ten days later: known, counts add up.
    const std::vector<LogRecord> day11(day1.begin(), day1.begin() + 2);
    outcome = coordinator.run(day11, date("2024-05-11"));
    assert(outcome.report.newSignatures().empty());
    assert(store.stored().at(npe) == (HistoryEntry{"2024-05-01", "2024-05-11", 5}));

    // 31 days after the last sighting, without a new one: gone.
    outcome = coordinator.run({}, date("2024-06-11"));
    assert(outcome.report.expiredSignatures() == 2);
    assert(store.stored().empty());
    std::cout << "[PASS] Signature lifecycle across runs" << std::endl;
}

static void testLegacyEncodingAcrossRuns() {
    std::cout << "[Test] Latin-1 signature survives the history file..." << std::endl;
    namespace fs = std::filesystem;
    const fs::path dir = fs::temp_directory_path() / "errorwatch_coordinator_test";
    fs::remove_all(dir);

    const std::string expected = "IllegalStateException: caf\xEF\xBF\xBD closed";
    const std::vector<LogRecord> legacy{
        LogRecord("2024-05-01T08:00:00", "IllegalStateException: caf\xE9 closed", "legacy"),
    };

    {
        JsonFileHistoryStore store(dir / "history.json");
        RunCoordinator coordinator(EngineSettings{}, store);
        const auto first = coordinator.run(legacy, date("2024-05-01"));
        assert(first.historySaved);
        assert(first.report.newSignatures().size() == 1);
        assert(first.report.isNew(expected));
    }

    // Fresh store and coordinator: everything comes back from disk.
    JsonFileHistoryStore store(dir / "history.json");
    RunCoordinator coordinator(EngineSettings{}, store);
    const auto second = coordinator.run(legacy, date("2024-05-02"));
    assert(second.historySaved);
    assert(second.report.newSignatures().empty());

    const auto history = store.load();
    assert(history.size() == 1);
    assert(history.at(expected).totalCount == 2);
    assert(history.at(expected).firstSeenDate == "2024-05-01");

    fs::remove_all(dir);
    std::cout << "[PASS] Latin-1 signature survives the history file" << std::endl;
}

static void testEmptyBatch() {
    std::cout << "[Test] Empty batch..." << std::endl;
    InMemoryHistoryStore store;
    RunCoordinator coordinator(EngineSettings{}, store);
    const auto outcome = coordinator.run({}, date("2024-05-10"));
    assert(outcome.report.patternCount() == 0);
    assert(outcome.report.totalRecords() == 0);
    assert(outcome.historySaved);
    std::cout << "[PASS] Empty batch" << std::endl;
}

int main() {
    ErrorWatch::Utils::getLogger().setConsole(nullptr);

    testFirstRun();
    testSecondRun();
    testExpiryDuringRun();
    testSaveFailure();
    testDryRun();
    testCustomNoise();
    testConstructionErrors();
    testLifecycleAcrossRuns();
    testLegacyEncodingAcrossRuns();
    testEmptyBatch();

    std::cout << "[PASS] All RunCoordinator tests" << std::endl;
    return 0;
}
