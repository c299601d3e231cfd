#include <iostream>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <cassert>

#include "history/InMemoryHistoryStore.hpp"
#include "history/JsonFileHistoryStore.hpp"
#include "utils/Logger.hpp"

namespace fs = std::filesystem;

using ErrorWatch::History::HistoryEntry;
using ErrorWatch::History::HistoryMap;
using ErrorWatch::History::HistoryStore;
using ErrorWatch::History::InMemoryHistoryStore;
using ErrorWatch::History::JsonFileHistoryStore;
using ErrorWatch::Utils::CivilDate;

static CivilDate date(const char* s) {
    auto d = CivilDate::parse(s);
    assert(d.has_value());
    return *d;
}

static ErrorWatch::core::AggregateMap groupsOf(std::initializer_list<std::pair<const char*, std::uint64_t>> items) {
    ErrorWatch::core::AggregateMap m;
    for (const auto& [sig, count] : items) {
        m[sig].signature = sig;
        m[sig].count = count;
    }
    return m;
}

static void writeFile(const fs::path& p, const std::string& content) {
    std::ofstream out(p);
    out << content;
}

static void testColdStartUpdate() {
    std::cout << "[Test] First observation creates entries..." << std::endl;
    HistoryMap history;
    const auto fresh = HistoryStore::update(history, groupsOf({{"A", 3}}), date("2024-05-10"));

    assert(fresh.size() == 1 && fresh.count("A") == 1);
    const auto& e = history.at("A");
    assert(e.firstSeenDate == "2024-05-10");
    assert(e.lastSeenDate == "2024-05-10");
    assert(e.totalCount == 3);
    std::cout << "[PASS] First observation creates entries" << std::endl;
}

static void testRecurringUpdate() {
    std::cout << "[Test] Known signatures are not new and accumulate..." << std::endl;
    HistoryMap history;
    history["A"] = HistoryEntry{"2024-05-01", "2024-05-05", 10};

    const auto fresh = HistoryStore::update(history, groupsOf({{"A", 2}, {"B", 1}}), date("2024-05-10"));
    assert(fresh.size() == 1 && fresh.count("B") == 1);

    assert(history.at("A").firstSeenDate == "2024-05-01");
    assert(history.at("A").lastSeenDate == "2024-05-10");
    assert(history.at("A").totalCount == 12);
    assert(history.at("B").totalCount == 1);
    std::cout << "[PASS] Known signatures are not new and accumulate" << std::endl;
}

static void testExpiryBoundary() {
    std::cout << "[Test] Retention boundary..." << std::endl;
    HistoryMap history;
    history["edge"]    = HistoryEntry{"2024-04-01", "2024-05-01", 1}; // exactly today - 30
    history["stale"]   = HistoryEntry{"2024-04-01", "2024-04-30", 1};
    history["recent"]  = HistoryEntry{"2024-05-20", "2024-05-31", 1};
    history["garbage"] = HistoryEntry{"?", "not-a-date", 1};

    const auto removed = HistoryStore::expire(history, date("2024-05-31"), 30);
    assert(removed == 2);
    assert(history.size() == 2);
    assert(history.count("edge") == 1);
    assert(history.count("recent") == 1);

    bool threw = false;
    try {
        HistoryStore::expire(history, date("2024-05-31"), -1);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[PASS] Retention boundary" << std::endl;
}

static void testExpiredSignatureIsNewAgain() {
    std::cout << "[Test] Expired signature comes back as new..." << std::endl;
    HistoryMap history;
    history["A"] = HistoryEntry{"2024-01-01", "2024-01-02", 50};

    HistoryStore::expire(history, date("2024-05-01"), 30);
    assert(history.empty());

    const auto fresh = HistoryStore::update(history, groupsOf({{"A", 1}}), date("2024-05-01"));
    assert(fresh.count("A") == 1);
    assert(history.at("A").totalCount == 1);
    assert(history.at("A").firstSeenDate == "2024-05-01");
    std::cout << "[PASS] Expired signature comes back as new" << std::endl;
}

static void testJsonRoundTrip(const fs::path& dir) {
    std::cout << "[Test] JSON file round trip..." << std::endl;
    const fs::path path = dir / "nested" / "deeper" / "history.json";
    JsonFileHistoryStore store(path);

    // Missing file is a cold start.
    assert(store.load().empty());

    HistoryMap history;
    history["IOException: disk {num} full"] = HistoryEntry{"2024-05-01", "2024-05-03", 42};
    history["DbError: \xED\x85\x8C\xEC\x9D\xB4\xEB\xB8\x94 \"orders\" {id}"] = HistoryEntry{"2024-04-11", "2024-05-03", 7};
    history["[ERROR] tab\there"] = HistoryEntry{"2024-05-02", "2024-05-02", 0};

    const auto saved = store.save(history);
    assert(saved.ok);
    assert(saved.error.empty());
    assert(fs::exists(path));

    const HistoryMap loaded = store.load();
    assert(loaded == history);

    // No temp files left next to the target.
    std::size_t files = 0;
    for (const auto& entry : fs::directory_iterator(path.parent_path())) {
        (void)entry;
        ++files;
    }
    assert(files == 1);

    // A second save fully replaces the first.
    HistoryMap smaller;
    smaller["only"] = HistoryEntry{"2024-05-04", "2024-05-04", 1};
    assert(store.save(smaller).ok);
    assert(store.load() == smaller);
    std::cout << "[PASS] JSON file round trip" << std::endl;
}

static void testCorruptFiles(const fs::path& dir) {
    std::cout << "[Test] Corrupt history loads as empty..." << std::endl;
    const fs::path path = dir / "corrupt.json";

    writeFile(path, "{not json at all");
    assert(JsonFileHistoryStore(path).load().empty());

    writeFile(path, "[1, 2, 3]");
    assert(JsonFileHistoryStore(path).load().empty());

    writeFile(path, R"({
        "good":    {"first_seen": "2024-01-01", "last_seen": "2024-01-02", "total_count": 3},
        "nocount": {"first_seen": "2024-01-01", "last_seen": "2024-01-02"},
        "number":  5,
        "partial": {"first_seen": "2024-01-01"},
        "negative": {"first_seen": "2024-01-01", "last_seen": "2024-01-02", "total_count": -4}
    })");
    const auto loaded = JsonFileHistoryStore(path).load();
    assert(loaded.size() == 2);
    assert(loaded.at("good").totalCount == 3);
    assert(loaded.at("nocount").totalCount == 0);
    std::cout << "[PASS] Corrupt history loads as empty" << std::endl;
}

static void testUnwritableLocation(const fs::path& dir) {
    std::cout << "[Test] Save failure is reported, not thrown..." << std::endl;
    const fs::path blocker = dir / "blocker";
    writeFile(blocker, "a regular file, not a directory");

    JsonFileHistoryStore store(blocker / "history.json");
    HistoryMap history;
    history["A"] = HistoryEntry{"2024-05-01", "2024-05-01", 1};

    const auto result = store.save(history);
    assert(!result.ok);
    assert(!result.error.empty());
    std::cout << "[PASS] Save failure is reported, not thrown" << std::endl;
}

static void testInMemoryStore() {
    std::cout << "[Test] In-memory store..." << std::endl;
    HistoryMap seed;
    seed["A"] = HistoryEntry{"2024-05-01", "2024-05-01", 1};
    InMemoryHistoryStore store(seed);
    assert(store.load() == seed);

    HistoryMap next = seed;
    next["B"] = HistoryEntry{"2024-05-02", "2024-05-02", 2};
    assert(store.save(next).ok);
    assert(store.stored() == next);
    assert(store.saveCount() == 1);

    store.setFailSaves(true, "disk on fire");
    const auto failed = store.save(seed);
    assert(!failed.ok);
    assert(failed.error == "disk on fire");
    assert(store.stored() == next);
    assert(store.saveCount() == 1);
    std::cout << "[PASS] In-memory store" << std::endl;
}

int main() {
    ErrorWatch::Utils::getLogger().setConsole(nullptr);

    const fs::path dir = fs::temp_directory_path() / "errorwatch_history_test";
    fs::remove_all(dir);
    fs::create_directories(dir);

    testColdStartUpdate();
    testRecurringUpdate();
    testExpiryBoundary();
    testExpiredSignatureIsNewAgain();
    testJsonRoundTrip(dir);
    testCorruptFiles(dir);
    testUnwritableLocation(dir);
    testInMemoryStore();

    fs::remove_all(dir);
    std::cout << "[PASS] All HistoryStore tests" << std::endl;
    return 0;
}
