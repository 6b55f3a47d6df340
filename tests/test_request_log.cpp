#include <catch2/catch_test_macros.hpp>

#include "storage/request_log.hpp"

#include <cstdlib>
#include <filesystem>
#include <string>
#include <unistd.h>

namespace {

struct TmpDb {
    std::string path;

    TmpDb() {
        path = std::filesystem::temp_directory_path() /
               ("micdrop_test_db_" + std::to_string(getpid()) + ".sqlite");
    }

    ~TmpDb() {
        std::filesystem::remove(path);
        std::filesystem::remove(path + "-wal");
        std::filesystem::remove(path + "-shm");
    }
};

RequestRecord make_record(std::string route, std::string status) {
    RequestRecord r;
    r.route = std::move(route);
    r.status = std::move(status);
    r.latency_ms = 1.5;
    return r;
}

} // namespace

TEST_CASE("RequestLog", "[history]") {

    SECTION("OpenCreatesFile") {
        TmpDb tmp;
        RequestLog log;
        REQUIRE(log.open(tmp.path));
        REQUIRE(log.is_open());
        REQUIRE(std::filesystem::exists(tmp.path));
    }

    SECTION("OpenFailsForUnwritablePath") {
        RequestLog log;
        REQUIRE_FALSE(log.open("/proc/micdrop/history.db"));
        REQUIRE_FALSE(log.is_open());
        REQUIRE_FALSE(log.insert(make_record("toggle-mic", "ok")));
        REQUIRE(log.count() == 0);
        REQUIRE(log.total_served() == 0);
    }

    SECTION("InsertAndRetrieve") {
        TmpDb tmp;
        RequestLog log;
        REQUIRE(log.open(tmp.path));

        auto rec = make_record("toggle-mic", "ok");
        rec.muted = true;
        REQUIRE(log.insert(rec));

        auto entries = log.recent(1);
        REQUIRE(entries.size() == 1);
        REQUIRE(entries[0].id > 0);
        REQUIRE(entries[0].route == "toggle-mic");
        REQUIRE(entries[0].status == "ok");
        REQUIRE(entries[0].muted == true);
        REQUIRE_FALSE(entries[0].volume.has_value());
        REQUIRE(entries[0].latency_ms == 1.5);
    }

    SECTION("VolumeStored") {
        TmpDb tmp;
        RequestLog log;
        REQUIRE(log.open(tmp.path));

        auto rec = make_record("volume/set", "ok");
        rec.volume = 0.3;
        REQUIRE(log.insert(rec));

        auto entries = log.recent(1);
        REQUIRE(entries[0].volume == 0.3);
        REQUIRE_FALSE(entries[0].muted.has_value());
    }

    SECTION("ReverseChronological") {
        TmpDb tmp;
        RequestLog log;
        REQUIRE(log.open(tmp.path));

        REQUIRE(log.insert(make_record("first", "ok")));
        REQUIRE(log.insert(make_record("second", "ok")));
        REQUIRE(log.insert(make_record("third", "ok")));

        auto entries = log.recent(3);
        REQUIRE(entries.size() == 3);
        REQUIRE(entries[0].route == "third");
        REQUIRE(entries[1].route == "second");
        REQUIRE(entries[2].route == "first");
    }

    SECTION("LimitWorks") {
        TmpDb tmp;
        RequestLog log;
        REQUIRE(log.open(tmp.path));

        for (int i = 0; i < 5; ++i) {
            REQUIRE(log.insert(make_record("volume/increase", "ok")));
        }
        REQUIRE(log.recent(2).size() == 2);
        REQUIRE(log.count() == 5);
    }

    SECTION("PrunedToMaxEntries") {
        TmpDb tmp;
        RequestLog log;
        REQUIRE(log.open(tmp.path, 3));

        for (int i = 0; i < 6; ++i) {
            REQUIRE(log.insert(make_record("route " + std::to_string(i), "ok")));
        }
        REQUIRE(log.count() == 3);
        auto entries = log.recent(10);
        REQUIRE(entries.size() == 3);
        REQUIRE(entries[0].route == "route 5");
        REQUIRE(entries[2].route == "route 3");
    }

    SECTION("ReopenKeepsRows") {
        TmpDb tmp;
        {
            RequestLog log;
            REQUIRE(log.open(tmp.path));
            REQUIRE(log.insert(make_record("toggle-mic", "timeout")));
        }
        RequestLog log;
        REQUIRE(log.open(tmp.path));
        REQUIRE(log.count() == 1);
        REQUIRE(log.recent(1)[0].status == "timeout");
    }

    SECTION("ServedCountSurvivesPruningAndRestart") {
        TmpDb tmp;
        {
            RequestLog log;
            REQUIRE(log.open(tmp.path, 3));
            for (int i = 0; i < 5; ++i) {
                REQUIRE(log.insert(make_record("toggle-mic", "ok")));
            }
            REQUIRE(log.count() == 3);
            REQUIRE(log.total_served() == 5);
        }
        RequestLog log;
        REQUIRE(log.open(tmp.path, 3));
        REQUIRE(log.total_served() == 5);
        REQUIRE(log.insert(make_record("volume/set", "ok")));
        REQUIRE(log.total_served() == 6);
        REQUIRE(log.count() == 3);
    }

    SECTION("TimestampAutoPopulated") {
        TmpDb tmp;
        RequestLog log;
        REQUIRE(log.open(tmp.path));
        REQUIRE(log.insert(make_record("toggle-mic", "ok")));

        auto entries = log.recent(1);
        REQUIRE(entries.size() == 1);
        REQUIRE_FALSE(entries[0].timestamp.empty());
    }
}
