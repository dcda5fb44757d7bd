#include <nadeef/core/diagnostics.hpp>

#include <catch2/catch_test_macros.hpp>

#include <chrono>

using namespace std::chrono_literals;

TEST_CASE("diagnostics: spdlog sink accumulates stats", "[diagnostics]") {
    nadeef::SpdlogSink sink;
    sink.record(nadeef::StatType::QueryTime, 5ms);
    sink.record(nadeef::StatType::QueryTime, 7ms);

    auto query = sink.stat(nadeef::StatType::QueryTime);
    CHECK(query.total == 12ms);
    CHECK(query.count == 2);
    CHECK(sink.stat(nadeef::StatType::ExportTime).count == 0);
    CHECK_NOTHROW(sink.dump_stats());
}

TEST_CASE("diagnostics: scoped timer records once on exit", "[diagnostics]") {
    nadeef::SpdlogSink sink;
    {
        nadeef::ScopedTimer timer(sink, nadeef::StatType::DetectTime);
    }
    CHECK(sink.stat(nadeef::StatType::DetectTime).count == 1);
}

TEST_CASE("diagnostics: stat names", "[diagnostics]") {
    CHECK(nadeef::to_string(nadeef::StatType::DbLoadTime) == "db-load");
    CHECK(nadeef::to_string(nadeef::StatType::FlowTime) == "flow");
}

TEST_CASE("diagnostics: default sink is shared", "[diagnostics]") {
    CHECK(nadeef::default_sink() == nadeef::default_sink());
    CHECK(nadeef::default_sink() != nullptr);
}
