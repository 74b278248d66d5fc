#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest.h"
#include "cli/command_hashing.h"
#include "cli/arg_parser.h"

#include <string>

TEST_CASE("FNV-1a basic correctness")
{
    CHECK(fnv1a("") == 2166136261u);
    CHECK(fnv1a("start") != fnv1a("stop"));
    CHECK(fnv1a("ls") != fnv1a("LS"));
    CHECK(fnv1a("create") != fnv1a("remove"));
}

TEST_CASE("FNV-1a usable in switch labels")
{
    constexpr uint32_t h = fnv1a("restart");
    static_assert(h == fnv1a("restart"));
    CHECK(h == fnv1a(std::string("restart")));
}

TEST_CASE("FNV-1a IPC commands unique")
{
    uint32_t hashes[] = {
        fnv1a("create"), fnv1a("start"), fnv1a("stop"), fnv1a("restart"),
        fnv1a("remove"), fnv1a("rm"), fnv1a("update"), fnv1a("ls"),
        fnv1a("show"), fnv1a("user"), fnv1a("cert"), fnv1a("logs"),
        fnv1a("daemon"), fnv1a("help"), fnv1a("version")
    };

    size_t count = sizeof(hashes) / sizeof(hashes[0]);
    for (size_t i = 0; i < count; i++)
        for (size_t j = i + 1; j < count; j++)
            CHECK(hashes[i] != hashes[j]);
}

TEST_CASE("FNV-1a create and update flags unique")
{
    uint32_t hashes[] = {
        fnv1a("-p"), fnv1a("--port"), fnv1a("--https"), fnv1a("--no-https"),
        fnv1a("--dpi"), fnv1a("--no-dpi"), fnv1a("--forward"), fnv1a("--cover"),
        fnv1a("--no-cover"), fnv1a("--cn"), fnv1a("--user"), fnv1a("-s"),
        fnv1a("--start"), fnv1a("--days"), fnv1a("--bits"), fnv1a("-n")
    };

    size_t count = sizeof(hashes) / sizeof(hashes[0]);
    for (size_t i = 0; i < count; i++)
        for (size_t j = i + 1; j < count; j++)
            CHECK(hashes[i] != hashes[j]);
}

TEST_CASE("parsed_args tokenizes a command line")
{
    parsed_args pa;

    SUBCASE("collapses repeated whitespace")
    {
        pa.parse("  create\tforward   office -p 3128 ");
        REQUIRE(pa.count == 5);
        CHECK(pa.args[0] == "create");
        CHECK(pa.args[2] == "office");
        CHECK(pa.hashes[3] == fnv1a("-p"));
        CHECK(pa.args[4] == "3128");
        CHECK_FALSE(pa.truncated);
    }

    SUBCASE("empty line")
    {
        pa.parse("   ");
        CHECK(pa.count == 0);
    }

    SUBCASE("rest_from keeps inner spacing")
    {
        pa.parse("user add office alice correct  horse battery");
        CHECK(pa.rest_from(4) == "correct  horse battery");
        CHECK(pa.rest_from(10).empty());
    }

    SUBCASE("too many tokens is flagged")
    {
        std::string line;
        for (size_t i = 0; i < MAX_ARGS + 3; ++i)
            line += "x ";
        pa.parse(line);
        CHECK(pa.count == MAX_ARGS);
        CHECK(pa.truncated);
    }
}
