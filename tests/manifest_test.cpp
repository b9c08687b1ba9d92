/*
 * cascade - Tiered Batch Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <catch2/catch.hpp>

#include "cascade/manifest.hpp"
#include "test_util.hpp"

namespace cascade {
namespace unittest {

TEST_CASE("Job specification parsing", "[manifest]") {
    SECTION("comments, blank lines and CRLF") {
        ManifestResult result = Manifest::parse(
            "# output\taccession\tsamples\n"
            "\n"
            "PRJ1\tGSE100\tGSM1,GSM2\r\n"
            "   \n"
            "PRJ2\tGSE200\tall\n");
        REQUIRE(result);
        REQUIRE(result.studies.size() == 2);

        const StudyRequest& first = result.studies[0];
        REQUIRE(first.outputUnit == "PRJ1");
        REQUIRE(first.accession == "GSE100");
        REQUIRE_FALSE(first.allItems);
        REQUIRE(first.items == std::vector<std::string>{"GSM1", "GSM2"});

        REQUIRE(result.studies[1].allItems);
        REQUIRE(result.studies[1].items.empty());
    }

    SECTION("rows for one output unit merge") {
        ManifestResult result = Manifest::parse(
            "PRJ1\tGSE100\tGSM1, GSM2\n"
            "PRJ1\tGSE100\tGSM2,GSM3\tkey.ngc\n");
        REQUIRE(result.studies.size() == 1);
        REQUIRE(result.studies[0].items == std::vector<std::string>{"GSM1", "GSM2", "GSM3"});
        REQUIRE(result.studies[0].auth == "key.ngc");
    }

    SECTION("all wins over explicit lists") {
        ManifestResult result = Manifest::parse(
            "PRJ1\tGSE100\tGSM1\n"
            "PRJ1\tGSE100\tALL\n"
            "PRJ1\tGSE100\tGSM9\n");
        REQUIRE(result.studies.size() == 1);
        REQUIRE(result.studies[0].allItems);
        REQUIRE(result.studies[0].items.empty());
    }

    SECTION("missing item column means every item") {
        ManifestResult result = Manifest::parse("PRJ1\n");
        REQUIRE(result);
        REQUIRE(result.studies[0].allItems);
        REQUIRE(result.studies[0].accession.empty());
    }

    SECTION("empty specification is an error") {
        ManifestResult result = Manifest::parse("# nothing here\n\n");
        REQUIRE_FALSE(result);
        REQUIRE_FALSE(result.error.empty());
    }

    SECTION("unreadable file") {
        ManifestResult result = Manifest::parseFile("/nonexistent/cascade/jobs.tsv");
        REQUIRE_FALSE(result);
        REQUIRE(result.error.find("jobs.tsv") != std::string::npos);
    }

    SECTION("from a file") {
        TempDir tmp;
        writeFile(tmp / "jobs.tsv", "PRJ3\tGSE3\tGSM7\n");
        ManifestResult result = Manifest::parseFile(tmp / "jobs.tsv");
        REQUIRE(result);
        REQUIRE(result.studies[0].outputUnit == "PRJ3");
    }
}

TEST_CASE("Selectors and rows", "[manifest]") {
    StudyRequest request;
    Manifest::applySelector(request, "GSM1,,GSM1, GSM2 ");
    REQUIRE_FALSE(request.allItems);
    REQUIRE(request.items == std::vector<std::string>{"GSM1", "GSM2"});

    Manifest::applySelector(request, "");
    REQUIRE(request.allItems);

    request.outputUnit = "PRJ1";
    request.accession = "GSE1";
    REQUIRE(Manifest::formatRow(request) == "PRJ1\tGSE1\tall");

    Manifest::applySelector(request, "GSM5,GSM6");
    request.auth = "k.ngc";
    REQUIRE(Manifest::formatRow(request) == "PRJ1\tGSE1\tGSM5,GSM6\tk.ngc");

    ManifestResult back = Manifest::parse(Manifest::formatRow(request));
    REQUIRE(back.studies[0].items == request.items);
}

}
}
