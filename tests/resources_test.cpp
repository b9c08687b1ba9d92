/*
 * cascade - Tiered Batch Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <catch2/catch.hpp>

#include "cascade/resources.hpp"

namespace cascade {
namespace unittest {

TEST_CASE("CPU reserve grows with the core count", "[resources]") {
    REQUIRE(ResourceProbe::cpuReserve(1) == 0);
    REQUIRE(ResourceProbe::cpuReserve(4) == 0);
    REQUIRE(ResourceProbe::cpuReserve(5) == 1);
    REQUIRE(ResourceProbe::cpuReserve(8) == 1);
    REQUIRE(ResourceProbe::cpuReserve(9) == 2);
    REQUIRE(ResourceProbe::cpuReserve(128) == 2);
}

TEST_CASE("Budget subtracts the reserves from the host", "[resources]") {
    HostTotals host{16, 32768, 20000, true};

    SECTION("whole host") {
        ResourceBudget b = ResourceProbe::budget(host, 1, 10);
        REQUIRE(b.totalCpus == 16);
        REQUIRE(b.reservedCpus == 2);
        REQUIRE(b.usableCpus == 14);
        REQUIRE(b.availableMemoryMiB == 20000);
        REQUIRE(b.reservedMemoryMiB == 2000);
        REQUIRE(b.usableMemoryMiB == 18000);
    }

    SECTION("shared between two batches") {
        ResourceBudget b = ResourceProbe::budget(host, 2, 10);
        REQUIRE(b.parallelBatches == 2);
        REQUIRE(b.totalCpus == 8);
        REQUIRE(b.reservedCpus == 1);
        REQUIRE(b.usableCpus == 7);
        REQUIRE(b.availableMemoryMiB == 10000);
        REQUIRE(b.usableMemoryMiB == 9000);
    }

    SECTION("no memory reserve") {
        ResourceBudget b = ResourceProbe::budget(host, 1, 0);
        REQUIRE(b.reservedMemoryMiB == 0);
        REQUIRE(b.usableMemoryMiB == 20000);
    }

    SECTION("usable never exceeds available") {
        for (int parallel = 1; parallel <= 8; ++parallel) {
            ResourceBudget b = ResourceProbe::budget(host, parallel, 10);
            REQUIRE(b.usableCpus >= ResourceProbe::kMinUsableCpus);
            REQUIRE(b.usableMemoryMiB <= b.availableMemoryMiB);
        }
    }
}

TEST_CASE("Small hosts keep two usable CPUs", "[resources]") {
    HostTotals host{2, 4096, 3000, true};
    ResourceBudget b = ResourceProbe::budget(host, 1, 10);
    REQUIRE(b.reservedCpus == 0);
    REQUIRE(b.usableCpus == 2);

    HostTotals tiny{1, 1024, 512, true};
    REQUIRE(ResourceProbe::budget(tiny, 4, 10).usableCpus == 2);
}

TEST_CASE("Meminfo parsing", "[resources]") {
    SECTION("modern kernel") {
        MemInfo info = ResourceProbe::parseMemInfo(
            "MemTotal:       65536000 kB\n"
            "MemFree:         1000000 kB\n"
            "MemAvailable:   40000000 kB\n"
            "Buffers:          200000 kB\n");
        REQUIRE(info.totalKiB);
        REQUIRE(*info.totalKiB == 65536000);
        REQUIRE(info.availableKiB);
        REQUIRE(*info.availableKiB == 40000000);
    }

    SECTION("no MemAvailable line") {
        MemInfo info = ResourceProbe::parseMemInfo("MemTotal: 1024 kB\nMemFree: 512 kB\n");
        REQUIRE(info.totalKiB);
        REQUIRE_FALSE(info.availableKiB);
    }

    SECTION("garbage") {
        MemInfo info = ResourceProbe::parseMemInfo("not meminfo at all");
        REQUIRE_FALSE(info.totalKiB);
        REQUIRE_FALSE(info.availableKiB);
    }
}

TEST_CASE("Probing the host never fails", "[resources]") {
    HostTotals host = ResourceProbe::probeHost();
    REQUIRE(host.cpus > 0);
    REQUIRE(host.totalMemoryMiB > 0);
    REQUIRE(host.availableMemoryMiB > 0);

    REQUIRE(ResourceProbe::freeDiskMiB("/"));
    REQUIRE_FALSE(describeBudget(ResourceProbe::budget(host)).empty());
}

}
}
