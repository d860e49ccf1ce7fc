#include <catch2/catch_test_macros.hpp>
#include <fmt/core.h>

#include "sector_map.h"

#include <stdexcept>

using namespace mcregion;


TEST_CASE( "SectorMapFirstFit", "[sectormap]" ) {
	SectorMap map(10, 2);

	REQUIRE(map.size() == 10);
	REQUIRE(map.occ(0));
	REQUIRE(map.occ(1));
	REQUIRE(map.occupiedCount() == 2);

	REQUIRE(map.findFirstFit(0) == std::nullopt);
	REQUIRE(map.findFirstFit(1) == 2);
	REQUIRE(map.findFirstFit(8) == 2);
	REQUIRE(map.findFirstFit(9) == std::nullopt);

	map.mark(2, 3, false);
	REQUIRE(map.occupiedCount() == 5);
	REQUIRE(map.findFirstFit(2) == 5);

	// Punch a one-sector hole: too small for two, first choice for one.
	map.mark(3, 1, true);
	REQUIRE(map.isFree(3));
	REQUIRE(map.findFirstFit(1) == 3);
	REQUIRE(map.findFirstFit(2) == 5);
	REQUIRE(map.findFirstFit(6) == std::nullopt);

	size_t first = map.grow(3, true);
	REQUIRE(first == 10);
	REQUIRE(map.size() == 13);
	REQUIRE(map.findFirstFit(6) == 5);
	REQUIRE(map.findFirstFit(9) == std::nullopt);

	first = map.grow(2, false);
	REQUIRE(first == 13);
	REQUIRE(map.occ(13));
	REQUIRE(map.occ(14));

	std::vector<size_t> expected { 0, 1, 2, 4, 13, 14 };
	REQUIRE(map.occupiedSectors() == expected);
}

TEST_CASE( "SectorMapReservedAndBounds", "[sectormap]" ) {
	SectorMap map(4, 2);

	// Header sectors stay occupied.
	map.mark(0, 4, true);
	REQUIRE(map.occ(0));
	REQUIRE(map.occ(1));
	REQUIRE(map.isFree(2));
	REQUIRE(map.isFree(3));

	REQUIRE_THROWS_AS(map.mark(3, 2, false), std::out_of_range);
	REQUIRE_THROWS_AS(map.mark(5, 1, true), std::out_of_range);

	// A map that starts empty reserves the header as it grows over it.
	SectorMap empty(0, 2);
	REQUIRE(empty.findFirstFit(1) == std::nullopt);
	REQUIRE(empty.grow(3, true) == 0);
	REQUIRE(empty.occ(0));
	REQUIRE(empty.occ(1));
	REQUIRE(empty.isFree(2));
	REQUIRE(empty.findFirstFit(1) == 2);
}
