#include <catch2/catch_test_macros.hpp>

#include "mcregion/coordinates.h"
#include "mcregion/region/header_tables.h"
#include "mcregion/detail/testUtil.hpp"

using namespace mcregion;


TEST_CASE( "ChunkToRegionFloors", "[coordinates]" ) {
	REQUIRE(chunkToRegion(0) == 0);
	REQUIRE(chunkToRegion(31) == 0);
	REQUIRE(chunkToRegion(32) == 1);
	REQUIRE(chunkToRegion(-1) == -1);
	REQUIRE(chunkToRegion(-32) == -1);
	REQUIRE(chunkToRegion(-33) == -2);

	REQUIRE(chunkToLocal(-1) == 31);
	REQUIRE(chunkToLocal(-32) == 0);
	REQUIRE(chunkToLocal(-33) == 31);
	REQUIRE(chunkToLocal(65) == 1);

	auto rc = RegionCoordinate::fromChunk(30, -3);
	REQUIRE(rc == RegionCoordinate{0, -1});
	REQUIRE(chunkToLocal(30) == 30);
	REQUIRE(chunkToLocal(-3) == 29);

	REQUIRE(chunkIndex(5, 5) == 165);
	REQUIRE(outOfBounds(-1, 0));
	REQUIRE(outOfBounds(0, 32));
	REQUIRE(not outOfBounds(31, 31));
}

TEST_CASE( "RegionNames", "[coordinates]" ) {
	REQUIRE(regionFileName(0, -1) == "r.0.-1.mcr");
	REQUIRE(regionFileName(12, 3, "mca") == "r.12.3.mca");

	REQUIRE(parseRegionName("r.0.-1.mcr") == RegionCoordinate{0, -1});
	REQUIRE(parseRegionName("/some/world/region/r.-3.7.mca") == RegionCoordinate{-3, 7});

	REQUIRE(errorKindOf([]{ parseRegionName("level.dat"); }) == ErrorKind::BadRegionName);
	REQUIRE(errorKindOf([]{ parseRegionName("r.a.b.mcr"); }) == ErrorKind::BadRegionName);
	REQUIRE(errorKindOf([]{ parseRegionName("r..1.mcr"); }) == ErrorKind::BadRegionName);
	REQUIRE(errorKindOf([]{ parseRegionName("/tmp/r.1.2/region"); }) == ErrorKind::BadRegionName);
}

TEST_CASE( "LocationPacking", "[coordinates]" ) {
	Location loc { 1234, 17 };
	REQUIRE(loc.pack() == ((1234u << 8) | 17u));
	REQUIRE(Location::unpack(loc.pack()) == loc);
	REQUIRE(loc.end() == 1251);
	REQUIRE(Location{}.empty());
	REQUIRE(Location::unpack(0).empty());
}
