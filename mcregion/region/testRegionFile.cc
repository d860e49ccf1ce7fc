#include <catch2/catch_test_macros.hpp>
#include <fmt/core.h>

#include "region_file.h"
#include "mcregion/detail/testUtil.hpp"

#include <ctime>
#include <map>
#include <random>
#include <set>

using namespace mcregion;

namespace {

	RegionOptions quietOptions() {
		RegionOptions o;
		o.syncOnClose = false;
		return o;
	}

	// Occupied sectors implied by the offset table: header plus every valid run.
	std::vector<size_t> expectedOccupied(RegionFile& region) {
		std::set<size_t> occ { 0, 1 };
		for (int z=0; z<RegionWidth; z++)
			for (int x=0; x<RegionWidth; x++) {
				Location loc = region.location(x,z);
				for (uint32_t s=loc.sectorNumber; s<loc.end(); s++) {
					// Runs must never overlap.
					REQUIRE(occ.count(s) == 0);
					occ.insert(s);
				}
			}
		return std::vector<size_t>(occ.begin(), occ.end());
	}

}


TEST_CASE( "RegionScenario", "[region]" ) {
	TmpRegionPath path("scenario");
	RegionFile region(path, quietOptions());

	REQUIRE(region.sizeDelta() == 8192);
	REQUIRE(region.sizeDelta() == 0);
	REQUIRE(region.chunkCount() == 0);
	REQUIRE(region.sectorCount() == 2);

	std::vector<uint8_t> small(1000, 0xaa);
	region.write(5, 5, small.data(), small.size());
	REQUIRE(region.location(5,5) == Location{2, 1});
	REQUIRE(region.sizeDelta() == 4096);

	std::vector<uint8_t> bigger(5000, 0xbb);
	region.write(5, 5, bigger.data(), bigger.size());
	Location loc = region.location(5,5);
	REQUIRE(loc.sectorCount == 2);
	REQUIRE(loc.sectorNumber == 3);
	REQUIRE(region.sizeDelta() == 8192);
	REQUIRE(region.sectorMap().isFree(2));
	REQUIRE(region.chunkCount() == 1);

	// The freed sector is the first fit for the next small chunk.
	region.write(6, 5, small.data(), small.size());
	REQUIRE(region.location(6,5) == Location{2, 1});
	REQUIRE(region.sizeDelta() == 0);

	region.close();
	REQUIRE(fileLength(path) == 5 * SectorBytes);
}

TEST_CASE( "RegionNameAndAccessors", "[region]" ) {
	TmpRegionPath path("names", -2, 5);
	RegionFile region(path, quietOptions());

	REQUIRE(region.regionX() == -2);
	REQUIRE(region.regionZ() == 5);
	REQUIRE(region.coordinate() == RegionCoordinate{-2, 5});
	REQUIRE(region.path() == path.path);
	REQUIRE(not region.isReadOnly());
	REQUIRE(region.lastModified() == 0);
	REQUIRE(region.isOpen());

	REQUIRE(errorKindOf([]{ RegionFile r("/tmp/notARegion.dat"); }) == ErrorKind::BadRegionName);
}

TEST_CASE( "RegionRoundTripAndRewriteInPlace", "[region]" ) {
	TmpRegionPath path("rewrite");
	RegionFile region(path, quietOptions());
	region.sizeDelta();

	auto a = makeChunkData(3000, 1);
	auto b = makeChunkData(2500, 2);
	EncodedChunk ea = encodeChunk(a);
	EncodedChunk eb = encodeChunk(b);
	REQUIRE(RegionFile::sectorsNeeded(ea.bytes.size()) == 1);
	REQUIRE(RegionFile::sectorsNeeded(eb.bytes.size()) == 1);

	region.write(10, 20, ea);
	Location first = region.location(10,20);
	REQUIRE(region.readAll(10,20) == a);

	region.write(10, 20, eb);
	REQUIRE(region.location(10,20) == first);
	REQUIRE(region.sizeDelta() == 4096);
	REQUIRE(region.readAll(10,20) == b);

	auto stream = region.read(10,20);
	REQUIRE(stream.has_value());
	REQUIRE(stream->version() == DefaultCodecVersion);
}

TEST_CASE( "RegionSectorsNeeded", "[region]" ) {
	REQUIRE(RegionFile::sectorsNeeded(0) == 1);
	REQUIRE(RegionFile::sectorsNeeded(4091) == 1);
	REQUIRE(RegionFile::sectorsNeeded(4092) == 2);
	REQUIRE(RegionFile::sectorsNeeded(5000) == 2);
	REQUIRE(RegionFile::sectorsNeeded(255 * 4096 - 5) == 255);
	REQUIRE(RegionFile::sectorsNeeded(255 * 4096 - 4) == 256);
}

TEST_CASE( "RegionGrowthAccounting", "[region]" ) {
	TmpRegionPath path("growth");
	RegionFile region(path, quietOptions());
	REQUIRE(region.sizeDelta() == 8192);

	int64_t expected = 0;
	size_t sizes[] = { 100, 9000, 4091, 20000, 4092 };
	int x = 0;
	for (size_t n : sizes) {
		std::vector<uint8_t> data(n, 1);
		region.write(x++, 0, data.data(), data.size());
		expected += 4096 * RegionFile::sectorsNeeded(n);
	}
	REQUIRE(region.sizeDelta() == expected);
	REQUIRE(region.sizeDelta() == 0);
	REQUIRE(region.sectorCount() * SectorBytes == 8192 + expected);
}

TEST_CASE( "RegionFreeMapConsistency", "[region]" ) {
	TmpRegionPath path("freemap");
	std::mt19937 rng(1234);

	{
		RegionFile region(path, quietOptions());

		for (int iter=0; iter<400; iter++) {
			int x = rng() % 6;
			int z = rng() % 6;
			if (rng() % 4 == 0) {
				region.remove(x, z);
			} else {
				std::vector<uint8_t> data(1 + rng() % 20000, static_cast<uint8_t>(iter));
				region.write(x, z, data.data(), data.size());
			}

			if (iter % 20 == 0)
				REQUIRE(region.sectorMap().occupiedSectors() == expectedOccupied(region));
		}
		REQUIRE(region.sectorMap().occupiedSectors() == expectedOccupied(region));
	}

	// The map rebuilt from the file matches too.
	RegionFile reopened(path, quietOptions());
	REQUIRE(reopened.sizeDelta() == 0);
	REQUIRE(reopened.sectorMap().occupiedSectors() == expectedOccupied(reopened));
}

TEST_CASE( "RegionBounds", "[region]" ) {
	TmpRegionPath path("bounds");
	RegionFile region(path, quietOptions());
	std::vector<uint8_t> data(10, 1);

	REQUIRE(not region.read(-1, 0).has_value());
	REQUIRE(not region.read(32, 0).has_value());
	REQUIRE(not region.readAll(0, 32).has_value());
	REQUIRE(not region.contains(0, -1));
	REQUIRE(not region.contains(100, 100));

	REQUIRE(errorKindOf([&]{ region.write(32, 0, data.data(), data.size()); }) == ErrorKind::OutOfBounds);
	REQUIRE(errorKindOf([&]{ region.remove(-1, 0); }) == ErrorKind::OutOfBounds);
	REQUIRE(errorKindOf([&]{ region.getChunkWriter(0, -1); }) == ErrorKind::OutOfBounds);
	REQUIRE(errorKindOf([&]{ region.location(0, 32); }) == ErrorKind::OutOfBounds);
	REQUIRE(region.chunkCount() == 0);
}

TEST_CASE( "RegionDelete", "[region]" ) {
	TmpRegionPath path("delete");
	RegionFile region(path, quietOptions());

	auto data = makeChunkData(6000, 4);
	region.write(3, 4, encodeChunk(data));
	REQUIRE(region.contains(3, 4));
	Location loc = region.location(3, 4);

	uint32_t before = static_cast<uint32_t>(time(nullptr));
	region.remove(3, 4);

	REQUIRE(not region.contains(3, 4));
	REQUIRE(not region.read(3, 4).has_value());
	REQUIRE(region.location(3, 4).empty());
	REQUIRE(region.timestamp(3, 4) >= before);
	REQUIRE(region.chunkCount() == 0);
	for (uint32_t s=loc.sectorNumber; s<loc.end(); s++)
		REQUIRE(region.sectorMap().isFree(s));

	// Deleting an empty cell is fine.
	region.remove(3, 4);
	REQUIRE(not region.contains(3, 4));
}

TEST_CASE( "RegionRejectsOversizedChunks", "[region]" ) {
	TmpRegionPath path("toolarge");
	RegionFile region(path, quietOptions());
	region.sizeDelta();

	std::vector<uint8_t> huge(255 * 4096, 0);
	REQUIRE(errorKindOf([&]{ region.write(0, 0, huge.data(), huge.size()); }) == ErrorKind::ChunkTooLarge);
	REQUIRE(region.chunkCount() == 0);
	REQUIRE(region.sectorCount() == 2);
	REQUIRE(region.timestamp(0, 0) == 0);
	REQUIRE(region.sizeDelta() == 0);

	// The biggest chunk that still fits.
	huge.resize(255 * 4096 - 5);
	region.write(0, 0, huge.data(), huge.size());
	REQUIRE(region.location(0, 0) == Location{2, 255});
}

TEST_CASE( "RegionReadOnly", "[region]" ) {
	TmpRegionPath path("readonly");

	REQUIRE(errorKindOf([&]{ RegionFile r(path, RegionOptions::getReadonly()); }) == ErrorKind::NotFound);
	REQUIRE(fileLength(path) == 0);

	auto data = makeChunkData(5000, 8);
	{
		RegionFile region(path, quietOptions());
		region.write(1, 2, encodeChunk(data));
	}

	RegionFile region(path, RegionOptions::getReadonly());
	REQUIRE(region.isReadOnly());
	REQUIRE(region.lastModified() > 0);
	REQUIRE(region.readAll(1, 2) == data);
	REQUIRE(region.sizeDelta() == 0);

	REQUIRE(errorKindOf([&]{ region.write(1, 2, encodeChunk(data)); }) == ErrorKind::ReadOnlyViolation);
	REQUIRE(errorKindOf([&]{ region.remove(1, 2); }) == ErrorKind::ReadOnlyViolation);
	REQUIRE(errorKindOf([&]{ region.getChunkWriter(1, 2); }) == ErrorKind::ReadOnlyViolation);
	REQUIRE(region.contains(1, 2));
}

TEST_CASE( "RegionPersistence", "[region]" ) {
	TmpRegionPath path("persist");
	std::map<std::pair<int,int>, std::vector<uint8_t>> written;
	std::map<std::pair<int,int>, uint32_t> stamps;

	{
		RegionFile region(path, quietOptions());
		for (int i=0; i<20; i++) {
			int x = (i * 7) % 32, z = (i * 13) % 32;
			auto data = makeChunkData(500 + i * 900, i);
			region.write(x, z, encodeChunk(data));
			written[{x,z}] = data;
			stamps[{x,z}] = region.timestamp(x, z);
		}
		region.close();
	}

	RegionFile region(path, RegionOptions::getReadonly());
	REQUIRE(region.chunkCount() == static_cast<int>(written.size()));
	for (auto& kv : written) {
		int x = kv.first.first, z = kv.first.second;
		REQUIRE(region.readAll(x, z) == kv.second);
		REQUIRE(region.timestamp(x, z) == stamps[kv.first]);
	}
}

TEST_CASE( "RegionPadsShortFiles", "[region]" ) {
	SECTION( "tail padded to a whole sector" ) {
		TmpRegionPath path("padtail");
		pokeBytes(path, 0, std::vector<uint8_t>(8192 + 100, 0));

		RegionFile region(path, quietOptions());
		REQUIRE(region.sizeDelta() == 4096 - 100);
		REQUIRE(region.sectorCount() == 3);
		REQUIRE(fileLength(path) == 3 * 4096);
		REQUIRE(region.sectorMap().findFirstFit(1) == 2);
	}

	SECTION( "too short for the tables" ) {
		TmpRegionPath path("padhead");
		pokeBytes(path, 0, std::vector<uint8_t>(10, 0xff));

		RegionFile region(path, quietOptions());
		REQUIRE(region.sizeDelta() == 8192 - 10);
		REQUIRE(region.chunkCount() == 0);
		REQUIRE(fileLength(path) == 8192);
	}
}

TEST_CASE( "RegionDetectsDamage", "[region]" ) {
	TmpRegionPath path("damage");
	auto data = makeChunkData(3000, 12);
	{
		RegionFile region(path, quietOptions());
		region.write(0, 0, encodeChunk(data));
		REQUIRE(region.location(0, 0) == Location{2, 1});
	}

	SECTION( "run past the end of the file" ) {
		pokeBigEndian32(path, 4 * chunkIndex(1, 0), Location{100, 1}.pack());
		RegionFile region(path, quietOptions());
		auto kind = errorKindOf([&]{ region.read(1, 0); });
		REQUIRE(kind == ErrorKind::InvalidSector);
		REQUIRE(region.readAll(0, 0) == data);

		// The damaged cell can be overwritten.
		region.write(1, 0, encodeChunk(data));
		REQUIRE(region.readAll(1, 0) == data);
		REQUIRE(region.sectorMap().occupiedSectors() == expectedOccupied(region));
	}

	SECTION( "run inside the header" ) {
		pokeBigEndian32(path, 4 * chunkIndex(2, 0), Location{1, 1}.pack());
		RegionFile region(path, RegionOptions::getReadonly());
		REQUIRE(errorKindOf([&]{ region.read(2, 0); }) == ErrorKind::InvalidSector);
	}

	SECTION( "length longer than the run" ) {
		pokeBigEndian32(path, 2 * 4096, 10000);
		RegionFile region(path, RegionOptions::getReadonly());
		REQUIRE(errorKindOf([&]{ region.read(0, 0); }) == ErrorKind::InvalidLength);
	}

	SECTION( "zero length" ) {
		pokeBigEndian32(path, 2 * 4096, 0);
		RegionFile region(path, RegionOptions::getReadonly());
		REQUIRE(errorKindOf([&]{ region.read(0, 0); }) == ErrorKind::InvalidLength);
	}

	SECTION( "unknown version" ) {
		pokeBytes(path, 2 * 4096 + 4, { 7 });
		RegionFile region(path, RegionOptions::getReadonly());
		REQUIRE(errorKindOf([&]{ region.read(0, 0); }) == ErrorKind::UnsupportedCodecVersion);
	}

	SECTION( "garbled payload" ) {
		pokeBytes(path, 2 * 4096 + 5, { 0xde, 0xad, 0xbe, 0xef });
		RegionFile region(path, RegionOptions::getReadonly());
		try {
			region.readAll(0, 0);
			FAIL("garbled chunk was decoded");
		} catch (const RegionError& e) {
			REQUIRE(e.kind() == ErrorKind::CorruptPayload);
			REQUIRE(e.isCorruption());
		}
	}
}

TEST_CASE( "RegionEntryPastEndStaysUnmapped", "[region]" ) {
	TmpRegionPath path("pastend");
	auto a = makeChunkData(2000, 21);
	auto b = makeChunkData(2500, 22);
	{
		RegionFile region(path, quietOptions());
		region.write(0, 0, encodeChunk(a));
		REQUIRE(region.sectorCount() == 3);
	}

	// (1,0) claims the sector right after the end of the file.
	pokeBigEndian32(path, 4 * chunkIndex(1, 0), Location{3, 1}.pack());

	RegionFile region(path, quietOptions());
	REQUIRE(region.sectorCount() == 3);

	// The file grows over the bogus run.
	region.write(2, 0, encodeChunk(b));
	REQUIRE(region.location(2, 0) == Location{3, 1});
	REQUIRE(errorKindOf([&]{ region.read(1, 0); }) == ErrorKind::InvalidSector);

	SECTION( "rewrite at the same sector count" ) {
		region.write(1, 0, encodeChunk(a));
		REQUIRE(region.location(1, 0) != Location{3, 1});
		REQUIRE(region.readAll(1, 0) == a);
		REQUIRE(region.readAll(2, 0) == b);
		REQUIRE(region.sectorMap().occupiedSectors() == expectedOccupied(region));

		// From now on the cell owns its run like any other.
		region.remove(1, 0);
		REQUIRE(region.sectorMap().occupiedSectors() == expectedOccupied(region));
	}

	SECTION( "remove" ) {
		region.remove(1, 0);
		REQUIRE(not region.contains(1, 0));
		REQUIRE(region.sectorMap().occ(3));
		REQUIRE(region.readAll(2, 0) == b);
		REQUIRE(region.sectorMap().occupiedSectors() == expectedOccupied(region));
	}

	REQUIRE(region.readAll(0, 0) == a);
}

TEST_CASE( "RegionClosed", "[region]" ) {
	TmpRegionPath path("closed");
	RegionFile region(path, quietOptions());
	std::vector<uint8_t> data(10, 1);

	region.close();
	REQUIRE(not region.isOpen());
	region.close();

	REQUIRE(errorKindOf([&]{ region.read(0, 0); }) == ErrorKind::Closed);
	REQUIRE(errorKindOf([&]{ region.write(0, 0, data.data(), data.size()); }) == ErrorKind::Closed);
	REQUIRE(errorKindOf([&]{ region.remove(0, 0); }) == ErrorKind::Closed);
	REQUIRE(errorKindOf([&]{ region.chunkCount(); }) == ErrorKind::Closed);
	REQUIRE(errorKindOf([&]{ region.sizeDelta(); }) == ErrorKind::Closed);
}
