#include <catch2/catch_test_macros.hpp>
#include <fmt/core.h>

#include "region_file.h"
#include "chunk_buffer.h"
#include "parallel_writer.h"
#include "mcregion/detail/testUtil.hpp"

#include <stdexcept>

using namespace mcregion;

namespace {

	RegionOptions quietOptions() {
		RegionOptions o;
		o.syncOnClose = false;
		return o;
	}

	std::vector<uint8_t> cellData(int x, int z) {
		int i = chunkIndex(x, z);
		return makeChunkData(1000 + i * 37, i);
	}

}


TEST_CASE( "ChunkBufferCommitsOnScopeExit", "[chunkbuffer]" ) {
	TmpRegionPath path("bufscope");
	RegionFile region(path, quietOptions());
	auto data = makeChunkData(30'000, 1);

	{
		auto buffer = region.getChunkWriter(3, 4);
		REQUIRE(buffer.x() == 3);
		REQUIRE(buffer.z() == 4);
		buffer.write(data.data(), 10'000);
		buffer.write(data.data() + 10'000, data.size() - 10'000);
		REQUIRE(buffer.size() == data.size());

		// Nothing reaches the region before the commit.
		REQUIRE(not region.contains(3, 4));
	}

	REQUIRE(region.contains(3, 4));
	REQUIRE(region.readAll(3, 4) == data);
}

TEST_CASE( "ChunkBufferCommitsDuringUnwinding", "[chunkbuffer]" ) {
	TmpRegionPath path("bufunwind");
	RegionFile region(path, quietOptions());
	auto data = makeChunkData(5000, 2);

	try {
		auto buffer = region.getChunkWriter(0, 31);
		buffer.write(data);
		throw std::runtime_error("producer gave up");
	} catch (const std::runtime_error& e) {
		REQUIRE(std::string(e.what()) == "producer gave up");
	}

	REQUIRE(region.readAll(0, 31) == data);
}

TEST_CASE( "ChunkBufferCommitsOnce", "[chunkbuffer]" ) {
	TmpRegionPath path("bufonce");
	RegionFile region(path, quietOptions());
	auto data = makeChunkData(2000, 3);

	{
		auto buffer = region.getChunkWriter(7, 7);
		buffer.write(data);
		buffer.commit();
		REQUIRE(buffer.committed());
		REQUIRE(region.readAll(7, 7) == data);

		buffer.commit();
		REQUIRE_THROWS_AS(buffer.write(data), std::logic_error);

		// If the destructor committed again the cell would come back.
		region.remove(7, 7);
	}

	REQUIRE(not region.contains(7, 7));
	REQUIRE(region.chunkCount() == 0);
}

TEST_CASE( "ChunkBufferMoveAndDiscard", "[chunkbuffer]" ) {
	TmpRegionPath path("bufmove");
	RegionFile region(path, quietOptions());
	auto data = makeChunkData(4000, 4);

	{
		auto a = region.getChunkWriter(1, 1);
		a.write(data);
		ChunkBuffer b(std::move(a));
		REQUIRE(a.committed());
		REQUIRE(not b.committed());
		REQUIRE(b.size() == data.size());
	}
	REQUIRE(region.readAll(1, 1) == data);

	{
		auto c = region.getChunkWriter(2, 2);
		c.write(data);
		c.discard();
		REQUIRE(c.committed());
	}
	REQUIRE(not region.contains(2, 2));
}

TEST_CASE( "ChunkBufferReportsCommitFailure", "[chunkbuffer]" ) {
	TmpRegionPath path("buffail");
	RegionFile region(path, quietOptions());

	auto buffer = region.getChunkWriter(5, 5);
	buffer.write(makeChunkData(100, 5));
	region.close();

	REQUIRE(errorKindOf([&]{ buffer.commit(); }) == ErrorKind::Closed);
	// Not retried by the destructor.
	REQUIRE(buffer.committed());
}

TEST_CASE( "ParallelChunkWriterFillsRegion", "[chunkbuffer][parallel]" ) {
	TmpRegionPath path("parallel");
	RegionFile region(path, quietOptions());

	ParallelChunkWriter writer(region, [](int x, int z, ChunkBuffer& buffer) {
		buffer.write(cellData(x, z));
	});
	REQUIRE(writer.getThreadCount() == MCREGION_WRITER_THREADS);

	for (int z=0; z<RegionWidth; z++)
		for (int x=0; x<RegionWidth; x++)
			writer.submit(x, z);
	writer.finish();

	REQUIRE(writer.chunksWritten() == ChunksPerRegion);
	REQUIRE(writer.chunksFailed() == 0);
	REQUIRE(region.chunkCount() == ChunksPerRegion);

	size_t used = HeaderSectors;
	for (int z=0; z<RegionWidth; z++)
		for (int x=0; x<RegionWidth; x++) {
			REQUIRE(region.readAll(x, z) == cellData(x, z));
			used += region.location(x, z).sectorCount;
		}
	REQUIRE(region.sectorMap().occupiedCount() == used);
}

TEST_CASE( "ParallelChunkWriterRethrowsFirstFailure", "[chunkbuffer][parallel]" ) {
	TmpRegionPath path("parallelfail");
	RegionFile region(path, quietOptions());

	ParallelChunkWriter writer(region, [](int x, int z, ChunkBuffer& buffer) {
		buffer.write(cellData(x, z));
		if (x == 7) throw std::runtime_error(fmt::format("no content for {},{}", x, z));
	}, 3);

	REQUIRE(errorKindOf([&]{ writer.submit(32, 0); }) == ErrorKind::OutOfBounds);

	for (int z=0; z<RegionWidth; z++)
		for (int x=0; x<RegionWidth; x++)
			writer.submit(x, z);

	REQUIRE_THROWS_AS(writer.finish(), std::runtime_error);
	REQUIRE(writer.chunksFailed() == RegionWidth);
	REQUIRE(writer.chunksWritten() == ChunksPerRegion - RegionWidth);

	for (int z=0; z<RegionWidth; z++) {
		REQUIRE(not region.contains(7, z));
		REQUIRE(region.readAll(8, z) == cellData(8, z));
	}

	// Already finished.
	writer.finish();
}
