#include <catch2/catch_test_macros.hpp>
#include <fmt/core.h>

#include "codec.h"
#include "mcregion/detail/testUtil.hpp"

#include <algorithm>
#include <stdexcept>

using namespace mcregion;


TEST_CASE( "CodecRoundTrip", "[codec]" ) {
	for (size_t len : { size_t(0), size_t(1), size_t(4096), size_t(1'000'000) }) {
		auto data = makeChunkData(len, static_cast<uint32_t>(len));

		EncodedChunk enc = encodeChunk(data);
		REQUIRE(enc.version == DefaultCodecVersion);
		REQUIRE(enc.bytes.size() > 0);

		ChunkStream stream = decodeChunk(enc.version, std::move(enc.bytes));
		REQUIRE(stream.readAll() == data);
		REQUIRE(stream.eof());
	}
}

TEST_CASE( "CodecStreamsInSmallPieces", "[codec]" ) {
	auto data = makeChunkData(100'000, 7);
	EncodedChunk enc = encodeChunk(data);
	ChunkStream stream = decodeChunk(enc.version, std::move(enc.bytes));

	std::vector<uint8_t> out;
	uint8_t buf[333];
	while (true) {
		size_t n = stream.read(buf, sizeof(buf));
		if (n == 0) break;
		out.insert(out.end(), buf, buf+n);
	}
	REQUIRE(out == data);
	REQUIRE(stream.read(buf, sizeof(buf)) == 0);
}

TEST_CASE( "CodecMovedFromStream", "[codec]" ) {
	auto data = makeChunkData(3000, 13);
	ChunkStream a = decodeChunk(DefaultCodecVersion, encodeChunk(data).bytes);
	ChunkStream b(std::move(a));

	uint8_t buf[16];
	REQUIRE_THROWS_AS(a.read(buf, sizeof(buf)), std::logic_error);
	REQUIRE(b.readAll() == data);
}

TEST_CASE( "CodecIncrementalWriter", "[codec]" ) {
	auto data = makeChunkData(50'000, 11);

	DeflateWriter w;
	for (size_t i=0; i<data.size(); i+=1000) w.write(data.data()+i, std::min<size_t>(1000, data.size()-i));
	REQUIRE(w.bytesIn() == data.size());
	REQUIRE(not w.finished());
	w.finish();
	REQUIRE(w.finished());
	REQUIRE_THROWS_AS(w.write(data.data(), 1), std::logic_error);

	auto stream = decodeChunk(DefaultCodecVersion, w.takeOutput());
	REQUIRE(stream.readAll() == data);
}

TEST_CASE( "CodecReadsGzip", "[codec]" ) {
	auto data = makeChunkData(20'000, 3);

	DeflateWriter w(6, CodecVersion::Gzip);
	w.write(data.data(), data.size());
	w.finish();
	std::vector<uint8_t> gz = w.takeOutput();

	// gzip magic
	REQUIRE(gz.size() > 2);
	REQUIRE(gz[0] == 0x1f);
	REQUIRE(gz[1] == 0x8b);

	auto stream = decodeChunk(static_cast<uint8_t>(CodecVersion::Gzip), std::move(gz));
	REQUIRE(stream.version() == 1);
	REQUIRE(stream.readAll() == data);
}

TEST_CASE( "CodecRejectsBadInput", "[codec]" ) {
	auto data = makeChunkData(1000, 5);
	EncodedChunk enc = encodeChunk(data);

	REQUIRE(errorKindOf([&]{ decodeChunk(3, std::vector<uint8_t>(enc.bytes)); }) == ErrorKind::UnsupportedCodecVersion);
	REQUIRE(errorKindOf([&]{ decodeChunk(0, std::vector<uint8_t>(enc.bytes)); }) == ErrorKind::UnsupportedCodecVersion);

	// Not a zlib header.
	REQUIRE(errorKindOf([]{ decodeChunk(2, { 0xde, 0xad, 0xbe, 0xef, 0x00, 0x11 }).readAll(); }) == ErrorKind::CorruptPayload);

	// Nothing at all.
	REQUIRE(errorKindOf([]{ decodeChunk(2, {}).readAll(); }) == ErrorKind::CorruptPayload);

	// Cut off half way.
	auto big = makeChunkData(200'000, 9);
	EncodedChunk encBig = encodeChunk(big);
	encBig.bytes.resize(encBig.bytes.size() / 2);
	REQUIRE(errorKindOf([&]{ decodeChunk(2, std::move(encBig.bytes)).readAll(); }) == ErrorKind::CorruptPayload);

	REQUIRE_THROWS_AS(DeflateWriter(42), std::invalid_argument);
}
