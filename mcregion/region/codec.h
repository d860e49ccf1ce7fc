#pragma once

#include <cstdint>
#include <cstddef>
#include <memory>
#include <vector>

// Avoid pulling zlib.h into every user of the codec.
struct z_stream_s;

namespace mcregion {

	// Version tag stored in the byte after a chunk's length prefix.
	enum class CodecVersion : uint8_t {
		Gzip    = 1, // read-only, for files written by old tools
		Deflate = 2, // zlib stream, used for every new write
	};

	constexpr uint8_t DefaultCodecVersion = static_cast<uint8_t>(CodecVersion::Deflate);
	constexpr int DefaultCompressionLevel = -1; // Z_DEFAULT_COMPRESSION

	struct EncodedChunk {
		uint8_t version = DefaultCodecVersion;
		std::vector<uint8_t> bytes;
	};

	//
	// Forward-only stream over the decompressed content of one chunk.
	// Owns the compressed bytes and inflates them on demand, so the decompressed size
	// never has to be known up front.
	//
	// Throws RegionError(CorruptPayload) from read() when the compressed data is bad or ends early.
	//
	class ChunkStream {
		public:
			ChunkStream(uint8_t version, std::vector<uint8_t>&& compressed);
			ChunkStream(ChunkStream&& o) noexcept;
			ChunkStream& operator=(ChunkStream&& o) noexcept;
			~ChunkStream();

			// Fills up to @n bytes of @dst. Returns 0 only at the end of the stream.
			size_t read(void* dst, size_t n);

			std::vector<uint8_t> readAll();

			inline bool eof() const { return finished_; }
			inline uint8_t version() const { return version_; }
			inline size_t compressedSize() const { return compressed_.size(); }

		private:
			void release();

			uint8_t version_;
			std::vector<uint8_t> compressed_;
			std::unique_ptr<z_stream_s> zs_;
			bool finished_ = false;
	};

	//
	// Incremental compressor. Bytes handed to write() are compressed right away into
	// an owned output buffer; finish() flushes the trailer.
	//
	class DeflateWriter {
		public:
			DeflateWriter(int level=DefaultCompressionLevel, CodecVersion format=CodecVersion::Deflate, size_t reserve=8192);
			~DeflateWriter();

			DeflateWriter(const DeflateWriter&) = delete;
			DeflateWriter& operator=(const DeflateWriter&) = delete;

			void write(const void* data, size_t n);
			void finish();

			inline bool finished() const { return finished_; }
			inline size_t bytesIn() const { return bytesIn_; }
			inline CodecVersion format() const { return format_; }
			inline const std::vector<uint8_t>& output() const { return out_; }
			inline std::vector<uint8_t> takeOutput() { return std::move(out_); }

		private:
			void pump(int flush);

			CodecVersion format_;
			std::unique_ptr<z_stream_s> zs_;
			std::vector<uint8_t> out_;
			size_t bytesIn_ = 0;
			bool finished_ = false;
	};

	// Dispatches on @version. Anything but 1 or 2 throws RegionError(UnsupportedCodecVersion).
	ChunkStream decodeChunk(uint8_t version, std::vector<uint8_t>&& compressed);

	// Always produces the default (zlib) version.
	EncodedChunk encodeChunk(const void* data, size_t len, int level=DefaultCompressionLevel);
	inline EncodedChunk encodeChunk(const std::vector<uint8_t>& data, int level=DefaultCompressionLevel) {
		return encodeChunk(data.data(), data.size(), level);
	}

}
