#include "codec.h"
#include "mcregion/errors.h"

#include <zlib.h>

#include <algorithm>
#include <climits>
#include <new>
#include <stdexcept>

namespace {

	// zlib counts in uInt, so big buffers are fed in slices.
	constexpr size_t MaxSlice = UINT_MAX;
	constexpr size_t OutputStep = 16384;

	int windowBitsFor(uint8_t version) {
		// 16+ tells zlib to expect (or write) a gzip wrapper instead of a zlib one.
		return version == static_cast<uint8_t>(mcregion::CodecVersion::Gzip) ? 16 + MAX_WBITS : MAX_WBITS;
	}

	bool knownVersion(uint8_t version) {
		return version == static_cast<uint8_t>(mcregion::CodecVersion::Gzip)
			or version == static_cast<uint8_t>(mcregion::CodecVersion::Deflate);
	}

	std::string zmsg(const z_stream* zs, int ret) {
		return fmt::format("zlib error {} ({})", ret, zs->msg ? zs->msg : "no message");
	}

}

namespace mcregion {

	/* ===================================================
	 *
	 *                  ChunkStream
	 *
	 * =================================================== */

	ChunkStream::ChunkStream(uint8_t version, std::vector<uint8_t>&& compressed)
		: version_(version), compressed_(std::move(compressed)), zs_(new z_stream_s{})
	{
		if (not knownVersion(version))
			throw RegionError(ErrorKind::UnsupportedCodecVersion, fmt::format("unknown chunk version {}", version));

		int ret = inflateInit2(zs_.get(), windowBitsFor(version));
		if (ret == Z_MEM_ERROR) throw std::bad_alloc();
		if (ret != Z_OK) throw std::runtime_error("inflateInit2 failed: " + zmsg(zs_.get(), ret));

		zs_->next_in  = compressed_.data();
		zs_->avail_in = static_cast<uInt>(std::min(compressed_.size(), MaxSlice));
	}

	ChunkStream::ChunkStream(ChunkStream&& o) noexcept
		: version_(o.version_), compressed_(std::move(o.compressed_)), zs_(std::move(o.zs_)), finished_(o.finished_)
	{ }

	ChunkStream& ChunkStream::operator=(ChunkStream&& o) noexcept {
		if (this != &o) {
			release();
			version_    = o.version_;
			compressed_ = std::move(o.compressed_);
			zs_         = std::move(o.zs_);
			finished_   = o.finished_;
		}
		return *this;
	}

	ChunkStream::~ChunkStream() {
		release();
	}

	void ChunkStream::release() {
		if (zs_) {
			inflateEnd(zs_.get());
			zs_.reset();
		}
	}

	size_t ChunkStream::read(void* dst_, size_t n) {
		if (not zs_) throw std::logic_error("ChunkStream::read() on a moved-from stream");
		if (finished_ or n == 0) return 0;

		uint8_t* dst = static_cast<uint8_t*>(dst_);
		size_t produced = 0;

		while (produced < n) {
			if (zs_->avail_in == 0) {
				size_t consumed = zs_->next_in - compressed_.data();
				zs_->avail_in = static_cast<uInt>(std::min(compressed_.size() - consumed, MaxSlice));
			}

			size_t want = std::min(n - produced, MaxSlice);
			zs_->next_out  = dst + produced;
			zs_->avail_out = static_cast<uInt>(want);

			int ret = inflate(zs_.get(), Z_NO_FLUSH);
			produced += want - zs_->avail_out;

			if (ret == Z_STREAM_END) {
				finished_ = true;
				break;
			}
			if (ret == Z_BUF_ERROR and zs_->avail_in == 0)
				throw RegionError(ErrorKind::CorruptPayload, "compressed chunk data ends before the stream does");
			if (ret != Z_OK and ret != Z_BUF_ERROR)
				throw RegionError(ErrorKind::CorruptPayload, zmsg(zs_.get(), ret));
		}

		return produced;
	}

	std::vector<uint8_t> ChunkStream::readAll() {
		std::vector<uint8_t> out;
		size_t used = 0;
		while (not finished_) {
			out.resize(used + OutputStep * 4);
			used += read(out.data() + used, OutputStep * 4);
		}
		out.resize(used);
		return out;
	}

	/* ===================================================
	 *
	 *                  DeflateWriter
	 *
	 * =================================================== */

	DeflateWriter::DeflateWriter(int level, CodecVersion format, size_t reserve)
		: format_(format), zs_(new z_stream_s{})
	{
		int ret = deflateInit2(zs_.get(), level, Z_DEFLATED, windowBitsFor(static_cast<uint8_t>(format)), 8, Z_DEFAULT_STRATEGY);
		if (ret == Z_MEM_ERROR) throw std::bad_alloc();
		if (ret == Z_STREAM_ERROR) throw std::invalid_argument(fmt::format("invalid compression level {}", level));
		if (ret != Z_OK) throw std::runtime_error("deflateInit2 failed: " + zmsg(zs_.get(), ret));
		out_.reserve(reserve);
	}

	DeflateWriter::~DeflateWriter() {
		deflateEnd(zs_.get());
	}

	void DeflateWriter::write(const void* data, size_t n) {
		if (finished_) throw std::logic_error("DeflateWriter::write() after finish()");

		const uint8_t* in = static_cast<const uint8_t*>(data);
		while (n > 0) {
			size_t slice = std::min(n, MaxSlice);
			zs_->next_in  = const_cast<Bytef*>(in);
			zs_->avail_in = static_cast<uInt>(slice);
			pump(Z_NO_FLUSH);
			in += slice;
			n  -= slice;
			bytesIn_ += slice;
		}
	}

	void DeflateWriter::finish() {
		if (finished_) return;
		zs_->next_in  = nullptr;
		zs_->avail_in = 0;
		pump(Z_FINISH);
		finished_ = true;
	}

	void DeflateWriter::pump(int flush) {
		while (true) {
			size_t used = out_.size();
			out_.resize(used + OutputStep);
			zs_->next_out  = out_.data() + used;
			zs_->avail_out = static_cast<uInt>(OutputStep);

			int ret = deflate(zs_.get(), flush);
			out_.resize(used + OutputStep - zs_->avail_out);

			if (ret == Z_STREAM_ERROR) throw std::runtime_error("deflate failed: " + zmsg(zs_.get(), ret));

			if (flush == Z_FINISH) {
				if (ret == Z_STREAM_END) return;
			} else if (zs_->avail_out != 0) {
				// Output space left over means all input was consumed.
				return;
			}
		}
	}

	/* ===================================================
	 *
	 *                  Free functions
	 *
	 * =================================================== */

	ChunkStream decodeChunk(uint8_t version, std::vector<uint8_t>&& compressed) {
		if (not knownVersion(version))
			throw RegionError(ErrorKind::UnsupportedCodecVersion, fmt::format("unknown chunk version {}", version));
		return ChunkStream(version, std::move(compressed));
	}

	EncodedChunk encodeChunk(const void* data, size_t len, int level) {
		DeflateWriter w(level, CodecVersion::Deflate, len / 2 + 64);
		w.write(data, len);
		w.finish();

		EncodedChunk out;
		out.version = DefaultCodecVersion;
		out.bytes = w.takeOutput();
		return out;
	}

}
