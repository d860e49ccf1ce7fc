#pragma once

#include "mcregion/region/codec.h"

#include <cstdint>
#include <memory>
#include <vector>

namespace mcregion {

	class RegionFile;

	//
	// Lets chunk content be produced on any thread without holding the region's lock.
	//
	// Everything written is deflated straight away into an in-memory buffer. commit()
	// finishes the stream and hands the bytes to RegionFile::write(), which is the only
	// step that locks the region.
	//
	// The commit happens exactly once: on an explicit commit(), or from the destructor
	// when the buffer goes out of scope, including during stack unwinding.
	// A destructor cannot rethrow, so a failure there is only printed. Call commit()
	// yourself if you need to see errors.
	//
	// Obtained from RegionFile::getChunkWriter(). Movable, not copyable.
	// The RegionFile must outlive the buffer.
	//
	class ChunkBuffer {
		public:
			ChunkBuffer(RegionFile& region, int x, int z, int level=DefaultCompressionLevel);
			ChunkBuffer(ChunkBuffer&& o) noexcept;
			ChunkBuffer& operator=(ChunkBuffer&&) = delete;
			ChunkBuffer(const ChunkBuffer&) = delete;
			~ChunkBuffer();

			void write(const void* data, size_t n);
			inline void write(const std::vector<uint8_t>& data) { write(data.data(), data.size()); }

			void commit();
			// Drops everything written. Nothing is stored, not even by the destructor.
			void discard();

			inline bool committed() const { return committed_; }
			inline int x() const { return x_; }
			inline int z() const { return z_; }
			// Uncompressed bytes written so far.
			inline size_t size() const { return deflater_ ? deflater_->bytesIn() : 0; }

		private:
			RegionFile* region_;
			int x_, z_;
			std::unique_ptr<DeflateWriter> deflater_;
			bool committed_ = false;
	};

}
