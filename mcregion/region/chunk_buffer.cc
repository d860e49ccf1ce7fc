#include "chunk_buffer.h"
#include "region_file.h"

#include <fmt/core.h>
#include <fmt/color.h>

#include <stdexcept>

namespace mcregion {

	ChunkBuffer::ChunkBuffer(RegionFile& region, int x, int z, int level)
		: region_(&region), x_(x), z_(z), deflater_(new DeflateWriter(level, CodecVersion::Deflate, 8192))
	{ }

	ChunkBuffer::ChunkBuffer(ChunkBuffer&& o) noexcept
		: region_(o.region_), x_(o.x_), z_(o.z_), deflater_(std::move(o.deflater_)), committed_(o.committed_)
	{
		// The moved-from buffer no longer owns a commit.
		o.committed_ = true;
	}

	ChunkBuffer::~ChunkBuffer() {
		if (committed_) return;
		try {
			commit();
		} catch (const std::exception& e) {
			fmt::print(stderr, fmt::fg(fmt::color::red), " - [~ChunkBuffer] commit of chunk ({},{}) to {} failed: {}\n",
					x_, z_, region_->path(), e.what());
		}
	}

	void ChunkBuffer::write(const void* data, size_t n) {
		if (committed_) throw std::logic_error("ChunkBuffer::write() after commit()");
		deflater_->write(data, n);
	}

	void ChunkBuffer::commit() {
		if (committed_) return;
		// Set first so that a failing write is not retried by the destructor.
		committed_ = true;

		deflater_->finish();
		const auto& bytes = deflater_->output();
		region_->write(x_, z_, bytes.data(), bytes.size());

		deflater_.reset();
	}

	void ChunkBuffer::discard() {
		committed_ = true;
		deflater_.reset();
	}

}
