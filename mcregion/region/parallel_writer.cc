#include "parallel_writer.h"
#include "region_file.h"

#include <fmt/core.h>
#include <fmt/color.h>

#include <stdexcept>

namespace {

	struct WorkerStats {
		int chunks = 0;
		size_t bytesIn = 0;
	};

}

namespace mcregion {

	ParallelChunkWriter::ParallelChunkWriter(RegionFile& region, ChunkProducer producer, int threads)
		: ThreadPool(threads), region_(region), producer_(std::move(producer))
	{
		if (not producer_) throw std::invalid_argument("ParallelChunkWriter needs a producer");
		start();
	}

	ParallelChunkWriter::~ParallelChunkWriter() {
		if (not finished_) {
			// Nothing can be rethrown here, finish() has to be called for that.
			stop();
			if (firstError_)
				fmt::print(stderr, fmt::fg(fmt::color::red), " - [~ParallelChunkWriter] {} chunks of {} failed and finish() was never called\n",
						failed_.load(), region_.path());
		}
	}

	void ParallelChunkWriter::submit(int x, int z) {
		if (outOfBounds(x, z))
			throw RegionError(ErrorKind::OutOfBounds, fmt::format("chunk ({},{}) is outside the 32x32 grid", x, z));
		enqueue(static_cast<Key>(chunkIndex(x, z)));
	}

	void ParallelChunkWriter::finish() {
		if (finished_) return;
		blockUntilFinished();
		stop();
		finished_ = true;

		std::exception_ptr e;
		{
			std::lock_guard<std::mutex> lck(errorMtx_);
			e = firstError_;
		}
		if (e) std::rethrow_exception(e);
	}

	void ParallelChunkWriter::process(int workerId, const Key& key) {
		int x = static_cast<int>(key % RegionWidth);
		int z = static_cast<int>(key / RegionWidth);
		auto* stats = static_cast<WorkerStats*>(getWorkerData(workerId));

		try {
			ChunkBuffer buffer = region_.getChunkWriter(x, z);
			try {
				producer_(x, z, buffer);
			} catch (...) {
				// The cell must not be stored half-written: disarm the buffer before it unwinds.
				buffer.discard();
				throw;
			}
			stats->bytesIn += buffer.size();
			buffer.commit();
			stats->chunks++;
			written_++;
		} catch (...) {
			// Kept for finish() to rethrow.
			failed_++;
			std::lock_guard<std::mutex> lck(errorMtx_);
			if (not firstError_) firstError_ = std::current_exception();
		}
	}

	void* ParallelChunkWriter::createWorkerData(int workerId) {
		return new WorkerStats();
	}

	void ParallelChunkWriter::destroyWorkerData(int workerId, void* ptr) {
		auto* stats = static_cast<WorkerStats*>(ptr);
		if (stats->chunks > 0)
			fmt::print(" - writer {} stored {} chunks ({} bytes before compression)\n", workerId, stats->chunks, stats->bytesIn);
		delete stats;
	}

}
