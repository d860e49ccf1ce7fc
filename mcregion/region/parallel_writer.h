#pragma once

#include "mcregion/tpool/tpool.h"
#include "mcregion/region/chunk_buffer.h"

#include <atomic>
#include <exception>
#include <functional>
#include <mutex>

#ifndef MCREGION_WRITER_THREADS
#define MCREGION_WRITER_THREADS 4
#endif

namespace mcregion {

	class RegionFile;

	// Fills the buffer for chunk (x,z). Called on a worker thread, without the region's lock.
	using ChunkProducer = std::function<void(int x, int z, ChunkBuffer& buffer)>;

	//
	// Produces and stores many chunks of one region on a pool of threads.
	//
	// Each submitted cell is handled by one worker: it gets a ChunkBuffer from the region,
	// runs the producer on it (compression happens here, in parallel) and commits it.
	// Only the commits are serialized, by the region's own mutex.
	//
	// The first exception thrown by a producer or a commit is kept and rethrown from finish().
	// Cells whose producer threw are not written.
	//
	class ParallelChunkWriter : public ThreadPool {
		public:
			ParallelChunkWriter(RegionFile& region, ChunkProducer producer, int threads=MCREGION_WRITER_THREADS);
			virtual ~ParallelChunkWriter();

			// Throws RegionError(OutOfBounds) for cells outside the grid.
			void submit(int x, int z);

			// Waits for all submitted cells, stops the workers and rethrows the first failure.
			void finish();

			inline int chunksWritten() const { return written_.load(); }
			inline int chunksFailed() const { return failed_.load(); }

			virtual void process(int workerId, const Key& key) override;
			virtual void* createWorkerData(int workerId) override;
			virtual void destroyWorkerData(int workerId, void* ptr) override;

		private:
			RegionFile& region_;
			ChunkProducer producer_;

			std::atomic<int> written_ { 0 };
			std::atomic<int> failed_ { 0 };

			std::mutex errorMtx_;
			std::exception_ptr firstError_;

			bool finished_ = false;
	};

}
