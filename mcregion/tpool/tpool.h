#pragma once

#include <vector>
#include <deque>
#include <thread>
#include <condition_variable>
#include <mutex>
#include <cstdint>

namespace mcregion {

struct WorkerMeta {
	std::thread thread;
};

using Key = uint64_t;

//
// A Thread Pool that lets a subclass implement the virtual process() function,
// as well as virtual functions to construct/destruct per-worker user data.
//
// Work is described by a `Key` (a uint64_t). The region writer uses the chunk index
// as the key and process() produces and stores that chunk.
// Anything that is not thread-safe should live in the per-worker userData.
//
// process() must not throw: it runs on a worker thread with nobody to catch.
//
// Threads are started by start() and joined by stop(), not by the constructor / destructor,
// because they call virtual methods of the derived class.
//

class ThreadPool {

	public:
		ThreadPool(int n);
		virtual ~ThreadPool();

		virtual void process(int workerId, const Key& key) =0;
		virtual void* createWorkerData(int workerId) =0;
		virtual void destroyWorkerData(int workerId, void* ptr) =0;

		inline void* getWorkerData(int workerId) { return workerDatas[workerId]; }

		void start();
		// Lets the workers drain the queue, then joins them.
		void stop();
		int  enqueue(const Key& k);

		// Sleeps until every enqueued key has been processed.
		void blockUntilFinished();

		inline int getThreadCount() const { return static_cast<int>(workerMetas.size()); }
		inline bool isRunning() const { return started_ and not doStop_; }

	private:

		std::deque<Key> queuedWork;
		// Enqueued but not yet finished, including keys a worker is busy with.
		size_t inFlight_ = 0;

		std::vector<WorkerMeta> workerMetas;
		std::vector<void*> workerDatas;

		void workerLoop(int i);

		std::condition_variable cv;
		std::condition_variable doneCv;
		std::mutex mtx;

		bool started_ = false;

	protected:
		bool doStop_ = false;
};


}
