#include <catch2/catch_test_macros.hpp>
#include <fmt/core.h>
#include <unistd.h>
#include <atomic>
#include <mutex>
#include <stdexcept>
#include <unordered_set>

#include "tpool.h"

using namespace mcregion;

class Test_ThreadPool : public ThreadPool {

	public:

		static constexpr int THREADS = 4;

		inline Test_ThreadPool() : ThreadPool(THREADS) {
			for (int i=0; i<THREADS; i++) cnts[i] = 0;
		};
		inline virtual ~Test_ThreadPool() {
			if (isRunning()) stop();
		}

		std::mutex mtx;
		std::unordered_set<Key> seen;
		int n_duplicate = 0;

		int cnts[THREADS];
		std::atomic<int> created { 0 };
		std::atomic<int> destroyed { 0 };
		std::atomic<int> badWorkerData { 0 };

		inline virtual void process(int workerId, const Key& key) override {
			cnts[workerId] += 1;
			// Catch assertions are not thread-safe, count here and check on the main thread.
			if (*static_cast<int*>(getWorkerData(workerId)) != workerId) badWorkerData++;

			mtx.lock();
			n_duplicate += seen.find(key) != seen.end();
			seen.insert(key);
			mtx.unlock();
		}
		inline virtual void* createWorkerData(int workerId) override {
			created++;
			return new int(workerId);
		}
		inline virtual void destroyWorkerData(int workerId, void* ptr) override {
			destroyed++;
			delete static_cast<int*>(ptr);
		}

		inline int total() {
			int t = 0;
			for (int i=0; i<THREADS; i++) t += cnts[i];
			return t;
		}

};


TEST_CASE( "tpool", "[tpool]" ) {

	Test_ThreadPool* tpool = new Test_ThreadPool();
	tpool->start();
	REQUIRE(tpool->isRunning());

	constexpr int N = 1<<16;
	for (int i=0; i<N; i++) {
		int n = tpool->enqueue(i);
		if (n > 1<<12) usleep(100);
	}

	tpool->blockUntilFinished();

	{
		std::lock_guard<std::mutex> lck(tpool->mtx);
		REQUIRE(tpool->n_duplicate == 0);
		REQUIRE(tpool->seen.size() == N);
	}

	tpool->stop();
	REQUIRE(tpool->total() == N);
	REQUIRE(tpool->created == Test_ThreadPool::THREADS);
	REQUIRE(tpool->destroyed == Test_ThreadPool::THREADS);
	REQUIRE(tpool->badWorkerData == 0);
	REQUIRE_THROWS_AS(tpool->enqueue(0), std::logic_error);

	delete tpool;
}

TEST_CASE( "tpoolStopDrainsQueue", "[tpool]" ) {
	Test_ThreadPool tpool;
	tpool.start();
	for (int i=0; i<1000; i++) tpool.enqueue(i);
	tpool.stop();
	REQUIRE(tpool.total() == 1000);
}
