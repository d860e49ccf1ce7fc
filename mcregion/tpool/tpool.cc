#include "tpool.h"

#include <fmt/core.h>
#include <fmt/color.h>

#include <exception>
#include <stdexcept>

namespace mcregion {

ThreadPool::ThreadPool(int n) {
	if (n < 1) throw std::invalid_argument(fmt::format("ThreadPool needs at least one thread, got {}", n));
	workerDatas.resize(n, nullptr);
	workerMetas.resize(n);
}

void ThreadPool::start() {
	{
		std::lock_guard<std::mutex> lck(mtx);
		if (started_) throw std::logic_error("ThreadPool::start() called twice");
		started_ = true;
	}
	for (size_t i=0; i<workerMetas.size(); i++) {
		WorkerMeta wm;
		wm.thread = std::thread(&ThreadPool::workerLoop, this, static_cast<int>(i));
		workerMetas[i] = std::move(wm);
	}
}

void ThreadPool::stop() {
	mtx.lock();
	doStop_ = true;
	mtx.unlock();
	cv.notify_all();

	for (auto& meta : workerMetas)
		if (meta.thread.joinable())
			meta.thread.join();
}

ThreadPool::~ThreadPool() {
	// A subclass must stop() in its own destructor, while process() is still callable.
	for (auto& meta : workerMetas)
		if (meta.thread.joinable()) {
			fmt::print(stderr, fmt::fg(fmt::color::red), " - [~ThreadPool] destroyed while running, call stop() first\n");
			std::terminate();
		}
}

int ThreadPool::enqueue(const Key& k) {
	size_t n = 0;
	{
		std::lock_guard<std::mutex> lck(mtx);
		if (doStop_) throw std::logic_error("ThreadPool::enqueue() after stop()");
		queuedWork.push_front(k);
		inFlight_++;
		n = queuedWork.size();
	}

	// Reduce wakeups when pushing fast: a woken worker keeps going while there is work.
	if (n < 8 or (n >= 32 and n < 40))
		cv.notify_one();
	return static_cast<int>(n);
}

void ThreadPool::workerLoop(int I) {
	workerDatas[I] = createWorkerData(I);

	while (true) {

		// Sleep until some work is available.
		std::unique_lock<std::mutex> lck(mtx);
		cv.wait(lck, [&] { return doStop_ or queuedWork.size(); });

		// Queued work is still done after a stop request.
		if (queuedWork.empty()) break;

		Key key = queuedWork.back();
		queuedWork.pop_back();
		bool more = not queuedWork.empty();
		lck.unlock();

		// The waiters may have been passed over by a throttled notify in enqueue().
		if (more) cv.notify_one();

		process(I, key);

		lck.lock();
		if (--inFlight_ == 0) doneCv.notify_all();
	}

	destroyWorkerData(I, workerDatas[I]);
	workerDatas[I] = nullptr;
}

void ThreadPool::blockUntilFinished() {
	std::unique_lock<std::mutex> lck(mtx);
	doneCv.wait(lck, [&] { return inFlight_ == 0; });
}


}
