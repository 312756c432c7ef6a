#pragma once

#include <memory>

namespace kcore {

struct thread;

/**
 * The run-queue side of the kernel, as seen by the process core. How
 * threads are picked to run is up to the implementation.
 *
 * thread_block() parks the calling thread, which must be the running one,
 * until some other context calls thread_unblock() on it. An unblock that
 * arrives while the thread is not (yet) parked is remembered, and makes the
 * next thread_block() return immediately. Callers must not hold a spinlock
 * while blocking.
 */
struct scheduler {
	virtual ~scheduler() {}

	virtual void thread_ready(std::shared_ptr<thread> thr) = 0;
	virtual void thread_exiting(std::shared_ptr<thread> thr) = 0;
	virtual void thread_block(std::shared_ptr<thread> thr) = 0;
	virtual void thread_unblock(std::shared_ptr<thread> thr) = 0;

	/* may return an empty pointer while no thread runs on this CPU */
	virtual std::shared_ptr<thread> get_running_thread() = 0;
};

}
