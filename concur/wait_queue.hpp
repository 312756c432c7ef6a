#pragma once

#include <concur/spinlock.hpp>
#include <list>
#include <memory>
#include <vector>

namespace kcore {

struct thread;

/**
 * A queue of threads waiting for some state to change.
 *
 * A waiter re-evaluates its condition every time it is woken, and only
 * returns from wait_until() once the condition holds. The thread that makes
 * the condition true must commit that change (under whatever lock protects
 * it) before calling wake_one() or wake_all(); the waiter enqueues itself
 * before it evaluates the condition, so such a wakeup is never lost.
 *
 * The queue is protected by its own spinlock, which is never held while a
 * thread blocks or while the condition is evaluated. Never call
 * wait_until() with a spinlock held.
 */
struct wait_queue {
	wait_queue() = default;
	wait_queue(wait_queue const&) = delete;
	wait_queue &operator=(wait_queue const&) = delete;

	template <typename Predicate>
	void wait_until(Predicate pred) {
		while(true) {
			waiter w(current_thread());
			enqueue(&w);
			if(pred()) {
				dequeue(&w);
				return;
			}
			block(&w);
			dequeue(&w);
		}
	}

	/* wake the longest-waiting thread, if any; returns whether one was woken */
	bool wake_one();
	/* wake every thread currently waiting; returns how many were woken */
	size_t wake_all();

	size_t waiter_count();

private:
	struct waiter {
		waiter(std::shared_ptr<thread> t)
		: thr(std::move(t))
		, woken(false)
		{}

		std::shared_ptr<thread> thr;
		std::atomic<bool> woken;
	};

	static std::shared_ptr<thread> current_thread();
	void enqueue(waiter *w);
	void dequeue(waiter *w);
	void block(waiter *w);
	static std::shared_ptr<thread> claim(waiter *w);

	spinlock<std::list<waiter*>> waiters;
};

}
