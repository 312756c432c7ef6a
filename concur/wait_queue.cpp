#include <concur/wait_queue.hpp>
#include <proc/scheduler.hpp>
#include <proc/thread.hpp>
#include <global.hpp>

using namespace kcore;

std::shared_ptr<thread> wait_queue::current_thread()
{
	auto thr = thread::current();
	if(!thr) {
		kernel_panic("wait_queue::wait_until() called outside of a thread");
	}
	return thr;
}

void wait_queue::enqueue(waiter *w)
{
	// append, don't prepend, to prevent starvation
	waiters.lock()->push_back(w);
}

void wait_queue::dequeue(waiter *w)
{
	// a waker that took w off the queue has already set woken, under this
	// same lock, and won't touch w again
	waiters.lock()->remove(w);
}

void wait_queue::block(waiter *w)
{
	assert(local_irq_enabled());
	while(!w->woken.load(std::memory_order_seq_cst)) {
		get_scheduler()->thread_block(w->thr);
	}
}

std::shared_ptr<thread> wait_queue::claim(waiter *w)
{
	// the waiter lives on the stack of the waiting thread, and may be gone
	// as soon as woken is set
	auto thr = w->thr;
	w->woken.store(true, std::memory_order_seq_cst);
	return thr;
}

bool wait_queue::wake_one()
{
	std::shared_ptr<thread> thr;
	{
		auto list = waiters.lock();
		if(list->empty()) {
			return false;
		}
		thr = claim(list->front());
		list->pop_front();
	}
	get_scheduler()->thread_unblock(thr);
	return true;
}

size_t wait_queue::wake_all()
{
	std::vector<std::shared_ptr<thread>> woken;
	{
		auto list = waiters.lock();
		for(auto *w : *list) {
			woken.push_back(claim(w));
		}
		list->clear();
	}
	for(auto &thr : woken) {
		get_scheduler()->thread_unblock(thr);
	}
	return woken.size();
}

size_t wait_queue::waiter_count()
{
	return waiters.lock()->size();
}
