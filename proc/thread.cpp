#include <proc/thread.hpp>
#include <proc/scheduler.hpp>
#include <memory/address_space.hpp>
#include <global.hpp>
#include <oslibc/error.h>

using namespace kcore;

thread::thread(kcore_tid_t t, std::weak_ptr<kcore::process> p, load_result const &s)
: tid(t)
, process_(std::move(p))
, start(s)
, status(thread_status::init)
{
	if(tid <= 0) {
		kernel_panic("Thread ids must be positive");
	}
}

kcore_errno_t thread::new_from_executable(kcore_pid_t pid, address_space &aspace,
	fs_resolver const &fs, std::string const &path, std::weak_ptr<kcore::process> p,
	std::vector<std::string> const &argv, std::vector<std::string> const &envp,
	std::shared_ptr<thread> &result)
{
	load_result start;
	auto res = get_program_loader()->load_executable(aspace, fs, path, argv, envp, start);
	if(res != 0) {
		return res;
	}
	if(start.entry_point == 0 || !aspace.is_mapped(start.entry_point)) {
		// the loader claims success but left nothing to run
		return ENOEXEC;
	}

	result = std::make_shared<thread>(pid, std::move(p), start);
	return 0;
}

std::shared_ptr<thread> thread::current()
{
	return get_scheduler()->get_running_thread();
}

thread_status thread::get_status()
{
	return *status.lock();
}

void thread::run()
{
	{
		auto s = status.lock();
		if(*s != thread_status::init) {
			kernel_panic("thread::run() on a thread that was already started");
		}
		*s = thread_status::running;
	}
	get_scheduler()->thread_ready(shared_from_this());
}

void thread::exit()
{
	{
		auto s = status.lock();
		if(*s == thread_status::exited) {
			return;
		}
		*s = thread_status::exited;
	}
	get_scheduler()->thread_exiting(shared_from_this());
}

thread_store::thread_store()
: next_tid(1)
{}

kcore_tid_t thread_store::allocate_tid()
{
	return next_tid.fetch_add(1, std::memory_order_seq_cst);
}

void thread_store::add_thread(std::shared_ptr<thread> thr)
{
	assert(thr);
	auto threads_ = threads.lock();
	if(!threads_->emplace(thr->get_thread_id(), thr).second) {
		kernel_panic("thread registering to thread store is already registered");
	}
}

void thread_store::remove_thread(kcore_tid_t tid)
{
	auto threads_ = threads.lock();
	if(threads_->erase(tid) == 0) {
		kernel_panic("removing a thread that is not in the thread store");
	}
}

std::shared_ptr<thread> thread_store::find_thread(kcore_tid_t tid)
{
	auto threads_ = threads.lock();
	auto it = threads_->find(tid);
	return it == threads_->end() ? nullptr : it->second;
}

size_t thread_store::thread_count()
{
	return threads.lock()->size();
}
