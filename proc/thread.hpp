#pragma once

#include <abi/kcore_types.h>
#include <concur/spinlock.hpp>
#include <proc/program_loader.hpp>
#include <atomic>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace kcore {

struct process;
struct address_space;
struct fs_resolver;

enum class thread_status {
	init,
	running,
	exited,
};

/**
 * A thread is a unit of execution belonging to a process. The thread does
 * not own its process: the process owns its threads, and a thread only keeps
 * a weak reference back.
 *
 * The main thread of a process has the same id as the process.
 */
struct thread : std::enable_shared_from_this<thread> {
	thread(kcore_tid_t tid, std::weak_ptr<process> owner, load_result const &start);

	/* Load the executable at path into aspace and create the main thread of
	 * process pid for it. Nothing is registered anywhere: the caller adds
	 * the thread to its process and to the thread store once the whole
	 * process has been built. */
	static kcore_errno_t new_from_executable(kcore_pid_t pid, address_space &aspace,
		fs_resolver const &fs, std::string const &path, std::weak_ptr<process> owner,
		std::vector<std::string> const &argv, std::vector<std::string> const &envp,
		std::shared_ptr<thread> &result);

	/* the thread running on this CPU, or an empty pointer */
	static std::shared_ptr<thread> current();

	inline kcore_tid_t get_thread_id() const {
		return tid;
	}

	/* empty once the process is gone */
	inline std::shared_ptr<process> get_process() {
		return process_.lock();
	}

	inline load_result const &get_start_state() const {
		return start;
	}

	thread_status get_status();
	inline bool is_exited() {
		return get_status() == thread_status::exited;
	}

	/* Hand the thread to the scheduler. */
	void run();
	/* Mark the thread exited and tell the scheduler. Further calls do nothing. */
	void exit();

private:
	const kcore_tid_t tid;
	const std::weak_ptr<process> process_;
	const load_result start;
	spinlock<thread_status> status;
};

/**
 * Global registry of live threads, and the allocator of thread and process
 * ids, which share one number space.
 */
struct thread_store {
	thread_store();

	kcore_tid_t allocate_tid();

	void add_thread(std::shared_ptr<thread> thr);
	void remove_thread(kcore_tid_t tid);
	std::shared_ptr<thread> find_thread(kcore_tid_t tid);
	size_t thread_count();

private:
	std::atomic<kcore_tid_t> next_tid;
	spinlock<std::map<kcore_tid_t, std::shared_ptr<thread>>> threads;
};

}
