#pragma once

#include <abi/kcore_types.h>
#include <concur/spinlock.hpp>
#include <map>
#include <memory>

namespace kcore {

struct process;
struct process_group;

/**
 * The global process registry. It owns every registered process and
 * process group, from registration until the process is reaped or the
 * group becomes empty. Each map has its own lock, and neither is held
 * while calling into a process or group.
 */
struct process_store {
	process_store();

	/* panics if a process with the same pid is already registered */
	void add_process(std::shared_ptr<process> p);
	/* panics if pid is not registered */
	void remove_process(kcore_pid_t pid);
	std::shared_ptr<process> find_process(kcore_pid_t pid);
	std::shared_ptr<process> get_init_process();
	size_t process_count();

	template <typename Functor>
	void for_each_process(Functor f) {
		// call f without holding the registry lock
		std::map<kcore_pid_t, std::shared_ptr<process>> snapshot = *processes.lock();
		for(auto &entry : snapshot) {
			f(entry.second);
		}
	}

	/* panics if a group with the same pgid is already registered */
	void add_process_group(std::shared_ptr<process_group> g);
	/* returns false, and registers nothing, if the pgid is taken */
	bool try_add_process_group(std::shared_ptr<process_group> g);
	/* returns whether a group was removed */
	bool remove_process_group(kcore_pgid_t pgid);
	/* removes g only if it is the group registered under its pgid */
	bool remove_process_group(process_group const &g);
	std::shared_ptr<process_group> find_process_group(kcore_pgid_t pgid);
	size_t process_group_count();

private:
	spinlock<std::map<kcore_pid_t, std::shared_ptr<process>>> processes;
	spinlock<std::map<kcore_pgid_t, std::shared_ptr<process_group>>> process_groups;
};

}
