#pragma once

#include <abi/kcore_types.h>
#include <concur/spinlock.hpp>
#include <proc/signal.hpp>
#include <map>
#include <memory>
#include <vector>

namespace kcore {

struct process;

/**
 * A set of processes sharing a job control identity. The pgid is the pid of
 * the process that created the group; the leader may leave or exit while the
 * group lives on. Members are not owned by the group.
 *
 * Once the last member leaves, the group removes itself from the process
 * store. A group is never refilled after that: a new group with the same
 * pgid would have to be created.
 */
struct process_group : std::enable_shared_from_this<process_group> {
	/* a group whose only member is leader */
	process_group(std::shared_ptr<process> leader);

	inline kcore_pgid_t pgid() const {
		return pgid_;
	}

	/* Adding a process that is already a member does nothing. Returns false
	 * if the group has already dissolved. */
	bool add_process(std::shared_ptr<process> p);
	/* returns false if pid was not a member */
	bool remove_process(kcore_pid_t pid);
	bool contains(kcore_pid_t pid);
	/* true once the last member has left */
	bool dissolved();
	size_t member_count();
	/* empty if the leader is gone */
	std::shared_ptr<process> get_leader();

	/* f is called outside the member lock */
	template <typename Functor>
	void for_each_member(Functor f) {
		for(auto &p : live_members()) {
			f(p);
		}
	}

	/* enqueue sig on every live member, returns how many got it */
	size_t deliver_signal_to_group(queued_signal const &sig);

private:
	std::vector<std::shared_ptr<process>> live_members();

	const kcore_pgid_t pgid_;
	const std::weak_ptr<process> leader;
	struct member_list {
		std::map<kcore_pid_t, std::weak_ptr<process>> procs;
		bool dissolved = false;
	};
	spinlock<member_list> members;
};

}
