#pragma once

#include <abi/kcore_types.h>
#include <memory>

namespace kcore {

struct process;

/* Which children a wait is interested in. */
struct wait_filter {
	enum class kind {
		any,
		pid,
		pgid,
	};

	static wait_filter any_child() {
		return wait_filter(kind::any, 0);
	}
	static wait_filter child_pid(kcore_pid_t pid) {
		return wait_filter(kind::pid, pid);
	}
	static wait_filter child_pgid(kcore_pgid_t pgid) {
		return wait_filter(kind::pgid, pgid);
	}

	bool matches(process &child) const;

	kind k;
	int32_t id;

private:
	wait_filter(kind k_, int32_t i)
	: k(k_)
	, id(i)
	{}
};

struct wait_result {
	kcore_pid_t pid = 0; /* 0 if WNOHANG found nothing to reap */
	kcore_exitcode_t exit_code = 0;
};

/**
 * Wait until a child of parent matching filter has exited, and reap it.
 * Fails with ECHILD when parent has no matching child. With KCORE_WNOHANG
 * in options, it never blocks: result.pid is 0 if no matching child has
 * exited yet. Must be called from a thread of parent, without any spinlock
 * held.
 */
kcore_errno_t wait_for_child(std::shared_ptr<process> const &parent,
	wait_filter filter, int options, wait_result &result);

}
