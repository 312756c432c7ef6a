#include <proc/wait.hpp>
#include <proc/process.hpp>
#include <oslibc/error.h>

using namespace kcore;

bool wait_filter::matches(process &child) const
{
	switch(k) {
	case kind::any:
		return true;
	case kind::pid:
		return child.pid() == id;
	case kind::pgid:
		return child.pgid() == id;
	}
	return false;
}

namespace {

enum class scan_result {
	no_children,
	none_exited,
	found,
};

/* Look for a matching child that is ready to be reaped. Must not be called
 * with the children lock held, since matching a pgid takes other locks. */
scan_result find_exited_child(process &parent, wait_filter const &filter, kcore_pid_t &found)
{
	child_map kids = *parent.children().lock();
	bool any_match = false;
	for(auto &entry : kids) {
		if(!filter.matches(*entry.second)) {
			continue;
		}
		any_match = true;
		if(entry.second->exit_published()) {
			found = entry.first;
			return scan_result::found;
		}
	}
	return any_match ? scan_result::none_exited : scan_result::no_children;
}

}

kcore_errno_t kcore::wait_for_child(std::shared_ptr<process> const &parent,
	wait_filter filter, int options, wait_result &result)
{
	assert(parent);
	while(true) {
		kcore_pid_t found = 0;
		scan_result scan = find_exited_child(*parent, filter, found);
		if(scan == scan_result::no_children) {
			return ECHILD;
		}
		if(scan == scan_result::none_exited) {
			if(options & KCORE_WNOHANG) {
				result.pid = 0;
				result.exit_code = 0;
				return 0;
			}
			parent->waiting_children().wait_until([&]() {
				return find_exited_child(*parent, filter, found) != scan_result::none_exited;
			});
			continue;
		}

		// another thread of parent may have reaped it in the meantime
		kcore_exitcode_t code;
		if(!parent->try_reap_zombie_child(found, code)) {
			continue;
		}
		result.pid = found;
		result.exit_code = code;
		return 0;
	}
}
