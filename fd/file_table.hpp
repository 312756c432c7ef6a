#pragma once

#include <abi/kcore_types.h>
#include <memory>
#include <vector>

namespace kcore {

struct file;

struct fd_mapping_t {
	std::shared_ptr<file> f; /* empty if this descriptor is unused */
	bool close_on_exec = false;
};

/**
 * Descriptor table of a process: maps descriptor numbers to open files.
 * Not locked by itself; a process keeps it behind a spinlock, shared with
 * threads that share the table.
 */
struct file_table {
	static const size_t DEFAULT_MAX_FDS = 1024;

	file_table(size_t max_fds = DEFAULT_MAX_FDS);

	/* a table with console on descriptors 0, 1 and 2 */
	static file_table new_with_stdio(std::shared_ptr<file> console, size_t max_fds = DEFAULT_MAX_FDS);

	/* installs f on the lowest free descriptor */
	kcore_errno_t insert(std::shared_ptr<file> f, bool close_on_exec, kcore_fd_t &fd);
	/* Installs f on descriptor fd. Whatever was open there before is
	 * returned in previous (empty if the slot was free). */
	kcore_errno_t insert_at(kcore_fd_t fd, std::shared_ptr<file> f, bool close_on_exec, std::shared_ptr<file> &previous);
	kcore_errno_t get(kcore_fd_t fd, std::shared_ptr<file> &f) const;
	kcore_errno_t close(kcore_fd_t fd);
	/* closes every descriptor flagged close-on-exec, returns how many */
	size_t close_on_exec();

	size_t count() const;

	inline size_t get_max_fds() const {
		return max_fds;
	}

private:
	bool valid_fd(kcore_fd_t fd) const;

	size_t max_fds;
	std::vector<fd_mapping_t> fds;
};

}
