#pragma once

#include <abi/kcore_types.h>
#include <concur/spinlock.hpp>
#include <concur/wait_queue.hpp>
#include <fd/file_table.hpp>
#include <fd/fs_resolver.hpp>
#include <proc/resource_limits.hpp>
#include <proc/signal.hpp>
#include <atomic>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace kcore {

struct thread;
struct process;
struct process_group;
struct address_space;
struct user_vm;

enum class process_status {
	runnable,
	zombie,
};

typedef std::map<kcore_pid_t, std::shared_ptr<process>> child_map;

/**
 * A user process.
 *
 * Ownership runs one way: the process store and the parent's children map
 * hold a process, while the parent and process group references held by a
 * process are weak. Each mutable part has its own lock. Where more than one
 * is taken, the order is:
 *
 *   children of the exiting process, children of init, parent reference
 *   children, status
 *   process group reference, group members, process store groups
 *   status, signal queues
 *
 * A process lives from spawn_user_process() until its parent calls
 * reap_zombie_child() on it; between exit_group() and that call it is a
 * zombie, keeping its pid, threads and address space.
 */
struct process : std::enable_shared_from_this<process> {
	~process();

	/* Create a process running the executable at path, which must be
	 * absolute. It gets a new pid, a process group of its own that becomes
	 * the foreground group of the controlling tty, and no parent. If any
	 * step fails, nothing of the process stays registered. */
	static kcore_errno_t spawn_user_process(std::string const &path,
		std::vector<std::string> const &argv, std::vector<std::string> const &envp,
		std::shared_ptr<process> &result);

	/* the process of the running thread */
	static std::shared_ptr<process> current();

	inline kcore_pid_t pid() const {
		return pid_;
	}

	/* 0 if the process is in no group */
	kcore_pgid_t pgid();
	std::shared_ptr<process_group> get_process_group();
	/* empty for init and for orphans */
	std::shared_ptr<process> parent();

	process_status get_status();
	bool is_zombie();
	/* only meaningful once is_zombie() */
	inline kcore_exitcode_t exit_code() const {
		return exit_code_.load();
	}
	/* true once exit_group() has handed over the children and notified
	 * the parent; only then may the parent reap this process */
	inline bool exit_published() const {
		return exit_published_.load();
	}

	/* child.parent must already be, or be about to be, this process */
	void add_child(std::shared_ptr<process> child);
	void set_parent(std::shared_ptr<process> new_parent);
	bool has_child();
	std::shared_ptr<process> find_child(kcore_pid_t pid);
	size_t child_count();
	inline spinlock<child_map> &children() {
		return children_;
	}

	/* Leave the current group, if any, and join new_group (which may be
	 * empty). Fails with ESRCH if new_group has dissolved; if it dissolves
	 * while the process is moving, the process ends up in no group. */
	kcore_errno_t set_process_group(std::shared_ptr<process_group> new_group);
	/* Create a group with this process as leader and move into it. Fails
	 * with EPERM if a group with this pid already exists. */
	kcore_errno_t create_and_set_process_group();

	/* Terminate the process: it becomes a zombie, its threads exit, its
	 * children go to init and its parent receives SIGCHLD. Only the first
	 * call has any effect. */
	void exit_group(kcore_exitcode_t code);

	/* Release a zombie child, returning its exit code. The child must have
	 * published its exit; anything else is a kernel bug. */
	kcore_exitcode_t reap_zombie_child(kcore_pid_t pid);
	/* Same, but returns false if pid is no longer a child, for when another
	 * thread may have reaped it first. */
	bool try_reap_zombie_child(kcore_pid_t pid, kcore_exitcode_t &code);

	bool is_init_process() const;

	/* Start the only thread of the process. */
	void run();

	/* Pend sig on this process; returns false if it is a zombie, the
	 * signal was already pending, or it is a real-time signal and the
	 * sigpending soft limit of queued real-time signals is reached. */
	bool enqueue_signal(queued_signal const &sig);
	/* Send sig to the live process pid. */
	static kcore_errno_t deliver_signal(kcore_pid_t pid, queued_signal const &sig);

	inline wait_queue &waiting_children() {
		return waiting_children_;
	}

	inline spinlock<std::vector<std::shared_ptr<thread>>> &threads() {
		return threads_;
	}
	size_t thread_count();

	inline std::shared_ptr<address_space> const &root_address_space() const {
		return root_aspace;
	}
	inline user_vm &get_user_vm() {
		return *vm;
	}
	inline std::shared_ptr<spinlock<file_table>> const &get_file_table() const {
		return files;
	}
	inline std::shared_ptr<spinlock<fs_resolver>> const &get_fs() const {
		return fs;
	}
	inline std::shared_ptr<spinlock<file_creation_mask>> const &get_umask() const {
		return umask;
	}
	inline std::shared_ptr<spinlock<sig_dispositions>> const &get_sig_dispositions() const {
		return dispositions;
	}
	inline spinlock<resource_limits> &get_resource_limits() {
		return limits;
	}
	inline spinlock<sig_queues> &get_sig_queues() {
		return signals;
	}

	std::string executable_path();
	void set_executable_path(std::string path);

private:
	process(kcore_pid_t pid, std::shared_ptr<address_space> aspace,
		std::unique_ptr<user_vm> vm, resource_limits const &limits,
		std::shared_ptr<spinlock<file_table>> files, fs_resolver const &fs,
		std::string executable_path);

	std::shared_ptr<process> detach_zombie_child(kcore_pid_t pid);
	kcore_exitcode_t release_child(std::shared_ptr<process> child);
	size_t hand_children_to_init();
	void notify_parent();

	const kcore_pid_t pid_;

	spinlock<std::vector<std::shared_ptr<thread>>> threads_;
	spinlock<process_status> status;
	std::atomic<kcore_exitcode_t> exit_code_;
	std::atomic<bool> exit_published_;

	spinlock<std::weak_ptr<process>> parent_;
	spinlock<child_map> children_;
	spinlock<std::weak_ptr<process_group>> group;

	const std::shared_ptr<address_space> root_aspace;
	const std::unique_ptr<user_vm> vm;
	const std::shared_ptr<spinlock<file_table>> files;
	const std::shared_ptr<spinlock<fs_resolver>> fs;
	const std::shared_ptr<spinlock<file_creation_mask>> umask;
	const std::shared_ptr<spinlock<sig_dispositions>> dispositions;
	spinlock<resource_limits> limits;
	spinlock<sig_queues> signals;
	spinlock<std::string> executable_path_;

	wait_queue waiting_children_;
};

}
