#include <proc/process.hpp>
#include <proc/process_group.hpp>
#include <proc/process_store.hpp>
#include <proc/thread.hpp>
#include <memory/address_space.hpp>
#include <memory/user_vm.hpp>
#include <term/tty.hpp>
#include <boot/boot_config.hpp>
#include <global.hpp>
#include <oslibc/error.h>

using namespace kcore;

process::process(kcore_pid_t p, std::shared_ptr<address_space> a,
	std::unique_ptr<user_vm> v, resource_limits const &l,
	std::shared_ptr<spinlock<file_table>> f, fs_resolver const &r,
	std::string path)
: pid_(p)
, status(process_status::runnable)
, exit_code_(0)
, exit_published_(false)
, root_aspace(std::move(a))
, vm(std::move(v))
, files(std::move(f))
, fs(std::make_shared<spinlock<fs_resolver>>(r))
, umask(std::make_shared<spinlock<file_creation_mask>>())
, dispositions(std::make_shared<spinlock<sig_dispositions>>())
, limits(l)
, executable_path_(std::move(path))
{}

process::~process()
{}

kcore_errno_t process::spawn_user_process(std::string const &path,
	std::vector<std::string> const &argv, std::vector<std::string> const &envp,
	std::shared_ptr<process> &result)
{
	if(path.empty() || path[0] != '/') {
		kernel_panic("spawn_user_process: executable path is not absolute");
	}

	std::shared_ptr<address_space> aspace;
	auto res = get_address_space_allocator()->create_root(aspace);
	if(res != 0) {
		log_line(get_log_stream()) << "spawn " << path << ": no address space, error " << res << "\n";
		return res;
	}

	std::unique_ptr<user_vm> vm;
	res = user_vm::create(aspace, vm);
	if(res != 0) {
		aspace->destroy_all();
		log_line(get_log_stream()) << "spawn " << path << ": cannot lay out user memory, error " << res << "\n";
		return res;
	}

	resource_limits limits;
	auto *config = global_state_->boot_config;
	if(config) {
		rlimit_t nofile = limits.get(resource_kind::nofile);
		nofile.cur = config->nofile;
		if(nofile.max < nofile.cur) {
			nofile.max = nofile.cur;
		}
		res = limits.set(resource_kind::nofile, nofile);
		if(res != 0) {
			aspace->destroy_all();
			return res;
		}
	}

	auto console = get_tty();
	auto files = std::make_shared<spinlock<file_table>>(file_table::new_with_stdio(
		console, limits.get(resource_kind::nofile).cur));

	fs_resolver fs;
	kcore_pid_t pid = get_thread_store()->allocate_tid();
	std::shared_ptr<process> proc(new process(pid, aspace, std::move(vm), limits, files, fs, path));

	std::shared_ptr<thread> main_thread;
	res = thread::new_from_executable(pid, *aspace, fs, path, proc, argv, envp, main_thread);
	if(res != 0) {
		// proc was never published anywhere; dropping it releases everything
		aspace->destroy_all();
		log_line(get_log_stream()) << "spawn " << path << ": cannot load executable, error " << res << "\n";
		return res;
	}

	proc->threads_.lock()->push_back(main_thread);
	get_thread_store()->add_thread(main_thread);

	res = proc->create_and_set_process_group();
	if(res != 0) {
		kernel_panic("spawn_user_process: fresh pid already leads a process group");
	}
	if(console) {
		console->set_fg(proc->pgid());
	}

	get_process_store()->add_process(proc);
	log_line(get_log_stream()) << "spawned process " << pid << " running " << path << "\n";

	proc->run();
	result = proc;
	return 0;
}

std::shared_ptr<process> process::current()
{
	auto thr = thread::current();
	if(!thr) {
		kernel_panic("process::current() called without a running thread");
	}
	auto proc = thr->get_process();
	if(!proc) {
		kernel_panic("running thread has no process");
	}
	return proc;
}

kcore_pgid_t process::pgid()
{
	auto g = get_process_group();
	return g ? g->pgid() : 0;
}

std::shared_ptr<process_group> process::get_process_group()
{
	return group.lock()->lock();
}

std::shared_ptr<process> process::parent()
{
	return parent_.lock()->lock();
}

process_status process::get_status()
{
	return *status.lock();
}

bool process::is_zombie()
{
	return get_status() == process_status::zombie;
}

void process::add_child(std::shared_ptr<process> child)
{
	assert(child);
	auto pid = child->pid();
	auto kids = children_.lock();
	if(!kids->emplace(pid, std::move(child)).second) {
		kernel_panic("add_child: process is already a child");
	}
}

void process::set_parent(std::shared_ptr<process> new_parent)
{
	*parent_.lock() = new_parent;
}

bool process::has_child()
{
	return !children_.lock()->empty();
}

std::shared_ptr<process> process::find_child(kcore_pid_t pid)
{
	auto kids = children_.lock();
	auto it = kids->find(pid);
	return it == kids->end() ? nullptr : it->second;
}

size_t process::child_count()
{
	return children_.lock()->size();
}

kcore_errno_t process::set_process_group(std::shared_ptr<process_group> new_group)
{
	auto g = group.lock();
	auto old_group = g->lock();
	if(old_group == new_group) {
		return 0;
	}
	if(new_group && new_group->dissolved()) {
		return ESRCH;
	}
	// old_group may dissolve here and leave the process store
	if(old_group) {
		old_group->remove_process(pid_);
	}
	if(new_group && !new_group->add_process(shared_from_this())) {
		// the last member of new_group left in the meantime
		*g = std::weak_ptr<process_group>();
		return ESRCH;
	}
	*g = new_group;
	return 0;
}

kcore_errno_t process::create_and_set_process_group()
{
	auto new_group = std::make_shared<process_group>(shared_from_this());
	// another thread of this process may be creating the same group
	if(!get_process_store()->try_add_process_group(new_group)) {
		return EPERM;
	}
	return set_process_group(new_group);
}

bool process::is_init_process() const
{
	return pid_ == KCORE_INIT_PID;
}

void process::exit_group(kcore_exitcode_t code)
{
	{
		auto s = status.lock();
		if(*s == process_status::zombie) {
			return;
		}
		*s = process_status::zombie;
		exit_code_.store(code);
	}

	std::vector<std::shared_ptr<thread>> thrs = *threads_.lock();
	for(auto &t : thrs) {
		t->exit();
	}

	size_t moved = 0;
	if(!is_init_process()) {
		moved = hand_children_to_init();
	}

	{
		log_line line(get_log_stream());
		line << "process " << pid_ << " exited with code " << code;
		if(moved > 0) {
			line << ", " << moved << " children moved to init";
		}
		line << "\n";
	}

	notify_parent();
}

size_t process::hand_children_to_init()
{
	auto init = get_process_store()->get_init_process();
	std::vector<std::shared_ptr<process>> moved;
	{
		auto kids = children_.lock();
		if(kids->empty()) {
			return 0;
		}
		if(!init) {
			log_line(get_log_stream()) << "process " << pid_ << " exits without init, "
				<< kids->size() << " children are orphaned\n";
			for(auto &entry : *kids) {
				entry.second->set_parent(nullptr);
			}
			kids->clear();
			return 0;
		}

		auto init_kids = init->children_.lock();
		for(auto &entry : *kids) {
			entry.second->set_parent(init);
			if(!init_kids->emplace(entry.first, entry.second).second) {
				kernel_panic("reparenting a child that init already has");
			}
			moved.push_back(entry.second);
		}
		kids->clear();
	}

	// A child that published its exit before it saw its new parent has
	// only told us. Tell init instead.
	bool zombie_moved = false;
	for(auto &child : moved) {
		if(child->exit_published()) {
			zombie_moved = true;
		}
	}
	if(zombie_moved) {
		init->enqueue_signal(queued_signal::kernel_signal(KCORE_SIGCHLD));
		init->waiting_children_.wake_all();
	}
	return moved.size();
}

void process::notify_parent()
{
	auto notified = parent();
	if(notified) {
		notified->enqueue_signal(queued_signal::kernel_signal(KCORE_SIGCHLD));
	}
	exit_published_.store(true);
	if(notified) {
		notified->waiting_children_.wake_all();
	}

	// we may have been moved to init while notifying the old parent
	auto now = parent();
	if(now && now != notified) {
		now->enqueue_signal(queued_signal::kernel_signal(KCORE_SIGCHLD));
		now->waiting_children_.wake_all();
	}
}

kcore_exitcode_t process::reap_zombie_child(kcore_pid_t pid)
{
	auto child = detach_zombie_child(pid);
	if(!child) {
		kernel_panic("reap_zombie_child: no such child");
	}
	return release_child(std::move(child));
}

bool process::try_reap_zombie_child(kcore_pid_t pid, kcore_exitcode_t &code)
{
	auto child = detach_zombie_child(pid);
	if(!child) {
		return false;
	}
	code = release_child(std::move(child));
	return true;
}

std::shared_ptr<process> process::detach_zombie_child(kcore_pid_t pid)
{
	std::shared_ptr<process> child;
	auto kids = children_.lock();
	auto it = kids->find(pid);
	if(it == kids->end()) {
		return nullptr;
	}
	if(!it->second->is_zombie() || !it->second->exit_published()) {
		kernel_panic("reap_zombie_child: child has not finished exiting");
	}
	child = std::move(it->second);
	kids->erase(it);
	return child;
}

kcore_exitcode_t process::release_child(std::shared_ptr<process> child)
{
	kcore_pid_t pid = child->pid();
	child->root_aspace->destroy_all();

	std::vector<std::shared_ptr<thread>> thrs;
	thrs.swap(*child->threads_.lock());
	for(auto &t : thrs) {
		get_thread_store()->remove_thread(t->get_thread_id());
	}

	get_process_store()->remove_process(pid);
	auto res = child->set_process_group(nullptr);
	assert(res == 0);
	UNUSED(res);
	child->set_parent(nullptr);

	kcore_exitcode_t code = child->exit_code();
	log_line(get_log_stream()) << "process " << pid_ << " reaped child " << pid << ", exit code " << code << "\n";
	return code;
}

void process::run()
{
	std::shared_ptr<thread> main_thread;
	{
		auto thrs = threads_.lock();
		if(thrs->size() != 1) {
			kernel_panic("process::run() needs exactly one thread");
		}
		main_thread = thrs->front();
	}
	main_thread->run();
}

size_t process::thread_count()
{
	return threads_.lock()->size();
}

bool process::enqueue_signal(queued_signal const &sig)
{
	uint64_t sigpending = limits.lock()->get(resource_kind::sigpending).cur;
	size_t max_queued = sigpending < sig_queues::MAX_QUEUED_REALTIME
		? size_t(sigpending) : sig_queues::MAX_QUEUED_REALTIME;

	auto s = status.lock();
	if(*s == process_status::zombie) {
		return false;
	}
	return signals.lock()->enqueue(sig, max_queued);
}

kcore_errno_t process::deliver_signal(kcore_pid_t pid, queued_signal const &sig)
{
	auto target = get_process_store()->find_process(pid);
	if(!target || target->is_zombie()) {
		return ESRCH;
	}
	target->enqueue_signal(sig);
	return 0;
}

std::string process::executable_path()
{
	return *executable_path_.lock();
}

void process::set_executable_path(std::string path)
{
	*executable_path_.lock() = std::move(path);
}
