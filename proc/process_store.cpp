#include <proc/process_store.hpp>
#include <proc/process.hpp>
#include <proc/process_group.hpp>
#include <global.hpp>

using namespace kcore;

process_store::process_store()
{}

void process_store::add_process(std::shared_ptr<process> p)
{
	assert(p);
	auto pid = p->pid();
	auto procs = processes.lock();
	if(!procs->emplace(pid, std::move(p)).second) {
		kernel_panic("process registering to process store is already registered");
	}
}

void process_store::remove_process(kcore_pid_t pid)
{
	std::shared_ptr<process> removed;
	{
		auto procs = processes.lock();
		auto it = procs->find(pid);
		if(it == procs->end()) {
			kernel_panic("removing a process that is not in the process store");
		}
		// the process may be destroyed here, do that outside the lock
		removed = std::move(it->second);
		procs->erase(it);
	}
}

std::shared_ptr<process> process_store::find_process(kcore_pid_t pid)
{
	auto procs = processes.lock();
	auto it = procs->find(pid);
	return it == procs->end() ? nullptr : it->second;
}

std::shared_ptr<process> process_store::get_init_process()
{
	return find_process(KCORE_INIT_PID);
}

size_t process_store::process_count()
{
	return processes.lock()->size();
}

void process_store::add_process_group(std::shared_ptr<process_group> g)
{
	if(!try_add_process_group(std::move(g))) {
		kernel_panic("process group registering to process store is already registered");
	}
}

bool process_store::try_add_process_group(std::shared_ptr<process_group> g)
{
	assert(g);
	auto pgid = g->pgid();
	auto groups = process_groups.lock();
	return groups->emplace(pgid, std::move(g)).second;
}

bool process_store::remove_process_group(kcore_pgid_t pgid)
{
	std::shared_ptr<process_group> removed;
	{
		auto groups = process_groups.lock();
		auto it = groups->find(pgid);
		if(it == groups->end()) {
			return false;
		}
		removed = std::move(it->second);
		groups->erase(it);
	}
	return true;
}

bool process_store::remove_process_group(process_group const &g)
{
	std::shared_ptr<process_group> removed;
	{
		auto groups = process_groups.lock();
		auto it = groups->find(g.pgid());
		if(it == groups->end() || it->second.get() != &g) {
			return false;
		}
		removed = std::move(it->second);
		groups->erase(it);
	}
	return true;
}

std::shared_ptr<process_group> process_store::find_process_group(kcore_pgid_t pgid)
{
	auto groups = process_groups.lock();
	auto it = groups->find(pgid);
	return it == groups->end() ? nullptr : it->second;
}

size_t process_store::process_group_count()
{
	return process_groups.lock()->size();
}
