#include <proc/process_group.hpp>
#include <proc/process.hpp>
#include <proc/process_store.hpp>
#include <global.hpp>

using namespace kcore;

process_group::process_group(std::shared_ptr<process> l)
: pgid_(l->pid())
, leader(l)
{
	members.lock()->procs.emplace(l->pid(), l);
}

bool process_group::add_process(std::shared_ptr<process> p)
{
	assert(p);
	auto m = members.lock();
	if(m->dissolved) {
		return false;
	}
	m->procs.emplace(p->pid(), p);
	return true;
}

bool process_group::remove_process(kcore_pid_t pid)
{
	bool now_empty;
	{
		auto m = members.lock();
		if(m->procs.erase(pid) == 0) {
			return false;
		}
		now_empty = m->procs.empty();
		m->dissolved = now_empty;
	}
	// the member lock is released before the store is touched
	if(now_empty) {
		get_process_store()->remove_process_group(*this);
	}
	return true;
}

bool process_group::contains(kcore_pid_t pid)
{
	auto m = members.lock();
	return m->procs.find(pid) != m->procs.end();
}

bool process_group::dissolved()
{
	return members.lock()->dissolved;
}

size_t process_group::member_count()
{
	return members.lock()->procs.size();
}

std::shared_ptr<process> process_group::get_leader()
{
	return leader.lock();
}

std::vector<std::shared_ptr<process>> process_group::live_members()
{
	std::vector<std::shared_ptr<process>> result;
	auto m = members.lock();
	for(auto &entry : m->procs) {
		auto p = entry.second.lock();
		if(p) {
			result.push_back(p);
		}
	}
	return result;
}

size_t process_group::deliver_signal_to_group(queued_signal const &sig)
{
	size_t delivered = 0;
	for_each_member([&](std::shared_ptr<process> const &p) {
		if(p->enqueue_signal(sig)) {
			delivered++;
		}
	});
	return delivered;
}
