#include <proc/process_group.hpp>
#include <proc/test/hosted_kernel.hpp>
#include <oslibc/error.h>
#include <catch.hpp>
#include <thread>

using namespace kcore;
using kcore::testing::hosted_kernel;

TEST_CASE("proc/process_group spawned processes lead their own group") {
	hosted_kernel kernel;
	auto p = kernel.spawn();
	auto group = p->get_process_group();
	REQUIRE(group);
	REQUIRE(p->pgid() == p->pid());
	REQUIRE(group->get_leader() == p);
	REQUIRE(group->member_count() == 1);
	REQUIRE(group->contains(p->pid()));
	REQUIRE(kernel.console->get_fg() == p->pgid());

	REQUIRE(p->create_and_set_process_group() == EPERM);
}

TEST_CASE("proc/process_group moving between groups") {
	hosted_kernel kernel;
	auto leader = kernel.spawn();
	auto member = kernel.spawn();
	auto group = leader->get_process_group();
	auto old_group = member->get_process_group();
	REQUIRE(kernel.processes.process_group_count() == 2);

	REQUIRE(member->set_process_group(group) == 0);
	REQUIRE(member->pgid() == leader->pid());
	REQUIRE(group->member_count() == 2);
	REQUIRE(group->contains(member->pid()));
	REQUIRE(!old_group->contains(member->pid()));

	// member's old group became empty and left the store
	REQUIRE(old_group->member_count() == 0);
	REQUIRE(!kernel.processes.find_process_group(member->pid()));
	REQUIRE(kernel.processes.process_group_count() == 1);

	SECTION("a dissolved group cannot be joined") {
		REQUIRE(leader->set_process_group(old_group) == ESRCH);
		REQUIRE(leader->pgid() == leader->pid());
	}

	SECTION("setting the same group twice") {
		REQUIRE(member->set_process_group(group) == 0);
		REQUIRE(group->member_count() == 2);
	}

	SECTION("leaving every group") {
		REQUIRE(member->set_process_group(nullptr) == 0);
		REQUIRE(member->pgid() == 0);
		REQUIRE(!member->get_process_group());
		REQUIRE(group->member_count() == 1);
	}

	SECTION("a group outlives its leader") {
		REQUIRE(leader->set_process_group(nullptr) == 0);
		REQUIRE(kernel.processes.find_process_group(leader->pid()) == group);
		REQUIRE(member->pgid() == leader->pid());
		REQUIRE(!group->remove_process(leader->pid()));
	}

	SECTION("a new group for a member") {
		REQUIRE(member->create_and_set_process_group() == 0);
		REQUIRE(member->pgid() == member->pid());
		REQUIRE(group->member_count() == 1);
		REQUIRE(kernel.processes.process_group_count() == 2);
	}
}

TEST_CASE("proc/process_group signals every live member") {
	hosted_kernel kernel;
	auto leader = kernel.spawn();
	auto a = kernel.spawn();
	auto b = kernel.spawn();
	auto group = leader->get_process_group();
	REQUIRE(a->set_process_group(group) == 0);
	REQUIRE(b->set_process_group(group) == 0);

	size_t visited = 0;
	group->for_each_member([&](std::shared_ptr<process> const &p) {
		REQUIRE(p->pgid() == leader->pid());
		visited++;
	});
	REQUIRE(visited == 3);

	b->exit_group(0);
	REQUIRE(group->deliver_signal_to_group(queued_signal::kernel_signal(KCORE_SIGINT)) == 2);
	REQUIRE(leader->get_sig_queues().lock()->get_pending().contains(KCORE_SIGINT));
	REQUIRE(a->get_sig_queues().lock()->get_pending().contains(KCORE_SIGINT));
	REQUIRE(b->get_sig_queues().lock()->is_empty());
}

TEST_CASE("proc/process_group two threads creating the same group") {
	hosted_kernel kernel;
	auto init = kernel.spawn("/sbin/init");
	auto p = kernel.spawn();
	auto init_group = init->get_process_group();

	for(int i = 0; i < 2000; ++i) {
		// p's own group dissolves, so both threads see its pgid free
		REQUIRE(p->set_process_group(init_group) == 0);
		REQUIRE(!kernel.processes.find_process_group(p->pid()));

		kcore_errno_t results[2] = {0xffff, 0xffff};
		bool panicked[2] = {false, false};
		auto create = [&](int n) {
			try {
				results[n] = p->create_and_set_process_group();
			} catch(kernel_panic_error &) {
				panicked[n] = true;
			}
		};
		std::thread first(create, 0);
		std::thread second(create, 1);
		first.join();
		second.join();

		REQUIRE(!panicked[0]);
		REQUIRE(!panicked[1]);
		REQUIRE(((results[0] == 0 && results[1] == EPERM) || (results[0] == EPERM && results[1] == 0)));
		REQUIRE(p->pgid() == p->pid());
		auto group = kernel.processes.find_process_group(p->pid());
		REQUIRE(group == p->get_process_group());
		REQUIRE(group->member_count() == 1);
		REQUIRE(!init_group->contains(p->pid()));
	}
	REQUIRE(kernel.processes.process_group_count() == 2);
}

TEST_CASE("proc/process_group a dissolving group only unregisters itself") {
	hosted_kernel kernel;
	auto a = kernel.spawn();
	REQUIRE(a->set_process_group(nullptr) == 0);
	REQUIRE(!kernel.processes.find_process_group(a->pid()));

	// an old group and its successor share a pgid
	auto stale = std::make_shared<process_group>(a);
	auto current = std::make_shared<process_group>(a);
	kernel.processes.add_process_group(current);

	REQUIRE(stale->remove_process(a->pid()));
	REQUIRE(stale->dissolved());
	REQUIRE(kernel.processes.find_process_group(a->pid()) == current);
	REQUIRE(!kernel.processes.remove_process_group(*stale));
	REQUIRE(kernel.processes.remove_process_group(*current));
	REQUIRE(!kernel.processes.find_process_group(a->pid()));
}
