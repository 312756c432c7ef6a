#include <proc/process_store.hpp>
#include <proc/process_group.hpp>
#include <proc/test/hosted_kernel.hpp>
#include <catch.hpp>
#include <set>

using namespace kcore;
using kcore::testing::hosted_kernel;

TEST_CASE("proc/process_store registration") {
	hosted_kernel kernel;
	process_store &store = kernel.processes;

	auto init = kernel.spawn("/sbin/init");
	auto other = kernel.spawn();
	REQUIRE(store.process_count() == 2);
	REQUIRE(store.find_process(init->pid()) == init);
	REQUIRE(store.get_init_process() == init);
	REQUIRE(store.find_process(other->pid()) == other);
	REQUIRE(!store.find_process(99));

	SECTION("a pid can only be registered once") {
		REQUIRE_THROWS_AS(store.add_process(other), kernel_panic_error);
		REQUIRE(store.process_count() == 2);
	}

	SECTION("removal") {
		store.remove_process(other->pid());
		REQUIRE(!store.find_process(other->pid()));
		REQUIRE(store.process_count() == 1);
		REQUIRE_THROWS_AS(store.remove_process(other->pid()), kernel_panic_error);
	}

	SECTION("iteration") {
		std::set<kcore_pid_t> seen;
		store.for_each_process([&](std::shared_ptr<process> const &p) {
			seen.insert(p->pid());
		});
		std::set<kcore_pid_t> expected;
		expected.insert(init->pid());
		expected.insert(other->pid());
		REQUIRE(seen == expected);
	}
}

TEST_CASE("proc/process_store groups") {
	hosted_kernel kernel;
	process_store &store = kernel.processes;

	auto p = kernel.spawn();
	REQUIRE(store.process_group_count() == 1);
	auto group = store.find_process_group(p->pid());
	REQUIRE(group);
	REQUIRE(group == p->get_process_group());

	REQUIRE_THROWS_AS(store.add_process_group(group), kernel_panic_error);
	REQUIRE(!store.try_add_process_group(std::make_shared<process_group>(p)));
	REQUIRE(store.find_process_group(p->pid()) == group);
	REQUIRE(store.remove_process_group(p->pid()));
	REQUIRE(!store.remove_process_group(p->pid()));
	REQUIRE(!store.find_process_group(p->pid()));
}

TEST_CASE("proc/process_store pids are unique") {
	hosted_kernel kernel;
	std::vector<std::shared_ptr<process>> procs;
	for(int i = 0; i < 20; ++i) {
		procs.push_back(kernel.spawn());
	}

	std::set<kcore_pid_t> pids;
	for(auto &p : procs) {
		pids.insert(p->pid());
		REQUIRE(kernel.processes.find_process(p->pid()) == p);
	}
	REQUIRE(pids.size() == procs.size());
	REQUIRE(kernel.processes.process_count() == procs.size());
}
