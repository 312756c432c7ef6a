#include <proc/signal.hpp>
#include <oslibc/error.h>
#include <catch.hpp>
#include <string.h>

using namespace kcore;

TEST_CASE("proc/signal names and classes") {
	REQUIRE(strcmp(signal_name(KCORE_SIGCHLD), "SIGCHLD") == 0);
	REQUIRE(strcmp(signal_name(KCORE_SIGSYS), "SIGSYS") == 0);
	REQUIRE(strcmp(signal_name(KCORE_SIGRTMIN + 3), "SIGRT") == 0);
	REQUIRE(strcmp(signal_name(0), "(invalid signal)") == 0);
	REQUIRE(!is_valid_signal(0));
	REQUIRE(!is_valid_signal(KCORE_SIGRTMAX + 1));
	REQUIRE(is_realtime_signal(KCORE_SIGRTMAX));
	REQUIRE(!is_realtime_signal(KCORE_SIGUSR1));
}

TEST_CASE("proc/signal payloads by kind") {
	auto k = queued_signal::kernel_signal(KCORE_SIGCHLD);
	REQUIRE(k.kind == signal_kind::kernel);
	REQUIRE(k.number == KCORE_SIGCHLD);

	auto u = queued_signal::user_signal(KCORE_SIGTERM, 12, 1000, 3);
	REQUIRE(u.kind == signal_kind::user);
	REQUIRE(u.user.sender_pid == 12);
	REQUIRE(u.user.sender_uid == 1000);
	REQUIRE(u.user.code == 3);

	auto f = queued_signal::fault_signal(KCORE_SIGSEGV, 0xdead0000);
	REQUIRE(f.kind == signal_kind::fault);
	REQUIRE(f.fault.address == 0xdead0000);
}

TEST_CASE("proc/sig_set") {
	sig_set set;
	REQUIRE(set.empty());
	set.add(KCORE_SIGINT);
	set.add(KCORE_SIGRTMAX);
	set.add(0);
	REQUIRE(set.contains(KCORE_SIGINT));
	REQUIRE(set.contains(KCORE_SIGRTMAX));
	REQUIRE(!set.contains(KCORE_SIGHUP));
	set.remove(KCORE_SIGINT);
	set.remove(KCORE_SIGRTMAX);
	REQUIRE(set.empty());
	REQUIRE(sig_set::full().contains(KCORE_SIGKILL));
}

TEST_CASE("proc/sig_queues") {
	sig_queues queues;
	auto out = queued_signal::kernel_signal(1);
	REQUIRE(queues.is_empty());
	REQUIRE(!queues.dequeue(sig_set(), out));

	SECTION("standard signals are pending at most once") {
		REQUIRE(queues.enqueue(queued_signal::kernel_signal(KCORE_SIGCHLD)));
		REQUIRE(!queues.enqueue(queued_signal::user_signal(KCORE_SIGCHLD, 4, 0)));
		REQUIRE(queues.count() == 1);
		REQUIRE(queues.dequeue(sig_set(), out));
		REQUIRE(out.kind == signal_kind::kernel);
		REQUIRE(queues.is_empty());
	}

	SECTION("real-time signals queue in order") {
		REQUIRE(queues.enqueue(queued_signal::user_signal(KCORE_SIGRTMIN, 1, 0, 10)));
		REQUIRE(queues.enqueue(queued_signal::user_signal(KCORE_SIGRTMIN, 1, 0, 11)));
		REQUIRE(queues.count() == 2);
		REQUIRE(queues.dequeue(sig_set(), out));
		REQUIRE(out.user.code == 10);
		REQUIRE(queues.dequeue(sig_set(), out));
		REQUIRE(out.user.code == 11);
		REQUIRE(queues.is_empty());
	}

	SECTION("lowest unblocked number first") {
		REQUIRE(queues.enqueue(queued_signal::kernel_signal(KCORE_SIGRTMIN)));
		REQUIRE(queues.enqueue(queued_signal::kernel_signal(KCORE_SIGTERM)));
		REQUIRE(queues.enqueue(queued_signal::kernel_signal(KCORE_SIGINT)));

		sig_set blocked;
		blocked.add(KCORE_SIGINT);
		REQUIRE(queues.has_pending(blocked));
		REQUIRE(queues.dequeue(blocked, out));
		REQUIRE(out.number == KCORE_SIGTERM);
		REQUIRE(queues.dequeue(blocked, out));
		REQUIRE(out.number == KCORE_SIGRTMIN);
		REQUIRE(!queues.dequeue(blocked, out));
		REQUIRE(!queues.has_pending(blocked));
		REQUIRE(queues.get_pending().contains(KCORE_SIGINT));
		REQUIRE(queues.dequeue(sig_set(), out));
		REQUIRE(out.number == KCORE_SIGINT);
	}

	SECTION("real-time signals are bounded") {
		for(size_t i = 0; i < sig_queues::MAX_QUEUED_REALTIME; ++i) {
			REQUIRE(queues.enqueue(queued_signal::user_signal(KCORE_SIGRTMIN + i % 4, 1, 0)));
		}
		REQUIRE(!queues.enqueue(queued_signal::user_signal(KCORE_SIGRTMAX, 1, 0)));
		// a huge limit does not lift the bound
		REQUIRE(!queues.enqueue(queued_signal::user_signal(KCORE_SIGRTMIN, 1, 0), ~size_t(0)));
		REQUIRE(queues.count() == sig_queues::MAX_QUEUED_REALTIME);

		// standard signals have their own slot each
		REQUIRE(queues.enqueue(queued_signal::kernel_signal(KCORE_SIGTERM)));

		REQUIRE(queues.dequeue(sig_set(), out));
		REQUIRE(out.number == KCORE_SIGTERM);
		REQUIRE(queues.dequeue(sig_set(), out));
		REQUIRE(out.number == KCORE_SIGRTMIN);
		REQUIRE(queues.enqueue(queued_signal::user_signal(KCORE_SIGRTMAX, 1, 0)));
	}

	SECTION("a smaller limit for real-time signals") {
		REQUIRE(queues.enqueue(queued_signal::kernel_signal(KCORE_SIGRTMIN), 2));
		REQUIRE(queues.enqueue(queued_signal::kernel_signal(KCORE_SIGRTMIN + 1), 2));
		REQUIRE(!queues.enqueue(queued_signal::kernel_signal(KCORE_SIGRTMIN + 2), 2));
		REQUIRE(queues.enqueue(queued_signal::kernel_signal(KCORE_SIGRTMIN + 2), 3));
		REQUIRE(queues.count() == 3);
	}

	SECTION("invalid numbers are dropped") {
		REQUIRE(!queues.enqueue(queued_signal::kernel_signal(0)));
		REQUIRE(!queues.enqueue(queued_signal::kernel_signal(KCORE_SIGRTMAX + 1)));
		REQUIRE(queues.is_empty());
	}
}

TEST_CASE("proc/sig_dispositions") {
	sig_dispositions dispositions;
	sig_action action;
	REQUIRE(dispositions.get(KCORE_SIGINT, action) == 0);
	REQUIRE(action.type == sig_action_type::default_action);

	REQUIRE(dispositions.set(KCORE_SIGINT, sig_action::user(0x1234)) == 0);
	REQUIRE(dispositions.set(KCORE_SIGPIPE, sig_action::ignore()) == 0);

	sig_action old;
	REQUIRE(dispositions.set(KCORE_SIGINT, sig_action::user(0x5678), &old) == 0);
	REQUIRE(old.type == sig_action_type::user_handler);
	REQUIRE(old.handler == 0x1234);

	REQUIRE(dispositions.set(KCORE_SIGKILL, sig_action::ignore()) == EINVAL);
	REQUIRE(dispositions.set(KCORE_SIGSTOP, sig_action::user(0x1)) == EINVAL);
	REQUIRE(dispositions.set(0, sig_action::ignore()) == EINVAL);
	REQUIRE(dispositions.get(KCORE_SIGRTMAX + 1, action) == EINVAL);

	dispositions.reset_user_handlers();
	REQUIRE(dispositions.get(KCORE_SIGINT, action) == 0);
	REQUIRE(action.type == sig_action_type::default_action);
	REQUIRE(dispositions.get(KCORE_SIGPIPE, action) == 0);
	REQUIRE(action.type == sig_action_type::ignore);
}
