#pragma once

#include <abi/kcore_types.h>
#include <hw/log_stream.hpp>
#include <deque>

namespace kcore {

inline bool is_valid_signal(kcore_signal_t s) {
	return s >= 1 && s <= KCORE_SIGRTMAX;
}

inline bool is_realtime_signal(kcore_signal_t s) {
	return s >= KCORE_SIGRTMIN && s <= KCORE_SIGRTMAX;
}

const char *signal_name(kcore_signal_t s);

enum class signal_kind {
	kernel, /* raised by the kernel itself, e.g. SIGCHLD on child exit */
	user,   /* sent by a process through kill() and friends */
	fault,  /* synchronous, caused by the receiving thread */
};

/**
 * A signal instance: a number, where it came from, and the payload that
 * belongs to its kind. Only the fields of the signal's own kind are
 * meaningful; construct signals with the named constructors.
 */
struct queued_signal {
	signal_kind kind;
	kcore_signal_t number;

	struct user_info {
		kcore_pid_t sender_pid;
		kcore_uid_t sender_uid;
		int32_t code;
	};
	struct fault_info {
		uintptr_t address;
	};

	union {
		user_info user;
		fault_info fault;
	};

	static queued_signal kernel_signal(kcore_signal_t number);
	static queued_signal user_signal(kcore_signal_t number, kcore_pid_t sender_pid, kcore_uid_t sender_uid, int32_t code = 0);
	static queued_signal fault_signal(kcore_signal_t number, uintptr_t address);

private:
	queued_signal(signal_kind k, kcore_signal_t n);
};

log_stream &operator<<(log_stream &s, queued_signal const &sig);

/* A set of signal numbers 1..64, bit n-1 standing for signal n. */
struct sig_set {
	sig_set(uint64_t b = 0) : bits(b) {}

	static sig_set full() {
		return sig_set(~uint64_t(0));
	}

	inline bool contains(kcore_signal_t s) const {
		return is_valid_signal(s) && (bits & bit(s)) != 0;
	}

	inline void add(kcore_signal_t s) {
		if(is_valid_signal(s)) {
			bits |= bit(s);
		}
	}

	inline void remove(kcore_signal_t s) {
		if(is_valid_signal(s)) {
			bits &= ~bit(s);
		}
	}

	inline bool empty() const {
		return bits == 0;
	}

	uint64_t bits;

private:
	static inline uint64_t bit(kcore_signal_t s) {
		return uint64_t(1) << (s - 1);
	}
};

/**
 * Signals pending for a process. A standard signal (1..31) is pending at
 * most once: sending it again while it is pending has no effect. Real-time
 * signals queue up, in order, per number, up to a bound on the number of
 * real-time instances queued in total.
 */
struct sig_queues {
	static const size_t MAX_QUEUED_REALTIME = 1024;

	sig_queues();

	/* Returns false if the signal was dropped: an invalid number, a standard
	 * signal that is already pending, or a real-time signal while
	 * max_queued real-time signals are queued already. max_queued is
	 * clamped to MAX_QUEUED_REALTIME. */
	bool enqueue(queued_signal const &sig, size_t max_queued = MAX_QUEUED_REALTIME);
	/* Take the lowest-numbered pending signal that is not blocked; standard
	 * signals go before real-time signals. Returns false if there is none. */
	bool dequeue(sig_set blocked, queued_signal &result);

	bool has_pending(sig_set blocked = sig_set()) const;
	inline bool is_empty() const {
		return pending.empty();
	}
	size_t count() const;
	sig_set get_pending() const {
		return pending;
	}

private:
	static const size_t NUM_STD_SIGNALS = KCORE_SIGRTMIN - 1;
	static const size_t NUM_RT_SIGNALS = KCORE_SIGRTMAX - KCORE_SIGRTMIN + 1;

	struct std_slot {
		bool used = false;
		queued_signal sig = queued_signal::kernel_signal(1);
	};

	std_slot std_queue[NUM_STD_SIGNALS];
	std::deque<queued_signal> rt_queues[NUM_RT_SIGNALS];
	size_t rt_queued = 0;
	sig_set pending;
};

enum class sig_action_type {
	default_action,
	ignore,
	user_handler,
};

struct sig_action {
	sig_action_type type = sig_action_type::default_action;
	uintptr_t handler = 0;
	uint32_t flags = 0;
	sig_set mask;

	static sig_action ignore() {
		sig_action a;
		a.type = sig_action_type::ignore;
		return a;
	}

	static sig_action user(uintptr_t handler, uint32_t flags = 0, sig_set mask = sig_set()) {
		sig_action a;
		a.type = sig_action_type::user_handler;
		a.handler = handler;
		a.flags = flags;
		a.mask = mask;
		return a;
	}
};

/**
 * How the threads of a process react to each signal. What the default
 * action of a signal is, and running handlers, is left to the signal
 * delivery code; this is only the table.
 */
struct sig_dispositions {
	sig_dispositions();

	kcore_errno_t get(kcore_signal_t number, sig_action &result) const;
	/* SIGKILL and SIGSTOP cannot be caught or ignored */
	kcore_errno_t set(kcore_signal_t number, sig_action const &action, sig_action *old = nullptr);
	/* On exec, handlers point into the old image: reset them to the default
	 * action. Ignored signals stay ignored. */
	void reset_user_handlers();

private:
	sig_action actions[KCORE_SIGRTMAX];
};

}
