#include <proc/signal.hpp>
#include <oslibc/assert.hpp>
#include <oslibc/error.h>

using namespace kcore;

static const char *signal_names[] = {
	nullptr, "SIGHUP", "SIGINT", "SIGQUIT", "SIGILL", "SIGTRAP", "SIGABRT",
	"SIGBUS", "SIGFPE", "SIGKILL", "SIGUSR1", "SIGSEGV", "SIGUSR2", "SIGPIPE",
	"SIGALRM", "SIGTERM", "SIGSTKFLT", "SIGCHLD", "SIGCONT", "SIGSTOP",
	"SIGTSTP", "SIGTTIN", "SIGTTOU", "SIGURG", "SIGXCPU", "SIGXFSZ",
	"SIGVTALRM", "SIGPROF", "SIGWINCH", "SIGIO", "SIGPWR", "SIGSYS",
};

const char *kcore::signal_name(kcore_signal_t s) {
	if(s >= 1 && s < KCORE_SIGRTMIN) {
		return signal_names[s];
	}
	if(is_realtime_signal(s)) {
		return "SIGRT";
	}
	return "(invalid signal)";
}

queued_signal::queued_signal(signal_kind k, kcore_signal_t n)
: kind(k)
, number(n)
{
	user = user_info{0, 0, 0};
}

queued_signal queued_signal::kernel_signal(kcore_signal_t number)
{
	return queued_signal(signal_kind::kernel, number);
}

queued_signal queued_signal::user_signal(kcore_signal_t number, kcore_pid_t sender_pid, kcore_uid_t sender_uid, int32_t code)
{
	queued_signal s(signal_kind::user, number);
	s.user = user_info{sender_pid, sender_uid, code};
	return s;
}

queued_signal queued_signal::fault_signal(kcore_signal_t number, uintptr_t address)
{
	queued_signal s(signal_kind::fault, number);
	s.fault = fault_info{address};
	return s;
}

log_stream &kcore::operator<<(log_stream &s, queued_signal const &sig) {
	s << signal_name(sig.number) << "(" << sig.number << ")";
	switch(sig.kind) {
	case signal_kind::kernel:
		s << " from kernel";
		break;
	case signal_kind::user:
		s << " from pid " << sig.user.sender_pid << " uid " << sig.user.sender_uid;
		break;
	case signal_kind::fault:
		s << " fault at " << reinterpret_cast<void*>(sig.fault.address);
		break;
	}
	return s;
}

const size_t sig_queues::MAX_QUEUED_REALTIME;

sig_queues::sig_queues()
{}

bool sig_queues::enqueue(queued_signal const &sig, size_t max_queued)
{
	if(!is_valid_signal(sig.number)) {
		return false;
	}
	if(is_realtime_signal(sig.number)) {
		if(max_queued > MAX_QUEUED_REALTIME) {
			max_queued = MAX_QUEUED_REALTIME;
		}
		if(rt_queued >= max_queued) {
			return false;
		}
		rt_queues[sig.number - KCORE_SIGRTMIN].push_back(sig);
		rt_queued++;
	} else {
		std_slot &slot = std_queue[sig.number - 1];
		if(slot.used) {
			// already pending, standard signals don't queue
			return false;
		}
		slot.used = true;
		slot.sig = sig;
	}
	pending.add(sig.number);
	return true;
}

bool sig_queues::dequeue(sig_set blocked, queued_signal &result)
{
	for(kcore_signal_t n = 1; n <= KCORE_SIGRTMAX; ++n) {
		if(!pending.contains(n) || blocked.contains(n)) {
			continue;
		}
		if(is_realtime_signal(n)) {
			auto &queue = rt_queues[n - KCORE_SIGRTMIN];
			assert(!queue.empty());
			result = queue.front();
			queue.pop_front();
			rt_queued--;
			if(queue.empty()) {
				pending.remove(n);
			}
		} else {
			std_slot &slot = std_queue[n - 1];
			assert(slot.used);
			result = slot.sig;
			slot.used = false;
			pending.remove(n);
		}
		return true;
	}
	return false;
}

bool sig_queues::has_pending(sig_set blocked) const
{
	return (pending.bits & ~blocked.bits) != 0;
}

size_t sig_queues::count() const
{
	size_t c = 0;
	for(size_t i = 0; i < NUM_STD_SIGNALS; ++i) {
		if(std_queue[i].used) {
			++c;
		}
	}
	return c + rt_queued;
}

sig_dispositions::sig_dispositions()
{}

kcore_errno_t sig_dispositions::get(kcore_signal_t number, sig_action &result) const
{
	if(!is_valid_signal(number)) {
		return EINVAL;
	}
	result = actions[number - 1];
	return 0;
}

kcore_errno_t sig_dispositions::set(kcore_signal_t number, sig_action const &action, sig_action *old)
{
	if(!is_valid_signal(number)) {
		return EINVAL;
	}
	if(number == KCORE_SIGKILL || number == KCORE_SIGSTOP) {
		return EINVAL;
	}
	if(old) {
		*old = actions[number - 1];
	}
	actions[number - 1] = action;
	return 0;
}

void sig_dispositions::reset_user_handlers()
{
	for(auto &action : actions) {
		if(action.type == sig_action_type::user_handler) {
			action = sig_action();
		}
	}
}
