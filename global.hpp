#pragma once

#include <hw/log_stream.hpp>
#include <oslibc/assert.hpp>
#include <memory>

#ifdef TESTING_ENABLED
#include <stdexcept>
#endif

namespace kcore {

struct global_state;
struct process_store;
struct thread_store;
struct scheduler;
struct program_loader;
struct address_space_allocator;
struct tty;
struct boot_config;

extern global_state *global_state_;

struct global_state {
	global_state();

	kcore::log_stream *log;
	kcore::process_store *process_store;
	kcore::thread_store *thread_store;
	kcore::scheduler *scheduler;
	kcore::program_loader *program_loader;
	kcore::address_space_allocator *address_space_allocator;
	std::shared_ptr<kcore::tty> tty; /* controlling terminal of init, may be null */
	kcore::boot_config const *boot_config;
};

#ifdef TESTING_ENABLED

/* Raised instead of halting when the core runs inside the test harness. */
struct kernel_panic_error : public std::runtime_error {
	kernel_panic_error(const char *message)
	: std::runtime_error(message)
	{}
};

[[noreturn]] inline void kernel_panic(const char *message) {
	if(global_state_ && global_state_->log) {
		log_line(*global_state_->log) << "!!! KERNEL PANIC !!!\n" << message << "\n";
	}
	throw kernel_panic_error(message);
}

#else

__attribute__((noreturn)) inline void kernel_panic(const char *message) {
	if(global_state_ && global_state_->log) {
		log_line(*global_state_->log) << "!!! KERNEL PANIC - HALTING !!!\n" << message << "\n\n\n";
	}
	asm volatile("cli; halted: hlt; jmp halted;");
	while(1) {}
}

#endif

#define GET_GLOBAL(NAME, TYPE, MEMBER) \
inline TYPE *get_##NAME() { \
	assert(global_state_ && global_state_->MEMBER); \
	return global_state_->MEMBER; \
}

GET_GLOBAL(process_store, process_store, process_store)
GET_GLOBAL(thread_store, thread_store, thread_store)
GET_GLOBAL(scheduler, scheduler, scheduler)
GET_GLOBAL(program_loader, program_loader, program_loader)
GET_GLOBAL(address_space_allocator, address_space_allocator, address_space_allocator)
GET_GLOBAL(boot_config, boot_config const, boot_config)

#undef GET_GLOBAL

/* the controlling terminal is optional */
inline std::shared_ptr<tty> get_tty() {
	assert(global_state_);
	return global_state_->tty;
}

inline log_stream &get_log_stream() {
	assert(global_state_ && global_state_->log);
	return *global_state_->log;
}

}
