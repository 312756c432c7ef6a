#include <oslibc/assert.hpp>
#include <hw/log_stream.hpp>
#include <global.hpp>

#ifndef TESTING_ENABLED

static void stack_up(uintptr_t * &fp, void * &ip) {
	if(fp) {
		ip = reinterpret_cast<void*>(*(fp + 1));
		fp = reinterpret_cast<uintptr_t*>(*fp);
	}
}

extern "C"
__attribute__((noreturn)) void assertion_failed(const char *assertion, const char *filename, int lineno, const char *function) {
	{
		kcore::log_line stream(kcore::get_log_stream());
		stream << "\n\n=============================================\n";
		stream << "Assertion failed: " << assertion << "\n";
		stream << function << "\n";
		stream << "At " << filename << ":" << lineno << "\n";

		uintptr_t *fp = reinterpret_cast<uintptr_t*>(__builtin_frame_address(0));
		void *ip = nullptr;
		for(size_t i = 1; i <= 5; ++i) {
			stack_up(fp, ip);
			stream << "At " << i << ": " << ip << "\n";
		}
	}

	kcore::kernel_panic("Assertion failed, halting.");
}

#endif
