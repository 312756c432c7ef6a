#pragma once

#include <memory/address_space.hpp>

namespace kcore {

/**
 * Layout of the user part of an address space: a heap growing upwards from
 * USER_HEAP_BASE, and a fixed-size stack ending at USER_STACK_TOP. The heap
 * end may lie in the middle of a page; the mapping always covers whole
 * pages up to the rounded-up end.
 */
struct user_vm {
	static const uintptr_t USER_HEAP_BASE = 0x10000000;
	static const uintptr_t USER_HEAP_LIMIT = 0x40000000;
	static const uintptr_t USER_STACK_TOP = 0xbfff0000;
	static const size_t USER_STACK_SIZE = 0x10000 /* 64 kb */;

	/* map the initial heap page and the stack into aspace */
	static kcore_errno_t create(std::shared_ptr<address_space> aspace, std::unique_ptr<user_vm> &result);

	/* Move the end of the heap. With new_end == 0, or a new end outside
	 * [USER_HEAP_BASE, USER_HEAP_LIMIT], the heap stays as it is. The
	 * resulting end is always written to result. */
	kcore_errno_t brk(uintptr_t new_end, uintptr_t &result);

	uintptr_t get_heap_end();

	inline uintptr_t get_stack_top() const {
		return USER_STACK_TOP;
	}

private:
	user_vm(std::shared_ptr<address_space> aspace);

	std::shared_ptr<address_space> aspace;
	spinlock<uintptr_t> heap_end;
};

}
