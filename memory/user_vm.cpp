#include <memory/user_vm.hpp>
#include <oslibc/error.h>

using namespace kcore;

const uintptr_t user_vm::USER_HEAP_BASE;
const uintptr_t user_vm::USER_HEAP_LIMIT;
const uintptr_t user_vm::USER_STACK_TOP;
const size_t user_vm::USER_STACK_SIZE;

/* end of the pages backing a heap that ends at heap_end */
static uintptr_t mapped_heap_end(uintptr_t heap_end) {
	uintptr_t end = page_round_up(heap_end);
	uintptr_t first_page_end = user_vm::USER_HEAP_BASE + VM_PAGE_SIZE;
	return end < first_page_end ? first_page_end : end;
}

user_vm::user_vm(std::shared_ptr<address_space> a)
: aspace(std::move(a))
, heap_end(USER_HEAP_BASE)
{}

kcore_errno_t user_vm::create(std::shared_ptr<address_space> aspace, std::unique_ptr<user_vm> &result)
{
	auto res = aspace->map(vm_range{USER_HEAP_BASE, VM_PAGE_SIZE});
	if(res != 0) {
		return res;
	}
	res = aspace->map(vm_range{USER_STACK_TOP - USER_STACK_SIZE, USER_STACK_SIZE});
	if(res != 0) {
		aspace->destroy(vm_range{USER_HEAP_BASE, VM_PAGE_SIZE});
		return res;
	}
	result.reset(new user_vm(std::move(aspace)));
	return 0;
}

kcore_errno_t user_vm::brk(uintptr_t new_end, uintptr_t &result)
{
	auto end = heap_end.lock();
	result = *end;
	if(new_end == 0 || new_end < USER_HEAP_BASE || new_end > USER_HEAP_LIMIT) {
		return 0;
	}

	uintptr_t old_mapped = mapped_heap_end(*end);
	uintptr_t new_mapped = mapped_heap_end(new_end);
	if(new_mapped > old_mapped) {
		auto res = aspace->map(vm_range{old_mapped, new_mapped - old_mapped});
		if(res != 0) {
			return res == EEXIST ? ENOMEM : res;
		}
	} else if(new_mapped < old_mapped) {
		auto res = aspace->destroy(vm_range{new_mapped, old_mapped - new_mapped});
		if(res != 0) {
			return res;
		}
	}
	*end = new_end;
	result = new_end;
	return 0;
}

uintptr_t user_vm::get_heap_end()
{
	return *heap_end.lock();
}
