#include <memory/user_vm.hpp>
#include <oslibc/error.h>
#include <catch.hpp>

using namespace kcore;

TEST_CASE("memory/user_vm initial layout") {
	address_space_allocator allocator(1);
	std::shared_ptr<address_space> aspace;
	REQUIRE(allocator.create_root(aspace) == 0);

	std::unique_ptr<user_vm> vm;
	REQUIRE(user_vm::create(aspace, vm) == 0);
	REQUIRE(vm->get_heap_end() == user_vm::USER_HEAP_BASE);
	REQUIRE(aspace->is_mapped(user_vm::USER_HEAP_BASE));
	REQUIRE(aspace->is_mapped(user_vm::USER_STACK_TOP - 1));
	REQUIRE(aspace->is_mapped(user_vm::USER_STACK_TOP - user_vm::USER_STACK_SIZE));
	REQUIRE(!aspace->is_mapped(user_vm::USER_STACK_TOP));
	REQUIRE(vm->get_stack_top() == user_vm::USER_STACK_TOP);

	SECTION("creating twice in one address space fails") {
		std::unique_ptr<user_vm> second;
		REQUIRE(user_vm::create(aspace, second) == EEXIST);
		REQUIRE(!second);
	}
}

TEST_CASE("memory/user_vm brk") {
	address_space_allocator allocator(1);
	std::shared_ptr<address_space> aspace;
	REQUIRE(allocator.create_root(aspace) == 0);
	std::unique_ptr<user_vm> vm;
	REQUIRE(user_vm::create(aspace, vm) == 0);

	const uintptr_t base = user_vm::USER_HEAP_BASE;
	uintptr_t end = 0;

	SECTION("query") {
		REQUIRE(vm->brk(0, end) == 0);
		REQUIRE(end == base);
	}

	SECTION("grow and shrink") {
		REQUIRE(vm->brk(base + 3 * VM_PAGE_SIZE + 10, end) == 0);
		REQUIRE(end == base + 3 * VM_PAGE_SIZE + 10);
		REQUIRE(aspace->is_mapped(base + 3 * VM_PAGE_SIZE + 9));
		REQUIRE(!aspace->is_mapped(base + 4 * VM_PAGE_SIZE));

		REQUIRE(vm->brk(base + 100, end) == 0);
		REQUIRE(end == base + 100);
		REQUIRE(aspace->is_mapped(base));
		REQUIRE(!aspace->is_mapped(base + VM_PAGE_SIZE));
	}

	SECTION("out of range requests leave the heap alone") {
		REQUIRE(vm->brk(base + VM_PAGE_SIZE * 2, end) == 0);
		REQUIRE(vm->brk(base - VM_PAGE_SIZE, end) == 0);
		REQUIRE(end == base + VM_PAGE_SIZE * 2);
		REQUIRE(vm->brk(user_vm::USER_HEAP_LIMIT + 1, end) == 0);
		REQUIRE(end == base + VM_PAGE_SIZE * 2);
	}
}
