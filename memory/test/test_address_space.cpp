#include <memory/address_space.hpp>
#include <global.hpp>
#include <oslibc/error.h>
#include <catch.hpp>

using namespace kcore;

TEST_CASE("memory/address_space mapping") {
	address_space_allocator allocator(4);
	std::shared_ptr<address_space> aspace;
	REQUIRE(allocator.create_root(aspace) == 0);

	REQUIRE(aspace->map(vm_range{0x1000, 0x2000}) == 0);
	REQUIRE(aspace->is_mapped(0x1000));
	REQUIRE(aspace->is_mapped(0x2fff));
	REQUIRE(!aspace->is_mapped(0x3000));
	REQUIRE(!aspace->is_mapped(0xfff));

	SECTION("rejects bad ranges") {
		REQUIRE(aspace->map(vm_range{0x10000, 0}) == EINVAL);
		REQUIRE(aspace->map(vm_range{0x10001, 0x1000}) == EINVAL);
		REQUIRE(aspace->map(vm_range{0x10000, 0x800}) == EINVAL);
		REQUIRE(aspace->mapping_count() == 1);
	}

	SECTION("rejects overlap") {
		REQUIRE(aspace->map(vm_range{0x2000, 0x1000}) == EEXIST);
		REQUIRE(aspace->map(vm_range{0x0, 0x2000}) == EEXIST);
		REQUIRE(aspace->map(vm_range{0x3000, 0x1000}) == 0);
		REQUIRE(aspace->mapping_count() == 2);
	}

	SECTION("destroy splits straddling mappings") {
		REQUIRE(aspace->map(vm_range{0x10000, 0x4000}) == 0);
		REQUIRE(aspace->destroy(vm_range{0x11000, 0x2000}) == 0);
		auto maps = aspace->get_mappings();
		REQUIRE(maps.size() == 3);
		REQUIRE(maps[1].base == 0x10000);
		REQUIRE(maps[1].length == 0x1000);
		REQUIRE(maps[2].base == 0x13000);
		REQUIRE(maps[2].length == 0x1000);
		REQUIRE(!aspace->is_mapped(0x11000));
		REQUIRE(!aspace->is_mapped(0x12fff));
	}

	SECTION("destroy covering several mappings") {
		REQUIRE(aspace->map(vm_range{0x4000, 0x1000}) == 0);
		REQUIRE(aspace->destroy(vm_range{0x0, 0x8000}) == 0);
		REQUIRE(aspace->mapping_count() == 0);
	}

	SECTION("destroy_all") {
		REQUIRE(aspace->map(vm_range{0x4000, 0x1000}) == 0);
		aspace->destroy_all();
		REQUIRE(aspace->mapping_count() == 0);
		REQUIRE(!aspace->is_mapped(0x1000));
	}
}

TEST_CASE("memory/address_space_allocator id pool") {
	address_space_allocator allocator(2);
	std::shared_ptr<address_space> a, b, c;
	REQUIRE(allocator.create_root(a) == 0);
	REQUIRE(allocator.create_root(b) == 0);
	REQUIRE(a->get_asid() != b->get_asid());
	REQUIRE(allocator.in_use() == 2);

	REQUIRE(allocator.create_root(c) == ENOMEM);
	REQUIRE(!c);

	uint32_t freed = a->get_asid();
	a.reset();
	REQUIRE(allocator.in_use() == 1);
	REQUIRE(allocator.create_root(c) == 0);
	REQUIRE(c->get_asid() == freed);
}
