#pragma once

#include <abi/kcore_types.h>
#include <concur/spinlock.hpp>
#include <iterator>
#include <map>
#include <memory>
#include <vector>

namespace kcore {

static const size_t VM_PAGE_SIZE = 4096 /* bytes */;

inline bool is_page_aligned(uintptr_t v) {
	return (v & (VM_PAGE_SIZE - 1)) == 0;
}

inline uintptr_t page_round_up(uintptr_t v) {
	return (v + VM_PAGE_SIZE - 1) & ~static_cast<uintptr_t>(VM_PAGE_SIZE - 1);
}

struct vm_range {
	uintptr_t base;
	size_t length;

	inline uintptr_t end() const {
		return base + length;
	}
};

struct address_space_allocator;

/**
 * The root of a process's user address space: the set of mapped page ranges,
 * and the address space id the MMU knows it by. Owned by its process (through
 * a shared pointer, so threads of the process can share it), and released
 * when the last owner lets go.
 */
struct address_space {
	address_space(address_space_allocator *allocator, uint32_t asid);
	~address_space();

	address_space(address_space const&) = delete;
	address_space &operator=(address_space const&) = delete;

	inline uint32_t get_asid() const {
		return asid;
	}

	/* range must be page-aligned and non-empty, and may not overlap an
	 * existing mapping */
	kcore_errno_t map(vm_range range);
	/* Unmap every page inside range; mappings straddling its edges are
	 * split. */
	kcore_errno_t destroy(vm_range range);
	void destroy_all();

	bool is_mapped(uintptr_t addr);
	size_t mapping_count();
	std::vector<vm_range> get_mappings();

private:
	address_space_allocator *allocator;
	const uint32_t asid;
	// base -> length
	spinlock<std::map<uintptr_t, size_t>> mappings;
};

/**
 * Hands out root address spaces. Address space ids come from a fixed pool;
 * once it is exhausted, create_root() fails until an address space is
 * released.
 */
struct address_space_allocator {
	address_space_allocator(size_t max_address_spaces);

	kcore_errno_t create_root(std::shared_ptr<address_space> &result);

	size_t in_use();

private:
	friend struct address_space;
	void release_asid(uint32_t asid);

	struct pool {
		std::vector<bool> used;
		size_t in_use = 0;
		size_t next = 0;
	};
	spinlock<pool> pool_;
};

}
