#include <memory/address_space.hpp>
#include <global.hpp>
#include <oslibc/error.h>

using namespace kcore;

address_space::address_space(address_space_allocator *a, uint32_t id)
: allocator(a)
, asid(id)
{}

address_space::~address_space()
{
	if(allocator) {
		allocator->release_asid(asid);
	}
}

kcore_errno_t address_space::map(vm_range range)
{
	if(range.length == 0 || !is_page_aligned(range.base) || !is_page_aligned(range.length)
	|| range.end() < range.base) {
		return EINVAL;
	}

	auto m = mappings.lock();
	auto next = m->lower_bound(range.base);
	if(next != m->end() && next->first < range.end()) {
		return EEXIST;
	}
	if(next != m->begin()) {
		auto prev = std::prev(next);
		if(prev->first + prev->second > range.base) {
			return EEXIST;
		}
	}
	m->emplace(range.base, range.length);
	return 0;
}

kcore_errno_t address_space::destroy(vm_range range)
{
	if(!is_page_aligned(range.base) || !is_page_aligned(range.length) || range.end() < range.base) {
		return EINVAL;
	}
	if(range.length == 0) {
		return 0;
	}

	auto m = mappings.lock();
	auto it = m->lower_bound(range.base);
	if(it != m->begin()) {
		auto prev = std::prev(it);
		if(prev->first + prev->second > range.base) {
			it = prev;
		}
	}
	while(it != m->end() && it->first < range.end()) {
		uintptr_t base = it->first;
		uintptr_t end = base + it->second;
		it = m->erase(it);
		if(base < range.base) {
			// keep the part in front of the range
			m->emplace(base, range.base - base);
		}
		if(end > range.end()) {
			// keep the part behind the range
			it = m->emplace(range.end(), end - range.end()).first;
			++it;
		}
	}
	return 0;
}

void address_space::destroy_all()
{
	mappings.lock()->clear();
}

bool address_space::is_mapped(uintptr_t addr)
{
	auto m = mappings.lock();
	auto it = m->upper_bound(addr);
	if(it == m->begin()) {
		return false;
	}
	--it;
	return addr < it->first + it->second;
}

size_t address_space::mapping_count()
{
	return mappings.lock()->size();
}

std::vector<vm_range> address_space::get_mappings()
{
	std::vector<vm_range> res;
	auto m = mappings.lock();
	for(auto const &entry : *m) {
		res.push_back(vm_range{entry.first, entry.second});
	}
	return res;
}

address_space_allocator::address_space_allocator(size_t max_address_spaces)
{
	assert(max_address_spaces > 0);
	pool_.lock()->used.resize(max_address_spaces, false);
}

kcore_errno_t address_space_allocator::create_root(std::shared_ptr<address_space> &result)
{
	uint32_t asid;
	{
		auto p = pool_.lock();
		size_t size = p->used.size();
		if(p->in_use == size) {
			return ENOMEM;
		}
		size_t i = p->next;
		while(p->used[i]) {
			i = (i + 1) % size;
		}
		p->used[i] = true;
		p->in_use++;
		p->next = (i + 1) % size;
		asid = i;
	}
	result = std::make_shared<address_space>(this, asid);
	return 0;
}

size_t address_space_allocator::in_use()
{
	return pool_.lock()->in_use;
}

void address_space_allocator::release_asid(uint32_t asid)
{
	auto p = pool_.lock();
	if(asid >= p->used.size() || !p->used[asid]) {
		kernel_panic("releasing an address space id that is not in use");
	}
	p->used[asid] = false;
	p->in_use--;
}
