#include <proc/resource_limits.hpp>
#include <oslibc/error.h>

using namespace kcore;

const uint64_t rlimit_t::INFINITY_LIMIT;
const uint64_t resource_limits::DEFAULT_STACK_SIZE;
const uint64_t resource_limits::DEFAULT_NOFILE_CUR;
const uint64_t resource_limits::DEFAULT_NOFILE_MAX;

static inline size_t index_of(resource_kind kind) {
	return static_cast<size_t>(kind);
}

resource_limits::resource_limits()
{
	for(auto &limit : limits) {
		limit = rlimit_t{rlimit_t::INFINITY_LIMIT, rlimit_t::INFINITY_LIMIT};
	}
	limits[index_of(resource_kind::stack)] = rlimit_t{DEFAULT_STACK_SIZE, rlimit_t::INFINITY_LIMIT};
	limits[index_of(resource_kind::nofile)] = rlimit_t{DEFAULT_NOFILE_CUR, DEFAULT_NOFILE_MAX};
	limits[index_of(resource_kind::core)] = rlimit_t{0, rlimit_t::INFINITY_LIMIT};
}

rlimit_t resource_limits::get(resource_kind kind) const
{
	size_t i = index_of(kind);
	if(i >= NUM_RESOURCE_KINDS) {
		return rlimit_t{0, 0};
	}
	return limits[i];
}

kcore_errno_t resource_limits::set(resource_kind kind, rlimit_t limit)
{
	size_t i = index_of(kind);
	if(i >= NUM_RESOURCE_KINDS || limit.cur > limit.max) {
		return EINVAL;
	}
	limits[i] = limit;
	return 0;
}
