#pragma once

#include <abi/kcore_types.h>

namespace kcore {

enum class resource_kind {
	cpu = 0,
	fsize,
	data,
	stack,
	core,
	rss,
	nproc,
	nofile,
	memlock,
	as,
	locks,
	sigpending,
	msgqueue,
	nice,
	rtprio,
	rttime,
};

static const size_t NUM_RESOURCE_KINDS = 16;

struct rlimit_t {
	static const uint64_t INFINITY_LIMIT = ~uint64_t(0);

	uint64_t cur;
	uint64_t max;
};

/**
 * Per-process resource limits. Defaults are those a freshly booted init
 * gets; children inherit a copy.
 */
struct resource_limits {
	resource_limits();

	static const uint64_t DEFAULT_STACK_SIZE = 8 * 1024 * 1024;
	static const uint64_t DEFAULT_NOFILE_CUR = 1024;
	static const uint64_t DEFAULT_NOFILE_MAX = 4096;

	rlimit_t get(resource_kind kind) const;
	/* fails with EINVAL if kind is out of range or limit.cur > limit.max */
	kcore_errno_t set(resource_kind kind, rlimit_t limit);

private:
	rlimit_t limits[NUM_RESOURCE_KINDS];
};

}
