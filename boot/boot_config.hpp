#pragma once

#include <abi/kcore_types.h>
#include <memory>
#include <string>
#include <vector>

namespace kcore {

struct process;

/**
 * Kernel configuration taken from the boot command line. The command line
 * is a list of words separated by spaces:
 *
 *   init=/sbin/init max_address_spaces=256 nofile=64 HOME=/ -- /sbin/init -s
 *
 * init=, max_address_spaces= and nofile= configure the kernel; any other
 * KEY=VALUE word is put in the environment of init. Words after "--" are
 * the arguments of init. Other words are ignored.
 */
struct boot_config {
	static const size_t DEFAULT_MAX_ADDRESS_SPACES = 4096;
	static const uint64_t DEFAULT_NOFILE = 1024;

	std::string init_path = "/sbin/init";
	size_t max_address_spaces = DEFAULT_MAX_ADDRESS_SPACES;
	uint64_t nofile = DEFAULT_NOFILE;
	std::vector<std::string> init_argv;
	std::vector<std::string> init_envp;

	/* On failure, config is left untouched. */
	static kcore_errno_t parse(std::string const &cmdline, boot_config &config);
};

/* Spawn init as configured. Panics if the new process did not get the init
 * pid, because it was not the first process. */
kcore_errno_t start_init(boot_config const &config, std::shared_ptr<process> &init);

}
