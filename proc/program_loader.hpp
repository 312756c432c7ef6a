#pragma once

#include <abi/kcore_types.h>
#include <string>
#include <vector>

namespace kcore {

struct address_space;
struct fs_resolver;

/* Result of loading an executable: where the main thread starts. */
struct load_result {
	uintptr_t entry_point = 0;
	uintptr_t stack_pointer = 0;
};

/**
 * Executable loader. load_executable() maps the program found at path into
 * the given address space, lays out argv and envp on its user stack, and
 * reports where execution begins. On failure it returns an error code and
 * may leave partial mappings behind, which the caller removes.
 */
struct program_loader {
	virtual ~program_loader() {}

	virtual kcore_errno_t load_executable(address_space &aspace, fs_resolver const &fs,
		std::string const &path, std::vector<std::string> const &argv,
		std::vector<std::string> const &envp, load_result &result) = 0;
};

}
