#pragma once

#include <abi/kcore_types.h>
#include <string>

namespace kcore {

/**
 * Filesystem context of a process: its root and current working directory.
 * Path lookups themselves belong to the VFS; this only turns paths into
 * normalized absolute ones.
 */
struct fs_resolver {
	fs_resolver();

	inline std::string const &get_root() const {
		return root;
	}

	inline std::string const &get_cwd() const {
		return cwd;
	}

	/* path must be absolute */
	kcore_errno_t set_cwd(std::string const &path);
	kcore_errno_t set_root(std::string const &path);

	/* Resolve path against the working directory, and remove "." and ".."
	 * components and duplicate slashes. ".." never leaves the root. */
	kcore_errno_t absolute_path(std::string const &path, std::string &result) const;

	static const size_t MAX_PATH_LENGTH = 4096;

private:
	std::string root;
	std::string cwd;
};

/* The mask applied to permission bits of newly created files. */
struct file_creation_mask {
	static const kcore_mode_t DEFAULT_MASK = 0022;
	static const kcore_mode_t PERMISSION_BITS = 0777;

	file_creation_mask(kcore_mode_t m = DEFAULT_MASK)
	: mask(m & PERMISSION_BITS)
	{}

	inline kcore_mode_t get() const {
		return mask;
	}

	/* returns the previous mask */
	kcore_mode_t set(kcore_mode_t new_mask) {
		kcore_mode_t old = mask;
		mask = new_mask & PERMISSION_BITS;
		return old;
	}

	inline kcore_mode_t apply(kcore_mode_t mode) const {
		return mode & ~mask;
	}

private:
	kcore_mode_t mask;
};

}
