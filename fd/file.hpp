#pragma once

#include <abi/kcore_types.h>
#include <hw/log_stream.hpp>

namespace kcore {

enum class file_type {
	unknown,
	character_device,
	regular_file,
	directory,
	pipe,
	socket,
};

log_stream &operator<<(log_stream &s, file_type type);

/** Open file objects
 *
 * A file is anything a file descriptor can refer to. File tables hold files
 * through shared pointers, so the same open file may appear in several
 * descriptor slots and in the tables of several processes; it is closed when
 * the last reference goes away.
 */
struct file {
	file(file_type t, const char *n);
	virtual ~file();

	file(file const&) = delete;
	file &operator=(file const&) = delete;

	const file_type type;
	char name[64]; /* for debugging */

	virtual kcore_errno_t read(void * /*dest*/, size_t /*count*/, size_t &nread) {
		nread = 0;
		return KCORE_EINVAL;
	}

	virtual kcore_errno_t write(const char * /*str*/, size_t /*count*/, size_t &nwritten) {
		nwritten = 0;
		return KCORE_EINVAL;
	}
};

}
