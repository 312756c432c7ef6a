#pragma once

#include <fd/file.hpp>
#include <concur/spinlock.hpp>

namespace kcore {

/**
 * A terminal as seen by job control: an open file whose output goes to a
 * log sink, and which has one foreground process group.
 */
struct tty : public file {
	tty(const char *name, log_sink &output);

	kcore_errno_t write(const char *str, size_t count, size_t &nwritten) override;

	void set_fg(kcore_pgid_t pgid);
	/* 0 if no foreground group was set */
	kcore_pgid_t get_fg();

private:
	log_sink &output;
	spinlock<kcore_pgid_t> foreground;
};

}
