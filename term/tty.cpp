#include <term/tty.hpp>

using namespace kcore;

tty::tty(const char *n, log_sink &o)
: file(file_type::character_device, n)
, output(o)
, foreground(0)
{}

kcore_errno_t tty::write(const char *str, size_t count, size_t &nwritten)
{
	output.write(str, count);
	nwritten = count;
	return 0;
}

void tty::set_fg(kcore_pgid_t pgid)
{
	*foreground.lock() = pgid;
}

kcore_pgid_t tty::get_fg()
{
	return *foreground.lock();
}
