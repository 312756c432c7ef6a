#include <fd/file_table.hpp>
#include <fd/file.hpp>
#include <global.hpp>
#include <oslibc/error.h>

using namespace kcore;

const size_t file_table::DEFAULT_MAX_FDS;

file_table::file_table(size_t m)
: max_fds(m)
{}

file_table file_table::new_with_stdio(std::shared_ptr<file> console, size_t max_fds)
{
	file_table table(max_fds);
	if(console) {
		for(kcore_fd_t fd = 0; fd < 3; ++fd) {
			kcore_fd_t installed;
			if(table.insert(console, false, installed) != 0 || installed != fd) {
				kernel_panic("failed to install the standard descriptors");
			}
		}
	}
	return table;
}

bool file_table::valid_fd(kcore_fd_t fd) const
{
	return fd >= 0 && static_cast<size_t>(fd) < max_fds;
}

kcore_errno_t file_table::insert(std::shared_ptr<file> f, bool close_on_exec, kcore_fd_t &fd)
{
	if(!f) {
		return EINVAL;
	}
	for(size_t i = 0; i < fds.size(); ++i) {
		if(!fds[i].f) {
			fds[i].f = std::move(f);
			fds[i].close_on_exec = close_on_exec;
			fd = i;
			return 0;
		}
	}
	if(fds.size() >= max_fds) {
		return EMFILE;
	}
	fd_mapping_t mapping;
	mapping.f = std::move(f);
	mapping.close_on_exec = close_on_exec;
	fds.push_back(std::move(mapping));
	fd = fds.size() - 1;
	return 0;
}

kcore_errno_t file_table::insert_at(kcore_fd_t fd, std::shared_ptr<file> f, bool close_on_exec, std::shared_ptr<file> &previous)
{
	if(!f) {
		return EINVAL;
	}
	if(!valid_fd(fd)) {
		return EBADF;
	}
	if(static_cast<size_t>(fd) >= fds.size()) {
		fds.resize(fd + 1);
	}
	previous = std::move(fds[fd].f);
	fds[fd].f = std::move(f);
	fds[fd].close_on_exec = close_on_exec;
	return 0;
}

kcore_errno_t file_table::get(kcore_fd_t fd, std::shared_ptr<file> &f) const
{
	if(fd < 0 || static_cast<size_t>(fd) >= fds.size() || !fds[fd].f) {
		return EBADF;
	}
	f = fds[fd].f;
	return 0;
}

kcore_errno_t file_table::close(kcore_fd_t fd)
{
	if(fd < 0 || static_cast<size_t>(fd) >= fds.size() || !fds[fd].f) {
		return EBADF;
	}
	fds[fd].f.reset();
	fds[fd].close_on_exec = false;
	return 0;
}

size_t file_table::close_on_exec()
{
	size_t closed = 0;
	for(auto &mapping : fds) {
		if(mapping.f && mapping.close_on_exec) {
			mapping.f.reset();
			mapping.close_on_exec = false;
			++closed;
		}
	}
	return closed;
}

size_t file_table::count() const
{
	size_t c = 0;
	for(auto const &mapping : fds) {
		if(mapping.f) {
			++c;
		}
	}
	return c;
}
