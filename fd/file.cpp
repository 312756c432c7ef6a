#include <fd/file.hpp>
#include <string.h>

using namespace kcore;

file::file(file_type t, const char *n)
: type(t)
{
	strncpy(name, n, sizeof(name) - 1);
	name[sizeof(name) - 1] = 0;
}

file::~file()
{}

log_stream &kcore::operator<<(log_stream &s, file_type type) {
	switch(type) {
#define FT(N) case file_type::N: s << #N; break
	FT(unknown);
	FT(character_device);
	FT(regular_file);
	FT(directory);
	FT(pipe);
	FT(socket);
#undef FT
	}
	return s;
}
