#include <hw/log_stream.hpp>
#include <string.h>
#include <type_traits>

using kcore::log_stream;
using kcore::log_line;
using kcore::ring_log_sink;
using kcore::string_log_sink;

ring_log_sink::ring_log_sink(size_t capacity)
{
	assert(capacity > 0);
	auto r = ring_.lock();
	r->buffer.resize(capacity);
}

void ring_log_sink::write(const char *str, size_t len)
{
	auto r = ring_.lock();
	size_t capacity = r->buffer.size();
	if(len > capacity) {
		// only the tail survives anyway
		str += len - capacity;
		len = capacity;
	}
	for(size_t i = 0; i < len; ++i) {
		r->buffer[(r->head + r->used) % capacity] = str[i];
		if(r->used == capacity) {
			r->head = (r->head + 1) % capacity;
		} else {
			r->used++;
		}
	}
}

std::string ring_log_sink::contents()
{
	auto r = ring_.lock();
	size_t capacity = r->buffer.size();
	std::string res;
	res.reserve(r->used);
	for(size_t i = 0; i < r->used; ++i) {
		res += r->buffer[(r->head + i) % capacity];
	}
	return res;
}

void ring_log_sink::clear()
{
	auto r = ring_.lock();
	r->head = 0;
	r->used = 0;
}

log_stream::log_stream(log_sink &s)
: base(10)
, sink_(s)
{}

void log_stream::write(const char *s) {
	sink_.write(s, strlen(s));
}

// modifiers
void kcore::bin(log_stream &s) {
	s.base = 2;
}
void kcore::dec(log_stream &s) {
	s.base = 10;
}
void kcore::hex(log_stream &s) {
	s.base = 16;
}

log_stream &kcore::operator<<(log_stream &s, kcore::modifier m)
{
	m(s);
	return s;
}

/* Writes value in the given base into the end of buffer, returns a pointer
 * to the first character. */
static char *u64_to_string(uint64_t value, bool negative, char *buf, size_t bufsize, int base) {
	const char *digits = "0123456789abcdefghijklmnopqrstuvwxyz";
	char *ptr = buf + bufsize - 1;
	*ptr = 0;
	do {
		*--ptr = digits[value % base];
		value /= base;
	} while(value > 0 && ptr > buf + 1);
	if(negative) {
		*--ptr = '-';
	}
	return ptr;
}

template <typename T>
static void write_integral_to_stream(log_stream &s, T value) {
	char buf[72];
	int base = (s.base >= 2 && s.base <= 36) ? s.base : 10;
	if(std::is_signed<T>::value && value < 0) {
		// negate in unsigned arithmetic so the minimum value survives
		uint64_t magnitude = ~static_cast<uint64_t>(value) + 1;
		s.write(u64_to_string(magnitude, true, &buf[0], sizeof(buf), base));
	} else {
		s.write(u64_to_string(static_cast<uint64_t>(value), false, &buf[0], sizeof(buf), base));
	}
}

#define TO_STREAM(TYPE) \
log_stream &kcore::operator<<(log_stream &s, TYPE value) { \
	write_integral_to_stream(s, value); \
	return s; \
}

TO_STREAM(signed char);
TO_STREAM(short int);
TO_STREAM(int);
TO_STREAM(long int);
TO_STREAM(long long int);

TO_STREAM(unsigned char);
TO_STREAM(unsigned short int);
TO_STREAM(unsigned int);
TO_STREAM(unsigned long int);
TO_STREAM(unsigned long long int);

#undef TO_STREAM

log_stream &kcore::operator<<(log_stream &s, bool val) {
	s.write(val ? "true" : "false");
	return s;
}

log_stream &kcore::operator<<(log_stream &s, char val) {
	char buf[2];
	buf[0] = val;
	buf[1] = 0;
	s.write(buf);
	return s;
}

log_stream &kcore::operator<<(log_stream &s, const char *str) {
	s.write(str == nullptr ? "(null)" : str);
	return s;
}

log_stream &kcore::operator<<(log_stream &s, std::string const &str) {
	s.write(str.c_str());
	return s;
}

log_stream &kcore::operator<<(log_stream &s, void *ptr) {
	if(ptr == nullptr) {
		s.write("(null)");
	} else {
		uint64_t addr = reinterpret_cast<uintptr_t>(ptr);
		char buf[24];
		s.write("0x");
		s.write(u64_to_string(addr, false, &buf[0], sizeof(buf), 16));
	}
	return s;
}

void string_log_sink::write(const char *str, size_t len)
{
	text.append(str, len);
}

log_line::log_line(log_stream &target)
: log_line_buffer()
, log_stream(buffer)
, target_(target.get_sink())
{}

log_line::~log_line()
{
	if(!buffer.text.empty()) {
		target_.write(buffer.text.data(), buffer.text.size());
	}
}
