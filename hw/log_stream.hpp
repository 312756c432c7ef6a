#pragma once

#include <stddef.h>
#include <stdint.h>
#include <string>
#include <concur/spinlock.hpp>

namespace kcore {

/** Destination of kernel log output. */
struct log_sink {
	virtual ~log_sink() {}
	virtual void write(const char *str, size_t len) = 0;
};

/**
 * The kernel message buffer. It keeps the last `capacity` bytes written to
 * it; older output is overwritten. Writers on any CPU may log concurrently,
 * every write() is applied as a whole.
 */
struct ring_log_sink : public log_sink {
	ring_log_sink(size_t capacity = 16384);

	void write(const char *str, size_t len) override;

	/* returns the retained output, oldest byte first */
	std::string contents();
	void clear();

private:
	struct ring {
		std::string buffer;
		size_t head = 0;
		size_t used = 0;
	};
	spinlock<ring> ring_;
};

/**
 * Formats values into a log_sink. Every operator<< is a separate write to
 * the sink, and the base set by a modifier sticks to the stream. A stream
 * shared between CPUs, like the kernel log, is written through a log_line.
 */
struct log_stream {
	log_stream(log_sink &s);

	int base;

	void write(const char*);

	inline log_sink &get_sink() {
		return sink_;
	}

private:
	log_sink &sink_;
};

// modifiers
typedef void (*modifier)(log_stream &);
void bin(log_stream&);
void dec(log_stream&);
void hex(log_stream&);
log_stream &operator<<(log_stream &, modifier);

log_stream &operator<<(log_stream &, signed char);
log_stream &operator<<(log_stream &, short int);
log_stream &operator<<(log_stream &, int);
log_stream &operator<<(log_stream &, long int);
log_stream &operator<<(log_stream &, long long int);

log_stream &operator<<(log_stream &, unsigned char);
log_stream &operator<<(log_stream &, unsigned short int);
log_stream &operator<<(log_stream &, unsigned int);
log_stream &operator<<(log_stream &, unsigned long int);
log_stream &operator<<(log_stream &, unsigned long long int);

log_stream &operator<<(log_stream &, bool);
log_stream &operator<<(log_stream &, char);
log_stream &operator<<(log_stream &, const char*);
log_stream &operator<<(log_stream &, std::string const&);
log_stream &operator<<(log_stream &, void*);

struct string_log_sink : public log_sink {
	void write(const char *str, size_t len) override;

	std::string text;
};

struct log_line_buffer {
	string_log_sink buffer;
};

/**
 * One message for a log_stream. Output streamed into the line is collected
 * and reaches the target's sink in a single write when the line is
 * destroyed, so messages logged on different CPUs never interleave. Base
 * modifiers only last until the end of the line.
 *
 *   log_line(get_log_stream()) << "process " << pid << " exited\n";
 */
struct log_line : private log_line_buffer, public log_stream {
	explicit log_line(log_stream &target);
	~log_line();

	log_line(log_line const&) = delete;
	log_line &operator=(log_line const&) = delete;

	/* allows streaming into a temporary line */
	template <typename T>
	log_stream &operator<<(T const &value) {
		return static_cast<log_stream&>(*this) << value;
	}

private:
	log_sink &target_;
};

}
