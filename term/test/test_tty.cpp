#include <term/tty.hpp>
#include <catch.hpp>

using namespace kcore;

TEST_CASE("term/tty") {
	ring_log_sink sink(64);
	tty console("console", sink);

	REQUIRE(console.type == file_type::character_device);
	REQUIRE(console.get_fg() == 0);
	console.set_fg(7);
	REQUIRE(console.get_fg() == 7);

	size_t written = 0;
	REQUIRE(console.write("hello", 5, written) == 0);
	REQUIRE(written == 5);
	REQUIRE(sink.contents() == "hello");

	char buf[4];
	size_t nread = 1;
	REQUIRE(console.read(buf, sizeof(buf), nread) != 0);
	REQUIRE(nread == 0);
}
