#include <boot/boot_config.hpp>
#include <proc/process.hpp>
#include <global.hpp>
#include <oslibc/error.h>

using namespace kcore;

const size_t boot_config::DEFAULT_MAX_ADDRESS_SPACES;
const uint64_t boot_config::DEFAULT_NOFILE;

namespace {

std::vector<std::string> split_words(std::string const &cmdline)
{
	std::vector<std::string> words;
	size_t pos = 0;
	while(pos < cmdline.size()) {
		while(pos < cmdline.size() && (cmdline[pos] == ' ' || cmdline[pos] == '\t')) {
			pos++;
		}
		size_t start = pos;
		while(pos < cmdline.size() && cmdline[pos] != ' ' && cmdline[pos] != '\t') {
			pos++;
		}
		if(pos > start) {
			words.push_back(cmdline.substr(start, pos - start));
		}
	}
	return words;
}

/* positive decimal number, without sign or leading garbage */
bool parse_number(std::string const &str, uint64_t &result)
{
	if(str.empty() || str.size() > 19) {
		return false;
	}
	uint64_t value = 0;
	for(char c : str) {
		if(c < '0' || c > '9') {
			return false;
		}
		value = value * 10 + (c - '0');
	}
	if(value == 0) {
		return false;
	}
	result = value;
	return true;
}

kcore_errno_t reject(std::string const &word)
{
	log_line(get_log_stream()) << "boot: invalid option \"" << word << "\"\n";
	return EINVAL;
}

}

kcore_errno_t boot_config::parse(std::string const &cmdline, boot_config &config)
{
	boot_config parsed;
	auto words = split_words(cmdline);
	size_t i = 0;
	for(; i < words.size(); ++i) {
		std::string const &word = words[i];
		if(word == "--") {
			++i;
			break;
		}
		auto eq = word.find('=');
		if(eq == std::string::npos || eq == 0) {
			continue;
		}
		std::string key = word.substr(0, eq);
		std::string value = word.substr(eq + 1);

		if(key == "init") {
			if(value.empty() || value[0] != '/') {
				return reject(word);
			}
			parsed.init_path = value;
		} else if(key == "max_address_spaces") {
			uint64_t n;
			if(!parse_number(value, n)) {
				return reject(word);
			}
			parsed.max_address_spaces = n;
		} else if(key == "nofile") {
			uint64_t n;
			// room for at least the standard descriptors
			if(!parse_number(value, n) || n < 3) {
				return reject(word);
			}
			parsed.nofile = n;
		} else {
			parsed.init_envp.push_back(word);
		}
	}
	for(; i < words.size(); ++i) {
		parsed.init_argv.push_back(words[i]);
	}
	if(parsed.init_argv.empty()) {
		parsed.init_argv.push_back(parsed.init_path);
	}

	config = std::move(parsed);
	return 0;
}

kcore_errno_t kcore::start_init(boot_config const &config, std::shared_ptr<process> &init)
{
	log_line(get_log_stream()) << "starting init " << config.init_path << "\n";
	auto res = process::spawn_user_process(config.init_path, config.init_argv, config.init_envp, init);
	if(res != 0) {
		log_line(get_log_stream()) << "failed to start init, error " << res << "\n";
		return res;
	}
	if(!init->is_init_process()) {
		kernel_panic("init did not get the init pid");
	}
	return 0;
}
