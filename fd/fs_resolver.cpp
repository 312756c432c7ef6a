#include <fd/fs_resolver.hpp>
#include <oslibc/error.h>
#include <vector>

using namespace kcore;

const size_t fs_resolver::MAX_PATH_LENGTH;
const kcore_mode_t file_creation_mask::DEFAULT_MASK;
const kcore_mode_t file_creation_mask::PERMISSION_BITS;

/* Appends the components of path; ".." never removes any of the first
 * min_depth components. */
static void split_components(std::string const &path, std::vector<std::string> &components, size_t min_depth = 0) {
	size_t pos = 0;
	while(pos < path.size()) {
		size_t next = path.find('/', pos);
		if(next == std::string::npos) {
			next = path.size();
		}
		std::string component = path.substr(pos, next - pos);
		if(component.empty() || component == ".") {
			// nothing
		} else if(component == "..") {
			if(components.size() > min_depth) {
				components.pop_back();
			}
		} else {
			components.push_back(component);
		}
		pos = next + 1;
	}
}

static std::string join_components(std::vector<std::string> const &components) {
	if(components.empty()) {
		return "/";
	}
	std::string res;
	for(auto const &component : components) {
		res += "/";
		res += component;
	}
	return res;
}

fs_resolver::fs_resolver()
: root("/")
, cwd("/")
{}

kcore_errno_t fs_resolver::set_cwd(std::string const &path)
{
	if(path.empty() || path[0] != '/') {
		return EINVAL;
	}
	return absolute_path(path, cwd);
}

kcore_errno_t fs_resolver::set_root(std::string const &path)
{
	if(path.empty() || path[0] != '/') {
		return EINVAL;
	}
	std::string new_root;
	auto res = absolute_path(path, new_root);
	if(res != 0) {
		return res;
	}
	root = new_root;
	return 0;
}

kcore_errno_t fs_resolver::absolute_path(std::string const &path, std::string &result) const
{
	if(path.empty()) {
		return ENOENT;
	}
	if(path.size() >= MAX_PATH_LENGTH) {
		return ENAMETOOLONG;
	}

	std::vector<std::string> root_components;
	split_components(root, root_components);

	std::vector<std::string> components;
	if(path[0] != '/') {
		split_components(cwd, components);
	} else {
		components = root_components;
	}
	split_components(path, components, root_components.size());
	result = join_components(components);
	return 0;
}
