#include <global.hpp>

namespace kcore {
global_state *global_state_ = nullptr;
}

kcore::global_state::global_state()
: log(nullptr)
, process_store(nullptr)
, thread_store(nullptr)
, scheduler(nullptr)
, program_loader(nullptr)
, address_space_allocator(nullptr)
, boot_config(nullptr)
{}
