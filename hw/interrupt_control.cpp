#include <hw/interrupt_control.hpp>

using namespace kcore;

#ifdef TESTING_ENABLED

/* Every host thread stands in for a CPU, with its own interrupt flag. */
static thread_local bool simulated_interrupt_flag = true;

static const irq_flags_t INTERRUPT_ENABLE = 1;

irq_flags_t kcore::local_irq_save() {
	irq_flags_t flags = simulated_interrupt_flag ? INTERRUPT_ENABLE : 0;
	simulated_interrupt_flag = false;
	return flags;
}

void kcore::local_irq_restore(irq_flags_t flags) {
	simulated_interrupt_flag = (flags & INTERRUPT_ENABLE) != 0;
}

void kcore::local_irq_enable() {
	simulated_interrupt_flag = true;
}

void kcore::local_irq_disable() {
	simulated_interrupt_flag = false;
}

bool kcore::local_irq_enabled() {
	return simulated_interrupt_flag;
}

#else

// EFLAGS.IF
static const irq_flags_t INTERRUPT_ENABLE = 1 << 9;

irq_flags_t kcore::local_irq_save() {
	irq_flags_t flags;
	asm volatile("pushf; pop %0; cli" : "=r"(flags) : : "memory");
	return flags;
}

void kcore::local_irq_restore(irq_flags_t flags) {
	if(flags & INTERRUPT_ENABLE) {
		asm volatile("sti" : : : "memory");
	} else {
		asm volatile("cli" : : : "memory");
	}
}

void kcore::local_irq_enable() {
	asm volatile("sti" : : : "memory");
}

void kcore::local_irq_disable() {
	asm volatile("cli" : : : "memory");
}

bool kcore::local_irq_enabled() {
	irq_flags_t flags;
	asm volatile("pushf; pop %0" : "=r"(flags) : : "memory");
	return (flags & INTERRUPT_ENABLE) != 0;
}

#endif

bool kcore::irq_flags_enabled(irq_flags_t flags) {
	return (flags & INTERRUPT_ENABLE) != 0;
}
