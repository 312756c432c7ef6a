#pragma once

#include <stdint.h>

namespace kcore {

/* Saved local interrupt state, as returned by local_irq_save(). Only the
 * interrupt-enable bit is meaningful. */
typedef uintptr_t irq_flags_t;

/* Disable interrupt delivery on this CPU, returning the previous state. */
irq_flags_t local_irq_save();
/* Restore a state returned by local_irq_save(). */
void local_irq_restore(irq_flags_t flags);

void local_irq_enable();
void local_irq_disable();
bool local_irq_enabled();

/* Whether a saved state has interrupts enabled. */
bool irq_flags_enabled(irq_flags_t flags);

/**
 * Keeps interrupts on the current CPU disabled for as long as it lives, and
 * puts back whatever state it found on destruction. Nests: an inner guard
 * finds interrupts already disabled and leaves them disabled.
 *
 * Interrupt state belongs to the CPU, so a guard must be destroyed on the CPU
 * that created it; it can be moved only within the creating context.
 */
struct irq_disabled_guard {
	irq_disabled_guard()
	: flags(local_irq_save())
	, active(true)
	{}

	irq_disabled_guard(irq_disabled_guard const&) = delete;
	irq_disabled_guard &operator=(irq_disabled_guard const&) = delete;

	irq_disabled_guard(irq_disabled_guard &&o)
	: flags(o.flags)
	, active(o.active)
	{
		o.active = false;
	}

	~irq_disabled_guard() {
		restore();
	}

	/* restores the saved state early; the destructor will do nothing */
	void restore() {
		if(active) {
			active = false;
			local_irq_restore(flags);
		}
	}

	inline bool interrupts_were_enabled() const {
		return irq_flags_enabled(flags);
	}

private:
	irq_flags_t flags;
	bool active;
};

}
