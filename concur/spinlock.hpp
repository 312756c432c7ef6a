#pragma once

#include <atomic>
#include <utility>
#include <hw/interrupt_control.hpp>
#include <oslibc/assert.hpp>

namespace kcore {

template <typename T>
struct spinlock;

/**
 * Exclusive access to the value inside a spinlock. Releasing the guard
 * (destruction, or an explicit unlock()) first clears the lock flag and then
 * puts back the interrupt state that was found when the lock was taken.
 *
 * A guard returned by spinlock::try_lock() may be empty; check it with
 * owns_lock() or operator bool before touching the value.
 */
template <typename T>
struct spinlock_guard {
	spinlock_guard(spinlock_guard const&) = delete;
	spinlock_guard &operator=(spinlock_guard const&) = delete;

	spinlock_guard(spinlock_guard &&o)
	: irq_guard(std::move(o.irq_guard))
	, lock_(o.lock_)
	{
		o.lock_ = nullptr;
	}

	~spinlock_guard() {
		unlock();
	}

	void unlock() {
		if(lock_) {
			lock_->release();
			lock_ = nullptr;
		}
		irq_guard.restore();
	}

	bool owns_lock() const {
		return lock_ != nullptr;
	}

	explicit operator bool() const {
		return owns_lock();
	}

	T &operator*() {
		assert(lock_ != nullptr);
		return lock_->value;
	}

	T *operator->() {
		assert(lock_ != nullptr);
		return &lock_->value;
	}

private:
	friend struct spinlock<T>;

	spinlock_guard(irq_disabled_guard &&irq, spinlock<T> *l)
	: irq_guard(std::move(irq))
	, lock_(l)
	{}

	// declared first, so that it is destroyed after the lock is released
	irq_disabled_guard irq_guard;
	spinlock<T> *lock_;
};

/**
 * Interrupt-masking spin lock around a value of type T.
 *
 * lock() disables interrupts on the current CPU, then spins until the lock is
 * acquired. Never block, and never take a lock from an interrupt handler that
 * may also be held with interrupts enabled on the same CPU. Acquisition is
 * not fair: under contention, any spinning CPU may win.
 */
template <typename T>
struct spinlock {
	template <class... Args>
	spinlock(Args&&... args)
	: value(std::forward<Args>(args)...)
	, locked(false)
	{}

	spinlock(spinlock const&) = delete;
	spinlock &operator=(spinlock const&) = delete;

	spinlock_guard<T> lock() {
		irq_disabled_guard irq;
		while(!try_acquire()) {
			cpu_relax();
		}
		return spinlock_guard<T>(std::move(irq), this);
	}

	/* Single attempt. On failure the returned guard is empty, and the
	 * interrupt state is back to what it was on entry. */
	spinlock_guard<T> try_lock() {
		irq_disabled_guard irq;
		if(try_acquire()) {
			return spinlock_guard<T>(std::move(irq), this);
		}
		irq.restore();
		return spinlock_guard<T>(std::move(irq), nullptr);
	}

	bool is_locked() const {
		return locked.load(std::memory_order_seq_cst);
	}

private:
	friend struct spinlock_guard<T>;

	bool try_acquire() {
		bool expected = false;
		return locked.compare_exchange_strong(expected, true,
			std::memory_order_seq_cst, std::memory_order_seq_cst);
	}

	void release() {
		assert(locked.load(std::memory_order_seq_cst));
		locked.store(false, std::memory_order_seq_cst);
	}

	static inline void cpu_relax() {
#if defined(__i386__) || defined(__x86_64__)
		asm volatile("pause" : : : "memory");
#endif
	}

	T value;
	std::atomic<bool> locked;
};

}
