/*
	Dining Philosophers Protocols Library for C++
	Copyright (C) 2019 Aleksa Ilic <aleksa.d.ilic@gmail.com>

	This Source Code Form is subject to the terms of the Mozilla Public
	License, v. 2.0. If a copy of the MPL was not distributed with this
	file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/

#ifndef PHILO_PROTOCOL_H_
#define PHILO_PROTOCOL_H_

#include "errors.h"
#include "concurrent/semaphore.h"

#include <atomic>
#include <exception>
#include <mutex>
#include <string>
#include <cstddef>

namespace philo {
	using actor_id = size_t;
	using resource_id = size_t;

	// holder of a free fork
	constexpr actor_id nobody = static_cast<actor_id>(-1);

	enum class side {
		left,
		right
	};

	inline const char* to_string(side s) {
		return s == side::left ? "left" : "right";
	}

	// Philosopher i sits between fork i on the left and fork i+1 on the right, the table is round.
	inline resource_id left_of(actor_id id, size_t n) {
		return id % n;
	}
	inline resource_id right_of(actor_id id, size_t n) {
		return (id + 1) % n;
	}
	inline resource_id fork_of(actor_id id, side s, size_t n) {
		return s == side::left ? left_of(id, n) : right_of(id, n);
	}

	/**
	 * Observation hook for tests and tracing. Callbacks come from whichever thread
	 * performed the transition, implementations have to do their own locking.
	 */
	class protocol_listener {
	public:
		virtual ~protocol_listener() {}

		// actor starts waiting for a fork
		virtual void on_request(actor_id, resource_id) {}
		// actor holds the fork and may use it
		virtual void on_acquire(actor_id, resource_id) {}
		// actor stops using the fork, reported before anybody else can get it
		virtual void on_release(actor_id, resource_id) {}
		// fork changed hands between two neighbours, message passing protocols only
		virtual void on_transfer(resource_id, actor_id /*from*/, actor_id /*to*/, bool /*clean*/) {}
		// fork got used by its holder, message passing protocols only
		virtual void on_dirty(resource_id, actor_id /*holder*/) {}
	};

	/**
	 * Uniform interface every dining protocol gives to its philosophers.
	 *
	 * start(n) lays out n forks and must be called before anything else,
	 * acquire_pair blocks until the philosopher holds both forks,
	 * release_pair puts them back and stop() wakes every blocked philosopher
	 * with a cancelled status after rolling back whatever was partially held.
	 * release_pair stays usable after stop() so that eating philosophers can finish.
	 */
	class protocol {
	public:
		virtual ~protocol() {}

		virtual void start(size_t n) = 0;
		virtual acquire_status acquire_pair_until(actor_id id, const concurrent::clock::time_point& deadline) = 0;
		virtual void release_pair(actor_id id) = 0;
		virtual void stop() = 0;
		virtual const char* name() const = 0;

		bool acquire_pair(actor_id id) {
			return acquire_pair_until(id, concurrent::forever()) == acquire_status::acquired;
		}

		template <class Rep, class Period>
		acquire_status try_acquire_pair_for(actor_id id, const std::chrono::duration<Rep, Period>& timeout) {
			return acquire_pair_until(id, concurrent::deadline_after(timeout));
		}

		size_t size() const { return size_; }
		bool stopped() const { return stopped_; }

		// first fatal error the protocol ran into on a thread of its own, if any
		std::exception_ptr failure() const {
			std::unique_lock<std::mutex> lock{ failure_mutex_ };
			return failure_;
		}

		// Not synchronized, set it before start().
		void set_listener(protocol_listener* listener) { listener_ = listener; }
	protected:
		void begin(size_t n, size_t minimum = 2) {
			if (!stopped_)
				throw configuration_error(std::string(name()) + " is already running");
			if (n < minimum)
				throw configuration_error(std::string(name()) + " needs at least "
					+ std::to_string(minimum) + " philosophers, got " + std::to_string(n));
			size_ = n;
			stopped_ = false;
			std::unique_lock<std::mutex> lock{ failure_mutex_ };
			failure_ = nullptr;
		}

		void record_failure(std::exception_ptr failure) {
			std::unique_lock<std::mutex> lock{ failure_mutex_ };
			if (!failure_)
				failure_ = failure;
		}

		void check_actor(actor_id id) const {
			if (id >= size_)
				throw configuration_error(std::string(name()) + ": no philosopher #" + std::to_string(id)
					+ " at a table of " + std::to_string(size_));
		}

		void notify_request(actor_id id, resource_id fork) {
			if (listener_) listener_->on_request(id, fork);
		}
		void notify_acquire(actor_id id, resource_id fork) {
			if (listener_) listener_->on_acquire(id, fork);
		}
		void notify_release(actor_id id, resource_id fork) {
			if (listener_) listener_->on_release(id, fork);
		}
		void notify_transfer(resource_id fork, actor_id from, actor_id to, bool clean) {
			if (listener_) listener_->on_transfer(fork, from, to, clean);
		}
		void notify_dirty(resource_id fork, actor_id holder) {
			if (listener_) listener_->on_dirty(fork, holder);
		}

		std::atomic<bool> stopped_{ true };
	private:
		std::atomic<size_t> size_{ 0 };
		protocol_listener* listener_ = nullptr;
		mutable std::mutex failure_mutex_;
		std::exception_ptr failure_;
	};

	/**
	 * RAII acquisition of a philosopher's pair: whatever was acquired is released
	 * when the guard goes out of scope, on every exit path.
	 * A release failing there means the table is corrupted beyond repair and terminates.
	 */
	class scoped_pair {
	public:
		scoped_pair(protocol& table, actor_id id, const concurrent::clock::time_point& deadline = concurrent::forever())
			: protocol_(table), id_(id), status_(table.acquire_pair_until(id, deadline)) {}

		~scoped_pair() {
			if (owns())
				protocol_.release_pair(id_);
		}

		scoped_pair(const scoped_pair&) = delete;
		scoped_pair& operator=(const scoped_pair&) = delete;

		// explicit release lets a failing release propagate to the caller
		void release() {
			if (owns()) {
				status_ = acquire_status::cancelled;
				protocol_.release_pair(id_);
			}
		}

		bool owns() const { return status_ == acquire_status::acquired; }
		acquire_status status() const { return status_; }
		explicit operator bool() const { return owns(); }
	private:
		protocol& protocol_;
		actor_id id_;
		acquire_status status_;
	};
}

#endif //PHILO_PROTOCOL_H_
