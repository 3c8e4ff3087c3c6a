/*
	Dining Philosophers Protocols Library for C++
	Copyright (C) 2019 Aleksa Ilic <aleksa.d.ilic@gmail.com>

	This Source Code Form is subject to the terms of the Mozilla Public
	License, v. 2.0. If a copy of the MPL was not distributed with this
	file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/

#ifndef PHILO_RESOURCE_H_
#define PHILO_RESOURCE_H_

#include "protocol.h"
#include "concurrent/semaphore.h"

#include <atomic>
#include <string>

namespace philo {
	/**
	 * Exclusively held fork: a semaphore with initial value 1 that also remembers
	 * who passed it, so that a second holder or a release by a stranger is caught.
	 */
	class resource {
	public:
		explicit resource(resource_id id = 0) : id_(id), sem_(1) {}

		resource(const resource&) = delete;
		resource& operator=(const resource&) = delete;

		acquire_status acquire_until(actor_id who, const concurrent::clock::time_point& deadline) {
			acquire_status status = sem_.wait_until(deadline);
			if (status != acquire_status::acquired)
				return status;

			actor_id expected = nobody;
			if (!holder_.compare_exchange_strong(expected, who))
				throw state_corruption("fork " + std::to_string(id_) + " taken by philosopher #"
					+ std::to_string(who) + " while philosopher #" + std::to_string(expected) + " holds it");
			return acquire_status::acquired;
		}

		bool acquire(actor_id who) {
			return acquire_until(who, concurrent::forever()) == acquire_status::acquired;
		}

		void release(actor_id who) {
			actor_id expected = who;
			if (!holder_.compare_exchange_strong(expected, nobody))
				throw state_corruption("fork " + std::to_string(id_) + " released by philosopher #"
					+ std::to_string(who) + " but held by "
					+ (expected == nobody ? std::string("nobody") : "philosopher #" + std::to_string(expected)));
			sem_.signal();
		}

		// wakes blocked acquirers with a cancelled status, holders may still release
		void cancel() { sem_.cancel(); }

		void reset(resource_id id) {
			id_ = id;
			holder_ = nobody;
			sem_.reset(1);
		}

		resource_id id() const { return id_; }
		actor_id holder() const { return holder_; }
	private:
		resource_id id_;
		concurrent::semaphore sem_;
		std::atomic<actor_id> holder_{ nobody };
	};

	/**
	 * Scoped hold of a single fork, released on destruction unless dismissed.
	 */
	class resource_lock {
	public:
		resource_lock(resource& fork, actor_id who, const concurrent::clock::time_point& deadline)
			: fork_(&fork), who_(who), status_(fork.acquire_until(who, deadline)) {}

		~resource_lock() {
			if (owns())
				fork_->release(who_);
		}

		resource_lock(const resource_lock&) = delete;
		resource_lock& operator=(const resource_lock&) = delete;

		// the hold outlives the lock, its owner releases the fork later
		void dismiss() { status_ = acquire_status::cancelled; }

		bool owns() const { return status_ == acquire_status::acquired; }
		acquire_status status() const { return status_; }
	private:
		resource* fork_;
		actor_id who_;
		acquire_status status_;
	};
}

#endif //PHILO_RESOURCE_H_
