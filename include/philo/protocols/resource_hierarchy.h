/*
	Dining Philosophers Protocols Library for C++
	Copyright (C) 2019 Aleksa Ilic <aleksa.d.ilic@gmail.com>

	This Source Code Form is subject to the terms of the Mozilla Public
	License, v. 2.0. If a copy of the MPL was not distributed with this
	file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/

#ifndef PHILO_PROTOCOLS_RESOURCE_HIERARCHY_H_
#define PHILO_PROTOCOLS_RESOURCE_HIERARCHY_H_

#include "../protocol.h"
#include "../resource.h"
#include "../utils/common.h"

#include <algorithm>
#include <memory>
#include <utility>
#include <vector>

namespace philo {
	namespace protocols {
		/**
		 * Forks are totally ordered by their index and every philosopher takes the lower
		 * indexed one first. The last philosopher therefore reaches for fork 0 before fork n-1,
		 * which is enough to keep the wait-for graph acyclic.
		 * Deadlock free, not starvation free.
		 */
		class resource_hierarchy : public protocol {
		public:
			const char* name() const override { return "resource hierarchy"; }

			// (first, second) fork in the order philosopher id picks them up
			static std::pair<resource_id, resource_id> ordered_pair(actor_id id, size_t n) {
				resource_id left = left_of(id, n);
				resource_id right = right_of(id, n);
				return std::make_pair(std::min(left, right), std::max(left, right));
			}

			void start(size_t n) override {
				begin(n);
				forks_.clear();
				for (resource_id fork = 0; fork < n; fork++)
					forks_.push_back(std::make_unique<resource>(fork));
#ifdef DEBUG_HIERARCHY
				DEBUG_WRITE("hierarchy", "started with %zu forks", n);
#endif
			}

			acquire_status acquire_pair_until(actor_id id, const concurrent::clock::time_point& deadline) override {
				check_actor(id);
				auto order = ordered_pair(id, size());

				notify_request(id, order.first);
				resource_lock first{ *forks_[order.first], id, deadline };
				if (!first.owns())
					return first.status();
#ifdef DEBUG_HIERARCHY
				DEBUG_WRITE("hierarchy", "philosopher #%zu took fork %zu", id, order.first);
#endif

				notify_request(id, order.second);
				resource_lock second{ *forks_[order.second], id, deadline };
				if (!second.owns())
					return second.status();
#ifdef DEBUG_HIERARCHY
				DEBUG_WRITE("hierarchy", "philosopher #%zu took fork %zu", id, order.second);
#endif

				first.dismiss();
				second.dismiss();
				notify_acquire(id, order.first);
				notify_acquire(id, order.second);
				return acquire_status::acquired;
			}

			// release order is free, only acquisition has to follow the hierarchy
			void release_pair(actor_id id) override {
				check_actor(id);
				auto order = ordered_pair(id, size());
				notify_release(id, order.second);
				forks_[order.second]->release(id);
				notify_release(id, order.first);
				forks_[order.first]->release(id);
#ifdef DEBUG_HIERARCHY
				DEBUG_WRITE("hierarchy", "philosopher #%zu put forks %zu and %zu down", id, order.first, order.second);
#endif
			}

			void stop() override {
				stopped_ = true;
				for (auto& fork : forks_)
					fork->cancel();
#ifdef DEBUG_HIERARCHY
				DEBUG_WRITE("hierarchy", "stopped");
#endif
			}

			actor_id holder(resource_id fork) const {
				return forks_.at(fork)->holder();
			}
		private:
			std::vector<std::unique_ptr<resource>> forks_;
		};
	}
}

#endif //PHILO_PROTOCOLS_RESOURCE_HIERARCHY_H_
