/*
	Dining Philosophers Protocols Library for C++
	Copyright (C) 2019 Aleksa Ilic <aleksa.d.ilic@gmail.com>

	This Source Code Form is subject to the terms of the Mozilla Public
	License, v. 2.0. If a copy of the MPL was not distributed with this
	file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/

#ifndef PHILO_PROTOCOLS_BOUNDED_OCCUPANCY_H_
#define PHILO_PROTOCOLS_BOUNDED_OCCUPANCY_H_

#include "../protocol.h"
#include "../resource.h"
#include "../concurrent/semaphore.h"
#include "../utils/common.h"

#include <algorithm>
#include <memory>
#include <mutex>
#include <vector>

namespace philo {
	namespace protocols {
		/**
		 * Counting gate in front of the table. Besides handing out permits it keeps track
		 * of how many are out right now and of the most that were ever out at once.
		 */
		class admission_gate {
		public:
			/**
			 * Permit passed through the gate, handed back on destruction unless dismissed.
			 */
			class permit {
			public:
				permit(admission_gate& gate, const concurrent::clock::time_point& deadline)
					: gate_(gate), status_(gate.enter_until(deadline)) {}

				~permit() {
					if (owns())
						gate_.leave();
				}

				permit(const permit&) = delete;
				permit& operator=(const permit&) = delete;

				void dismiss() { status_ = acquire_status::cancelled; }

				bool owns() const { return status_ == acquire_status::acquired; }
				acquire_status status() const { return status_; }
			private:
				admission_gate& gate_;
				acquire_status status_;
			};

			admission_gate() : sem_(0) {}

			admission_gate(const admission_gate&) = delete;
			admission_gate& operator=(const admission_gate&) = delete;

			void reset(size_t permits) {
				std::unique_lock<std::mutex> lock{ mutex_ };
				sem_.reset(static_cast<int>(permits));
				capacity_ = permits;
				issued_ = 0;
				peak_ = 0;
			}

			acquire_status enter_until(const concurrent::clock::time_point& deadline) {
				acquire_status status = sem_.wait_until(deadline);
				if (status == acquire_status::acquired) {
					std::unique_lock<std::mutex> lock{ mutex_ };
					peak_ = std::max(peak_, ++issued_);
				}
				return status;
			}

			void leave() {
				{
					std::unique_lock<std::mutex> lock{ mutex_ };
					if (issued_ == 0)
						throw state_corruption("admission gate: permit returned while none is out");
					--issued_;
				}
				sem_.signal();
			}

			void cancel() { sem_.cancel(); }

			size_t capacity() const {
				std::unique_lock<std::mutex> lock{ mutex_ };
				return capacity_;
			}
			size_t issued() const {
				std::unique_lock<std::mutex> lock{ mutex_ };
				return issued_;
			}
			size_t peak() const {
				std::unique_lock<std::mutex> lock{ mutex_ };
				return peak_;
			}
		private:
			concurrent::semaphore sem_;
			mutable std::mutex mutex_;
			size_t capacity_ = 0;
			size_t issued_ = 0;
			size_t peak_ = 0;
		};

		/**
		 * At most n-1 philosophers are let to the table at a time, so at least one of them
		 * is always thinking and the circle of waiting philosophers can never close.
		 * Inside, forks are taken naively, left one first.
		 */
		class bounded_occupancy : public protocol {
		public:
			const char* name() const override { return "bounded occupancy"; }

			void start(size_t n) override {
				begin(n);
				gate_.reset(n - 1);
				forks_.clear();
				for (resource_id fork = 0; fork < n; fork++)
					forks_.push_back(std::make_unique<resource>(fork));
#ifdef DEBUG_OCCUPANCY
				DEBUG_WRITE("occupancy", "started with %zu forks and %zu permits", n, n - 1);
#endif
			}

			acquire_status acquire_pair_until(actor_id id, const concurrent::clock::time_point& deadline) override {
				check_actor(id);
				resource_id left_fork = left_of(id, size());
				resource_id right_fork = right_of(id, size());

				admission_gate::permit ticket{ gate_, deadline };
				if (!ticket.owns())
					return ticket.status();
#ifdef DEBUG_OCCUPANCY
				DEBUG_WRITE("occupancy", "philosopher #%zu admitted, %zu at the table", id, gate_.issued());
#endif

				notify_request(id, left_fork);
				resource_lock left{ *forks_[left_fork], id, deadline };
				if (!left.owns())
					return left.status();

				notify_request(id, right_fork);
				resource_lock right{ *forks_[right_fork], id, deadline };
				if (!right.owns())
					return right.status();

				ticket.dismiss();
				left.dismiss();
				right.dismiss();
				notify_acquire(id, left_fork);
				notify_acquire(id, right_fork);
				return acquire_status::acquired;
			}

			// the permit goes back only once both forks are on the table again
			void release_pair(actor_id id) override {
				check_actor(id);
				resource_id left_fork = left_of(id, size());
				resource_id right_fork = right_of(id, size());
				notify_release(id, right_fork);
				forks_[right_fork]->release(id);
				notify_release(id, left_fork);
				forks_[left_fork]->release(id);
				gate_.leave();
#ifdef DEBUG_OCCUPANCY
				DEBUG_WRITE("occupancy", "philosopher #%zu left the table", id);
#endif
			}

			void stop() override {
				stopped_ = true;
				gate_.cancel();
				for (auto& fork : forks_)
					fork->cancel();
#ifdef DEBUG_OCCUPANCY
				DEBUG_WRITE("occupancy", "stopped");
#endif
			}

			const admission_gate& gate() const { return gate_; }

			actor_id holder(resource_id fork) const {
				return forks_.at(fork)->holder();
			}
		private:
			admission_gate gate_;
			std::vector<std::unique_ptr<resource>> forks_;
		};
	}
}

#endif //PHILO_PROTOCOLS_BOUNDED_OCCUPANCY_H_
