/*
	Dining Philosophers Protocols Library for C++
	Copyright (C) 2019 Aleksa Ilic <aleksa.d.ilic@gmail.com>

	This Source Code Form is subject to the terms of the Mozilla Public
	License, v. 2.0. If a copy of the MPL was not distributed with this
	file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/

#ifndef PHILO_PROTOCOLS_ARBITRATOR_H_
#define PHILO_PROTOCOLS_ARBITRATOR_H_

#include "../protocol.h"
#include "../utils/common.h"

#include <condition_variable>
#include <list>
#include <mutex>
#include <string>
#include <vector>

namespace philo {
	namespace protocols {
		/**
		 * A waiter owns every fork and philosophers only ask the waiter for them, one hand at a time.
		 * Free forks are handed out on request, except that the last free fork on the table
		 * is only ever given to a right hand: a philosopher asking with the right hand already
		 * holds the left fork, so they can eat right away and nobody ends up with one fork each.
		 *
		 * Every decision is taken under the waiter's single mutex. Requests that cannot be
		 * granted wait in one FIFO queue which is walked front to back on every change.
		 */
		class arbitrator : public protocol {
			struct pending {
				pending(actor_id who, side hand, resource_id fork) : who(who), hand(hand), fork(fork) {}

				actor_id who;
				side hand;
				resource_id fork;
				bool granted = false;
			};
		public:
			/**
			 * Fork granted by the waiter, given back on destruction unless dismissed.
			 */
			class grant {
			public:
				grant(arbitrator& waiter, actor_id who, side hand, const concurrent::clock::time_point& deadline)
					: waiter_(waiter), who_(who), hand_(hand), status_(waiter.request_until(who, hand, deadline)) {}

				~grant() {
					if (owns())
						waiter_.release(who_, hand_);
				}

				grant(const grant&) = delete;
				grant& operator=(const grant&) = delete;

				void dismiss() { status_ = acquire_status::cancelled; }

				bool owns() const { return status_ == acquire_status::acquired; }
				acquire_status status() const { return status_; }
			private:
				arbitrator& waiter_;
				actor_id who_;
				side hand_;
				acquire_status status_;
			};

			const char* name() const override { return "arbitrator"; }

			void start(size_t n) override {
				std::unique_lock<std::mutex> lock{ mutex_ };
				begin(n);
				holders_.assign(n, nobody);
				free_ = n;
				queue_.clear();
#ifdef DEBUG_ARBITRATOR
				DEBUG_WRITE("arbitrator", "started with %zu forks", n);
#endif
			}

			/**
			 * Blocks until the waiter hands over the fork on the given side of the philosopher.
			 * On timeout or stop the request leaves the queue and nothing is held.
			 */
			acquire_status request_until(actor_id who, side hand, const concurrent::clock::time_point& deadline) {
				check_actor(who);
				resource_id fork = fork_of(who, hand, size());
				notify_request(who, fork);

				std::unique_lock<std::mutex> lock{ mutex_ };
				if (stopped_)
					return acquire_status::cancelled;

				pending request{ who, hand, fork };
				queue_.push_back(&request);
				dispatch();

				auto done = [this, &request] { return request.granted || stopped_; };
				if (deadline == concurrent::forever())
					cond_.wait(lock, done);
				else
					cond_.wait_until(lock, deadline, done);

				if (request.granted)
					return acquire_status::acquired;

				queue_.remove(&request);
#ifdef DEBUG_ARBITRATOR
				DEBUG_WRITE("arbitrator", "philosopher #%zu withdrew %s request for fork %zu", who, to_string(hand), fork);
#endif
				return stopped_ ? acquire_status::cancelled : acquire_status::timed_out;
			}

			bool request(actor_id who, side hand) {
				return request_until(who, hand, concurrent::forever()) == acquire_status::acquired;
			}

			template <class Rep, class Period>
			acquire_status request_for(actor_id who, side hand, const std::chrono::duration<Rep, Period>& timeout) {
				return request_until(who, hand, concurrent::deadline_after(timeout));
			}

			void release(actor_id who, side hand) {
				check_actor(who);
				resource_id fork = fork_of(who, hand, size());

				std::unique_lock<std::mutex> lock{ mutex_ };
				if (holders_[fork] != who)
					throw state_corruption("arbitrator: philosopher #" + std::to_string(who) + " returned fork "
						+ std::to_string(fork) + " they do not hold");
				notify_release(who, fork);
				holders_[fork] = nobody;
				++free_;
#ifdef DEBUG_ARBITRATOR
				DEBUG_WRITE("arbitrator", "philosopher #%zu returned fork %zu, %zu free", who, fork, free_);
#endif
				dispatch();
			}

			acquire_status acquire_pair_until(actor_id id, const concurrent::clock::time_point& deadline) override {
				grant left{ *this, id, side::left, deadline };
				if (!left.owns())
					return left.status();
				grant right{ *this, id, side::right, deadline };
				if (!right.owns())
					return right.status();

				left.dismiss();
				right.dismiss();
				return acquire_status::acquired;
			}

			void release_pair(actor_id id) override {
				release(id, side::right);
				release(id, side::left);
			}

			void stop() override {
				std::unique_lock<std::mutex> lock{ mutex_ };
				stopped_ = true;
				cond_.notify_all();
#ifdef DEBUG_ARBITRATOR
				DEBUG_WRITE("arbitrator", "stopped");
#endif
			}

			size_t free_forks() const {
				std::unique_lock<std::mutex> lock{ mutex_ };
				return free_;
			}

			// requests currently waiting for a grant
			size_t waiting() const {
				std::unique_lock<std::mutex> lock{ mutex_ };
				return queue_.size();
			}

			actor_id holder(resource_id fork) const {
				std::unique_lock<std::mutex> lock{ mutex_ };
				return holders_.at(fork);
			}
		private:
			bool grantable(const pending& request) const {
				if (holders_[request.fork] != nobody)
					return false;
				return request.hand == side::right || free_ > 1;
			}

			// called with mutex_ held
			void dispatch() {
				bool granted = false;
				for (auto it = queue_.begin(); it != queue_.end();) {
					pending& request = **it;
					if (grantable(request)) {
						holders_[request.fork] = request.who;
						--free_;
						request.granted = true;
						granted = true;
						notify_acquire(request.who, request.fork);
#ifdef DEBUG_ARBITRATOR
						DEBUG_WRITE("arbitrator", "fork %zu granted to %s hand of philosopher #%zu, %zu free",
							request.fork, to_string(request.hand), request.who, free_);
#endif
						it = queue_.erase(it);
					}
					else {
						++it;
					}
				}
				if (granted)
					cond_.notify_all();
			}

			mutable std::mutex mutex_;
			std::condition_variable cond_;
			std::vector<actor_id> holders_;
			size_t free_ = 0;
			std::list<pending*> queue_;
		};
	}
}

#endif //PHILO_PROTOCOLS_ARBITRATOR_H_
