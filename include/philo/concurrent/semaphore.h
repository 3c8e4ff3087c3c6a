/*
	Dining Philosophers Protocols Library for C++
	Copyright (C) 2019 Aleksa Ilic <aleksa.d.ilic@gmail.com>

	This Source Code Form is subject to the terms of the Mozilla Public
	License, v. 2.0. If a copy of the MPL was not distributed with this
	file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/

#ifndef PHILO_CONCURRENT_SEMAPHORE_H_
#define PHILO_CONCURRENT_SEMAPHORE_H_

#include "../errors.h"

#include <chrono>
#include <mutex>
#include <condition_variable>

namespace philo {
	namespace concurrent {
		using clock = std::chrono::steady_clock;

		// deadline meaning "no deadline", waits given it never time out
		inline clock::time_point forever() {
			return clock::time_point::max();
		}

		template <class Rep, class Period>
		clock::time_point deadline_after(const std::chrono::duration<Rep, Period>& timeout) {
			return clock::now() + std::chrono::duration_cast<clock::duration>(timeout);
		}

		class semaphore {
		public:
			explicit semaphore(int val = 0) : val_(val) {}

			semaphore(const semaphore&) = delete;
			semaphore& operator=(const semaphore&) = delete;

			/**
			 * Increments the internal value of semaphore by 1 and,
			 * if there are processes waiting for it, transfers one of them to the ready queue.
			 * Signalling stays legal after cancel() so that holders can still give back what they took.
			 */
			void signal() {
				std::unique_lock<std::mutex> lock{ mutex_ };
				++val_;
				cond_.notify_one();
			}

			/**
			 * Blocks until the internal value is positive and then decrements it by 1.
			 * Returns false, without decrementing, when the semaphore got cancelled meanwhile.
			 */
			bool wait() {
				return wait_until(forever()) == acquire_status::acquired;
			}

			/**
			 * Same as wait() but gives up once the deadline passes.
			 */
			acquire_status wait_until(const clock::time_point& deadline) {
				std::unique_lock<std::mutex> lock{ mutex_ };
				auto ready = [this] { return val_ > 0 || cancelled_; };
				if (deadline == forever())
					cond_.wait(lock, ready);
				else if (!cond_.wait_until(lock, deadline, ready))
					return acquire_status::timed_out;

				if (cancelled_)
					return acquire_status::cancelled;
				--val_;
				return acquire_status::acquired;
			}

			template <class Rep, class Period>
			acquire_status wait_for(const std::chrono::duration<Rep, Period>& timeout) {
				return wait_until(deadline_after(timeout));
			}

			bool try_wait() {
				std::unique_lock<std::mutex> lock{ mutex_ };
				if (cancelled_ || val_ <= 0)
					return false;
				--val_;
				return true;
			}

			/**
			 * Releases every blocked process with a cancelled status.
			 * All waits keep failing until the semaphore is reset.
			 */
			void cancel() {
				std::unique_lock<std::mutex> lock{ mutex_ };
				cancelled_ = true;
				cond_.notify_all();
			}

			void reset(int val) {
				std::unique_lock<std::mutex> lock{ mutex_ };
				val_ = val;
				cancelled_ = false;
			}

			int value() const {
				std::unique_lock<std::mutex> lock{ mutex_ };
				return val_;
			}

			bool cancelled() const {
				std::unique_lock<std::mutex> lock{ mutex_ };
				return cancelled_;
			}
		private:
			mutable std::mutex mutex_;
			std::condition_variable cond_;
			int val_;
			bool cancelled_ = false;
		};
	}
}

#endif //PHILO_CONCURRENT_SEMAPHORE_H_
