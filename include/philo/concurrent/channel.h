/*
	Dining Philosophers Protocols Library for C++
	Copyright (C) 2019 Aleksa Ilic <aleksa.d.ilic@gmail.com>

	This Source Code Form is subject to the terms of the Mozilla Public
	License, v. 2.0. If a copy of the MPL was not distributed with this
	file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/

#ifndef PHILO_CONCURRENT_CHANNEL_H_
#define PHILO_CONCURRENT_CHANNEL_H_

#ifndef PHILO_CHANNEL_CAPACITY
#define PHILO_CHANNEL_CAPACITY 8
#endif

#include "../utils/common.h"
#include "semaphore.h"

#include <deque>
#include <string>
#include <mutex>
#include <condition_variable>

namespace philo {
	namespace concurrent {
		/**
		 * Bounded FIFO link with a single sender and a single receiver.
		 * Messages are delivered in the order they were put. A receiver that listens
		 * on several channels at once attaches the same doorbell semaphore to all of
		 * them: every put signals it exactly once, so each successful doorbell wait
		 * is matched by exactly one message waiting in one of the channels.
		 */
		template <class T>
		class channel {
		public:
			explicit channel(size_t capacity = PHILO_CHANNEL_CAPACITY, const std::string& name = "")
				: capacity_(capacity), name_(name) {}

			channel(const channel&) = delete;
			channel& operator=(const channel&) = delete;

			void attach(semaphore* doorbell) {
				std::unique_lock<std::mutex> lock{ mutex_ };
				doorbell_ = doorbell;
			}

			/**
			 * Appends the message, blocking while the channel is full.
			 * Returns false if the channel is closed before the message could be stored.
			 */
			bool put(const T& message) {
				std::unique_lock<std::mutex> lock{ mutex_ };
				not_full_.wait(lock, [this] { return buffer_.size() < capacity_ || closed_; });
				if (closed_)
					return false;
				buffer_.push_back(message);
				not_empty_.notify_one();
				if (doorbell_)
					doorbell_->signal();
#ifdef DEBUG_CHANNEL
				DEBUG_WRITE("channel(%s)", "message put", name_.c_str());
#endif
				return true;
			}

			bool get(T& message) {
				return get_until(message, forever()) == acquire_status::acquired;
			}

			/**
			 * Removes the oldest message, blocking while the channel is empty.
			 * A closed channel still hands out what it buffered before closing.
			 */
			acquire_status get_until(T& message, const clock::time_point& deadline) {
				std::unique_lock<std::mutex> lock{ mutex_ };
				auto ready = [this] { return !buffer_.empty() || closed_; };
				if (deadline == forever())
					not_empty_.wait(lock, ready);
				else if (!not_empty_.wait_until(lock, deadline, ready))
					return acquire_status::timed_out;

				if (buffer_.empty())
					return acquire_status::cancelled;
				take(message);
				return acquire_status::acquired;
			}

			bool try_get(T& message) {
				std::unique_lock<std::mutex> lock{ mutex_ };
				if (buffer_.empty())
					return false;
				take(message);
				return true;
			}

			void close() {
				std::unique_lock<std::mutex> lock{ mutex_ };
				closed_ = true;
				not_full_.notify_all();
				not_empty_.notify_all();
			}

			void reopen() {
				std::unique_lock<std::mutex> lock{ mutex_ };
				buffer_.clear();
				closed_ = false;
			}

			size_t size() const {
				std::unique_lock<std::mutex> lock{ mutex_ };
				return buffer_.size();
			}

			const std::string& name() const { return name_; }
		private:
			void take(T& message) {
				message = buffer_.front();
				buffer_.pop_front();
				not_full_.notify_one();
#ifdef DEBUG_CHANNEL
				DEBUG_WRITE("channel(%s)", "message received", name_.c_str());
#endif
			}

			mutable std::mutex mutex_;
			std::condition_variable not_full_;
			std::condition_variable not_empty_;
			std::deque<T> buffer_;
			size_t capacity_;
			bool closed_ = false;
			semaphore* doorbell_ = nullptr;
			std::string name_;
		};
	}
}

#endif //PHILO_CONCURRENT_CHANNEL_H_
