/*
	Dining Philosophers Protocols Library for C++
	Copyright (C) 2019 Aleksa Ilic <aleksa.d.ilic@gmail.com>

	This Source Code Form is subject to the terms of the Mozilla Public
	License, v. 2.0. If a copy of the MPL was not distributed with this
	file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/

#ifndef PHILO_CONCURRENT_THREAD_H_
#define PHILO_CONCURRENT_THREAD_H_

#include "../utils/common.h"

#include <atomic>
#include <exception>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace philo {
	namespace concurrent {
		/**
		 * Active object: derived classes put their body in run() and call join()
		 * from their own destructor, as the body may still touch derived members.
		 *
		 * An exception escaping run() does not take the process down: it is kept as
		 * the thread's failure and handed to on_exit(), which runs on the thread itself
		 * right after run() in either case.
		 */
		class thread {
		public:
			using id = size_t;

			enum class status {
				idle,
				active,
				finished,
				failed
			};
			struct descriptor {
				explicit descriptor(const std::string& name) : name(name) {}

				std::string name;
				thread::status status = thread::status::idle;
				thread::id id = ++thread::next_id();
			};

			explicit thread(const std::string& name) : desc_(name) {}
			virtual ~thread() {}

			thread(const thread&) = delete;
			thread& operator=(const thread&) = delete;

			// starting a thread that already ran is a no-op
			void start() {
				std::unique_lock<std::mutex> lock{ mutex_ };
				if (desc_.status != status::idle)
					return;
				desc_.status = status::active;
				thread_ = std::make_unique<std::thread>(thread_runner, this);
#ifdef DEBUG_THREAD
				DEBUG_WRITE("thread[#%zu] %s", "started", desc_.id, desc_.name.c_str());
#endif
			}

			// may be called from several threads at once, only the first one joins
			void join() {
				std::unique_lock<std::mutex> lock{ join_mutex_ };
				std::thread* running = nullptr;
				{
					std::unique_lock<std::mutex> state{ mutex_ };
					running = thread_.get();
				}
				if (running && running->joinable()) {
#ifdef DEBUG_THREAD
					DEBUG_WRITE("thread[#%zu] %s", "joined", desc_.id, desc_.name.c_str());
#endif
					running->join();
				}
			}

			descriptor get_descriptor() const {
				std::unique_lock<std::mutex> lock{ mutex_ };
				return desc_;
			}

			bool finished() const {
				std::unique_lock<std::mutex> lock{ mutex_ };
				return desc_.status == status::finished || desc_.status == status::failed;
			}

			std::exception_ptr failure() const {
				std::unique_lock<std::mutex> lock{ mutex_ };
				return failure_;
			}

			virtual void run() = 0;
		protected:
			virtual void on_exit(std::exception_ptr /*failure*/) {}
		private:
			static void thread_runner(thread* self) {
				std::exception_ptr failure;
				try {
					self->run();
				}
				catch (const std::exception& e) {
#ifdef DEBUG_THREAD
					DEBUG_WRITE("thread[#%zu] %s", "failed: %s", self->desc_.id, self->desc_.name.c_str(), e.what());
#endif
					failure = std::current_exception();
				}
				{
					std::unique_lock<std::mutex> lock{ self->mutex_ };
					self->failure_ = failure;
					self->desc_.status = failure ? status::failed : status::finished;
				}
				self->on_exit(failure);
			}
			static std::atomic_size_t& next_id() {
				static std::atomic_size_t next{ 0 };
				return next;
			}

			std::unique_ptr<std::thread> thread_;
			descriptor desc_;
			std::exception_ptr failure_;
			mutable std::mutex mutex_;
			std::mutex join_mutex_;
		};
	}
}

#endif //PHILO_CONCURRENT_THREAD_H_
