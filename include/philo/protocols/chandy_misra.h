/*
	Dining Philosophers Protocols Library for C++
	Copyright (C) 2019 Aleksa Ilic <aleksa.d.ilic@gmail.com>

	This Source Code Form is subject to the terms of the Mozilla Public
	License, v. 2.0. If a copy of the MPL was not distributed with this
	file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/

#ifndef PHILO_PROTOCOLS_CHANDY_MISRA_H_
#define PHILO_PROTOCOLS_CHANDY_MISRA_H_

#include "../protocol.h"
#include "../concurrent/channel.h"
#include "../concurrent/semaphore.h"
#include "../concurrent/thread.h"
#include "../utils/common.h"

#include <condition_variable>
#include <exception>
#include <initializer_list>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace philo {
	namespace protocols {
		/**
		 * Hygienic dining philosophers, without any shared state.
		 *
		 * Every philosopher has a node: an active object that alone knows which of their
		 * forks it has, whether they are clean or dirty and which neighbour asked for them.
		 * Nodes only talk to their neighbours, through one bounded FIFO channel per hand.
		 *
		 *  - Initially each fork lies with the lower indexed of its two users, dirty.
		 *  - A hungry node asks the neighbour for every fork it is missing.
		 *  - Asked for a fork, a node hands it over cleaned if it is dirty. If it is clean,
		 *    or the node is eating, the request waits until the meal is over.
		 *  - After the meal both forks are dirty and every waiting request is served.
		 *
		 * A philosopher that stops waiting leaves their node hungry: once it collects both
		 * forks it passes them on as if the meal had happened, so no clean fork gets stuck.
		 */
		class chandy_misra : public protocol {
		public:
			struct message {
				enum class kind {
					request,
					fork,
					hungry,
					done
				};

				kind type = kind::request;
				resource_id fork = 0;
				bool dirty = false;
			};

			// whether the philosopher starts with the fork in the given hand
			static bool initially_holds(actor_id id, side hand, size_t n) {
				actor_id neighbour = hand == side::left ? (id + n - 1) % n : (id + 1) % n;
				return id < neighbour;
			}

			chandy_misra() {}
			~chandy_misra() { stop(); }

			const char* name() const override { return "chandy-misra"; }

			void start(size_t n) override {
				if (!stopped_)
					throw configuration_error("chandy-misra is already running");
				// nodes of the previous run still reference the old seats
				join_nodes();
				begin(n);
				seats_.clear();
				nodes_.clear();
				for (actor_id id = 0; id < n; id++)
					seats_.push_back(std::make_unique<seat>());
				for (actor_id id = 0; id < n; id++)
					nodes_.push_back(std::make_unique<node>(*this, id));
				for (auto& node : nodes_)
					node->start();
#ifdef DEBUG_CHANDY_MISRA
				DEBUG_WRITE("chandy-misra", "started with %zu nodes", n);
#endif
			}

			acquire_status acquire_pair_until(actor_id id, const concurrent::clock::time_point& deadline) override {
				check_actor(id);
				seat& place = *seats_[id];
				{
					std::unique_lock<std::mutex> lock{ place.mutex };
					if (place.failure)
						std::rethrow_exception(place.failure);
					if (stopped_)
						return acquire_status::cancelled;
					if (place.state != phase::thinking)
						throw state_corruption("chandy-misra: philosopher #" + std::to_string(id) + " is already at the table");
					place.state = phase::hungry;
				}

				message hungry;
				hungry.type = message::kind::hungry;
				bool sent = nodes_[id]->commands().put(hungry);

				std::unique_lock<std::mutex> lock{ place.mutex };
				if (sent) {
					auto done = [this, &place] { return place.state == phase::eating || stopped_ || place.failure; };
					if (deadline == concurrent::forever())
						place.cond.wait(lock, done);
					else
						place.cond.wait_until(lock, deadline, done);
				}

				if (place.state == phase::eating)
					return acquire_status::acquired;

				place.state = phase::thinking;
				if (place.failure)
					std::rethrow_exception(place.failure);
				return stopped_ || !sent ? acquire_status::cancelled : acquire_status::timed_out;
			}

			void release_pair(actor_id id) override {
				check_actor(id);
				{
					seat& place = *seats_[id];
					std::unique_lock<std::mutex> lock{ place.mutex };
					if (place.state != phase::eating)
						throw state_corruption("chandy-misra: philosopher #" + std::to_string(id) + " is not eating");
					place.state = phase::thinking;
				}
				notify_release(id, left_of(id, size()));
				notify_release(id, right_of(id, size()));

				message done;
				done.type = message::kind::done;
				if (!nodes_[id]->commands().put(done)) {
#ifdef DEBUG_CHANDY_MISRA
					DEBUG_WRITE("chandy-misra", "philosopher #%zu finished after the table stopped", id);
#endif
				}
			}

			void stop() override {
				halt();
				join_nodes();
			}
		private:
			enum class phase {
				thinking,
				hungry,
				eating
			};

			// meeting point of a philosopher's own thread and their node
			struct seat {
				std::mutex mutex;
				std::condition_variable cond;
				phase state = phase::thinking;
				std::exception_ptr failure;
			};

			class node : public concurrent::thread {
				struct hand {
					resource_id fork = 0;
					actor_id neighbour = 0;
					bool present = false;
					bool dirty = false;
					bool requested = false;
					bool deferred = false;
				};
			public:
				node(chandy_misra& table, actor_id id)
					: thread("node #" + std::to_string(id)), table_(table), id_(id), doorbell_(0) {
					size_t n = table.size();
					for (side s : { side::left, side::right }) {
						hand& h = hands_[index(s)];
						h.fork = fork_of(id, s, n);
						h.neighbour = s == side::left ? (id + n - 1) % n : (id + 1) % n;
						h.present = initially_holds(id, s, n);
						h.dirty = true;
						inbox_[index(s)].attach(&doorbell_);
					}
					commands_.attach(&doorbell_);
				}

				~node() {
					halt();
					join();
				}

				// link on which the neighbour sharing the fork of the given hand writes
				concurrent::channel<message>& inbox(side s) { return inbox_[index(s)]; }
				// link on which the node's own philosopher writes
				concurrent::channel<message>& commands() { return commands_; }

				void halt() {
					doorbell_.cancel();
					inbox_[0].close();
					inbox_[1].close();
					commands_.close();
				}

				void run() override {
					message msg;
					while (!halted_ && doorbell_.wait()) {
						if (next(msg))
							handle(msg);
					}
#ifdef DEBUG_CHANDY_MISRA
					DEBUG_WRITE("chandy-misra", "node #%zu halted", id_);
#endif
				}
			protected:
				void on_exit(std::exception_ptr failure) override {
					if (failure)
						table_.fail(id_, failure);
				}
			private:
				static size_t index(side s) { return s == side::left ? 0 : 1; }

				// each wake of the doorbell has one message waiting, taken round robin
				bool next(message& msg) {
					for (size_t tries = 0; tries < 3; tries++) {
						size_t source = (turn_ + tries) % 3;
						bool found = source < 2 ? inbox_[source].try_get(msg) : commands_.try_get(msg);
						if (found) {
							turn_ = (source + 1) % 3;
							return true;
						}
					}
					return false;
				}

				void handle(const message& msg) {
					switch (msg.type) {
					case message::kind::hungry: become_hungry(); break;
					case message::kind::done: meal_over(); break;
					case message::kind::request: requested(hand_of(msg.fork)); break;
					case message::kind::fork: delivered(hand_of(msg.fork), msg.dirty); break;
					}
				}

				hand& hand_of(resource_id fork) {
					if (hands_[0].fork == fork)
						return hands_[0];
					if (hands_[1].fork == fork)
						return hands_[1];
					throw state_corruption("chandy-misra: fork " + std::to_string(fork)
						+ " does not belong to philosopher #" + std::to_string(id_));
				}

				void become_hungry() {
					if (hungry_ || eating_ || !table_.waits_at(id_))
						return;
					hungry_ = true;
					for (hand& h : hands_) {
						if (!h.present && !h.requested)
							ask_for(h);
					}
					try_eat();
				}

				void requested(hand& h) {
					if (!h.present)
						throw state_corruption("chandy-misra: philosopher #" + std::to_string(h.neighbour)
							+ " asked philosopher #" + std::to_string(id_) + " for fork " + std::to_string(h.fork)
							+ " it does not have");
					if (eating_ || !h.dirty) {
						h.deferred = true;
#ifdef DEBUG_CHANDY_MISRA
						DEBUG_WRITE("chandy-misra", "philosopher #%zu keeps clean fork %zu for now", id_, h.fork);
#endif
						return;
					}
					hand_over(h);
					// still hungry, so the fork is wanted right back
					if (hungry_)
						ask_for(h);
				}

				void delivered(hand& h, bool dirty) {
					h.present = true;
					h.dirty = dirty;
					h.requested = false;
					table_.fork_moved(h.fork, h.neighbour, id_, !dirty);
					try_eat();
				}

				void try_eat() {
					if (!hungry_ || !hands_[0].present || !hands_[1].present)
						return;
					hungry_ = false;
					if (table_.seat_at(id_)) {
						eating_ = true;
#ifdef DEBUG_CHANDY_MISRA
						DEBUG_WRITE("chandy-misra", "philosopher #%zu eats with forks %zu and %zu", id_, hands_[0].fork, hands_[1].fork);
#endif
						return;
					}
					// nobody is waiting for this meal any more
					finish_meal();
				}

				void meal_over() {
					if (!eating_)
						throw state_corruption("chandy-misra: node #" + std::to_string(id_) + " told to finish a meal it is not having");
					finish_meal();
				}

				void finish_meal() {
					eating_ = false;
					hungry_ = false;
					for (hand& h : hands_) {
						if (!h.present)
							throw state_corruption("chandy-misra: philosopher #" + std::to_string(id_)
								+ " finished a meal without fork " + std::to_string(h.fork));
						h.dirty = true;
						table_.fork_used(h.fork, id_);
					}
					for (hand& h : hands_) {
						if (h.deferred)
							hand_over(h);
					}
				}

				void hand_over(hand& h) {
					h.present = false;
					h.deferred = false;
					h.dirty = false;
					message msg;
					msg.type = message::kind::fork;
					msg.fork = h.fork;
					msg.dirty = false;
					send(h, msg);
				}

				void ask_for(hand& h) {
					h.requested = true;
					message msg;
					msg.type = message::kind::request;
					msg.fork = h.fork;
					send(h, msg);
				}

				void send(const hand& h, const message& msg) {
					// the neighbour holds the same fork in the opposite hand
					side receiver = &h == &hands_[0] ? side::right : side::left;
					if (!table_.link(h.neighbour, receiver).put(msg))
						halted_ = true;
				}

				chandy_misra& table_;
				actor_id id_;
				concurrent::semaphore doorbell_;
				concurrent::channel<message> inbox_[2];
				concurrent::channel<message> commands_;
				hand hands_[2];
				bool hungry_ = false;
				bool eating_ = false;
				bool halted_ = false;
				size_t turn_ = 0;
			};

			concurrent::channel<message>& link(actor_id to, side s) {
				return nodes_[to]->inbox(s);
			}

			// still waiting for a meal, checked before a node bothers the neighbours
			bool waits_at(actor_id id) {
				seat& place = *seats_[id];
				std::unique_lock<std::mutex> lock{ place.mutex };
				return place.state == phase::hungry;
			}

			// hands the meal to the philosopher if they are still waiting for it
			bool seat_at(actor_id id) {
				seat& place = *seats_[id];
				std::unique_lock<std::mutex> lock{ place.mutex };
				if (place.state != phase::hungry)
					return false;
				place.state = phase::eating;
				notify_acquire(id, left_of(id, size()));
				notify_acquire(id, right_of(id, size()));
				place.cond.notify_all();
				return true;
			}

			void fork_moved(resource_id fork, actor_id from, actor_id to, bool clean) {
#ifdef DEBUG_CHANDY_MISRA
				DEBUG_WRITE("chandy-misra", "fork %zu moved from #%zu to #%zu %s", fork, from, to, clean ? "clean" : "dirty");
#endif
				notify_transfer(fork, from, to, clean);
			}

			void fork_used(resource_id fork, actor_id holder) {
				notify_dirty(fork, holder);
			}

			void fail(actor_id id, std::exception_ptr failure) {
				{
					seat& place = *seats_[id];
					std::unique_lock<std::mutex> lock{ place.mutex };
					place.failure = failure;
				}
				record_failure(failure);
				halt();
			}

			// wakes everybody up without waiting for the nodes, safe to call from a node
			void halt() {
				stopped_ = true;
				for (auto& place : seats_) {
					std::unique_lock<std::mutex> lock{ place->mutex };
					place->cond.notify_all();
				}
				for (auto& node : nodes_)
					node->halt();
			}

			void join_nodes() {
				for (auto& node : nodes_)
					node->join();
			}

			std::vector<std::unique_ptr<seat>> seats_;
			std::vector<std::unique_ptr<node>> nodes_;
		};
	}
}

#endif //PHILO_PROTOCOLS_CHANDY_MISRA_H_
