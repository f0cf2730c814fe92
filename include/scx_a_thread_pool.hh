#pragma once

#include <cstdlib>
#include <cstddef>
#include <cstdio>
#include <deque>
#include <vector>
#include <random>
#include <concepts>
#include <optional>
#include <algorithm>
#include <functional>
#include <atomic>
#include <thread>
#include <mutex>
#include <semaphore>
#include <type_traits>
#include <system_error>

/* --------------------------------------------- */

namespace pth
{
  template <typename Lock> concept is_lockable = requires(Lock &&lock)
  { // https://en.cppreference.com/w/cpp/named_req/Lockable
    lock.lock();
    lock.unlock();
    { lock.try_lock() } -> std::convertible_to<bool>;
  };
  namespace details
  {
    using pth_f = std::function<void()>;
  }
}

template <typename T, typename Lock = std::mutex> requires pth::is_lockable<Lock>
class pth_q // thread safe queue <T, Lock>
{
private:
  std::deque<T> the_queue{};
  mutable Lock the_mutex{};
public:
  using value_type = T;
  using size_type = typename std::deque<T>::size_type;
  pth_q() = default;
  pth_q(const pth_q&) = delete;
  pth_q& operator=(const pth_q&) = delete;
  pth_q(pth_q&&) = delete;
  pth_q& operator=(pth_q&&) = delete;
  inline void push_back(T&& value)
  {
    std::scoped_lock lock(the_mutex);
    the_queue.push_back(std::forward<T>(value));
  }
  inline bool empty() const noexcept
  {
    std::scoped_lock lock(the_mutex);
    return the_queue.empty();
  }
  inline size_type size() const noexcept
  {
    std::scoped_lock lock(the_mutex);
    return the_queue.size();
  }
  inline size_type clear()
  {
    std::scoped_lock lock(the_mutex);
    auto size = the_queue.size();
    the_queue.clear();
    return size;
  }
  inline std::optional<T> pop_front()
  {
    std::scoped_lock lock(the_mutex);
    if (the_queue.empty()) return std::nullopt;
    std::optional<T> front = std::move(the_queue.front());
    the_queue.pop_front();
    return front;
  }
  inline std::optional<T> steal_() // victim side: take from the back
  {
    std::scoped_lock lock(the_mutex);
    if (the_queue.empty()) return std::nullopt;
    std::optional<T> back = std::move(the_queue.back());
    the_queue.pop_back();
    return back;
  }
};

/* --------------------------------------------- */

template <typename Function = pth::details::pth_f, typename Thread = std::jthread>
requires std::invocable<Function> && std::is_same_v<void, std::invoke_result_t<Function>>
class pth_v // work-stealing pool: one queue per worker, round-robin submit
{
private:
  struct task_item
  {
    pth_q<Function> tasks{};
    std::binary_semaphore signal{0};
  };
  std::atomic<bool> inited{false};
  std::vector<Thread> threads_v;
  std::deque<task_item> tasks_queue;
  std::atomic<size_t> next_thread_idx{0};
  std::atomic<size_t> num_queues{0};
  std::atomic_int_fast64_t unassigned_tasks{0}, in_flight_tasks{0};
  std::atomic_bool threads_complete_signal{false};
public:
  explicit pth_v(const unsigned int _thread_num = std::thread::hardware_concurrency()) { init_(_thread_num); }
  pth_v(const pth_v&) = delete;
  pth_v& operator=(const pth_v&) = delete;
  pth_v(pth_v&&) = delete;
  pth_v& operator=(pth_v&&) = delete;
  ~pth_v() { fina_(); }
  inline void init_(const unsigned int _thread_num = std::thread::hardware_concurrency())
  {
    if (inited.load(std::memory_order_acquire)) fina_(); // re-init
    const size_t n = clamp_workers_(_thread_num);
    tasks_queue.resize(n);
    num_queues.store(n, std::memory_order_release);
    for (size_t id = 0; id < n; ++id)
    {
      try
      {
        threads_v.emplace_back([this, id](const std::stop_token& _stop_tok) { work_(id, _stop_tok); });
      }
      catch (const std::system_error& e) // keep the workers already running
      {
        fprintf(stderr, "pth_v.init_(): thread %zu not started w/ %s\n", id, e.what());
        num_queues.store(id, std::memory_order_release);
        while (tasks_queue.size() > id) tasks_queue.pop_back();
        break;
      }
    }
    inited.store(true, std::memory_order_release);
  }
  inline void fina_(bool _force = false)
  {
    if (!inited.load(std::memory_order_acquire)) return;
    if (!_force) sync_();
    else clear_();
    for (size_t i = 0; i < threads_v.size(); ++i)
    {
      threads_v[i].request_stop();
      tasks_queue[i].signal.release();
      threads_v[i].join();
    }
    threads_v.clear();
    tasks_queue.clear();
    next_thread_idx.store(0, std::memory_order_relaxed);
    num_queues.store(0, std::memory_order_relaxed);
    unassigned_tasks.store(0, std::memory_order_relaxed);
    in_flight_tasks.store(0, std::memory_order_relaxed);
    threads_complete_signal.store(false, std::memory_order_relaxed);
    inited.store(false, std::memory_order_release);
  }
  inline size_t size_() const { return threads_v.size(); }
  template <typename Func> requires std::invocable<Func>
  inline void fire_(Func&& _func) // exceptions thrown by _func end at the worker
  {
    enqueue_task_([func = std::forward<Func>(_func)]() mutable
    {
      try { std::invoke(func); }
      catch (const std::exception& e) { fprintf(stderr, "pth_v.fire_(): task threw: %s\n", e.what()); }
      catch (...) { fprintf(stderr, "pth_v.fire_(): task threw a non-standard exception\n"); }
    });
  }
  inline size_t clear_()
  {
    size_t removed_task_count{0};
    for (auto& task_list : tasks_queue)
    {
      removed_task_count += task_list.tasks.clear();
    }
    in_flight_tasks.fetch_sub(removed_task_count, std::memory_order_release);
    unassigned_tasks.fetch_sub(removed_task_count, std::memory_order_release);
    return removed_task_count;
  }
  inline void sync_()
  {
    if (in_flight_tasks.load(std::memory_order_acquire) == 0) return;
    while (true)
    {
      threads_complete_signal.wait(false);
      if (in_flight_tasks.load(std::memory_order_acquire) == 0) return;
      threads_complete_signal.store(false, std::memory_order_relaxed);
    }
  }
private:
  static constexpr size_t clamp_workers_(unsigned int _n) { return _n == 0 ? 1 : (_n > 4096 ? 4096 : _n); }
  inline void run_task_(Function&& _task)
  {
    unassigned_tasks.fetch_sub(1, std::memory_order_release);
    std::invoke(std::move(_task));
    in_flight_tasks.fetch_sub(1, std::memory_order_release);
  }
  inline void work_(const size_t _id, const std::stop_token& _stop_tok)
  {
    std::random_device rd;
    std::mt19937 gen(rd() ^ (_id << 16)); // seed with worker id
    std::uniform_int_distribution<size_t> dist;
    do
    {
      tasks_queue[_id].signal.acquire();
      do
      {
        while (auto task = tasks_queue[_id].tasks.pop_front()) run_task_(std::move(task.value()));
        const size_t n_queues = num_queues.load(std::memory_order_acquire);
        if (n_queues < 2) continue;
        const size_t max_attempts = std::min(size_t(4), n_queues - 1);
        dist.param(std::uniform_int_distribution<size_t>::param_type(0, n_queues - 1));
        for (size_t attempt = 0; attempt < max_attempts; ++attempt)
        {
          size_t victim;
          do { victim = dist(gen); } while (victim == _id);
          if (auto task = tasks_queue[victim].tasks.steal_())
          {
            run_task_(std::move(task.value()));
            break;
          }
        }
      } while (unassigned_tasks.load(std::memory_order_acquire) > 0);
      if (in_flight_tasks.load(std::memory_order_acquire) == 0)
      {
        threads_complete_signal.store(true, std::memory_order_release);
        threads_complete_signal.notify_one();
      }
    } while (!_stop_tok.stop_requested());
  }
  template <typename Func>
  inline void enqueue_task_(Func&& _f)
  {
    const size_t n_queues = num_queues.load(std::memory_order_acquire);
    if (n_queues == 0)
    {
      fprintf(stderr, "pth_v.enqueue_task_(): no workers, task dropped\n");
      return;
    }
    const size_t i = next_thread_idx.fetch_add(1, std::memory_order_relaxed) % n_queues;
    unassigned_tasks.fetch_add(1, std::memory_order_release);
    const auto prev_in_flight = in_flight_tasks.fetch_add(1, std::memory_order_release);
    if (prev_in_flight == 0) threads_complete_signal.store(false, std::memory_order_release);
    tasks_queue[i].tasks.push_back(Function(std::forward<Func>(_f)));
    tasks_queue[i].signal.release();
  }
};
using pth_t = pth_v<>;

/* --------------------------------------------- */
