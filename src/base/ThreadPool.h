// +-------------------------------------------------------------------------
// | Copyright (C) 2017 Yunify, Inc.
// +-------------------------------------------------------------------------
// | Licensed under the Apache License, Version 2.0 (the "License");
// | You may not use this work except in compliance with the License.
// | You may obtain a copy of the License in the LICENSE file, or at:
// |
// | http://www.apache.org/licenses/LICENSE-2.0
// |
// | Unless required by applicable law or agreed to in writing, software
// | distributed under the License is distributed on an "AS IS" BASIS,
// | WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// | See the License for the specific language governing permissions and
// | limitations under the License.
// +-------------------------------------------------------------------------

#ifndef CHUNKXFER_BASE_THREADPOOL_H_
#define CHUNKXFER_BASE_THREADPOOL_H_

#include <stddef.h>

#include <deque>
#include <vector>

#include "boost/bind.hpp"
#include "boost/function.hpp"
#include "boost/make_shared.hpp"
#include "boost/move/move.hpp"
#include "boost/noncopyable.hpp"
#include "boost/preprocessor.hpp"
#include "boost/shared_ptr.hpp"
#include "boost/thread/condition_variable.hpp"
#include "boost/thread/future.hpp"
#include "boost/thread/mutex.hpp"
#include "boost/utility/result_of.hpp"

//
// Emulation of variadic templates and perfect forwarding
//
#define CHUNKXFER_POOL_MAX_ARITY 4
#define CHUNKXFER_POOL_PARAMETERS(Z, N, D) \
  BOOST_PP_COMMA_IF(N)                     \
  BOOST_FWD_REF(BOOST_PP_CAT(A, N)) BOOST_PP_CAT(a, N)
#define CHUNKXFER_POOL_FORWARD(Z, N, D) \
  BOOST_PP_COMMA_IF(N)                  \
  boost::forward<BOOST_PP_CAT(A, N)>(BOOST_PP_CAT(a, N))

namespace CX {

namespace Threading {

class TaskHandle;

typedef boost::function<void()> Task;

// Runs a packaged task, keeps it alive until the worker thread gets to it
template <typename R>
struct PackagedTaskRunner {
  boost::shared_ptr<boost::packaged_task<R> > m_task;
  explicit PackagedTaskRunner(
      const boost::shared_ptr<boost::packaged_task<R> > &task)
      : m_task(task) {}
  void operator()() { (*m_task)(); }
};

//
// ThreadPool
//
// Fixed number of worker threads started on construction. Destruction
// stops the workers and discards the tasks still waiting in the queue.
//
class ThreadPool : private boost::noncopyable {
 public:
  explicit ThreadPool(size_t poolSize);
  ~ThreadPool();

 public:
  size_t GetPoolSize() const { return m_poolSize; }

  void SubmitToThread(const Task &task, bool prioritized = false);

#define CHUNKXFER_POOL_EXPAND(N)                                              \
  template <typename F, BOOST_PP_ENUM_PARAMS(N, typename A)>                  \
  void Submit(F f, BOOST_PP_REPEAT(N, CHUNKXFER_POOL_PARAMETERS, ~)) {        \
    typedef typename boost::result_of<F(BOOST_PP_ENUM_PARAMS(N, A))>::type    \
        ReturnType;                                                           \
    SubmitToThread(boost::bind(boost::type<ReturnType>(), f,                  \
                               BOOST_PP_REPEAT(N, CHUNKXFER_POOL_FORWARD, ~))); \
  }                                                                           \
                                                                              \
  template <typename F, BOOST_PP_ENUM_PARAMS(N, typename A)>                  \
  boost::unique_future<                                                       \
      typename boost::result_of<F(BOOST_PP_ENUM_PARAMS(N, A))>::type>         \
  SubmitCallable(F f, BOOST_PP_REPEAT(N, CHUNKXFER_POOL_PARAMETERS, ~)) {     \
    typedef typename boost::result_of<F(BOOST_PP_ENUM_PARAMS(N, A))>::type    \
        ReturnType;                                                           \
    boost::shared_ptr<boost::packaged_task<ReturnType> > task =               \
        boost::make_shared<boost::packaged_task<ReturnType> >(boost::bind(    \
            boost::type<ReturnType>(), f,                                     \
            BOOST_PP_REPEAT(N, CHUNKXFER_POOL_FORWARD, ~)));                  \
    SubmitToThread(PackagedTaskRunner<ReturnType>(task));                     \
    return task->get_future();                                                \
  }                                                                           \
                                                                              \
  template <typename ReceivedHandler, typename F,                             \
            BOOST_PP_ENUM_PARAMS(N, typename A)>                              \
  void SubmitAsync(ReceivedHandler handler, F f,                              \
                   BOOST_PP_REPEAT(N, CHUNKXFER_POOL_PARAMETERS, ~)) {        \
    typedef typename boost::result_of<F(BOOST_PP_ENUM_PARAMS(N, A))>::type    \
        ReturnType;                                                           \
    SubmitToThread(boost::bind(                                               \
        boost::type<void>(), handler,                                         \
        boost::bind(boost::type<ReturnType>(), f,                             \
                    BOOST_PP_REPEAT(N, CHUNKXFER_POOL_FORWARD, ~))));         \
  }

#define BOOST_PP_LOCAL_MACRO(N) CHUNKXFER_POOL_EXPAND(N)
#define BOOST_PP_LOCAL_LIMITS (1, CHUNKXFER_POOL_MAX_ARITY)
#include BOOST_PP_LOCAL_ITERATE()

#undef BOOST_PP_LOCAL_MACRO
#undef BOOST_PP_LOCAL_LIMITS
#undef CHUNKXFER_POOL_EXPAND

 private:
  Task *PopTask();
  bool HasTasks();
  void StopProcessing();

 private:
  size_t m_poolSize;
  std::deque<Task *> m_tasks;
  boost::mutex m_queueLock;
  std::vector<TaskHandle *> m_taskHandles;
  boost::mutex m_syncLock;
  boost::condition_variable m_syncConditionVar;

  friend class TaskHandle;
  friend class ThreadPoolTest;
};

}  // namespace Threading
}  // namespace CX

#undef CHUNKXFER_POOL_FORWARD
#undef CHUNKXFER_POOL_PARAMETERS
#undef CHUNKXFER_POOL_MAX_ARITY

#endif  // CHUNKXFER_BASE_THREADPOOL_H_
