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

#ifndef CHUNKXFER_BASE_SINGLETON_HPP_
#define CHUNKXFER_BASE_SINGLETON_HPP_

#include "boost/noncopyable.hpp"
#include "boost/scoped_ptr.hpp"
#include "boost/thread/once.hpp"

namespace CX {

//
// Singleton
//
// Lazily constructs T on first Instance() call, thread safe by call_once.
// T hides its constructor and befriends Singleton<T>, e.g.
//
//   class Log : public Singleton<Log> {
//    private:
//     Log() {}
//     friend class Singleton<Log>;
//   };
//
//   Log::Instance().IsDebug();
//
template <typename T>
class Singleton : private boost::noncopyable {
 public:
  static T &Instance() {
    boost::call_once(s_onceFlag, &Singleton<T>::Create);
    return *s_instance;
  }

 protected:
  Singleton() {}
  virtual ~Singleton() {}

 private:
  static void Create() { s_instance.reset(new T); }

  static boost::scoped_ptr<T> s_instance;
  static boost::once_flag s_onceFlag;
};

template <typename T>
boost::scoped_ptr<T> Singleton<T>::s_instance(0);

template <typename T>
boost::once_flag Singleton<T>::s_onceFlag = BOOST_ONCE_INIT;

}  // namespace CX


#endif  // CHUNKXFER_BASE_SINGLETON_HPP_
